#ifndef BLED112_DRIVER_PAYLOAD_HPP
#define BLED112_DRIVER_PAYLOAD_HPP

#include "types.hpp"
#include <cstddef>
#include <cstdint>

namespace bgapi {

/**
 * @brief Little-endian cursor over a frame payload
 *
 * Reads past the end yield zero; byte sequences are clamped to what is
 * left. Short payloads therefore decode to zero-filled fields instead of
 * failing.
 */
class PayloadReader {
public:
    explicit PayloadReader(const Bytes& data);

    uint8_t u8();
    int8_t i8() { return static_cast<int8_t>(u8()); }
    uint16_t u16();
    int16_t i16() { return static_cast<int16_t>(u16()); }
    uint32_t u32();
    Mac mac();

    // Up to len bytes
    Bytes bytes(size_t len);
    // One length byte followed by that many bytes
    Bytes lengthPrefixed();
    // Everything not consumed yet
    Bytes rest();

    size_t remaining() const { return pos_ < data_.size() ? data_.size() - pos_ : 0; }
    bool exhausted() const { return remaining() == 0; }

private:
    const Bytes& data_;
    size_t pos_;
};

/**
 * @brief Little-endian payload builder for commands
 */
class PayloadWriter {
public:
    PayloadWriter& u8(uint8_t value);
    PayloadWriter& u16(uint16_t value);
    PayloadWriter& u32(uint32_t value);
    PayloadWriter& mac(const Mac& value);
    PayloadWriter& bytes(const Bytes& value);
    // Length byte followed by the data (BGAPI uint8array)
    PayloadWriter& lengthPrefixed(const Bytes& value);

    const Bytes& data() const { return data_; }

private:
    Bytes data_;
};

} // namespace bgapi

#endif // BLED112_DRIVER_PAYLOAD_HPP
