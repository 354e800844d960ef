#ifndef BLED112_DRIVER_FRAME_CODEC_HPP
#define BLED112_DRIVER_FRAME_CODEC_HPP

#include "types.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>

namespace bgapi {

enum class MessageKind {
    RESPONSE = 0,
    EVENT = 1
};

/**
 * @brief BGAPI frame header
 *
 * Wire layout (little-endian):
 *   [0..1] 16-bit word: bits 0-14 payload length, bit 15 message kind,
 *          bits 11-14 technology type (legacy overlay on the length bits)
 *   [2]    class (category)
 *   [3]    command / event id
 *
 * The payload length never includes the 4 header bytes.
 */
struct FrameHeader {
    uint16_t length_word = 0;
    uint8_t category = 0;
    uint8_t subtype = 0;

    static constexpr size_t SIZE = 4;
    static constexpr uint16_t MAX_PAYLOAD = 0x7FFF;

    uint16_t payloadLength() const { return length_word & 0x7FFF; }
    MessageKind messageKind() const {
        return (length_word >> 15) ? MessageKind::EVENT : MessageKind::RESPONSE;
    }
    uint8_t technologyType() const { return static_cast<uint8_t>((length_word >> 11) & 0x0F); }

    static FrameHeader make(MessageKind kind, uint8_t category, uint8_t subtype,
                            uint16_t payload_length);
    static FrameHeader parse(const uint8_t* data);

    Bytes encode() const;
};

struct Frame {
    FrameHeader header;
    Bytes payload;
};

/**
 * @brief Reassembles BGAPI frames from a byte stream
 *
 * Bytes may arrive in chunks of any size; state (including a parsed header)
 * is kept across append() calls until a whole frame is buffered.
 *
 * Usage:
 *   reader.append(data, n);
 *   while (reader.hasCompleteFrame()) {
 *       Frame frame = reader.takeFrame();
 *       ...
 *   }
 */
class FrameReader {
public:
    FrameReader();

    void append(const uint8_t* data, size_t len);
    void append(const Bytes& data) { append(data.data(), data.size()); }

    // Latches the next header once 4 bytes are available
    bool hasCompleteFrame();

    // Throws std::logic_error unless hasCompleteFrame() returned true
    Frame takeFrame();

    void reset();

    size_t bufferedBytes() const { return buffer_.size(); }
    bool inHeader() const { return in_header_; }

private:
    std::deque<uint8_t> buffer_;
    FrameHeader header_;
    bool in_header_;
};

// Complete wire image of one frame: header followed by payload
Bytes encodeFrame(MessageKind kind, uint8_t category, uint8_t subtype, const Bytes& payload);

} // namespace bgapi

#endif // BLED112_DRIVER_FRAME_CODEC_HPP
