#include "bled112_driver/payload.hpp"
#include <algorithm>

namespace bgapi {

PayloadReader::PayloadReader(const Bytes& data)
    : data_(data)
    , pos_(0)
{
}

uint8_t PayloadReader::u8() {
    if (pos_ >= data_.size()) {
        pos_++;
        return 0;
    }
    return data_[pos_++];
}

uint16_t PayloadReader::u16() {
    uint16_t lo = u8();
    uint16_t hi = u8();
    return static_cast<uint16_t>(lo | (hi << 8));
}

uint32_t PayloadReader::u32() {
    uint32_t value = 0;
    for (int i = 0; i < 4; i++) {
        value |= static_cast<uint32_t>(u8()) << (8 * i);
    }
    return value;
}

Mac PayloadReader::mac() {
    Mac address;
    for (auto& b : address.bytes) {
        b = u8();
    }
    return address;
}

Bytes PayloadReader::bytes(size_t len) {
    size_t n = std::min(len, remaining());
    if (n == 0) {
        return Bytes();
    }
    Bytes out(data_.begin() + pos_, data_.begin() + pos_ + n);
    pos_ += n;
    return out;
}

Bytes PayloadReader::lengthPrefixed() {
    uint8_t len = u8();
    return bytes(len);
}

Bytes PayloadReader::rest() {
    return bytes(remaining());
}

PayloadWriter& PayloadWriter::u8(uint8_t value) {
    data_.push_back(value);
    return *this;
}

PayloadWriter& PayloadWriter::u16(uint16_t value) {
    data_.push_back(value & 0xFF);
    data_.push_back((value >> 8) & 0xFF);
    return *this;
}

PayloadWriter& PayloadWriter::u32(uint32_t value) {
    for (int i = 0; i < 4; i++) {
        data_.push_back((value >> (8 * i)) & 0xFF);
    }
    return *this;
}

PayloadWriter& PayloadWriter::mac(const Mac& value) {
    data_.insert(data_.end(), value.bytes.begin(), value.bytes.end());
    return *this;
}

PayloadWriter& PayloadWriter::bytes(const Bytes& value) {
    data_.insert(data_.end(), value.begin(), value.end());
    return *this;
}

PayloadWriter& PayloadWriter::lengthPrefixed(const Bytes& value) {
    // uint8array can carry at most 255 bytes
    size_t n = std::min<size_t>(value.size(), 0xFF);
    data_.push_back(static_cast<uint8_t>(n));
    data_.insert(data_.end(), value.begin(), value.begin() + n);
    return *this;
}

} // namespace bgapi
