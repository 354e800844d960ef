#include "bled112_driver/frame_codec.hpp"
#include <stdexcept>

namespace bgapi {

constexpr size_t FrameHeader::SIZE;
constexpr uint16_t FrameHeader::MAX_PAYLOAD;

FrameHeader FrameHeader::make(MessageKind kind, uint8_t category, uint8_t subtype,
                              uint16_t payload_length) {
    FrameHeader header;
    header.length_word = static_cast<uint16_t>(payload_length & MAX_PAYLOAD);
    if (kind == MessageKind::EVENT) {
        header.length_word |= 0x8000;
    }
    header.category = category;
    header.subtype = subtype;
    return header;
}

FrameHeader FrameHeader::parse(const uint8_t* data) {
    FrameHeader header;
    header.length_word = static_cast<uint16_t>(data[0]) |
                         (static_cast<uint16_t>(data[1]) << 8);
    header.category = data[2];
    header.subtype = data[3];
    return header;
}

Bytes FrameHeader::encode() const {
    Bytes bytes(SIZE);
    bytes[0] = length_word & 0xFF;
    bytes[1] = (length_word >> 8) & 0xFF;
    bytes[2] = category;
    bytes[3] = subtype;
    return bytes;
}

FrameReader::FrameReader()
    : in_header_(false)
{
}

void FrameReader::append(const uint8_t* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
}

bool FrameReader::hasCompleteFrame() {
    if (!in_header_ && buffer_.size() >= FrameHeader::SIZE) {
        uint8_t raw[FrameHeader::SIZE];
        for (size_t i = 0; i < FrameHeader::SIZE; i++) {
            raw[i] = buffer_.front();
            buffer_.pop_front();
        }
        header_ = FrameHeader::parse(raw);
        in_header_ = true;
    }

    return in_header_ && buffer_.size() >= header_.payloadLength();
}

Frame FrameReader::takeFrame() {
    if (!in_header_ || buffer_.size() < header_.payloadLength()) {
        throw std::logic_error("FrameReader::takeFrame called without a complete frame");
    }

    Frame frame;
    frame.header = header_;
    auto end = buffer_.begin() + header_.payloadLength();
    frame.payload.assign(buffer_.begin(), end);
    buffer_.erase(buffer_.begin(), end);
    in_header_ = false;

    return frame;
}

void FrameReader::reset() {
    buffer_.clear();
    header_ = FrameHeader();
    in_header_ = false;
}

Bytes encodeFrame(MessageKind kind, uint8_t category, uint8_t subtype, const Bytes& payload) {
    Bytes frame = FrameHeader::make(kind, category, subtype,
                                    static_cast<uint16_t>(payload.size())).encode();
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

} // namespace bgapi
