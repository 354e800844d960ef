#ifndef BLED112_DRIVER_EVENT_DECODER_HPP
#define BLED112_DRIVER_EVENT_DECODER_HPP

#include "observer.hpp"
#include "types.hpp"
#include <cstdint>

namespace bgapi {

// BGAPI command/event classes
enum class EventClass : uint8_t {
    SYSTEM = 0,
    FLASH = 1,
    ATTRIBUTES = 2,
    CONNECTION = 3,
    ATTCLIENT = 4,
    SM = 5,
    GAP = 6,
    HARDWARE = 7,
    TEST = 8
};

/**
 * @brief Decodes event frames and forwards them to the bound Observer
 *
 * The class byte selects a sub-decoder and the event id selects the field
 * layout. Unknown (class, id) pairs are ignored so newer firmware does not
 * break older hosts.
 */
class EventDecoder {
public:
    explicit EventDecoder(Observer& observer);

    // Returns false when the (class, id) pair is not a known event
    bool decode(uint8_t category, uint8_t subtype, const Bytes& payload);

private:
    Observer& observer_;

    bool decodeSystem(uint8_t id, const Bytes& payload);
    bool decodeFlash(uint8_t id, const Bytes& payload);
    bool decodeAttributes(uint8_t id, const Bytes& payload);
    bool decodeConnection(uint8_t id, const Bytes& payload);
    bool decodeAttclient(uint8_t id, const Bytes& payload);
    bool decodeSm(uint8_t id, const Bytes& payload);
    bool decodeGap(uint8_t id, const Bytes& payload);
    bool decodeHardware(uint8_t id, const Bytes& payload);
};

} // namespace bgapi

#endif // BLED112_DRIVER_EVENT_DECODER_HPP
