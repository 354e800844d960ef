#include "bled112_driver/event_decoder.hpp"
#include "bled112_driver/payload.hpp"

namespace bgapi {

EventDecoder::EventDecoder(Observer& observer)
    : observer_(observer)
{
}

bool EventDecoder::decode(uint8_t category, uint8_t subtype, const Bytes& payload) {
    switch (static_cast<EventClass>(category)) {
        case EventClass::SYSTEM:     return decodeSystem(subtype, payload);
        case EventClass::FLASH:      return decodeFlash(subtype, payload);
        case EventClass::ATTRIBUTES: return decodeAttributes(subtype, payload);
        case EventClass::CONNECTION: return decodeConnection(subtype, payload);
        case EventClass::ATTCLIENT:  return decodeAttclient(subtype, payload);
        case EventClass::SM:         return decodeSm(subtype, payload);
        case EventClass::GAP:        return decodeGap(subtype, payload);
        case EventClass::HARDWARE:   return decodeHardware(subtype, payload);
        default:
            return false;
    }
}

bool EventDecoder::decodeSystem(uint8_t id, const Bytes& payload) {
    PayloadReader in(payload);

    switch (id) {
        case 0: {
            SystemInfo info;
            info.major = in.u16();
            info.minor = in.u16();
            info.patch = in.u16();
            info.build = in.u16();
            info.ll_version = in.u16();
            info.protocol_version = in.u8();
            info.hw = in.u8();
            observer_.onSystemBoot(info);
            return true;
        }
        case 1:
            observer_.onSystemDebug(in.lengthPrefixed());
            return true;
        case 2: {
            uint8_t endpoint = in.u8();
            uint8_t data = in.u8();
            observer_.onSystemEndpointWatermarkRx(endpoint, data);
            return true;
        }
        case 3: {
            uint8_t endpoint = in.u8();
            uint8_t data = in.u8();
            observer_.onSystemEndpointWatermarkTx(endpoint, data);
            return true;
        }
        case 4: {
            uint16_t address = in.u16();
            uint16_t reason = in.u16();
            observer_.onSystemScriptFailure(address, reason);
            return true;
        }
        case 5:
            observer_.onSystemNoLicenseKey();
            return true;
        default:
            return false;
    }
}

bool EventDecoder::decodeFlash(uint8_t id, const Bytes& payload) {
    if (id != 0) {
        return false;
    }

    PayloadReader in(payload);
    uint16_t key = in.u16();
    observer_.onFlashPsKey(key, in.lengthPrefixed());
    return true;
}

bool EventDecoder::decodeAttributes(uint8_t id, const Bytes& payload) {
    PayloadReader in(payload);

    switch (id) {
        case 0: {
            uint8_t connection = in.u8();
            uint8_t reason = in.u8();
            uint16_t handle = in.u16();
            uint16_t offset = in.u16();
            observer_.onAttributeValue(connection, reason, handle, offset, in.lengthPrefixed());
            return true;
        }
        case 1: {
            uint8_t connection = in.u8();
            uint16_t handle = in.u16();
            uint16_t offset = in.u16();
            uint8_t max_size = in.u8();
            observer_.onAttributeUserReadRequest(connection, handle, offset, max_size);
            return true;
        }
        case 2: {
            uint16_t handle = in.u16();
            uint8_t flags = in.u8();
            observer_.onAttributeStatus(handle, flags);
            return true;
        }
        default:
            return false;
    }
}

bool EventDecoder::decodeConnection(uint8_t id, const Bytes& payload) {
    PayloadReader in(payload);

    switch (id) {
        case 0: {
            ConnectionStatus status;
            status.connection = in.u8();
            status.flags = in.u8();
            status.address.address = in.mac();
            status.address.address_type = in.u8();
            status.conn_interval = in.u16();
            status.timeout = in.u16();
            status.latency = in.u16();
            status.bonding = in.u8();
            observer_.onConnectionStatus(status);
            return true;
        }
        case 1: {
            ConnectionVersionIndication indication;
            indication.connection = in.u8();
            indication.version = in.u8();
            indication.comp_id = in.u16();
            indication.sub_version = in.u16();
            observer_.onConnectionVersionIndication(indication);
            return true;
        }
        case 2: {
            uint8_t connection = in.u8();
            observer_.onConnectionFeatureIndication(connection, in.lengthPrefixed());
            return true;
        }
        case 3: {
            uint8_t connection = in.u8();
            observer_.onConnectionRawRx(connection, in.lengthPrefixed());
            return true;
        }
        case 4: {
            uint8_t connection = in.u8();
            uint16_t reason = in.u16();
            observer_.onConnectionDisconnected(connection, reason);
            return true;
        }
        default:
            return false;
    }
}

bool EventDecoder::decodeAttclient(uint8_t id, const Bytes& payload) {
    if (id > 6) {
        return false;
    }

    // Every attribute client event starts with the connection handle
    PayloadReader in(payload);
    uint8_t connection = in.u8();

    switch (id) {
        case 0: {
            uint16_t attr_handle = in.u16();
            observer_.onAttclientIndicated(connection, attr_handle);
            break;
        }
        case 1: {
            uint16_t result = in.u16();
            uint16_t chr_handle = in.u16();
            observer_.onAttclientProcedureCompleted(connection, result, chr_handle);
            break;
        }
        case 2: {
            uint16_t start = in.u16();
            uint16_t end = in.u16();
            observer_.onAttclientGroupFound(connection, start, end, in.lengthPrefixed());
            break;
        }
        case 3: {
            uint16_t chrdecl = in.u16();
            uint16_t value = in.u16();
            uint8_t properties = in.u8();
            observer_.onAttclientAttributeFound(connection, chrdecl, value, properties,
                                                in.lengthPrefixed());
            break;
        }
        case 4: {
            uint16_t chr_handle = in.u16();
            observer_.onAttclientFindInformationFound(connection, chr_handle, in.lengthPrefixed());
            break;
        }
        case 5: {
            uint16_t att_handle = in.u16();
            uint8_t type = in.u8();
            observer_.onAttclientAttributeValue(connection, att_handle, type, in.lengthPrefixed());
            break;
        }
        case 6:
            observer_.onAttclientReadMultipleResponse(connection, in.lengthPrefixed());
            break;
    }
    return true;
}

bool EventDecoder::decodeSm(uint8_t id, const Bytes& payload) {
    PayloadReader in(payload);

    // bond_status is the only security manager event without a handle
    if (id == 4) {
        SmBondStatus status;
        status.bond = in.u8();
        status.key_size = in.u8();
        status.mitm = in.u8();
        status.keys = in.u8();
        observer_.onSmBondStatus(status);
        return true;
    } else if (id > 4) {
        return false;
    }

    uint8_t handle = in.u8();

    switch (id) {
        case 0: {
            uint8_t packet = in.u8();
            observer_.onSmSmpData(handle, packet, in.lengthPrefixed());
            break;
        }
        case 1:
            observer_.onSmBondingFail(handle, in.u16());
            break;
        case 2:
            observer_.onSmPasskeyDisplay(handle, in.u32());
            break;
        case 3:
            observer_.onSmPasskeyRequest(handle);
            break;
    }
    return true;
}

bool EventDecoder::decodeGap(uint8_t id, const Bytes& payload) {
    PayloadReader in(payload);

    switch (id) {
        case 0: {
            GapScanResponse response;
            response.rssi = in.i8();
            response.packet_type = in.u8();
            response.address.address = in.mac();
            response.address.address_type = in.u8();
            response.bond = in.u8();
            // uint8array on the wire; bytes past its declared length are dropped
            response.data = in.lengthPrefixed();
            observer_.onGapScanResponse(response);
            return true;
        }
        case 1: {
            uint8_t discover = in.u8();
            uint8_t connect = in.u8();
            observer_.onGapModeChanged(discover, connect);
            return true;
        }
        default:
            return false;
    }
}

bool EventDecoder::decodeHardware(uint8_t id, const Bytes& payload) {
    PayloadReader in(payload);

    switch (id) {
        case 0: {
            IoPortStatus status;
            status.timestamp = in.u32();
            status.port = in.u8();
            status.irq = in.u8();
            status.state = in.u8();
            observer_.onHardwareIoPortStatus(status);
            return true;
        }
        case 1:
            observer_.onHardwareSoftTimer(in.u8());
            return true;
        case 2: {
            uint8_t input = in.u8();
            int16_t value = in.i16();
            observer_.onHardwareAdcResult(input, value);
            return true;
        }
        default:
            return false;
    }
}

} // namespace bgapi
