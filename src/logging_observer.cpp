#include "bled112_driver/observer.hpp"
#include <iomanip>

namespace bgapi {

namespace {

// Prints a byte as hex without disturbing the stream's base afterwards
struct HexWord {
    unsigned value;
    int width;
};

std::ostream& operator<<(std::ostream& os, const HexWord& h) {
    std::ios_base::fmtflags flags = os.flags();
    os << "0x" << std::hex << std::setfill('0') << std::setw(h.width) << h.value;
    os.flags(flags);
    return os;
}

HexWord hex8(uint8_t v) { return HexWord{v, 2}; }
HexWord hex16(uint16_t v) { return HexWord{v, 4}; }

} // namespace

LoggingObserver::LoggingObserver(std::ostream& out)
    : out_(out)
{
}

void LoggingObserver::onSystemBoot(const SystemInfo& info) {
    out_ << "[system] boot: " << info.toString() << std::endl;
}

void LoggingObserver::onSystemDebug(const Bytes& data) {
    out_ << "[system] debug: " << toHex(data) << std::endl;
}

void LoggingObserver::onSystemEndpointWatermarkRx(uint8_t endpoint, uint8_t data) {
    out_ << "[system] endpoint " << static_cast<int>(endpoint)
         << " rx watermark: " << static_cast<int>(data) << std::endl;
}

void LoggingObserver::onSystemEndpointWatermarkTx(uint8_t endpoint, uint8_t data) {
    out_ << "[system] endpoint " << static_cast<int>(endpoint)
         << " tx watermark: " << static_cast<int>(data) << std::endl;
}

void LoggingObserver::onSystemScriptFailure(uint16_t address, uint16_t reason) {
    out_ << "[system] script failure at " << hex16(address)
         << " reason " << hex16(reason) << std::endl;
}

void LoggingObserver::onSystemNoLicenseKey() {
    out_ << "[system] no license key" << std::endl;
}

void LoggingObserver::onFlashPsKey(uint16_t key, const Bytes& value) {
    out_ << "[flash] ps key " << hex16(key) << ": " << toHex(value) << std::endl;
}

void LoggingObserver::onAttributeValue(uint8_t connection, uint8_t reason, uint16_t handle,
                                       uint16_t offset, const Bytes& value) {
    out_ << "[attributes] value conn=" << static_cast<int>(connection)
         << " reason=" << static_cast<int>(reason)
         << " handle=" << handle << " offset=" << offset
         << ": " << toHex(value) << std::endl;
}

void LoggingObserver::onAttributeUserReadRequest(uint8_t connection, uint16_t handle,
                                                 uint16_t offset, uint8_t max_size) {
    out_ << "[attributes] user read request conn=" << static_cast<int>(connection)
         << " handle=" << handle << " offset=" << offset
         << " max=" << static_cast<int>(max_size) << std::endl;
}

void LoggingObserver::onAttributeStatus(uint16_t handle, uint8_t flags) {
    out_ << "[attributes] status handle=" << handle << " flags=" << hex8(flags) << std::endl;
}

void LoggingObserver::onConnectionStatus(const ConnectionStatus& status) {
    out_ << "[connection] status conn=" << static_cast<int>(status.connection)
         << " flags=" << hex8(status.flags)
         << " address=" << status.address.address.toString()
         << " interval=" << status.conn_interval
         << " timeout=" << status.timeout
         << " latency=" << status.latency
         << " bonding=" << static_cast<int>(status.bonding) << std::endl;
}

void LoggingObserver::onConnectionVersionIndication(const ConnectionVersionIndication& indication) {
    out_ << "[connection] version conn=" << static_cast<int>(indication.connection)
         << " version=" << static_cast<int>(indication.version)
         << " comp_id=" << hex16(indication.comp_id)
         << " sub_version=" << hex16(indication.sub_version) << std::endl;
}

void LoggingObserver::onConnectionFeatureIndication(uint8_t connection, const Bytes& features) {
    out_ << "[connection] features conn=" << static_cast<int>(connection)
         << ": " << toHex(features) << std::endl;
}

void LoggingObserver::onConnectionRawRx(uint8_t connection, const Bytes& data) {
    out_ << "[connection] raw rx conn=" << static_cast<int>(connection)
         << ": " << toHex(data) << std::endl;
}

void LoggingObserver::onConnectionDisconnected(uint8_t connection, uint16_t reason) {
    out_ << "[connection] disconnected conn=" << static_cast<int>(connection)
         << " reason=" << hex16(reason) << std::endl;
}

void LoggingObserver::onAttclientIndicated(uint8_t connection, uint16_t attr_handle) {
    out_ << "[attclient] indicated conn=" << static_cast<int>(connection)
         << " handle=" << attr_handle << std::endl;
}

void LoggingObserver::onAttclientProcedureCompleted(uint8_t connection, uint16_t result,
                                                    uint16_t chr_handle) {
    out_ << "[attclient] procedure completed conn=" << static_cast<int>(connection)
         << " result=" << hex16(result) << " handle=" << chr_handle << std::endl;
}

void LoggingObserver::onAttclientGroupFound(uint8_t connection, uint16_t start, uint16_t end,
                                            const Bytes& uuid) {
    out_ << "[attclient] group found conn=" << static_cast<int>(connection)
         << " start=" << start << " end=" << end
         << " uuid=" << toHex(uuid) << std::endl;
}

void LoggingObserver::onAttclientAttributeFound(uint8_t connection, uint16_t chrdecl,
                                                uint16_t value, uint8_t properties,
                                                const Bytes& uuid) {
    out_ << "[attclient] attribute found conn=" << static_cast<int>(connection)
         << " chrdecl=" << chrdecl << " value=" << value
         << " properties=" << hex8(properties)
         << " uuid=" << toHex(uuid) << std::endl;
}

void LoggingObserver::onAttclientFindInformationFound(uint8_t connection, uint16_t chr_handle,
                                                      const Bytes& uuid) {
    out_ << "[attclient] information found conn=" << static_cast<int>(connection)
         << " handle=" << chr_handle << " uuid=" << toHex(uuid) << std::endl;
}

void LoggingObserver::onAttclientAttributeValue(uint8_t connection, uint16_t att_handle,
                                                uint8_t type, const Bytes& value) {
    out_ << "[attclient] value conn=" << static_cast<int>(connection)
         << " handle=" << att_handle << " type=" << static_cast<int>(type)
         << ": " << toHex(value) << std::endl;
}

void LoggingObserver::onAttclientReadMultipleResponse(uint8_t connection, const Bytes& handles) {
    out_ << "[attclient] read multiple conn=" << static_cast<int>(connection)
         << ": " << toHex(handles) << std::endl;
}

void LoggingObserver::onSmSmpData(uint8_t handle, uint8_t packet, const Bytes& data) {
    out_ << "[sm] smp data handle=" << static_cast<int>(handle)
         << " packet=" << static_cast<int>(packet) << ": " << toHex(data) << std::endl;
}

void LoggingObserver::onSmBondingFail(uint8_t handle, uint16_t result) {
    out_ << "[sm] bonding failed handle=" << static_cast<int>(handle)
         << " result=" << hex16(result) << std::endl;
}

void LoggingObserver::onSmPasskeyDisplay(uint8_t handle, uint32_t passkey) {
    out_ << "[sm] passkey handle=" << static_cast<int>(handle)
         << ": " << std::setfill('0') << std::setw(6) << passkey
         << std::setfill(' ') << std::endl;
}

void LoggingObserver::onSmPasskeyRequest(uint8_t handle) {
    out_ << "[sm] passkey requested handle=" << static_cast<int>(handle) << std::endl;
}

void LoggingObserver::onSmBondStatus(const SmBondStatus& status) {
    out_ << "[sm] bond " << static_cast<int>(status.bond)
         << " keysize=" << static_cast<int>(status.key_size)
         << " mitm=" << static_cast<int>(status.mitm)
         << " keys=" << hex8(status.keys) << std::endl;
}

void LoggingObserver::onGapScanResponse(const GapScanResponse& response) {
    out_ << "[gap] scan response " << response.address.address.toString()
         << " rssi=" << static_cast<int>(response.rssi)
         << " type=" << static_cast<int>(response.packet_type)
         << " data=" << toHex(response.data) << std::endl;
}

void LoggingObserver::onGapModeChanged(uint8_t discover, uint8_t connect) {
    out_ << "[gap] mode changed discover=" << static_cast<int>(discover)
         << " connect=" << static_cast<int>(connect) << std::endl;
}

void LoggingObserver::onHardwareIoPortStatus(const IoPortStatus& status) {
    out_ << "[hardware] port " << static_cast<int>(status.port)
         << " irq=" << hex8(status.irq) << " state=" << hex8(status.state)
         << " at " << status.timestamp << std::endl;
}

void LoggingObserver::onHardwareSoftTimer(uint8_t handle) {
    out_ << "[hardware] soft timer " << static_cast<int>(handle) << std::endl;
}

void LoggingObserver::onHardwareAdcResult(uint8_t input, int16_t value) {
    out_ << "[hardware] adc input " << static_cast<int>(input)
         << " = " << value << std::endl;
}

} // namespace bgapi
