#ifndef BLED112_DRIVER_TYPES_HPP
#define BLED112_DRIVER_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace bgapi {

using Bytes = std::vector<uint8_t>;

// Bluetooth device address, stored in wire (little-endian) order
struct Mac {
    std::array<uint8_t, 6> bytes{};

    // "aa:bb:cc:dd:ee:ff", most significant byte first
    std::string toString() const;

    bool operator==(const Mac& other) const { return bytes == other.bytes; }
    bool operator!=(const Mac& other) const { return bytes != other.bytes; }
    bool operator<(const Mac& other) const { return bytes < other.bytes; }
};

// Address qualified by its BLE address type (0=public, 1=random)
struct QualifiedMac {
    Mac address;
    uint8_t address_type = 0;

    // Key suitable for maps: address followed by type
    std::string hashable() const;
};

struct ConnectionParameters {
    uint16_t interval_min = 0;   // 1.25 ms units
    uint16_t interval_max = 0;   // 1.25 ms units
    uint16_t timeout = 0;        // 10 ms units
    uint16_t latency = 0;        // connection events
};

struct SystemCounters {
    uint8_t tx_ok = 0;
    uint8_t tx_retry = 0;
    uint8_t rx_ok = 0;
    uint8_t rx_fail = 0;
    uint8_t mbuf = 0;
};

struct SystemInfo {
    uint16_t major = 0;
    uint16_t minor = 0;
    uint16_t patch = 0;
    uint16_t build = 0;
    uint16_t ll_version = 0;
    uint8_t protocol_version = 0;
    uint8_t hw = 0;

    std::string toString() const;
};

struct ConnectionStatus {
    uint8_t connection = 0;
    uint8_t flags = 0;
    QualifiedMac address;
    uint16_t conn_interval = 0;
    uint16_t timeout = 0;
    uint16_t latency = 0;
    uint8_t bonding = 0;

    // Connection status flag bits
    static constexpr uint8_t FLAG_CONNECTED = 0x01;
    static constexpr uint8_t FLAG_ENCRYPTED = 0x02;
    static constexpr uint8_t FLAG_COMPLETED = 0x04;
    static constexpr uint8_t FLAG_PARAMETERS_CHANGE = 0x08;

    bool isConnected() const { return (flags & FLAG_CONNECTED) != 0; }
};

struct ConnectionVersionIndication {
    uint8_t connection = 0;
    uint8_t version = 0;
    uint16_t comp_id = 0;
    uint16_t sub_version = 0;
};

struct SmBondStatus {
    uint8_t bond = 0;
    uint8_t key_size = 0;
    uint8_t mitm = 0;
    uint8_t keys = 0;
};

struct GapScanResponse {
    int8_t rssi = 0;
    uint8_t packet_type = 0;
    QualifiedMac address;
    uint8_t bond = 0;
    Bytes data;
};

struct SpiConfig {
    uint8_t polarity = 0;
    uint8_t phase = 0;
    uint8_t bit_order = 0;
    uint8_t baud_e = 0;
    uint8_t baud_m = 0;
};

struct IoPortStatus {
    uint32_t timestamp = 0;
    uint8_t port = 0;
    uint8_t irq = 0;
    uint8_t state = 0;
};

// Hex dump helper shared by the tools and the logging observer
std::string toHex(const Bytes& data);

} // namespace bgapi

#endif // BLED112_DRIVER_TYPES_HPP
