#include "bled112_driver/types.hpp"
#include <iomanip>
#include <sstream>

namespace bgapi {

constexpr uint8_t ConnectionStatus::FLAG_CONNECTED;
constexpr uint8_t ConnectionStatus::FLAG_ENCRYPTED;
constexpr uint8_t ConnectionStatus::FLAG_COMPLETED;
constexpr uint8_t ConnectionStatus::FLAG_PARAMETERS_CHANGE;

std::string Mac::toString() const {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = bytes.size(); i > 0; i--) {
        ss << std::setw(2) << static_cast<int>(bytes[i - 1]);
        if (i > 1) ss << ":";
    }
    return ss.str();
}

std::string QualifiedMac::hashable() const {
    std::string key(address.bytes.begin(), address.bytes.end());
    key.push_back(static_cast<char>(address_type));
    return key;
}

std::string SystemInfo::toString() const {
    std::stringstream ss;
    ss << major << "." << minor << "." << patch << "-" << build
       << " (ll " << ll_version
       << ", protocol " << static_cast<int>(protocol_version)
       << ", hw " << static_cast<int>(hw) << ")";
    return ss.str();
}

std::string toHex(const Bytes& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < data.size(); i++) {
        if (i > 0) ss << " ";
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

} // namespace bgapi
