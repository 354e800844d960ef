#ifndef BLED112_DRIVER_BGAPI_SERIAL_HPP
#define BLED112_DRIVER_BGAPI_SERIAL_HPP

#include "transport.hpp"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <boost/asio.hpp>

namespace bgapi {

/**
 * @brief Serial link to a BLED112 dongle
 *
 * The dongle enumerates as a USB CDC device (/dev/ttyACM*). Baud rate is
 * nominal for CDC but is still applied for UART-attached BLE112 modules.
 */
class BgapiSerial : public Transport {
public:
    struct Config {
        std::string device;
        unsigned int baudrate;
        
        Config() : device("/dev/ttyACM0"), baudrate(115200) {}
    };

    explicit BgapiSerial(const Config& config = Config());
    ~BgapiSerial() override;

    // Connection management
    bool connect();
    void disconnect();
    bool isConnected() const { return connected_; }

    // Transport
    size_t read(uint8_t* buffer, size_t len, uint32_t timeout_ms,
                boost::system::error_code& ec) override;
    boost::system::error_code write(const Bytes& data) override;
    boost::system::error_code flush() override;

    // Drop anything the dongle sent before we were listening
    void discardInput();
    
    std::string getLastError() const { return last_error_; }
    const Config& getConfig() const { return config_; }

private:
    Config config_;
    boost::asio::io_context io_context_;
    std::unique_ptr<boost::asio::serial_port> serial_port_;
    bool connected_;
    std::string last_error_;
};

} // namespace bgapi

#endif // BLED112_DRIVER_BGAPI_SERIAL_HPP
