#include "bled112_driver/bgapi_serial.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <thread>
#ifdef __linux__
#include <sys/select.h>
#include <unistd.h>
#include <termios.h>
#include <errno.h>
#include <cstring>
#endif

namespace bgapi {

BgapiSerial::BgapiSerial(const Config& config)
    : config_(config)
    , serial_port_(nullptr)
    , connected_(false)
{
}

BgapiSerial::~BgapiSerial() {
    disconnect();
}

bool BgapiSerial::connect() {
    try {
        serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_);
        serial_port_->open(config_.device);
        
        serial_port_->set_option(boost::asio::serial_port_base::baud_rate(config_.baudrate));
        serial_port_->set_option(boost::asio::serial_port_base::character_size(8));
        serial_port_->set_option(boost::asio::serial_port_base::parity(
            boost::asio::serial_port_base::parity::none));
        serial_port_->set_option(boost::asio::serial_port_base::stop_bits(
            boost::asio::serial_port_base::stop_bits::one));
        serial_port_->set_option(boost::asio::serial_port_base::flow_control(
            boost::asio::serial_port_base::flow_control::none));
        
        #ifdef __linux__
        int fd = serial_port_->native_handle();
        struct termios tio;
        if (tcgetattr(fd, &tio) == 0) {
            // Raw binary link: no line discipline, no echo, no translation
            tio.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG | IEXTEN);
            tio.c_iflag &= ~(IXON | IXOFF | IXANY | INLCR | IGNCR | ICRNL |
                             IGNBRK | BRKINT | PARMRK | ISTRIP);
            tio.c_oflag &= ~OPOST;
            tio.c_cflag &= ~CRTSCTS;
            tio.c_cflag |= CREAD | CLOCAL;
            // select() does the waiting, read() returns what is there
            tio.c_cc[VMIN] = 0;
            tio.c_cc[VTIME] = 0;
            if (tcsetattr(fd, TCSANOW, &tio) != 0) {
                last_error_ = "Failed to configure serial port termios";
                disconnect();
                return false;
            }
        }
        #endif
        
        connected_ = true;
        last_error_.clear();
        
        // The CDC endpoint may still hold bytes from a previous session
        discardInput();
        
        return true;
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to connect: ") + e.what();
        connected_ = false;
        serial_port_.reset();
        return false;
    }
}

void BgapiSerial::disconnect() {
    if (serial_port_ && serial_port_->is_open()) {
        boost::system::error_code ec;
        serial_port_->close(ec);
        if (ec) {
            last_error_ = std::string("Close failed: ") + ec.message();
        }
    }
    serial_port_.reset();
    connected_ = false;
}

size_t BgapiSerial::read(uint8_t* buffer, size_t len, uint32_t timeout_ms,
                         boost::system::error_code& ec) {
    ec.clear();
    if (!connected_ || !serial_port_ || !serial_port_->is_open()) {
        ec = boost::asio::error::not_connected;
        return 0;
    }
    
    #ifdef __linux__
    int fd = serial_port_->native_handle();
    
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(fd, &readfds);
    
    int ret = select(fd + 1, &readfds, NULL, NULL, &tv);
    if (ret < 0) {
        if (errno == EINTR) {
            return 0;
        }
        ec = boost::system::error_code(errno, boost::system::system_category());
        return 0;
    } else if (ret == 0) {
        return 0;  // Nothing within the poll interval
    }
    
    ssize_t n = ::read(fd, buffer, len);
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) {
            return 0;
        }
        ec = boost::system::error_code(errno, boost::system::system_category());
        return 0;
    }
    if (n == 0) {
        // Readable but empty: the device went away (USB unplug)
        ec = boost::asio::error::eof;
        return 0;
    }
    return static_cast<size_t>(n);
    #else
    // Non-Linux: blocking read, timeout_ms is not honoured
    (void)timeout_ms;
    return serial_port_->read_some(boost::asio::buffer(buffer, len), ec);
    #endif
}

boost::system::error_code BgapiSerial::write(const Bytes& data) {
    if (!connected_ || !serial_port_ || !serial_port_->is_open()) {
        return boost::asio::error::not_connected;
    }
    
    #ifdef BLED112_DEBUG_PROTOCOL
    std::cout << "TX: ";
    for (size_t i = 0; i < data.size(); i++) {
        std::cout << "0x" << std::hex << std::setfill('0') << std::setw(2)
                  << static_cast<int>(data[i]) << " ";
    }
    std::cout << std::dec << std::endl;
    #endif
    
    boost::system::error_code ec;
    size_t bytes_written = boost::asio::write(*serial_port_, boost::asio::buffer(data), ec);
    if (ec) {
        return ec;
    }
    if (bytes_written != data.size()) {
        return boost::asio::error::broken_pipe;
    }
    return boost::system::error_code();
}

boost::system::error_code BgapiSerial::flush() {
    if (!serial_port_ || !serial_port_->is_open()) {
        return boost::asio::error::not_connected;
    }
    
    #ifdef __linux__
    if (::tcdrain(serial_port_->native_handle()) != 0) {
        return boost::system::error_code(errno, boost::system::system_category());
    }
    #endif
    return boost::system::error_code();
}

void BgapiSerial::discardInput() {
    if (!serial_port_ || !serial_port_->is_open()) return;
    
    #ifdef __linux__
    ::tcflush(serial_port_->native_handle(), TCIFLUSH);
    #endif
}

} // namespace bgapi
