#include "bled112_driver/bgapi_commands.hpp"
#include "bled112_driver/bgapi_driver.hpp"
#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/string.hpp>
#include <chrono>
#include <memory>
#include <sstream>

// Forwards dongle events to the ROS logger and publishes scan responses
class RosEventObserver : public bgapi::Observer {
public:
    explicit RosEventObserver(rclcpp::Logger logger) : logger_(logger) {}

    void setPublisher(rclcpp::Publisher<std_msgs::msg::String>::SharedPtr publisher) {
        scan_pub_ = publisher;
    }

    void onSystemBoot(const bgapi::SystemInfo& info) override {
        RCLCPP_INFO(logger_, "Dongle booted: %s", info.toString().c_str());
    }

    void onSystemNoLicenseKey() override {
        RCLCPP_WARN(logger_, "Dongle reports no license key");
    }

    void onConnectionStatus(const bgapi::ConnectionStatus& status) override {
        RCLCPP_INFO(logger_, "Connection %d to %s flags=0x%02x interval=%u",
                    status.connection, status.address.address.toString().c_str(),
                    status.flags, status.conn_interval);
    }

    void onConnectionDisconnected(uint8_t connection, uint16_t reason) override {
        RCLCPP_INFO(logger_, "Connection %d closed, reason 0x%04x", connection, reason);
    }

    void onGapScanResponse(const bgapi::GapScanResponse& response) override {
        // address,address_type,rssi,packet_type,data
        std::stringstream ss;
        ss << response.address.address.toString() << ","
           << static_cast<int>(response.address.address_type) << ","
           << static_cast<int>(response.rssi) << ","
           << static_cast<int>(response.packet_type) << ","
           << bgapi::toHex(response.data);

        RCLCPP_DEBUG(logger_, "Scan response %s", ss.str().c_str());

        if (scan_pub_) {
            std_msgs::msg::String msg;
            msg.data = ss.str();
            scan_pub_->publish(msg);
        }
    }

    void onSmBondingFail(uint8_t handle, uint16_t result) override {
        RCLCPP_WARN(logger_, "Bonding failed on connection %d: 0x%04x", handle, result);
    }

private:
    rclcpp::Logger logger_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr scan_pub_;
};

class Bled112Node : public rclcpp::Node {
public:
    Bled112Node() : Node("bled112"), observer_(this->get_logger()) {
        std::string device = this->declare_parameter<std::string>("device", "/dev/ttyACM0");
        int baudrate = this->declare_parameter<int>("baudrate", 115200);
        int timeout_ms = this->declare_parameter<int>("timeout_ms", 1000);
        bool scan_on_start = this->declare_parameter<bool>("scan_on_start", false);
        int scan_mode = this->declare_parameter<int>("scan_mode", 1);

        bgapi::BgapiDriver::Config config;
        config.serial.device = device;
        config.serial.baudrate = static_cast<unsigned int>(baudrate);
        config.default_timeout_ms = static_cast<uint32_t>(timeout_ms);

        scan_pub_ = this->create_publisher<std_msgs::msg::String>("~/scan_responses", 100);
        observer_.setPublisher(scan_pub_);

        driver_ = std::make_unique<bgapi::BgapiDriver>(observer_, config);
        rclcpp::Logger logger = this->get_logger();
        driver_->setLogHandler([logger](bgapi::LogLevel level, const std::string& message) {
            switch (level) {
                case bgapi::LogLevel::DEBUG: RCLCPP_DEBUG(logger, "%s", message.c_str()); break;
                case bgapi::LogLevel::INFO:  RCLCPP_INFO(logger, "%s", message.c_str()); break;
                case bgapi::LogLevel::WARN:  RCLCPP_WARN(logger, "%s", message.c_str()); break;
                case bgapi::LogLevel::ERROR: RCLCPP_ERROR(logger, "%s", message.c_str()); break;
            }
        });
        commands_ = std::make_unique<bgapi::BgapiCommands>(*driver_);

        RCLCPP_INFO(this->get_logger(), "Connecting to %s at %d baud", device.c_str(), baudrate);
        if (!driver_->connect()) {
            RCLCPP_ERROR(this->get_logger(), "Failed to connect: %s", driver_->getLastError().c_str());
            throw std::runtime_error("Failed to connect to BLED112");
        }

        boost::system::error_code ec = commands_->systemHello();
        if (ec) {
            RCLCPP_ERROR(this->get_logger(), "Dongle not answering: %s", ec.message().c_str());
            throw std::runtime_error("BLED112 not answering");
        }

        bgapi::Mac address;
        if (!commands_->systemAddressGet(address)) {
            RCLCPP_INFO(this->get_logger(), "Dongle address: %s", address.toString().c_str());
        }
        bgapi::SystemInfo info;
        ec = commands_->systemGetInfo(info);
        if (ec) {
            RCLCPP_WARN(this->get_logger(), "get_info failed: %s", ec.message().c_str());
        } else {
            RCLCPP_INFO(this->get_logger(), "Firmware: %s", info.toString().c_str());
        }

        if (scan_on_start) {
            startScan(static_cast<uint8_t>(scan_mode));
        }

        // Keepalive: a hello every few seconds surfaces a dongle that went away
        keepalive_timer_ = this->create_wall_timer(
            std::chrono::seconds(5),
            std::bind(&Bled112Node::keepalive, this)
        );
    }

    ~Bled112Node() {
        if (driver_) {
            if (scanning_) {
                uint16_t result = 0;
                boost::system::error_code ec = commands_->gapEndProcedure(result);
                if (ec) {
                    RCLCPP_WARN(this->get_logger(), "end_procedure failed: %s", ec.message().c_str());
                }
            }
            driver_->disconnect();
        }
    }

private:
    void startScan(uint8_t mode) {
        uint16_t result = 0;
        boost::system::error_code ec = commands_->gapDiscover(mode, result);
        if (ec) {
            RCLCPP_ERROR(this->get_logger(), "discover failed: %s", ec.message().c_str());
            return;
        }
        if (result != 0) {
            RCLCPP_ERROR(this->get_logger(), "discover rejected by dongle: 0x%04x", result);
            return;
        }
        scanning_ = true;
        RCLCPP_INFO(this->get_logger(), "Scanning (mode %d), publishing on %s",
                    mode, scan_pub_->get_topic_name());
    }

    void keepalive() {
        boost::system::error_code ec = commands_->systemHello();
        if (ec) {
            RCLCPP_WARN_THROTTLE(this->get_logger(), *this->get_clock(), 30000,
                "Dongle not answering: %s", ec.message().c_str());
        }

        bgapi::DriverStats stats = driver_->stats();
        RCLCPP_DEBUG(this->get_logger(),
            "frames=%llu events=%llu responses=%llu timeouts=%llu mismatches=%llu read_errors=%llu",
            static_cast<unsigned long long>(stats.frames_received),
            static_cast<unsigned long long>(stats.events),
            static_cast<unsigned long long>(stats.responses),
            static_cast<unsigned long long>(stats.timeouts),
            static_cast<unsigned long long>(stats.mismatches),
            static_cast<unsigned long long>(stats.read_errors));
    }

    RosEventObserver observer_;
    std::unique_ptr<bgapi::BgapiDriver> driver_;
    std::unique_ptr<bgapi::BgapiCommands> commands_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr scan_pub_;
    rclcpp::TimerBase::SharedPtr keepalive_timer_;
    bool scanning_ = false;
};

int main(int argc, char** argv) {
    rclcpp::init(argc, argv);

    try {
        auto node = std::make_shared<Bled112Node>();
        rclcpp::spin(node);
    } catch (const std::exception& e) {
        RCLCPP_ERROR(rclcpp::get_logger("bled112"), "Exception: %s", e.what());
        return 1;
    }

    rclcpp::shutdown();
    return 0;
}
