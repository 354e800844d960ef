#include "bled112_driver/bgapi_driver.hpp"
#include <iomanip>
#include <sstream>
#include <vector>

namespace bgapi {

BgapiDriver::BgapiDriver(Observer& observer, const Config& config)
    : config_(config)
    , serial_(std::make_unique<BgapiSerial>(config.serial))
    , transport_(serial_.get())
    , log_handler_(defaultLogHandler)
    , decoder_(observer)
    , dispatcher_(*transport_, [this](LogLevel level, const std::string& message) {
          log(level, message);
      })
    , running_(false)
    , frames_received_(0)
    , responses_(0)
    , events_(0)
    , unknown_events_(0)
    , read_errors_(0)
{
    // The dongle only accepts whole frames
    config_.frame_requests = true;
    dispatcher_.setFrameRequests(true);
}

BgapiDriver::BgapiDriver(Observer& observer, Transport& transport, const Config& config)
    : config_(config)
    , serial_(nullptr)
    , transport_(&transport)
    , log_handler_(defaultLogHandler)
    , decoder_(observer)
    , dispatcher_(*transport_, [this](LogLevel level, const std::string& message) {
          log(level, message);
      })
    , running_(false)
    , frames_received_(0)
    , responses_(0)
    , events_(0)
    , unknown_events_(0)
    , read_errors_(0)
{
    dispatcher_.setFrameRequests(config_.frame_requests);
}

BgapiDriver::~BgapiDriver() {
    disconnect();
}

bool BgapiDriver::connect() {
    if (running_) {
        return true;
    }

    if (serial_) {
        if (!serial_->connect()) {
            last_error_ = serial_->getLastError();
            log(LogLevel::ERROR, last_error_);
            return false;
        }
        log(LogLevel::INFO, "Opened " + config_.serial.device);
    }

    framer_.reset();
    last_error_.clear();
    running_ = true;
    dispatcher_.start();
    reader_thread_ = std::thread(&BgapiDriver::readerLoop, this);

    return true;
}

void BgapiDriver::disconnect() {
    if (!running_ && !reader_thread_.joinable()) {
        return;
    }

    // Writer first: pending callers get errc::aborted instead of a timeout
    dispatcher_.stop();

    running_ = false;
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }

    if (serial_) {
        serial_->disconnect();
        log(LogLevel::INFO, "Closed " + config_.serial.device);
    }
}

boost::system::error_code BgapiDriver::send(uint8_t category, uint8_t command,
                                            const Bytes& payload,
                                            std::chrono::milliseconds timeout,
                                            const SuccessHandler& on_success) {
    if (timeout.count() <= 0) {
        timeout = std::chrono::milliseconds(config_.default_timeout_ms);
    }

    Bytes reply;
    boost::system::error_code ec = dispatcher_.submit(category, command, payload, timeout, reply);
    if (ec) {
        return ec;
    }

    if (on_success) {
        on_success(reply);
    }
    return ec;
}

boost::system::error_code BgapiDriver::send(uint8_t category, uint8_t command,
                                            const Bytes& payload,
                                            const SuccessHandler& on_success) {
    return send(category, command, payload,
                std::chrono::milliseconds(config_.default_timeout_ms), on_success);
}

void BgapiDriver::sendAsync(uint8_t category, uint8_t command, const Bytes& payload,
                            std::chrono::milliseconds timeout,
                            OperationDispatcher::Completion completion) {
    if (timeout.count() <= 0) {
        timeout = std::chrono::milliseconds(config_.default_timeout_ms);
    }
    dispatcher_.submitAsync(category, command, payload, timeout, std::move(completion));
}

void BgapiDriver::setLogHandler(LogHandler handler) {
    log_handler_ = std::move(handler);
}

DriverStats BgapiDriver::stats() const {
    DriverStats s;
    s.frames_received = frames_received_;
    s.responses = responses_;
    s.events = events_;
    s.unknown_events = unknown_events_;
    s.unsolicited_responses = dispatcher_.unsolicitedCount();
    s.completed = dispatcher_.completedCount();
    s.timeouts = dispatcher_.timeoutCount();
    s.mismatches = dispatcher_.mismatchCount();
    s.read_errors = read_errors_;
    s.write_errors = dispatcher_.writeErrorCount();
    return s;
}

void BgapiDriver::readerLoop() {
    std::vector<uint8_t> buffer(config_.read_chunk_size > 0 ? config_.read_chunk_size : 128);
    bool read_failing = false;

    while (running_) {
        boost::system::error_code ec;
        size_t n = transport_->read(buffer.data(), buffer.size(), config_.read_poll_ms, ec);

        if (ec) {
            read_errors_++;
            // Report once per failure streak, keep trying
            if (!read_failing) {
                log(LogLevel::ERROR, "Read failed: " + ec.message());
                read_failing = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.read_poll_ms));
            continue;
        }

        if (read_failing) {
            log(LogLevel::INFO, "Reads recovered");
            read_failing = false;
        }

        if (n > 0) {
            onTransportData(buffer.data(), n);
        }
    }
}

void BgapiDriver::onTransportData(const uint8_t* data, size_t len) {
    framer_.append(data, len);
    while (framer_.hasCompleteFrame()) {
        routeFrame(framer_.takeFrame());
    }
}

void BgapiDriver::routeFrame(Frame frame) {
    frames_received_++;

    if (frame.header.messageKind() == MessageKind::RESPONSE) {
        responses_++;
        dispatcher_.onResponse(std::move(frame));
        return;
    }

    events_++;
    try {
        if (!decoder_.decode(frame.header.category, frame.header.subtype, frame.payload)) {
            unknown_events_++;
            std::stringstream ss;
            ss << "Ignoring unknown event (" << static_cast<int>(frame.header.category)
               << ", " << static_cast<int>(frame.header.subtype) << ")";
            log(LogLevel::DEBUG, ss.str());
        }
    } catch (const std::exception& e) {
        log(LogLevel::ERROR, std::string("Observer threw: ") + e.what());
    }
}

void BgapiDriver::log(LogLevel level, const std::string& message) {
    if (log_handler_) {
        log_handler_(level, message);
    }
}

} // namespace bgapi
