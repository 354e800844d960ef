#ifndef BLED112_DRIVER_BGAPI_DRIVER_HPP
#define BLED112_DRIVER_BGAPI_DRIVER_HPP

#include "bgapi_serial.hpp"
#include "errors.hpp"
#include "event_decoder.hpp"
#include "frame_codec.hpp"
#include "log.hpp"
#include "observer.hpp"
#include "operation_dispatcher.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace bgapi {

// Snapshot of driver counters
struct DriverStats {
    uint64_t frames_received = 0;
    uint64_t responses = 0;
    uint64_t events = 0;
    uint64_t unknown_events = 0;
    uint64_t unsolicited_responses = 0;
    uint64_t completed = 0;
    uint64_t timeouts = 0;
    uint64_t mismatches = 0;
    uint64_t read_errors = 0;
    uint64_t write_errors = 0;
};

/**
 * @brief Host-side BGAPI driver for a BLED112 dongle
 *
 * Runs two threads while connected:
 * - reader: transport reads -> FrameReader -> responses to the dispatcher,
 *   events to the EventDecoder (and from there to the Observer)
 * - writer: the OperationDispatcher, one command in flight at a time
 *
 * send() is the primitive the command layer (BgapiCommands) is built on.
 */
class BgapiDriver {
public:
    struct Config {
        BgapiSerial::Config serial;
        uint32_t default_timeout_ms;
        uint32_t read_poll_ms;     // Reader wakes at least this often to see shutdown
        size_t read_chunk_size;
        bool frame_requests;       // Write requests as whole frames, header included

        Config() : default_timeout_ms(1000), read_poll_ms(100), read_chunk_size(128),
                   frame_requests(false) {}
    };

    using SuccessHandler = std::function<void(const Bytes& payload)>;

    // Talks to the serial device named in config.serial; requests are always framed
    explicit BgapiDriver(Observer& observer, const Config& config = Config());
    // Talks over a caller-owned transport that outlives the driver
    BgapiDriver(Observer& observer, Transport& transport, const Config& config = Config());
    ~BgapiDriver();

    BgapiDriver(const BgapiDriver&) = delete;
    BgapiDriver& operator=(const BgapiDriver&) = delete;

    // Connection
    bool connect();
    void disconnect();
    bool isConnected() const { return running_; }

    /**
     * @brief Send one command and wait for its response
     * @param on_success Called with the response payload, on the caller's thread
     * @return Empty on success; errc::timeout, errc::protocol_mismatch,
     *         errc::transport_write_failure, errc::not_connected or errc::aborted
     */
    boost::system::error_code send(uint8_t category, uint8_t command, const Bytes& payload,
                                   std::chrono::milliseconds timeout,
                                   const SuccessHandler& on_success = SuccessHandler());

    // Same, with the configured default timeout
    boost::system::error_code send(uint8_t category, uint8_t command, const Bytes& payload,
                                   const SuccessHandler& on_success = SuccessHandler());

    // Completion runs on the writer thread; it may call disconnect() but not send()
    void sendAsync(uint8_t category, uint8_t command, const Bytes& payload,
                   std::chrono::milliseconds timeout, OperationDispatcher::Completion completion);

    // Must be set before connect()
    void setLogHandler(LogHandler handler);

    DriverStats stats() const;
    std::string getLastError() const { return last_error_; }
    const Config& getConfig() const { return config_; }

private:
    void readerLoop();
    void onTransportData(const uint8_t* data, size_t len);
    void routeFrame(Frame frame);
    void log(LogLevel level, const std::string& message);

    Config config_;
    std::unique_ptr<BgapiSerial> serial_;   // Set when the driver owns the port
    Transport* transport_;
    LogHandler log_handler_;

    FrameReader framer_;
    EventDecoder decoder_;
    OperationDispatcher dispatcher_;

    std::thread reader_thread_;
    std::atomic<bool> running_;
    std::string last_error_;

    std::atomic<uint64_t> frames_received_;
    std::atomic<uint64_t> responses_;
    std::atomic<uint64_t> events_;
    std::atomic<uint64_t> unknown_events_;
    std::atomic<uint64_t> read_errors_;
};

} // namespace bgapi

#endif // BLED112_DRIVER_BGAPI_DRIVER_HPP
