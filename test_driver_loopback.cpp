#include "bled112_driver/bgapi_commands.hpp"
#include "bled112_driver/bgapi_driver.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using bgapi::Bytes;
using bgapi::MessageKind;
using namespace std::chrono_literals;

// Records events from the reader thread
class EventLog : public bgapi::Observer {
public:
    void onSystemBoot(const bgapi::SystemInfo& info) override {
        record("boot " + std::to_string(info.major) + "." + std::to_string(info.minor));
    }
    void onSystemEndpointWatermarkRx(uint8_t endpoint, uint8_t data) override {
        record("watermark_rx " + std::to_string(endpoint) + " " + std::to_string(data));
    }
    void onGapScanResponse(const bgapi::GapScanResponse& response) override {
        if (throw_on_scan) {
            throw std::runtime_error("observer failure");
        }
        record("scan " + response.address.address.toString());
    }
    void onGapModeChanged(uint8_t discover, uint8_t connect) override {
        record("mode " + std::to_string(discover) + " " + std::to_string(connect));
    }

    std::vector<std::string> events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    bool waitFor(size_t n, std::chrono::milliseconds timeout = 1000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (events().size() >= n) return true;
            std::this_thread::sleep_for(2ms);
        }
        return events().size() >= n;
    }

    std::atomic<bool> throw_on_scan{false};

private:
    void record(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::mutex mutex_;
    std::vector<std::string> events_;
};

struct LogCapture {
    std::mutex mutex;
    std::vector<std::pair<bgapi::LogLevel, std::string>> lines;

    bgapi::LogHandler handler() {
        return [this](bgapi::LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.emplace_back(level, message);
        };
    }

    int count(bgapi::LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex);
        int n = 0;
        for (const auto& line : lines) {
            if (line.first == level) n++;
        }
        return n;
    }
};

static bgapi::BgapiDriver::Config testConfig() {
    bgapi::BgapiDriver::Config config;
    config.read_poll_ms = 10;
    return config;
}

static Bytes concat(const Bytes& a, const Bytes& b) {
    Bytes out = a;
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

// Answers every request with an empty response of the same class/command
static Bytes echoResponse(const Bytes& request) {
    return bgapi::encodeFrame(MessageKind::RESPONSE, request[0], request[1], {});
}

static void testHello() {
    std::cout << "\n=== Hello through the driver ===" << std::endl;

    FakeTransport transport;
    transport.setResponder(echoResponse);
    EventLog observer;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    bgapi::BgapiCommands commands(driver);

    check(commands.systemHello() == bgapi::make_error_code(bgapi::errc::not_connected),
          "send before connect -> not_connected");

    check(driver.connect(), "connect over an external transport");
    check(driver.isConnected(), "connected");

    boost::system::error_code ec = commands.systemHello();
    check(!ec, "system_hello succeeds");
    check(transport.writes().back() == Bytes({0x00, 0x01}), "hello written as [0, 1]");

    bool called = false;
    ec = driver.send(0, 1, Bytes(), [&](const Bytes& payload) {
        called = payload.empty();
    });
    check(!ec && called, "send runs the success handler with the payload");

    bgapi::DriverStats stats = driver.stats();
    check(stats.responses == 2 && stats.completed == 2, "responses and completions counted");

    driver.disconnect();
    check(!driver.isConnected(), "disconnected");
    check(commands.systemHello() == bgapi::make_error_code(bgapi::errc::not_connected),
          "send after disconnect -> not_connected");
}

static void testEventThenResponseInOneRead() {
    std::cout << "\n=== Event and response in one read ===" << std::endl;

    FakeTransport transport;
    // Boot-style event immediately followed by the reply, one chunk
    transport.setResponder([](const Bytes& request) {
        Bytes event = bgapi::encodeFrame(MessageKind::EVENT, 6, 1, {0x02, 0x02});
        return concat(event, bgapi::encodeFrame(MessageKind::RESPONSE, request[0], request[1], {0x00, 0x00}));
    });
    EventLog observer;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    bgapi::BgapiCommands commands(driver);
    driver.connect();

    uint16_t result = 0xFFFF;
    boost::system::error_code ec = commands.gapSetMode(2, 2, result);
    check(!ec && result == 0, "gap_set_mode completes with result 0");

    std::vector<std::string> events = observer.events();
    check(events.size() == 1 && events[0] == "mode 2 2", "event delivered before the command returned");

    driver.disconnect();
}

static void testMultiFrameRead() {
    std::cout << "\n=== Several frames in one read ===" << std::endl;

    FakeTransport transport;
    EventLog observer;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    driver.connect();

    Bytes first = bgapi::encodeFrame(MessageKind::EVENT, 0, 2, {0x05, 0x7F});
    Bytes second = bgapi::encodeFrame(MessageKind::EVENT, 6, 0,
                                      {0xC4, 0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x00, 0xFF, 0x00});
    transport.inject(concat(first, second));

    check(observer.waitFor(2), "both frames dispatched");
    std::vector<std::string> events = observer.events();
    check(events.size() == 2 && events[0] == "watermark_rx 5 127" && events[1] == "scan 66:55:44:33:22:11",
          "dispatched in arrival order");

    // A frame split over two reads
    Bytes third = bgapi::encodeFrame(MessageKind::EVENT, 0, 2, {0x01, 0x02});
    transport.inject(Bytes(third.begin(), third.begin() + 3));
    std::this_thread::sleep_for(30ms);
    check(observer.events().size() == 2, "half a frame is held back");
    transport.inject(Bytes(third.begin() + 3, third.end()));
    check(observer.waitFor(3), "completed by the next read");

    bgapi::DriverStats stats = driver.stats();
    check(stats.frames_received == 3 && stats.events == 3, "frame and event counters");

    driver.disconnect();
}

static void testUnknownAndFailingEvents() {
    std::cout << "\n=== Unknown events and observer failures ===" << std::endl;

    FakeTransport transport;
    EventLog observer;
    LogCapture logs;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    driver.setLogHandler(logs.handler());
    driver.connect();

    transport.inject(bgapi::encodeFrame(MessageKind::EVENT, 0x42, 0x01, {0x00}));
    observer.throw_on_scan = true;
    transport.inject(bgapi::encodeFrame(MessageKind::EVENT, 6, 0,
                                        {0xC4, 0x00, 1, 2, 3, 4, 5, 6, 0x00, 0xFF, 0x00}));
    transport.inject(bgapi::encodeFrame(MessageKind::EVENT, 0, 2, {0x09, 0x01}));

    check(observer.waitFor(1), "reader survives an unknown event and a throwing observer");
    check(observer.events()[0] == "watermark_rx 9 1", "later event still delivered");
    check(driver.stats().unknown_events == 1, "unknown event counted");
    check(logs.count(bgapi::LogLevel::ERROR) >= 1, "observer exception logged");

    driver.disconnect();
}

static void testUnsolicitedResponse() {
    std::cout << "\n=== Unsolicited response ===" << std::endl;

    FakeTransport transport;
    EventLog observer;
    LogCapture logs;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    driver.setLogHandler(logs.handler());
    driver.connect();

    transport.inject(bgapi::encodeFrame(MessageKind::RESPONSE, 0, 1, {}));
    for (int i = 0; i < 100 && driver.stats().unsolicited_responses == 0; i++) {
        std::this_thread::sleep_for(5ms);
    }
    check(driver.stats().unsolicited_responses == 1, "stray response dropped and counted");
    check(logs.count(bgapi::LogLevel::WARN) >= 1, "stray response logged");

    transport.setResponder(echoResponse);
    bgapi::BgapiCommands commands(driver);
    check(!commands.systemHello(), "driver still usable");

    driver.disconnect();
}

static void testReadFailures() {
    std::cout << "\n=== Read failures ===" << std::endl;

    FakeTransport transport;
    EventLog observer;
    LogCapture logs;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    driver.setLogHandler(logs.handler());
    driver.connect();

    transport.setFailReads(true);
    std::this_thread::sleep_for(100ms);
    uint64_t errors = driver.stats().read_errors;
    check(errors >= 2, "every failed read counted");
    check(logs.count(bgapi::LogLevel::ERROR) == 1, "one error log per failure streak");

    transport.setFailReads(false);
    transport.inject(bgapi::encodeFrame(MessageKind::EVENT, 0, 2, {0x03, 0x04}));
    check(observer.waitFor(1), "events flow again once reads recover");

    driver.disconnect();
}

static void testTimeoutAndAbort() {
    std::cout << "\n=== Timeout and shutdown ===" << std::endl;

    FakeTransport transport;
    EventLog observer;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    driver.setLogHandler([](bgapi::LogLevel, const std::string&) {});
    driver.connect();

    boost::system::error_code ec = driver.send(0, 1, Bytes(), 30ms);
    check(ec == bgapi::make_error_code(bgapi::errc::timeout), "unanswered send times out");
    check(driver.stats().timeouts == 1, "timeout counted");

    std::promise<boost::system::error_code> outcome;
    driver.sendAsync(0, 1, Bytes(), 10000ms, [&](const boost::system::error_code& e, const Bytes&) {
        outcome.set_value(e);
    });
    transport.waitForWrites(2);
    driver.disconnect();

    auto future = outcome.get_future();
    check(future.wait_for(0s) == std::future_status::ready &&
          future.get() == bgapi::make_error_code(bgapi::errc::aborted), "disconnect aborts the pending send");
}

static void testSystemReset() {
    std::cout << "\n=== system_reset ===" << std::endl;

    FakeTransport transport;
    // The dongle reboots instead of replying, then announces itself
    transport.setResponder([](const Bytes&) {
        return bgapi::encodeFrame(MessageKind::EVENT, 0, 0,
                                  {0x01, 0x00, 0x03, 0x00, 0x00, 0x00, 0x2A, 0x00, 0x03, 0x00, 0x03, 0x01});
    });
    EventLog observer;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    driver.setLogHandler([](bgapi::LogLevel, const std::string&) {});
    bgapi::BgapiCommands commands(driver);
    driver.connect();

    boost::system::error_code ec = commands.systemReset(false);
    check(!ec, "unanswered reset is a success");
    check(transport.writes().back() == Bytes({0x00, 0x00, 0x00}), "reset written as [0, 0, boot_in_dfu]");
    check(observer.waitFor(1) && observer.events()[0] == "boot 1.3", "boot event observed");

    driver.disconnect();
}

static void testRequestFraming() {
    std::cout << "\n=== Request layout ===" << std::endl;

    // Reply to a framed request: class and command follow the 4 header bytes
    auto framedEcho = [](const Bytes& request) {
        return bgapi::encodeFrame(MessageKind::RESPONSE, request[2], request[3], {0x00, 0x00});
    };

    {
        FakeTransport transport;
        transport.setResponder([](const Bytes& request) {
            return bgapi::encodeFrame(MessageKind::RESPONSE, request[0], request[1], {0x00, 0x00});
        });
        EventLog observer;
        bgapi::BgapiDriver driver(observer, transport, testConfig());
        bgapi::BgapiCommands commands(driver);
        driver.connect();

        uint16_t result = 0xFFFF;
        check(!commands.gapDiscover(1, result) && result == 0, "bare request answered");
        check(transport.writes().back() == Bytes({0x06, 0x02, 0x01}), "default layout is [class, command, payload]");
        driver.disconnect();
    }

    {
        FakeTransport transport;
        transport.setResponder(framedEcho);
        EventLog observer;
        bgapi::BgapiDriver::Config config = testConfig();
        config.frame_requests = true;
        bgapi::BgapiDriver driver(observer, transport, config);
        bgapi::BgapiCommands commands(driver);
        driver.connect();

        uint16_t result = 0xFFFF;
        check(!commands.gapDiscover(1, result) && result == 0, "framed request answered");
        check(transport.writes().back() == Bytes({0x01, 0x00, 0x06, 0x02, 0x01}),
              "framed layout adds the 4-byte header");
        check(!commands.systemHello(), "framed hello answered");
        check(transport.writes().back() == Bytes({0x00, 0x00, 0x00, 0x01}), "empty payload gives length 0");
        driver.disconnect();
    }
}

static void testDisconnectFromCompletion() {
    std::cout << "\n=== Disconnect from a completion ===" << std::endl;

    FakeTransport transport;
    transport.setResponder(echoResponse);
    EventLog observer;
    bgapi::BgapiDriver driver(observer, transport, testConfig());
    driver.setLogHandler([](bgapi::LogLevel, const std::string&) {});
    driver.connect();

    std::promise<boost::system::error_code> outcome;
    driver.sendAsync(0, 1, Bytes(), 1000ms, [&](const boost::system::error_code& e, const Bytes&) {
        driver.disconnect();
        outcome.set_value(e);
    });

    auto future = outcome.get_future();
    check(future.wait_for(2s) == std::future_status::ready && !future.get(),
          "completion may disconnect the driver");
    check(!driver.isConnected(), "driver disconnected");
    check(driver.send(0, 1, Bytes()) == bgapi::make_error_code(bgapi::errc::not_connected),
          "send after disconnect -> not_connected");

    check(driver.connect(), "reconnects");
    bgapi::BgapiCommands commands(driver);
    check(!commands.systemHello(), "reconnected driver works");
    driver.disconnect();
}

int main() {
    std::cout << "=== Driver loopback tests ===" << std::endl;

    testHello();
    testEventThenResponseInOneRead();
    testMultiFrameRead();
    testUnknownAndFailingEvents();
    testUnsolicitedResponse();
    testReadFailures();
    testTimeoutAndAbort();
    testSystemReset();
    testRequestFraming();
    testDisconnectFromCompletion();

    std::cout << "\n" << (g_failures == 0 ? "All checks passed" : "FAILURES: " + std::to_string(g_failures))
              << std::endl;
    return g_failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
