#include "bled112_driver/operation_dispatcher.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using bgapi::Bytes;
using bgapi::Frame;
using bgapi::FrameHeader;
using bgapi::MessageKind;
using bgapi::OperationDispatcher;
using namespace std::chrono_literals;

static Frame response(uint8_t category, uint8_t command, const Bytes& payload = Bytes()) {
    Frame frame;
    frame.header = FrameHeader::make(MessageKind::RESPONSE, category, command,
                                     static_cast<uint16_t>(payload.size()));
    frame.payload = payload;
    return frame;
}

// Collects log lines so tests can look for them
struct LogSink {
    std::mutex mutex;
    std::vector<std::pair<bgapi::LogLevel, std::string>> lines;

    bgapi::LogHandler handler() {
        return [this](bgapi::LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.emplace_back(level, message);
        };
    }

    bool has(bgapi::LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& line : lines) {
            if (line.first == level) return true;
        }
        return false;
    }
};

static void testHelloRoundTrip() {
    std::cout << "\n=== Round trip ===" << std::endl;

    FakeTransport transport;
    OperationDispatcher dispatcher(transport);
    dispatcher.start();

    // Answer as soon as the request is on the wire
    std::thread responder([&] {
        if (transport.waitForWrites(1)) {
            dispatcher.onResponse(response(0, 1));
        }
    });

    Bytes reply{0xEE};
    boost::system::error_code ec = dispatcher.submit(0, 1, Bytes(), 1000ms, reply);
    responder.join();

    check(!ec, "hello succeeds");
    check(reply.empty(), "empty reply payload");
    check(transport.writes().size() == 1 && transport.writes()[0] == Bytes({0x00, 0x01}),
          "request written as [class, command]");
    check(dispatcher.completedCount() == 1, "completed counter");

    // Payload bytes follow class and command
    std::thread responder2([&] {
        if (transport.waitForWrites(2)) {
            dispatcher.onResponse(response(0, 4, {0x34, 0x12, 0x7F}));
        }
    });
    ec = dispatcher.submit(0, 4, {0x34, 0x12}, 1000ms, reply);
    responder2.join();
    check(!ec && reply == Bytes({0x34, 0x12, 0x7F}), "reply payload handed back");
    check(transport.writes()[1] == Bytes({0x00, 0x04, 0x34, 0x12}), "payload follows the routing bytes");

    dispatcher.stop();
}

static void testTimeout() {
    std::cout << "\n=== Timeout ===" << std::endl;

    FakeTransport transport;
    LogSink sink;
    OperationDispatcher dispatcher(transport, sink.handler());
    dispatcher.start();

    Bytes reply;
    auto started = std::chrono::steady_clock::now();
    boost::system::error_code ec = dispatcher.submit(0, 1, Bytes(), 50ms, reply);
    auto waited = std::chrono::steady_clock::now() - started;

    check(ec == bgapi::make_error_code(bgapi::errc::timeout), "no response -> timeout");
    check(waited >= 50ms, "waited out the timeout");
    check(dispatcher.timeoutCount() == 1, "timeout counter");
    check(sink.has(bgapi::LogLevel::WARN), "timeout logged as a warning");

    // The slot is free again
    std::thread responder([&] {
        if (transport.waitForWrites(2)) {
            dispatcher.onResponse(response(0, 1));
        }
    });
    ec = dispatcher.submit(0, 1, Bytes(), 1000ms, reply);
    responder.join();
    check(!ec, "next submit after a timeout succeeds");

    dispatcher.stop();
}

static void testMismatch() {
    std::cout << "\n=== Mismatch ===" << std::endl;

    FakeTransport transport;
    OperationDispatcher dispatcher(transport, [](bgapi::LogLevel, const std::string&) {});
    dispatcher.start();

    std::thread responder([&] {
        if (transport.waitForWrites(1)) {
            dispatcher.onResponse(response(0, 2));
        }
    });

    Bytes reply;
    boost::system::error_code ec = dispatcher.submit(0, 1, Bytes(), 1000ms, reply);
    responder.join();

    check(ec == bgapi::make_error_code(bgapi::errc::protocol_mismatch), "(0, 2) answering (0, 1) is a mismatch");
    check(ec.category() == bgapi::bgapi_category(), "error in the bgapi category");
    check(dispatcher.mismatchCount() == 1, "mismatch counter");

    dispatcher.stop();
}

static void testUnsolicited() {
    std::cout << "\n=== Unsolicited response ===" << std::endl;

    FakeTransport transport;
    LogSink sink;
    OperationDispatcher dispatcher(transport, sink.handler());
    dispatcher.start();

    dispatcher.onResponse(response(0, 1));

    // Give the writer time to drain it
    for (int i = 0; i < 100 && dispatcher.unsolicitedCount() == 0; i++) {
        std::this_thread::sleep_for(5ms);
    }
    check(dispatcher.unsolicitedCount() == 1, "stray response counted");
    check(sink.has(bgapi::LogLevel::WARN), "stray response logged");
    check(transport.writeCount() == 0, "nothing written");

    std::thread responder([&] {
        if (transport.waitForWrites(1)) {
            dispatcher.onResponse(response(0, 8, {0x01}));
        }
    });
    Bytes reply;
    boost::system::error_code ec = dispatcher.submit(0, 8, Bytes(), 1000ms, reply);
    responder.join();
    check(!ec && reply == Bytes({0x01}), "subsequent submit still works");
    check(dispatcher.unsolicitedCount() == 1, "real response not counted as stray");

    dispatcher.stop();
}

static void testSerializedWrites() {
    std::cout << "\n=== One request in flight ===" << std::endl;

    FakeTransport transport;
    OperationDispatcher dispatcher(transport);
    dispatcher.start();

    // Echo every request back after a delay, only from the outside
    std::atomic<bool> done(false);
    std::thread responder([&] {
        size_t answered = 0;
        while (!done) {
            if (transport.waitForWrites(answered + 1, 50)) {
                // A second request must not appear before this one is answered
                std::this_thread::sleep_for(20ms);
                Bytes request = transport.writes()[answered];
                dispatcher.onResponse(response(request[0], request[1]));
                answered++;
            }
        }
    });

    const int callers = 4;
    std::vector<std::thread> threads;
    std::atomic<int> successes(0);
    for (int i = 0; i < callers; i++) {
        threads.emplace_back([&, i] {
            Bytes reply;
            boost::system::error_code ec = dispatcher.submit(0, static_cast<uint8_t>(i + 1), Bytes(), 1000ms, reply);
            if (!ec) successes++;
        });
    }

    // While the first request is outstanding, only it has been written
    transport.waitForWrites(1);
    std::this_thread::sleep_for(3ms);
    check(transport.writeCount() == 1, "second write waits for the first response");

    for (auto& t : threads) {
        t.join();
    }
    done = true;
    responder.join();

    check(successes == callers, "every concurrent caller completes");
    check(transport.writeCount() == static_cast<size_t>(callers), "one write per caller");
    check(transport.overlappingWrites() == 0, "writes never interleave");

    dispatcher.stop();
}

static void testFifo() {
    std::cout << "\n=== FIFO order ===" << std::endl;

    FakeTransport transport;
    OperationDispatcher dispatcher(transport);
    transport.setResponder([](const Bytes& request) {
        return bgapi::encodeFrame(MessageKind::RESPONSE, request[0], request[1], {});
    });
    dispatcher.start();

    // The fake transport queues replies for read(); pump them into the dispatcher
    std::atomic<bool> done(false);
    std::thread reader([&] {
        bgapi::FrameReader framer;
        uint8_t buffer[64];
        while (!done) {
            boost::system::error_code ec;
            size_t n = transport.read(buffer, sizeof(buffer), 10, ec);
            framer.append(buffer, n);
            while (framer.hasCompleteFrame()) {
                dispatcher.onResponse(framer.takeFrame());
            }
        }
    });

    std::mutex order_mutex;
    std::vector<int> order;
    std::promise<void> all_done;
    std::atomic<int> remaining(5);
    for (int i = 0; i < 5; i++) {
        dispatcher.submitAsync(2, static_cast<uint8_t>(i), Bytes(), 1000ms,
            [&, i](const boost::system::error_code&, const Bytes&) {
                {
                    std::lock_guard<std::mutex> lock(order_mutex);
                    order.push_back(i);
                }
                if (--remaining == 0) {
                    all_done.set_value();
                }
            });
    }

    bool finished = all_done.get_future().wait_for(2s) == std::future_status::ready;
    done = true;
    reader.join();

    check(finished, "all async submissions complete");
    check(order == std::vector<int>({0, 1, 2, 3, 4}), "completed in submission order");

    dispatcher.stop();
}

static void testWriteFailure() {
    std::cout << "\n=== Write failure ===" << std::endl;

    FakeTransport transport;
    LogSink sink;
    OperationDispatcher dispatcher(transport, sink.handler());
    dispatcher.start();
    transport.setFailWrites(true);

    Bytes reply;
    auto started = std::chrono::steady_clock::now();
    boost::system::error_code ec = dispatcher.submit(0, 1, Bytes(), 1000ms, reply);
    auto waited = std::chrono::steady_clock::now() - started;

    check(ec == bgapi::make_error_code(bgapi::errc::transport_write_failure), "write failure reported");
    check(waited < 500ms, "reported immediately, not after the timeout");
    check(dispatcher.writeErrorCount() == 1 && dispatcher.timeoutCount() == 0, "counted as a write error");
    check(sink.has(bgapi::LogLevel::ERROR), "logged as an error");

    // A late response for the failed request finds nothing armed
    transport.setFailWrites(false);
    dispatcher.onResponse(response(0, 1));
    for (int i = 0; i < 100 && dispatcher.unsolicitedCount() == 0; i++) {
        std::this_thread::sleep_for(5ms);
    }
    check(dispatcher.unsolicitedCount() == 1, "failed write did not arm a slot");

    dispatcher.stop();
}

static void testStop() {
    std::cout << "\n=== Stop and restart ===" << std::endl;

    FakeTransport transport;
    OperationDispatcher dispatcher(transport);

    Bytes reply;
    boost::system::error_code ec = dispatcher.submit(0, 1, Bytes(), 100ms, reply);
    check(ec == bgapi::make_error_code(bgapi::errc::not_connected), "submit before start -> not_connected");

    dispatcher.start();

    std::promise<boost::system::error_code> active;
    std::promise<boost::system::error_code> queued;
    dispatcher.submitAsync(0, 1, Bytes(), 10000ms, [&](const boost::system::error_code& e, const Bytes&) {
        active.set_value(e);
    });
    dispatcher.submitAsync(0, 2, Bytes(), 10000ms, [&](const boost::system::error_code& e, const Bytes&) {
        queued.set_value(e);
    });
    transport.waitForWrites(1);

    auto started = std::chrono::steady_clock::now();
    dispatcher.stop();
    auto waited = std::chrono::steady_clock::now() - started;

    auto active_future = active.get_future();
    auto queued_future = queued.get_future();
    check(active_future.wait_for(0s) == std::future_status::ready &&
          active_future.get() == bgapi::make_error_code(bgapi::errc::aborted), "active operation aborted");
    check(queued_future.wait_for(0s) == std::future_status::ready &&
          queued_future.get() == bgapi::make_error_code(bgapi::errc::aborted), "queued operation aborted");
    check(waited < 1s, "stop does not wait out the timeout");
    check(transport.writeCount() == 1, "queued operation never written");
    check(!dispatcher.isRunning(), "stopped");

    ec = dispatcher.submit(0, 1, Bytes(), 100ms, reply);
    check(ec == bgapi::make_error_code(bgapi::errc::not_connected), "submit after stop -> not_connected");

    dispatcher.start();
    std::thread responder([&] {
        if (transport.waitForWrites(2)) {
            dispatcher.onResponse(response(0, 1));
        }
    });
    ec = dispatcher.submit(0, 1, Bytes(), 1000ms, reply);
    responder.join();
    check(!ec, "restarted dispatcher works");
    dispatcher.stop();
}

static void testStopFromCompletion() {
    std::cout << "\n=== Stop from inside a completion ===" << std::endl;

    FakeTransport transport;
    OperationDispatcher dispatcher(transport, [](bgapi::LogLevel, const std::string&) {});
    dispatcher.start();

    std::promise<boost::system::error_code> first;
    std::promise<boost::system::error_code> second;
    dispatcher.submitAsync(0, 1, Bytes(), 30ms, [&](const boost::system::error_code& e, const Bytes&) {
        dispatcher.stop();
        first.set_value(e);
    });
    dispatcher.submitAsync(0, 2, Bytes(), 10000ms, [&](const boost::system::error_code& e, const Bytes&) {
        second.set_value(e);
    });

    auto first_future = first.get_future();
    auto second_future = second.get_future();
    check(first_future.wait_for(2s) == std::future_status::ready &&
          first_future.get() == bgapi::make_error_code(bgapi::errc::timeout),
          "completion that stops the dispatcher returns normally");
    check(second_future.wait_for(2s) == std::future_status::ready &&
          second_future.get() == bgapi::make_error_code(bgapi::errc::aborted),
          "queued operation aborted by the writer on its way out");
    check(transport.writeCount() == 1, "queued operation never written");

    Bytes reply;
    check(dispatcher.submit(0, 1, Bytes(), 100ms, reply) == bgapi::make_error_code(bgapi::errc::not_connected),
          "submit after stop -> not_connected");

    for (int i = 0; i < 100 && dispatcher.isRunning(); i++) {
        std::this_thread::sleep_for(5ms);
    }
    check(!dispatcher.isRunning(), "writer thread finished");

    // start() reaps the old writer thread
    dispatcher.start();
    std::thread responder([&] {
        if (transport.waitForWrites(2)) {
            dispatcher.onResponse(response(0, 1));
        }
    });
    boost::system::error_code ec = dispatcher.submit(0, 1, Bytes(), 1000ms, reply);
    responder.join();
    check(!ec, "restarted after a stop from a completion");
    dispatcher.stop();
}

static void testFramedRequests() {
    std::cout << "\n=== Framed requests ===" << std::endl;

    FakeTransport transport;
    OperationDispatcher dispatcher(transport, [](bgapi::LogLevel, const std::string&) {});
    dispatcher.setFrameRequests(true);
    dispatcher.start();

    std::thread responder([&] {
        if (transport.waitForWrites(1)) {
            dispatcher.onResponse(response(6, 2, {0x00, 0x00}));
        }
    });
    Bytes reply;
    boost::system::error_code ec = dispatcher.submit(6, 2, Bytes{0x01}, 1000ms, reply);
    responder.join();

    check(!ec, "framed request answered");
    check(transport.writes().front() == Bytes({0x01, 0x00, 0x06, 0x02, 0x01}),
          "header carries length 1, response kind, class 6, command 2");
    dispatcher.stop();
}

int main() {
    std::cout << "=== Operation dispatcher tests ===" << std::endl;

    testHelloRoundTrip();
    testTimeout();
    testMismatch();
    testUnsolicited();
    testSerializedWrites();
    testFifo();
    testWriteFailure();
    testStop();
    testStopFromCompletion();
    testFramedRequests();

    std::cout << "\n" << (g_failures == 0 ? "All checks passed" : "FAILURES: " + std::to_string(g_failures))
              << std::endl;
    return g_failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
