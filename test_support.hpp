#ifndef BLED112_DRIVER_TEST_SUPPORT_HPP
#define BLED112_DRIVER_TEST_SUPPORT_HPP

#include "bled112_driver/frame_codec.hpp"
#include "bled112_driver/transport.hpp"
#include <boost/system/error_code.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// In-memory transport for the unit tests: records writes, serves injected
// bytes to read(), optionally answers each write through a responder.
class FakeTransport : public bgapi::Transport {
public:
    // Returns bytes to make readable in reply to a written request
    using Responder = std::function<bgapi::Bytes(const bgapi::Bytes& request)>;

    size_t read(uint8_t* buffer, size_t len, uint32_t timeout_ms,
                boost::system::error_code& ec) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ec.clear();

        if (fail_reads_) {
            lock.unlock();
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
            return 0;
        }

        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return !inbound_.empty() || fail_reads_;
        });

        // Hand out at most one injected chunk per read, like a serial read
        if (inbound_.empty()) {
            return 0;
        }
        bgapi::Bytes& chunk = inbound_.front();
        size_t n = std::min(len, chunk.size());
        std::copy(chunk.begin(), chunk.begin() + n, buffer);
        chunk.erase(chunk.begin(), chunk.begin() + n);
        if (chunk.empty()) {
            inbound_.pop_front();
        }
        return n;
    }

    boost::system::error_code write(const bgapi::Bytes& data) override {
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fail_writes_) {
                return boost::system::errc::make_error_code(boost::system::errc::broken_pipe);
            }
            if (in_write_) {
                overlapping_writes_++;
            }
            in_write_ = true;
            writes_.push_back(data);
            responder = responder_;
        }
        cv_.notify_all();

        // Give a concurrent writer a chance to show up
        std::this_thread::sleep_for(std::chrono::milliseconds(2));

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_write_ = false;
        }

        if (responder) {
            bgapi::Bytes reply = responder(data);
            if (!reply.empty()) {
                inject(reply);
            }
        }
        return boost::system::error_code();
    }

    boost::system::error_code flush() override {
        return boost::system::error_code();
    }

    // Make bytes readable as one chunk
    void inject(const bgapi::Bytes& data) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_.push_back(data);
        }
        cv_.notify_all();
    }

    void setResponder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void setFailWrites(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    void setFailReads(bool fail) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_reads_ = fail;
        }
        cv_.notify_all();
    }

    std::vector<bgapi::Bytes> writes() {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    size_t writeCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_.size();
    }

    int overlappingWrites() {
        std::lock_guard<std::mutex> lock(mutex_);
        return overlapping_writes_;
    }

    // Wait until at least n writes were recorded
    bool waitForWrites(size_t n, int timeout_ms = 1000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
            return writes_.size() >= n;
        });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<bgapi::Bytes> inbound_;
    std::vector<bgapi::Bytes> writes_;
    Responder responder_;
    bool fail_writes_ = false;
    bool fail_reads_ = false;
    bool in_write_ = false;
    int overlapping_writes_ = 0;
};

// Shared pass/fail bookkeeping for the standalone test programs
static int g_failures = 0;

static void check(bool condition, const std::string& what) {
    if (condition) {
        std::cout << "  ✓ " << what << std::endl;
    } else {
        std::cout << "  ✗ " << what << std::endl;
        g_failures++;
    }
}

#endif // BLED112_DRIVER_TEST_SUPPORT_HPP
