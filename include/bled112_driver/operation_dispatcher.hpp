#ifndef BLED112_DRIVER_OPERATION_DISPATCHER_HPP
#define BLED112_DRIVER_OPERATION_DISPATCHER_HPP

#include "errors.hpp"
#include "frame_codec.hpp"
#include "log.hpp"
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace bgapi {

/**
 * @brief Serializes BGAPI commands onto the transport, one at a time
 *
 * The BLED112 firmware does not pipeline commands: the next command may only
 * be written once the previous one has been answered. The dispatcher owns a
 * writer thread that takes submitted operations in FIFO order, arms the
 * pending slot, writes [class, command, payload...] (or, with framed requests,
 * a whole frame: 4-byte header then payload), and then waits for the reader
 * thread to post a response frame or for the timeout to expire.
 *
 * Two message queues connect the threads, guarded by one mutex:
 * - submissions: callers -> writer thread
 * - responses:   reader thread -> writer thread
 * The pending operation itself is only ever touched by the writer thread.
 *
 * Every submitted operation gets exactly one completion call, carrying either
 * the response payload or an error:
 * - errc::timeout                   no response within the timeout
 * - errc::protocol_mismatch         response class/command differs
 * - errc::transport_write_failure   write or flush failed, nothing armed
 * - errc::aborted                   stop() while queued or waiting
 * - errc::not_connected             submitted while not running
 */
class OperationDispatcher {
public:
    using Completion = std::function<void(const boost::system::error_code& ec, const Bytes& payload)>;

    static constexpr uint32_t DEFAULT_TIMEOUT_MS = 1000;

    OperationDispatcher(Transport& transport, LogHandler log = defaultLogHandler);
    // Must not run on the writer thread
    ~OperationDispatcher();

    OperationDispatcher(const OperationDispatcher&) = delete;
    OperationDispatcher& operator=(const OperationDispatcher&) = delete;

    void start();
    /**
     * @brief Abort the active and all queued operations, then join the writer
     *
     * May be called from a completion. The writer thread then aborts the
     * queue on its way out and is joined by the next start() or stop() from
     * another thread.
     */
    void stop();
    bool isRunning() const { return running_; }

    // Must be set before start()
    void setFrameRequests(bool framed) { frame_requests_ = framed; }

    /**
     * @brief Queue an operation; completion runs on the writer thread
     *
     * The completion must not call submit(): the writer thread would wait
     * on itself.
     */
    void submitAsync(uint8_t category, uint8_t command, const Bytes& payload,
                     std::chrono::milliseconds timeout, Completion completion);

    /**
     * @brief Queue an operation and block until it completes
     * @param reply Response payload on success
     */
    boost::system::error_code submit(uint8_t category, uint8_t command, const Bytes& payload,
                                     std::chrono::milliseconds timeout, Bytes& reply);

    /**
     * @brief Post a response frame for correlation (reader thread)
     */
    void onResponse(Frame frame);

    // Counters
    uint64_t completedCount() const { return completed_; }
    uint64_t timeoutCount() const { return timeouts_; }
    uint64_t mismatchCount() const { return mismatches_; }
    uint64_t unsolicitedCount() const { return unsolicited_; }
    uint64_t writeErrorCount() const { return write_errors_; }

private:
    struct PendingOperation {
        uint8_t category = 0;
        uint8_t command = 0;
        Bytes payload;
        std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_MS};
        Completion completion;
        bool completed = false;

        Bytes encode(bool framed) const;
        void complete(const boost::system::error_code& ec, const Bytes& reply);
    };

    void writerLoop();
    void runOperation(std::unique_lock<std::mutex>& lock);
    void log(LogLevel level, const std::string& message);

    Transport& transport_;
    LogHandler log_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<PendingOperation>> submissions_;
    std::deque<Frame> responses_;
    std::unique_ptr<PendingOperation> pending_;
    bool stopping_;
    bool frame_requests_;

    std::thread writer_thread_;
    std::thread::id writer_id_;
    std::atomic<bool> running_;

    std::atomic<uint64_t> completed_;
    std::atomic<uint64_t> timeouts_;
    std::atomic<uint64_t> mismatches_;
    std::atomic<uint64_t> unsolicited_;
    std::atomic<uint64_t> write_errors_;
};

} // namespace bgapi

#endif // BLED112_DRIVER_OPERATION_DISPATCHER_HPP
