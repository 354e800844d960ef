#include "bled112_driver/operation_dispatcher.hpp"
#include <future>
#include <iomanip>
#include <sstream>

namespace bgapi {

constexpr uint32_t OperationDispatcher::DEFAULT_TIMEOUT_MS;

namespace {

std::string describe(uint8_t category, uint8_t command) {
    std::stringstream ss;
    ss << "(" << static_cast<int>(category) << ", " << static_cast<int>(command) << ")";
    return ss.str();
}

} // namespace

Bytes OperationDispatcher::PendingOperation::encode(bool framed) const {
    if (framed) {
        // Commands travel with the response kind (bit 15 clear)
        return encodeFrame(MessageKind::RESPONSE, category, command, payload);
    }

    Bytes request;
    request.reserve(2 + payload.size());
    request.push_back(category);
    request.push_back(command);
    request.insert(request.end(), payload.begin(), payload.end());
    return request;
}

void OperationDispatcher::PendingOperation::complete(const boost::system::error_code& ec,
                                                     const Bytes& reply) {
    if (completed) {
        return;
    }
    completed = true;
    if (completion) {
        completion(ec, reply);
    }
}

OperationDispatcher::OperationDispatcher(Transport& transport, LogHandler log)
    : transport_(transport)
    , log_(std::move(log))
    , stopping_(false)
    , frame_requests_(false)
    , running_(false)
    , completed_(0)
    , timeouts_(0)
    , mismatches_(0)
    , unsolicited_(0)
    , write_errors_(0)
{
}

OperationDispatcher::~OperationDispatcher() {
    stop();
}

void OperationDispatcher::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (running_ && !stopping_) {
        return;
    }
    if (writer_thread_.joinable()) {
        // Left over from a stop() issued inside a completion
        if (std::this_thread::get_id() == writer_id_) {
            return;
        }
        lock.unlock();
        writer_thread_.join();
        lock.lock();
        writer_id_ = std::thread::id();
    }
    stopping_ = false;
    responses_.clear();
    running_ = true;
    writer_thread_ = std::thread(&OperationDispatcher::writerLoop, this);
    writer_id_ = writer_thread_.get_id();
}

void OperationDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && !writer_thread_.joinable()) {
            return;
        }
        stopping_ = true;
        if (std::this_thread::get_id() == writer_id_) {
            // Inside a completion: writerLoop finishes the shutdown
            cv_.notify_all();
            return;
        }
    }
    cv_.notify_all();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    writer_id_ = std::thread::id();
}

void OperationDispatcher::submitAsync(uint8_t category, uint8_t command, const Bytes& payload,
                                      std::chrono::milliseconds timeout, Completion completion) {
    auto op = std::make_unique<PendingOperation>();
    op->category = category;
    op->command = command;
    op->payload = payload;
    op->timeout = timeout;
    op->completion = std::move(completion);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ && !stopping_) {
            submissions_.push_back(std::move(op));
        }
    }

    if (op) {
        // Not queued
        op->complete(make_error_code(errc::not_connected), Bytes());
        return;
    }
    cv_.notify_all();
}

boost::system::error_code OperationDispatcher::submit(uint8_t category, uint8_t command,
                                                      const Bytes& payload,
                                                      std::chrono::milliseconds timeout,
                                                      Bytes& reply) {
    struct Outcome {
        boost::system::error_code ec;
        Bytes payload;
    };

    auto promise = std::make_shared<std::promise<Outcome>>();
    std::future<Outcome> future = promise->get_future();

    submitAsync(category, command, payload, timeout,
        [promise](const boost::system::error_code& ec, const Bytes& data) {
            promise->set_value(Outcome{ec, data});
        });

    Outcome outcome = future.get();
    reply = std::move(outcome.payload);
    return outcome.ec;
}

void OperationDispatcher::onResponse(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) {
            return;
        }
        responses_.push_back(std::move(frame));
    }
    cv_.notify_all();
}

void OperationDispatcher::writerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        cv_.wait(lock, [this] {
            return stopping_ || !responses_.empty() || !submissions_.empty();
        });

        if (stopping_) {
            break;
        }

        if (!responses_.empty()) {
            // Nothing is armed at this point
            Frame stray = std::move(responses_.front());
            responses_.pop_front();
            unsolicited_++;
            lock.unlock();
            log(LogLevel::WARN, "Dropping unsolicited response " +
                describe(stray.header.category, stray.header.subtype));
            lock.lock();
            continue;
        }

        runOperation(lock);
    }

    std::deque<std::unique_ptr<PendingOperation>> leftovers;
    leftovers.swap(submissions_);
    responses_.clear();
    running_ = false;
    lock.unlock();

    for (auto& op : leftovers) {
        op->complete(make_error_code(errc::aborted), Bytes());
    }
}

void OperationDispatcher::runOperation(std::unique_lock<std::mutex>& lock) {
    // Arm before writing so the reply cannot race past us
    pending_ = std::move(submissions_.front());
    submissions_.pop_front();
    Bytes request = pending_->encode(frame_requests_);
    lock.unlock();

    boost::system::error_code ec = transport_.write(request);
    if (!ec) {
        ec = transport_.flush();
    }
    if (ec) {
        write_errors_++;
        log(LogLevel::ERROR, "Write failed for " +
            describe(pending_->category, pending_->command) + ": " + ec.message());
        std::unique_ptr<PendingOperation> op = std::move(pending_);
        op->complete(make_error_code(errc::transport_write_failure), Bytes());
        lock.lock();
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + pending_->timeout;

    lock.lock();
    cv_.wait_until(lock, deadline, [this] {
        return stopping_ || !responses_.empty();
    });

    std::unique_ptr<PendingOperation> op = std::move(pending_);

    if (!responses_.empty()) {
        Frame response = std::move(responses_.front());
        responses_.pop_front();
        lock.unlock();

        if (response.header.category != op->category || response.header.subtype != op->command) {
            mismatches_++;
            log(LogLevel::WARN, "Expected response " + describe(op->category, op->command) +
                ", got " + describe(response.header.category, response.header.subtype));
            op->complete(make_error_code(errc::protocol_mismatch), Bytes());
        } else {
            completed_++;
            op->complete(boost::system::error_code(), response.payload);
        }
    } else if (stopping_) {
        lock.unlock();
        op->complete(make_error_code(errc::aborted), Bytes());
    } else {
        timeouts_++;
        lock.unlock();
        log(LogLevel::WARN, "Timed out waiting for response " +
            describe(op->category, op->command));
        op->complete(make_error_code(errc::timeout), Bytes());
    }

    lock.lock();
}

void OperationDispatcher::log(LogLevel level, const std::string& message) {
    if (log_) {
        log_(level, message);
    }
}

} // namespace bgapi
