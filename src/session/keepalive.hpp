// session/keepalive.hpp
// Periodic "/ping" writer
//
// Runs on its own thread for the lifetime of a connected session, independent
// of reads and of user input. The first ping goes out one interval after
// start(). A failed write is reported once through the failure handler and the
// driver exits; it is not restarted.
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "../client_config.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

namespace anagram::session {

template<typename Connection>
class KeepaliveDriver {
public:
    using FailureHandler = std::function<void(const std::string&)>;

    KeepaliveDriver() = default;

    ~KeepaliveDriver() {
        stop();
    }

    KeepaliveDriver(const KeepaliveDriver&) = delete;
    KeepaliveDriver& operator=(const KeepaliveDriver&) = delete;

    /**
     * Start pinging conn every interval
     *
     * conn must outlive stop(). Calling start() twice has no effect.
     */
    void start(Connection& conn, std::chrono::milliseconds interval, FailureHandler on_failure) {
        if (thread_.joinable()) return;
        conn_ = &conn;
        interval_ = interval;
        on_failure_ = std::move(on_failure);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = false;
        }
        running_.store(true, std::memory_order_release);
        thread_ = std::thread([this]() { run(); });
    }

    // Wakes the driver out of its interval wait and joins it
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool running() const { return running_.load(std::memory_order_acquire); }
    uint64_t pings_sent() const { return pings_sent_.load(std::memory_order_acquire); }

private:
    void run() {
        auto next = std::chrono::steady_clock::now() + interval_;
        std::unique_lock<std::mutex> lock(mutex_);

        while (!cv_.wait_until(lock, next, [this] { return stop_; })) {
            lock.unlock();
            try {
                conn_->write_text(PING_PAYLOAD);
                pings_sent_.fetch_add(1, std::memory_order_acq_rel);
            } catch (const WriteError& e) {
                ANAGRAM_LOG_WARN("[Keepalive] ping failed, driver exiting: %s", e.what());
                running_.store(false, std::memory_order_release);
                on_failure_(e.what());
                return;
            }
            next += interval_;
            lock.lock();
        }
        running_.store(false, std::memory_order_release);
    }

    Connection* conn_ = nullptr;
    std::chrono::milliseconds interval_{KEEPALIVE_INTERVAL};
    FailureHandler on_failure_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> pings_sent_{0};
};

} // namespace anagram::session
