// session/ticker.hpp
// Countdown ticker with generations
//
// One thread for the whole session. arm(generation) (re)starts ticking at a
// fixed period, tagging every tick with that generation; arming again replaces
// the previous schedule and disarm() stops it. The reducer drops ticks whose
// generation is no longer current, so a tick already in the event queue when
// the ticker is replaced is harmless.
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "../client_config.hpp"

namespace anagram::session {

class Ticker {
public:
    using TickHandler = std::function<void(uint64_t generation)>;

    Ticker() = default;

    ~Ticker() {
        shutdown();
    }

    Ticker(const Ticker&) = delete;
    Ticker& operator=(const Ticker&) = delete;

    void start(std::chrono::milliseconds interval, TickHandler on_tick) {
        if (thread_.joinable()) return;
        interval_ = interval;
        on_tick_ = std::move(on_tick);
        thread_ = std::thread([this]() { run(); });
    }

    void arm(uint64_t generation) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            generation_ = generation;
            armed_ = true;
            next_due_ = std::chrono::steady_clock::now() + interval_;
        }
        cv_.notify_all();
    }

    void disarm() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            armed_ = false;
        }
        cv_.notify_all();
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool armed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return armed_;
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_) {
            if (!armed_) {
                cv_.wait(lock, [this] { return stop_ || armed_; });
                continue;
            }

            uint64_t gen = generation_;
            bool changed = cv_.wait_until(lock, next_due_, [this, gen] {
                return stop_ || !armed_ || generation_ != gen;
            });
            if (changed) continue;

            next_due_ += interval_;
            lock.unlock();
            on_tick_(gen);
            lock.lock();
        }
    }

    std::chrono::milliseconds interval_{TICK_INTERVAL};
    TickHandler on_tick_;

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool armed_ = false;
    uint64_t generation_ = 0;
    std::chrono::steady_clock::time_point next_due_;
};

} // namespace anagram::session
