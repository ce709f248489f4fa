// core/readiness_pump.hpp
// Turns "fd is readable" into a callback on a worker thread
//
// The worker never reads the descriptor itself: it reports readiness once, then
// waits for rearm() from the consumer (which drains the fd on its own thread)
// before watching again. Used for stdin, whose reader (curses) must stay on the
// main thread.
#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "../policy/event.hpp"
#include "log.hpp"

namespace anagram {

class ReadinessPump {
public:
    using ReadyHandler = std::function<void()>;

    ReadinessPump() = default;

    ~ReadinessPump() {
        stop();
    }

    ReadinessPump(const ReadinessPump&) = delete;
    ReadinessPump& operator=(const ReadinessPump&) = delete;

    /**
     * Watch fd on a new thread
     *
     * @throws std::runtime_error if epoll setup fails
     */
    void start(int fd, ReadyHandler on_ready) {
        if (thread_.joinable()) return;
        fd_ = fd;
        on_ready_ = std::move(on_ready);
        events_.init();
        events_.add_read(fd_);
        thread_ = std::thread([this]() { run(); });
    }

    // Consumer drained the fd; resume watching
    void rearm() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_ = false;
        }
        cv_.notify_all();
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        events_.wake();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void run() {
        for (;;) {
            if (events_.wait(-1) < 0) {
                ANAGRAM_LOG_WARN("[Pump] epoll_wait() failed, input disabled");
                return;
            }
            if (events_.woken()) return;
            if (!events_.is_ready(fd_)) continue;

            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) return;
            pending_ = true;
            lock.unlock();
            on_ready_();
            lock.lock();
            cv_.wait(lock, [this] { return stop_ || !pending_; });
            if (stop_) return;
        }
    }

    int fd_ = -1;
    ReadyHandler on_ready_;
    event_policies::EpollPolicy events_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    bool pending_ = false;
};

} // namespace anagram
