// policy/event.hpp
// Epoll-based readiness waiting with a cross-thread wakeup
//
// Used by the blocking sides of the client (socket reader, stdin pump):
//   - void init()
//   - void add_read(int fd)
//   - void remove(int fd)
//   - int wait(int timeout_ms)          // -1 = infinite
//   - bool is_ready(int fd) const       // after wait()
//   - bool woken() const                // after wait(), wake() was called
//   - void wake()                       // callable from any thread
//
// Level-triggered: a descriptor stays ready until drained, so a waiter that was
// interrupted between wait() and read() never misses data.
//
// Namespace: anagram::event_policies

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace anagram {
namespace event_policies {

/**
 * EpollPolicy - Linux epoll event notification
 *
 * The wakeup eventfd is registered at init(); once wake() is called it stays
 * signalled, so every later wait() returns immediately with woken() == true.
 *
 * Thread safety: wait()/add_read()/remove() from one thread; wake() from any.
 */
struct EpollPolicy {
    static constexpr int MAX_EVENTS = 8;

    EpollPolicy() : epfd_(-1), wake_fd_(-1), ready_count_(0), woken_(false) {}

    ~EpollPolicy() {
        cleanup();
    }

    // Prevent copying
    EpollPolicy(const EpollPolicy&) = delete;
    EpollPolicy& operator=(const EpollPolicy&) = delete;

    /**
     * Initialize epoll instance and wakeup eventfd
     *
     * @throws std::runtime_error if epoll_create1() or eventfd() fails
     */
    void init() {
        epfd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epfd_ < 0) {
            throw std::runtime_error(std::string("epoll_create1() failed: ") + strerror(errno));
        }
        wake_fd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (wake_fd_ < 0) {
            int saved = errno;
            cleanup();
            throw std::runtime_error(std::string("eventfd() failed: ") + strerror(saved));
        }
        add_read(wake_fd_);
    }

    /**
     * Register file descriptor for read events (EPOLLIN)
     *
     * @throws std::runtime_error if epoll_ctl() fails
     */
    void add_read(int fd) {
        struct epoll_event ev = {};
        ev.events = EPOLLIN | EPOLLRDHUP;
        ev.data.fd = fd;

        if (epoll_ctl(epfd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
            throw std::runtime_error(std::string("epoll_ctl(ADD, EPOLLIN) failed: ") +
                                     strerror(errno));
        }
    }

    void remove(int fd) {
        epoll_ctl(epfd_, EPOLL_CTL_DEL, fd, nullptr);
    }

    /**
     * Wait for events
     *
     * @param timeout_ms Timeout in milliseconds (-1 = infinite, 0 = poll)
     * @return Number of ready descriptors (0 = timeout, -1 = error other than EINTR)
     */
    int wait(int timeout_ms = -1) {
        int n;
        do {
            n = epoll_wait(epfd_, events_, MAX_EVENTS, timeout_ms);
        } while (n < 0 && errno == EINTR);

        ready_count_ = n > 0 ? n : 0;
        for (int i = 0; i < ready_count_; i++) {
            if (events_[i].data.fd == wake_fd_) {
                woken_ = true;
            }
        }
        return n;
    }

    bool is_ready(int fd) const {
        for (int i = 0; i < ready_count_; i++) {
            if (events_[i].data.fd == fd) {
                return true;
            }
        }
        return false;
    }

    bool woken() const {
        return woken_;
    }

    // Signal the waiter; never blocks
    void wake() {
        if (wake_fd_ < 0) return;
        uint64_t one = 1;
        ssize_t n = ::write(wake_fd_, &one, sizeof(one));
        (void)n;  // EAGAIN only when the counter is already saturated
    }

    static constexpr const char* name() {
        return "epoll";
    }

private:
    void cleanup() {
        if (wake_fd_ >= 0) {
            ::close(wake_fd_);
            wake_fd_ = -1;
        }
        if (epfd_ >= 0) {
            ::close(epfd_);
            epfd_ = -1;
        }
    }

    int epfd_;
    int wake_fd_;
    struct epoll_event events_[MAX_EVENTS];
    int ready_count_;
    bool woken_;
};

} // namespace event_policies
} // namespace anagram
