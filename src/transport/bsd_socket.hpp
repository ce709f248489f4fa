// transport/bsd_socket.hpp
// BSD Socket - TCP connection over the kernel stack
//
// Policy-based design: No inheritance, no virtual functions.
// Resolves with getaddrinfo (IPv4 and IPv6) and tries each address in turn with a
// bounded non-blocking connect.

#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "../core/log.hpp"

namespace anagram {
namespace transport {

/**
 * BSD Socket Configuration (optional)
 */
struct BSDSocketConfig {
    bool tcp_nodelay;      // Disable Nagle's algorithm (default: true)
    int connect_timeout_ms;  // Per-address connect timeout (default: 5000)

    BSDSocketConfig()
        : tcp_nodelay(true)
        , connect_timeout_ms(5000)
    {}
};

/**
 * BSDSocket - TCP socket using standard BSD sockets
 *
 * Socket Interface (duck typing):
 *   void init(const BSDSocketConfig& config)
 *   void connect(const char* host, uint16_t port)
 *   void set_nonblocking()
 *   void shutdown()        // wakes blocked readers/writers, keeps fd open
 *   void close()
 *   int get_fd() const
 */
struct BSDSocket {
    int fd_;
    BSDSocketConfig config_;

    BSDSocket()
        : fd_(-1)
    {}

    ~BSDSocket() {
        close();
    }

    BSDSocket(const BSDSocket&) = delete;
    BSDSocket& operator=(const BSDSocket&) = delete;

    void init(const BSDSocketConfig& config = BSDSocketConfig()) {
        config_ = config;
    }

    /**
     * Connect to host:port (blocking mode on return)
     *
     * @throws std::runtime_error naming the failing call
     */
    void connect(const char* host, uint16_t port) {
        struct addrinfo hints = {};
        struct addrinfo* result = nullptr;
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        std::string port_str = std::to_string(port);
        int ret = getaddrinfo(host, port_str.c_str(), &hints, &result);
        if (ret != 0) {
            throw std::runtime_error(std::string("getaddrinfo() failed: ") + gai_strerror(ret));
        }
        if (!result) {
            throw std::runtime_error("getaddrinfo() returned no addresses");
        }

        std::string last_error = "no usable address";
        for (struct addrinfo* ai = result; ai; ai = ai->ai_next) {
            try {
                connect_one(ai);
                freeaddrinfo(result);
                ANAGRAM_LOG_INFO("[BSD Socket] Connected to %s:%u", host, port);
                return;
            } catch (const std::runtime_error& e) {
                last_error = e.what();
                ANAGRAM_DEBUG_PRINT("[BSD Socket] %s:%u attempt failed: %s", host, port, e.what());
            }
        }

        freeaddrinfo(result);
        throw std::runtime_error(last_error);
    }

    void set_nonblocking() {
        int flags = fcntl(fd_, F_GETFL, 0);
        if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
            throw std::runtime_error(std::string("Failed to set non-blocking mode: ") +
                                     strerror(errno));
        }
    }

    // Half-close both directions: pending and future recv/send fail immediately
    void shutdown() {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
        }
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int get_fd() const {
        return fd_;
    }

private:
    void connect_one(const struct addrinfo* ai) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            throw std::runtime_error(std::string("socket() failed: ") + strerror(errno));
        }

        if (config_.tcp_nodelay) {
            int flag = 1;
            if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
                ANAGRAM_LOG_WARN("[BSD Socket] Failed to set TCP_NODELAY: %s", strerror(errno));
            }
        }

        // Non-blocking connect for timeout support
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            ::close(fd);
            throw std::runtime_error("Failed to set non-blocking mode");
        }

        int ret = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            int saved = errno;
            ::close(fd);
            throw std::runtime_error(std::string("connect() failed: ") + strerror(saved));
        }

        if (ret < 0) {  // EINPROGRESS
            struct pollfd pfd = {};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            do {
                ret = ::poll(&pfd, 1, config_.connect_timeout_ms);
            } while (ret < 0 && errno == EINTR);

            if (ret <= 0) {
                int saved = errno;
                ::close(fd);
                if (ret == 0) {
                    throw std::runtime_error("connect() timeout after " +
                                             std::to_string(config_.connect_timeout_ms) + " ms");
                }
                throw std::runtime_error(std::string("poll() failed: ") + strerror(saved));
            }

            int sock_error = 0;
            socklen_t len = sizeof(sock_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_error, &len) < 0) {
                ::close(fd);
                throw std::runtime_error("getsockopt() failed");
            }
            if (sock_error != 0) {
                ::close(fd);
                throw std::runtime_error(std::string("connect() failed: ") + strerror(sock_error));
            }
        }

        // Restore blocking mode for the TLS handshake and HTTP upgrade
        if (fcntl(fd, F_SETFL, flags) < 0) {
            ::close(fd);
            throw std::runtime_error("Failed to restore blocking mode");
        }

        fd_ = fd;
    }
};

} // namespace transport
} // namespace anagram
