// transport/ws_connection.hpp
// Full-duplex WebSocket client connection
//
// Connect sequence:
//   1. TCP connect (BSDSocket, getaddrinfo, bounded connect)
//   2. TLS handshake (SSLPolicy; NoSSLPolicy for ws://)
//   3. HTTP upgrade, Sec-WebSocket-Accept check
//   4. Socket switched to non-blocking, registered with epoll
//
// Concurrency contract:
//   - One reader role (read_message) and one writer role (write_text) may run
//     concurrently from different threads. Several writers are serialized by
//     write_mutex_.
//   - SSL objects are not safe for concurrent SSL_read/SSL_write, so every
//     SSLPolicy call happens under ssl_mutex_. That lock is never held while
//     waiting for socket readiness, so a reader parked in epoll never blocks
//     a writer.
//   - close() may be called from any thread: it wakes a parked reader, and
//     shuts the socket down so in-flight I/O fails promptly.
//
// Control frames are handled inside read_message(): PING is answered with PONG,
// PONG is dropped, CLOSE is echoed and ends the stream.

#pragma once

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include "../core/errors.hpp"
#include "../core/http.hpp"
#include "../core/log.hpp"
#include "../core/url.hpp"
#include "../policy/event.hpp"
#include "../policy/ssl.hpp"
#include "bsd_socket.hpp"

namespace anagram {
namespace transport {

struct ConnectionOptions {
    int connect_timeout_ms = 5000;                  // TCP connect, TLS and upgrade each
    size_t max_message_size = 16 * 1024 * 1024;     // Reassembled message limit
};

template<typename SSLPolicy_>
class WebSocketConnection {
public:
    using SSLPolicy = SSLPolicy_;

    static constexpr size_t RECV_CHUNK = 16 * 1024;
    static constexpr size_t MAX_HANDSHAKE_RESPONSE = 16 * 1024;

    WebSocketConnection() = default;

    ~WebSocketConnection() {
        close();
        ssl_.shutdown();
        socket_.close();
    }

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    /**
     * Dial, handshake and upgrade
     *
     * @throws ConnectError describing the failing step
     */
    void connect(const ParsedURL& url, const ConnectionOptions& options = {}) {
        options_ = options;

        BSDSocketConfig config;
        config.connect_timeout_ms = options.connect_timeout_ms;
        socket_.init(config);

        try {
            socket_.connect(url.host.c_str(), url.port);
            set_io_timeout(options.connect_timeout_ms);

            ssl_.init();
            ssl_.handshake(socket_.get_fd(), url.host.c_str());
            ANAGRAM_DEBUG_PRINT("[WS] %s handshake complete", SSLPolicy::name());

            upgrade(url);

            set_io_timeout(0);
            socket_.set_nonblocking();
            events_.init();
            events_.add_read(socket_.get_fd());
        } catch (const ConnectError&) {
            ssl_.shutdown();
            socket_.close();
            throw;
        } catch (const std::runtime_error& e) {
            ssl_.shutdown();
            socket_.close();
            throw ConnectError(e.what());
        }

        open_.store(true, std::memory_order_release);
        ANAGRAM_LOG_INFO("[WS] Connected to %s:%u%s", url.host.c_str(), url.port, url.path.c_str());
    }

    /**
     * Block until one complete data message arrives
     *
     * @return Message payload (TEXT or BINARY, fragments reassembled)
     * @throws ReadError on transport failure, peer close or local close
     */
    std::string read_message() {
        std::lock_guard<std::mutex> reader(read_mutex_);

        if (!broken_reason_.empty()) {
            throw ReadError(broken_reason_);
        }

        for (;;) {
            http::WebSocketFrame frame;
            while (next_frame(frame)) {
                std::string message;
                bool complete = handle_frame(frame, message);
                consume(frame);
                if (complete) {
                    return message;
                }
            }
            fill_rx_buffer();
        }
    }

    /**
     * Send one TEXT message
     *
     * @throws WriteError if the connection is closed or the write fails
     */
    void write_text(std::string_view text) {
        uint8_t mask[4];
        http::random_mask_key(mask);
        std::string frame = http::build_text_frame(text, mask);

        std::lock_guard<std::mutex> writer(write_mutex_);
        write_all(frame);
    }

    /**
     * Close the connection (idempotent, any thread)
     *
     * Sends a CLOSE frame when no write is in progress, then wakes the reader.
     */
    void close() {
        if (!open_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
        closing_.store(true, std::memory_order_release);

        std::unique_lock<std::mutex> writer(write_mutex_, std::try_to_lock);
        if (writer.owns_lock()) {
            uint8_t mask[4];
            http::random_mask_key(mask);
            std::string frame = http::build_close_frame(1000, "", mask);
            std::lock_guard<std::mutex> ssl_lock(ssl_mutex_);
            ssize_t n = ssl_.write(frame.data(), frame.size());
            if (n < 0) {
                ANAGRAM_DEBUG_PRINT("[WS] CLOSE frame not sent: %s", strerror(errno));
            }
        }

        events_.wake();
        socket_.shutdown();
        ANAGRAM_LOG_INFO("[WS] Connection closed");
    }

    bool is_open() const {
        return open_.load(std::memory_order_acquire);
    }

private:
    // Socket-level timeout for the blocking handshake phase (0 = none)
    void set_io_timeout(int timeout_ms) {
        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        int fd = socket_.get_fd();
        if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
            ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
            throw ConnectError(std::string("setsockopt(SO_RCVTIMEO) failed: ") + strerror(errno));
        }
    }

    void upgrade(const ParsedURL& url) {
        std::string key = http::generate_websocket_key();
        std::string request = http::build_websocket_upgrade_request(
            url.host_header(), url.path, key);

        size_t sent = 0;
        while (sent < request.size()) {
            ssize_t n = ssl_.write(request.data() + sent, request.size() - sent);
            if (n <= 0) {
                throw ConnectError(errno == EAGAIN
                    ? std::string("timed out sending upgrade request")
                    : "failed to send upgrade request: " + ssl_.last_error());
            }
            sent += static_cast<size_t>(n);
        }

        std::vector<uint8_t> response;
        uint8_t buf[4096];
        size_t header_end = 0;
        while (header_end == 0) {
            ssize_t n = ssl_.read(buf, sizeof(buf));
            if (n == 0) {
                throw ConnectError("failed to read upgrade response: connection closed");
            }
            if (n < 0) {
                throw ConnectError(errno == EAGAIN
                    ? std::string("timed out waiting for upgrade response")
                    : "failed to read upgrade response: " + ssl_.last_error());
            }
            response.insert(response.end(), buf, buf + n);
            header_end = http::find_header_end(response.data(), response.size());
            if (header_end == 0 && response.size() > MAX_HANDSHAKE_RESPONSE) {
                throw ConnectError("upgrade response headers too large");
            }
        }

        http::HttpResponse parsed;
        std::string_view head(reinterpret_cast<const char*>(response.data()), header_end);
        if (!http::parse_http_response(head, parsed)) {
            throw ConnectError("malformed upgrade response");
        }
        std::string error;
        if (!http::validate_http_upgrade_response(parsed, key, error)) {
            throw ConnectError("failed to WebSocket dial: " + error);
        }

        // Frames the server sent right behind the response
        rx_buf_.assign(response.begin() + static_cast<std::ptrdiff_t>(header_end), response.end());
        rx_off_ = 0;
    }

    // Parse the next complete frame from rx_buf_ (payload unmasked in place)
    bool next_frame(http::WebSocketFrame& frame) {
        size_t avail = rx_buf_.size() - rx_off_;
        if (!http::parse_websocket_frame(rx_buf_.data() + rx_off_, avail, frame)) {
            // Reject oversized frames before buffering them completely
            if (avail >= 2) {
                const uint8_t* p = rx_buf_.data() + rx_off_;
                uint64_t len = p[1] & 0x7F;
                if (len == 126 && avail >= 4) {
                    len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
                } else if (len == 127 && avail >= 10) {
                    len = 0;
                    for (int i = 0; i < 8; i++) len = (len << 8) | p[2 + i];
                }
                if (len > options_.max_message_size) {
                    fail_read("read limited at " + std::to_string(options_.max_message_size) + " bytes");
                }
            }
            return false;
        }
        if (frame.masked) {
            http::unmask_payload(const_cast<uint8_t*>(frame.payload),
                                 static_cast<size_t>(frame.payload_len), frame.mask_key);
        }
        return true;
    }

    void consume(const http::WebSocketFrame& frame) {
        rx_off_ += frame.header_len + static_cast<size_t>(frame.payload_len);
        if (rx_off_ == rx_buf_.size()) {
            rx_buf_.clear();
            rx_off_ = 0;
        }
    }

    /**
     * Handle one frame
     *
     * @return true when out_message holds a complete data message
     */
    bool handle_frame(const http::WebSocketFrame& frame, std::string& out_message) {
        using http::WebSocketOpcode;
        const char* data = reinterpret_cast<const char*>(frame.payload);
        size_t len = static_cast<size_t>(frame.payload_len);

        switch (static_cast<WebSocketOpcode>(frame.opcode)) {
            case WebSocketOpcode::TEXT:
            case WebSocketOpcode::BINARY:
                if (fragmented_) {
                    fail_read("received new data message without finishing the previous message");
                }
                if (frame.fin) {
                    out_message.assign(data, len);
                    return true;
                }
                fragmented_ = true;
                fragments_.assign(data, len);
                return false;

            case WebSocketOpcode::CONTINUATION:
                if (!fragmented_) {
                    fail_read("received continuation frame without text or binary frame");
                }
                if (fragments_.size() + len > options_.max_message_size) {
                    fail_read("read limited at " + std::to_string(options_.max_message_size) + " bytes");
                }
                fragments_.append(data, len);
                if (frame.fin) {
                    fragmented_ = false;
                    out_message.swap(fragments_);
                    fragments_.clear();
                    return true;
                }
                return false;

            case WebSocketOpcode::PING: {
                uint8_t mask[4];
                http::random_mask_key(mask);
                std::string pong = http::build_pong_frame(frame.payload, len, mask);
                std::lock_guard<std::mutex> writer(write_mutex_);
                try {
                    write_all(pong);
                } catch (const WriteError& e) {
                    fail_read(std::string("failed to write pong: ") + e.what());
                }
                return false;
            }

            case WebSocketOpcode::PONG:
                ANAGRAM_DEBUG_PRINT("[WS] Unsolicited PONG (%zu bytes)", len);
                return false;

            case WebSocketOpcode::CLOSE: {
                uint16_t code = 1005;  // No status received
                std::string reason;
                if (len >= 2) {
                    code = static_cast<uint16_t>((frame.payload[0] << 8) | frame.payload[1]);
                    reason.assign(data + 2, len - 2);
                }
                echo_close(code);
                fail_read("failed to get reader: received close frame: status = " +
                          std::to_string(code) + " and reason = \"" + reason + "\"");
            }
        }

        fail_read("received unknown opcode " + std::to_string(frame.opcode));
    }

    void echo_close(uint16_t code) {
        std::unique_lock<std::mutex> writer(write_mutex_, std::try_to_lock);
        if (!writer.owns_lock()) return;
        uint8_t mask[4];
        http::random_mask_key(mask);
        std::string frame = http::build_close_frame(code == 1005 ? 1000 : code, "", mask);
        try {
            write_all(frame);
        } catch (const WriteError& e) {
            ANAGRAM_DEBUG_PRINT("[WS] CLOSE echo failed: %s", e.what());
        }
    }

    // Read more bytes from the transport, waiting for readiness when needed
    void fill_rx_buffer() {
        if (rx_off_ > 0 && rx_off_ * 2 > rx_buf_.size()) {
            rx_buf_.erase(rx_buf_.begin(), rx_buf_.begin() + static_cast<std::ptrdiff_t>(rx_off_));
            rx_off_ = 0;
        }

        for (;;) {
            if (closing_.load(std::memory_order_acquire)) {
                fail_read("use of closed network connection");
            }

            uint8_t buf[RECV_CHUNK];
            ssize_t n;
            int err;
            std::string reason;
            {
                std::lock_guard<std::mutex> ssl_lock(ssl_mutex_);
                n = ssl_.read(buf, sizeof(buf));
                err = errno;
                if (n <= 0 && err != EAGAIN) {
                    reason = ssl_.last_error();
                }
            }

            if (n > 0) {
                rx_buf_.insert(rx_buf_.end(), buf, buf + n);
                return;
            }
            if (n == 0) {
                fail_read("failed to get reader: EOF");
            }
            if (err != EAGAIN) {
                fail_read(reason.empty() ? std::string(strerror(err)) : reason);
            }

            if (events_.wait(-1) < 0) {
                fail_read(std::string("epoll_wait() failed: ") + strerror(errno));
            }
            if (events_.woken()) {
                fail_read("use of closed network connection");
            }
        }
    }

    // Write the whole buffer; caller holds write_mutex_
    void write_all(std::string_view bytes) {
        if (closing_.load(std::memory_order_acquire) || !broken_write_.empty()) {
            throw WriteError(broken_write_.empty() ? "use of closed network connection" : broken_write_);
        }

        size_t off = 0;
        while (off < bytes.size()) {
            ssize_t n;
            int err;
            std::string reason;
            {
                std::lock_guard<std::mutex> ssl_lock(ssl_mutex_);
                n = ssl_.write(bytes.data() + off, bytes.size() - off);
                err = errno;
                if (n < 0 && err != EAGAIN) {
                    reason = ssl_.last_error();
                }
            }

            if (n > 0) {
                off += static_cast<size_t>(n);
                continue;
            }
            if (err != EAGAIN) {
                broken_write_ = reason.empty() ? std::string(strerror(err)) : reason;
                throw WriteError(broken_write_);
            }

            struct pollfd pfd = {};
            pfd.fd = socket_.get_fd();
            pfd.events = POLLOUT;
            int ret = ::poll(&pfd, 1, 100);
            if (ret < 0 && errno != EINTR) {
                throw WriteError(std::string("poll() failed: ") + strerror(errno));
            }
            if (closing_.load(std::memory_order_acquire)) {
                throw WriteError("use of closed network connection");
            }
        }
    }

    [[noreturn]] void fail_read(const std::string& reason) {
        broken_reason_ = reason;
        throw ReadError(reason);
    }

    BSDSocket socket_;
    SSLPolicy ssl_;
    event_policies::EpollPolicy events_;
    ConnectionOptions options_;

    std::mutex read_mutex_;    // reader role
    std::mutex write_mutex_;   // writer role(s)
    std::mutex ssl_mutex_;     // every SSLPolicy call after connect()

    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};

    // Reader-owned state
    std::vector<uint8_t> rx_buf_;
    size_t rx_off_ = 0;
    bool fragmented_ = false;
    std::string fragments_;
    std::string broken_reason_;

    // Writer-owned state
    std::string broken_write_;
};

using SecureConnection = WebSocketConnection<ssl::OpenSSLPolicy>;
using PlainConnection = WebSocketConnection<ssl::NoSSLPolicy>;

} // namespace transport
} // namespace anagram
