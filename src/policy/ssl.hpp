// policy/ssl.hpp
// SSL/TLS policies for the WebSocket connection
//
//   - OpenSSLPolicy: TLS 1.2+ client (wss://) with SNI and certificate verification
//   - NoSSLPolicy:   pass-through to the socket (ws://)
//
// All policies conform to the SSLPolicyConcept interface:
//   - void init()
//   - void handshake(int fd, const char* host)
//   - ssize_t read(void* buf, size_t len)
//   - ssize_t write(const void* buf, size_t len)
//   - int get_fd() const
//   - void shutdown()
//   - const std::string& last_error() const
//
// read()/write() return bytes transferred, 0 when the peer closed the stream, and
// -1 on failure. On a non-blocking socket that is not ready, -1 is returned with
// errno == EAGAIN so the caller can wait for readiness and retry.
//
// Thread safety: Not thread-safe. One SSL object carries state for both directions,
// so callers serialize every call on an instance (see transport/ws_connection.hpp).
//
// Namespace: anagram::ssl

#pragma once

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <sys/socket.h>
#include <sys/types.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace anagram {
namespace ssl {

// ============================================================================
// OpenSSL Policy
// ============================================================================

/**
 * OpenSSLPolicy - OpenSSL TLS client
 *
 * Features:
 *   - TLS 1.2 minimum
 *   - SNI (servers hosting several names need it to pick a certificate)
 *   - Peer verification against the system trust store, including hostname
 */
struct OpenSSLPolicy {
    OpenSSLPolicy() : ctx_(nullptr), ssl_(nullptr) {}

    ~OpenSSLPolicy() {
        shutdown();
    }

    // Prevent copying
    OpenSSLPolicy(const OpenSSLPolicy&) = delete;
    OpenSSLPolicy& operator=(const OpenSSLPolicy&) = delete;

    // Allow moving
    OpenSSLPolicy(OpenSSLPolicy&& other) noexcept
        : ctx_(other.ctx_)
        , ssl_(other.ssl_)
        , last_error_(std::move(other.last_error_))
    {
        other.ctx_ = nullptr;
        other.ssl_ = nullptr;
    }

    OpenSSLPolicy& operator=(OpenSSLPolicy&& other) noexcept {
        if (this != &other) {
            shutdown();
            ctx_ = other.ctx_;
            ssl_ = other.ssl_;
            last_error_ = std::move(other.last_error_);
            other.ctx_ = nullptr;
            other.ssl_ = nullptr;
        }
        return *this;
    }

    /**
     * Initialize SSL context
     *
     * @throws std::runtime_error if initialization fails
     */
    void init() {
        const SSL_METHOD* method = TLS_client_method();
        ctx_ = SSL_CTX_new(method);

        if (!ctx_) {
            throw std::runtime_error("SSL_CTX_new() failed: " + error_queue_string());
        }

        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
            throw std::runtime_error("SSL_CTX_set_default_verify_paths() failed: " +
                                     error_queue_string());
        }
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);

        // A retried SSL_write may come from a different buffer address
        SSL_CTX_set_mode(ctx_, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
    }

    /**
     * Perform TLS handshake (blocking socket)
     *
     * @param fd Connected socket
     * @param host Server name for SNI and certificate hostname check
     * @throws std::runtime_error if handshake fails
     */
    void handshake(int fd, const char* host) {
        ssl_ = SSL_new(ctx_);
        if (!ssl_) {
            throw std::runtime_error("SSL_new() failed: " + error_queue_string());
        }

        if (SSL_set_fd(ssl_, fd) != 1) {
            throw std::runtime_error("SSL_set_fd() failed: " + error_queue_string());
        }

        if (host && *host) {
            // SNI is only meaningful for DNS names, the hostname check covers both
            if (!is_ip_literal(host) && SSL_set_tlsext_host_name(ssl_, host) != 1) {
                throw std::runtime_error("SSL_set_tlsext_host_name() failed: " +
                                         error_queue_string());
            }
            X509_VERIFY_PARAM* param = SSL_get0_param(ssl_);
            int ok = is_ip_literal(host) ? X509_VERIFY_PARAM_set1_ip_asc(param, host)
                                         : X509_VERIFY_PARAM_set1_host(param, host, 0);
            if (ok != 1) {
                throw std::runtime_error("X509_VERIFY_PARAM host setup failed: " +
                                         error_queue_string());
            }
        }

        ERR_clear_error();
        int ret = SSL_connect(ssl_);
        if (ret != 1) {
            int err = SSL_get_error(ssl_, ret);
            std::string detail = error_queue_string();
            long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK) {
                detail = X509_verify_cert_error_string(verify);
            } else if (detail.empty()) {
                detail = err == SSL_ERROR_SYSCALL && errno != 0
                    ? std::string(strerror(errno))
                    : "SSL error " + std::to_string(err);
            }
            throw std::runtime_error("SSL_connect() failed: " + detail);
        }
    }

    /**
     * Read decrypted data from SSL connection
     *
     * @return Bytes read, 0 on connection close, -1 on error/would-block (errno == EAGAIN)
     */
    ssize_t read(void* buf, size_t len) {
        if (!ssl_) {
            errno = EBADF;
            return -1;
        }

        ERR_clear_error();
        int n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }
        return classify_failure(n, "SSL_read()");
    }

    /**
     * Write data to SSL connection
     *
     * @return Bytes written, -1 on error/would-block (errno == EAGAIN)
     */
    ssize_t write(const void* buf, size_t len) {
        if (!ssl_) {
            errno = EBADF;
            return -1;
        }

        ERR_clear_error();
        int n = SSL_write(ssl_, buf, static_cast<int>(len));
        if (n > 0) {
            return n;
        }
        if (classify_failure(n, "SSL_write()") == 0) {
            errno = EPIPE;
        }
        return -1;
    }

    int get_fd() const {
        if (!ssl_) return -1;
        return SSL_get_fd(ssl_);
    }

    /**
     * Shutdown SSL connection and free resources
     */
    void shutdown() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }

        if (ctx_) {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    const std::string& last_error() const {
        return last_error_;
    }

    static constexpr const char* name() {
        return "OpenSSL";
    }

    SSL_CTX* ctx_;
    SSL* ssl_;
    std::string last_error_;

private:
    static std::string error_queue_string() {
        std::string out;
        unsigned long code;
        while ((code = ERR_get_error()) != 0) {
            char err_buf[256];
            ERR_error_string_n(code, err_buf, sizeof(err_buf));
            if (!out.empty()) out += "; ";
            out += err_buf;
        }
        return out;
    }

    static bool is_ip_literal(const char* host) {
        // IPv6 literals contain ':', IPv4 literals are digits and dots only
        if (strchr(host, ':')) return true;
        for (const char* p = host; *p; p++) {
            if ((*p < '0' || *p > '9') && *p != '.') return false;
        }
        return true;
    }

    ssize_t classify_failure(int ret, const char* call) {
        int saved_errno = errno;
        int err = SSL_get_error(ssl_, ret);
        switch (err) {
            case SSL_ERROR_WANT_READ:
            case SSL_ERROR_WANT_WRITE:
                errno = EAGAIN;
                return -1;
            case SSL_ERROR_ZERO_RETURN:
                last_error_ = "connection closed";
                return 0;
            case SSL_ERROR_SYSCALL:
                last_error_ = std::string(call) + " failed: " +
                    (saved_errno != 0 ? strerror(saved_errno) : "unexpected EOF");
                errno = saved_errno != 0 ? saved_errno : ECONNRESET;
                return -1;
            default: {
                std::string detail = error_queue_string();
                last_error_ = std::string(call) + " failed: " +
                    (detail.empty() ? "SSL error " + std::to_string(err) : detail);
                errno = EIO;
                return -1;
            }
        }
    }
};

// ============================================================================
// No SSL Policy (plain ws://)
// ============================================================================

/**
 * NoSSLPolicy - direct socket I/O with the SSL policy interface
 */
struct NoSSLPolicy {
    NoSSLPolicy() : fd_(-1) {}

    void init() {}

    void handshake(int fd, const char* host) {
        (void)host;
        fd_ = fd;
    }

    ssize_t read(void* buf, size_t len) {
        if (fd_ < 0) {
            errno = EBADF;
            return -1;
        }
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errno = EAGAIN;
            } else {
                last_error_ = std::string("recv() failed: ") + strerror(errno);
            }
        } else if (n == 0) {
            last_error_ = "connection closed";
        }
        return n;
    }

    ssize_t write(const void* buf, size_t len) {
        if (fd_ < 0) {
            errno = EBADF;
            return -1;
        }
        ssize_t n = ::send(fd_, buf, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errno = EAGAIN;
            } else {
                last_error_ = std::string("send() failed: ") + strerror(errno);
            }
        }
        return n;
    }

    int get_fd() const {
        return fd_;
    }

    void shutdown() {
        fd_ = -1;
    }

    const std::string& last_error() const {
        return last_error_;
    }

    static constexpr const char* name() {
        return "NoSSL";
    }

    int fd_;
    std::string last_error_;
};

} // namespace ssl
} // namespace anagram

// ============================================================================
// SSL Policy Concept (C++20)
// ============================================================================

#if __cplusplus >= 202002L
#include <concepts>

namespace anagram {
namespace ssl {

template<typename T>
concept SSLPolicyConcept = requires(T ssl, int fd, const char* host, void* buf, size_t len) {
    { ssl.init() } -> std::same_as<void>;
    { ssl.handshake(fd, host) } -> std::same_as<void>;
    { ssl.read(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.write(buf, len) } -> std::convertible_to<ssize_t>;
    { ssl.get_fd() } -> std::convertible_to<int>;
    { ssl.shutdown() } -> std::same_as<void>;
    { ssl.last_error() } -> std::convertible_to<std::string>;
};

static_assert(SSLPolicyConcept<OpenSSLPolicy>);
static_assert(SSLPolicyConcept<NoSSLPolicy>);

} // namespace ssl
} // namespace anagram

#endif // C++20
