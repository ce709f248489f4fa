// transport/client_connection.hpp
// Scheme-selected connection handle (wss:// -> OpenSSL, ws:// -> plain TCP)
//
// The SSL policy is a template parameter of WebSocketConnection; the URL is only
// known at runtime, so the handle holds one of the two instantiations and
// forwards through std::visit. No virtual dispatch.
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include "../core/errors.hpp"
#include "../core/url.hpp"
#include "ws_connection.hpp"

namespace anagram {
namespace transport {

class ClientConnection {
    struct DialToken {
        explicit DialToken() = default;
    };

public:
    // Constructible only through dial(), which alone can name DialToken
    explicit ClientConnection(DialToken) {}

    /**
     * Parse the URL and open a connection (single attempt)
     *
     * @throws ConnectError for an invalid URL or any dial/TLS/upgrade failure
     */
    static std::unique_ptr<ClientConnection> dial(const std::string& url,
                                                  const ConnectionOptions& options = {}) {
        ParsedURL parsed = parse_url(url);
        if (!parsed.valid) {
            throw ConnectError(parsed.error);
        }

        auto conn = std::make_unique<ClientConnection>(DialToken{});
        if (parsed.is_wss) {
            auto ws = std::make_unique<SecureConnection>();
            ws->connect(parsed, options);
            conn->impl_ = std::move(ws);
        } else {
            auto ws = std::make_unique<PlainConnection>();
            ws->connect(parsed, options);
            conn->impl_ = std::move(ws);
        }
        return conn;
    }

    std::string read_message() {
        return std::visit([](auto& ws) { return ws->read_message(); }, impl_);
    }

    void write_text(std::string_view text) {
        std::visit([text](auto& ws) { ws->write_text(text); }, impl_);
    }

    void close() {
        std::visit([](auto& ws) { ws->close(); }, impl_);
    }

    bool is_secure() const {
        return std::holds_alternative<std::unique_ptr<SecureConnection>>(impl_);
    }

private:
    std::variant<std::unique_ptr<SecureConnection>, std::unique_ptr<PlainConnection>> impl_;
};

} // namespace transport
} // namespace anagram
