// core/url.hpp
// WebSocket URL parsing (ws:// and wss://)
//
// Splits a URL into the pieces the connection needs: host (for DNS, SNI and the
// Host header), port, request target (path + query) and whether TLS is used.
// Bracketed IPv6 literals are accepted: ws://[::1]:9000/ws
#pragma once

#include <cstdint>
#include <string>

namespace anagram {

struct ParsedURL {
    std::string host;       // e.g., "mc.chenk.my.id" (IPv6 without brackets)
    uint16_t port = 443;
    std::string path;       // request target, e.g., "/ws/anagram/1?x=y"
    bool is_wss = true;     // true for wss://, false for ws://

    bool valid = false;
    std::string error;      // reason when !valid

    // Value for the Host header (brackets IPv6, omits default port)
    std::string host_header() const {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        uint16_t default_port = is_wss ? 443 : 80;
        if (port != default_port) {
            h += ":" + std::to_string(port);
        }
        return h;
    }
};

inline ParsedURL parse_url(const std::string& url) {
    ParsedURL result;
    std::string rest;

    // Check scheme (case-insensitive)
    auto has_scheme = [&](const char* scheme, size_t len) {
        if (url.size() < len) return false;
        for (size_t i = 0; i < len; i++) {
            char c = url[i];
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if (c != scheme[i]) return false;
        }
        return true;
    };

    if (has_scheme("wss://", 6)) {
        result.is_wss = true;
        result.port = 443;
        rest = url.substr(6);
    } else if (has_scheme("ws://", 5)) {
        result.is_wss = false;
        result.port = 80;
        rest = url.substr(5);
    } else {
        result.error = "unsupported URL scheme (expected ws:// or wss://): " + url;
        return result;
    }

    // Authority ends at the first '/', '?' or '#'
    size_t auth_end = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, auth_end);
    std::string target = auth_end == std::string::npos ? "" : rest.substr(auth_end);

    // Fragments are never sent to the server
    size_t hash_pos = target.find('#');
    if (hash_pos != std::string::npos) {
        target.erase(hash_pos);
    }
    if (target.empty() || target[0] != '/') {
        target.insert(0, "/");
    }
    result.path = target;

    // Userinfo is not used for the handshake
    size_t at_pos = authority.rfind('@');
    if (at_pos != std::string::npos) {
        authority.erase(0, at_pos + 1);
    }

    // Parse host[:port], host may be a bracketed IPv6 literal
    std::string port_str;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            result.error = "unterminated IPv6 literal in URL: " + url;
            return result;
        }
        result.host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                result.error = "unexpected characters after IPv6 literal: " + url;
                return result;
            }
            port_str = after.substr(1);
        }
    } else {
        size_t colon_pos = authority.find(':');
        if (colon_pos != std::string::npos) {
            result.host = authority.substr(0, colon_pos);
            port_str = authority.substr(colon_pos + 1);
        } else {
            result.host = authority;
        }
    }

    if (result.host.empty()) {
        result.error = "missing host in URL: " + url;
        return result;
    }

    if (!port_str.empty()) {
        if (port_str.size() > 5) {
            result.error = "invalid port in URL: " + url;
            return result;
        }
        uint32_t port = 0;
        for (char c : port_str) {
            if (c < '0' || c > '9') {
                result.error = "invalid port in URL: " + url;
                return result;
            }
            port = port * 10 + static_cast<uint32_t>(c - '0');
        }
        if (port == 0 || port > 65535) {
            result.error = "port out of range in URL: " + url;
            return result;
        }
        result.port = static_cast<uint16_t>(port);
    }

    result.valid = true;
    return result;
}

} // namespace anagram
