// core/http.hpp
// HTTP upgrade and WebSocket frame utilities (RFC 6455)
//
// Transport-agnostic: no socket or TLS dependencies, only OpenSSL's libcrypto for
// the SHA-1/base64 in the Sec-WebSocket-Accept check. Used by
// transport/ws_connection.hpp for both ws:// and wss://.
//
// Key features:
//   - HTTP upgrade request building and response validation (status + accept key)
//   - WebSocket frame header parsing (server frames, optionally masked)
//   - Masked client frame building (TEXT, PONG, CLOSE)

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace anagram {
namespace http {

// GUID appended to the client key before hashing (RFC 6455 section 1.3)
inline constexpr const char* WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// Max header: 2 base + 8 extended length + 4 mask
inline constexpr size_t MAX_WS_HEADER_SIZE = 14;

// RFC 6455: control frame payloads must be <= 125 bytes
inline constexpr size_t MAX_CONTROL_PAYLOAD = 125;

using HeaderMap = std::vector<std::pair<std::string, std::string>>;

// ═══════════════════════════════════════════════════════════════════════════
// HTTP Utilities
// ═══════════════════════════════════════════════════════════════════════════

inline std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                            static_cast<int>(len));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

/**
 * Generate random WebSocket key
 *
 * 16 random bytes, base64-encoded to the 24-character Sec-WebSocket-Key value.
 */
inline std::string generate_websocket_key() {
    std::random_device rd;
    std::uniform_int_distribution<int> dis(0, 255);

    uint8_t nonce[16];
    for (auto& b : nonce) {
        b = static_cast<uint8_t>(dis(rd));
    }
    return base64_encode(nonce, sizeof(nonce));
}

/**
 * Compute the Sec-WebSocket-Accept value the server must answer with
 *
 * base64(SHA-1(key + GUID))
 */
inline std::string compute_accept_key(const std::string& websocket_key) {
    std::string input = websocket_key + WEBSOCKET_GUID;
    uint8_t digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest);
    return base64_encode(digest, sizeof(digest));
}

/**
 * Build HTTP WebSocket upgrade request
 *
 * @param host_header Host header value (e.g., "mc.chenk.my.id:3000")
 * @param path Request target (e.g., "/ws/anagram/1")
 * @param websocket_key Key from generate_websocket_key()
 */
inline std::string build_websocket_upgrade_request(
    const std::string& host_header,
    const std::string& path,
    const std::string& websocket_key)
{
    std::string request;
    request.reserve(512);

    request += "GET ";
    request += path;
    request += " HTTP/1.1\r\n";
    request += "Host: ";
    request += host_header;
    request += "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: ";
    request += websocket_key;
    request += "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n";

    request += "\r\n";
    return request;
}

/**
 * Find end of HTTP headers ("\r\n\r\n")
 *
 * @return Offset just past the blank line, or 0 if not yet received
 */
inline size_t find_header_end(const uint8_t* data, size_t len) {
    for (size_t i = 3; i < len; i++) {
        if (data[i - 3] == '\r' && data[i - 2] == '\n' &&
            data[i - 1] == '\r' && data[i] == '\n') {
            return i + 1;
        }
    }
    return 0;
}

/**
 * Parsed HTTP response head
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason;
    HeaderMap headers;

    // Case-insensitive header lookup, nullptr if absent
    const std::string* header(std::string_view name) const {
        for (const auto& [key, value] : headers) {
            if (key.size() != name.size()) continue;
            bool same = true;
            for (size_t i = 0; i < key.size(); i++) {
                char a = key[i], b = name[i];
                if (a >= 'A' && a <= 'Z') a = static_cast<char>(a - 'A' + 'a');
                if (b >= 'A' && b <= 'Z') b = static_cast<char>(b - 'A' + 'a');
                if (a != b) { same = false; break; }
            }
            if (same) return &value;
        }
        return nullptr;
    }
};

inline std::string trim_ows(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
    return std::string(s.substr(b, e - b));
}

/**
 * Parse HTTP response status line and headers
 *
 * @param head Bytes up to and including the blank line
 * @param out Parsed response
 * @return true if the status line is well formed
 */
inline bool parse_http_response(std::string_view head, HttpResponse& out) {
    size_t line_end = head.find("\r\n");
    if (line_end == std::string_view::npos) {
        return false;
    }
    std::string_view status_line = head.substr(0, line_end);

    // "HTTP/1.1 101 Switching Protocols"
    if (status_line.substr(0, 5) != "HTTP/") {
        return false;
    }
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string_view::npos || sp1 + 4 > status_line.size()) {
        return false;
    }
    int code = 0;
    for (size_t i = sp1 + 1; i < sp1 + 4; i++) {
        char c = status_line[i];
        if (c < '0' || c > '9') return false;
        code = code * 10 + (c - '0');
    }
    out.status_code = code;
    out.reason = sp1 + 5 <= status_line.size() ? std::string(status_line.substr(sp1 + 5)) : "";
    out.headers.clear();

    size_t pos = line_end + 2;
    while (pos < head.size()) {
        size_t next = head.find("\r\n", pos);
        if (next == std::string_view::npos) next = head.size();
        std::string_view line = head.substr(pos, next - pos);
        pos = next + 2;
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        out.headers.emplace_back(trim_ows(line.substr(0, colon)),
                                 trim_ows(line.substr(colon + 1)));
    }
    return true;
}

/**
 * Validate HTTP upgrade response
 *
 * Requires status 101 and a Sec-WebSocket-Accept matching the request key.
 *
 * @param response Parsed response head
 * @param websocket_key Key sent in the request
 * @param error Set to a description when validation fails
 */
inline bool validate_http_upgrade_response(const HttpResponse& response,
                                           const std::string& websocket_key,
                                           std::string& error) {
    if (response.status_code != 101) {
        error = "expected handshake response status code 101 but got " +
                std::to_string(response.status_code);
        return false;
    }
    const std::string* accept = response.header("Sec-WebSocket-Accept");
    if (!accept) {
        error = "missing Sec-WebSocket-Accept header";
        return false;
    }
    if (*accept != compute_accept_key(websocket_key)) {
        error = "invalid Sec-WebSocket-Accept " + *accept;
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Frame Structures
// ═══════════════════════════════════════════════════════════════════════════

/**
 * WebSocket frame opcodes (RFC 6455)
 */
enum class WebSocketOpcode : uint8_t {
    CONTINUATION = 0x00,
    TEXT = 0x01,
    BINARY = 0x02,
    CLOSE = 0x08,
    PING = 0x09,
    PONG = 0x0A,
};

/**
 * Parsed WebSocket frame header
 */
struct WebSocketFrame {
    bool fin;                  // FIN bit (final fragment)
    uint8_t opcode;            // Opcode (0x00-0x0F)
    bool masked;               // MASK bit
    uint64_t payload_len;      // Payload length
    uint8_t mask_key[4];       // Masking key (if masked)
    size_t header_len;         // Total header length (2-14 bytes)
    const uint8_t* payload;    // Pointer to payload (not copied)
};

/**
 * Parse WebSocket frame header
 *
 * Does NOT copy payload data; the buffer must stay valid while the frame is used.
 *
 * @param data Frame buffer
 * @param len Buffer length
 * @param out_frame Parsed frame metadata
 * @return true if a complete frame is available, false if incomplete
 */
inline bool parse_websocket_frame(const uint8_t* data, size_t len, WebSocketFrame& out_frame) {
    if (len < 2) {
        return false;
    }

    // Byte 0: FIN + opcode
    uint8_t byte0 = data[0];
    out_frame.fin = (byte0 & 0x80) != 0;
    out_frame.opcode = byte0 & 0x0F;

    // Byte 1: MASK + payload length
    uint8_t byte1 = data[1];
    out_frame.masked = (byte1 & 0x80) != 0;
    uint64_t payload_len = byte1 & 0x7F;

    size_t header_len = 2;

    if (payload_len == 126) {
        if (len < 4) return false;
        payload_len = (static_cast<uint64_t>(data[2]) << 8) | data[3];
        header_len = 4;
    } else if (payload_len == 127) {
        if (len < 10) return false;
        payload_len = 0;
        for (int i = 0; i < 8; i++) {
            payload_len = (payload_len << 8) | data[2 + i];
        }
        header_len = 10;
    }

    out_frame.payload_len = payload_len;

    if (out_frame.masked) {
        if (len < header_len + 4) return false;
        memcpy(out_frame.mask_key, data + header_len, 4);
        header_len += 4;
    }

    out_frame.header_len = header_len;

    if (len - header_len < payload_len) {
        return false;  // Incomplete frame
    }

    out_frame.payload = data + header_len;
    return true;
}

/**
 * Unmask WebSocket payload in-place
 */
inline void unmask_payload(uint8_t* payload, size_t len, const uint8_t mask_key[4]) {
    for (size_t i = 0; i < len; i++) {
        payload[i] ^= mask_key[i % 4];
    }
}

/**
 * Fresh masking key for a client frame (RFC 6455 section 5.3)
 */
inline void random_mask_key(uint8_t out[4]) {
    static thread_local std::mt19937 gen{std::random_device{}()};
    uint32_t v = gen();
    memcpy(out, &v, 4);
}

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket Frame Builders (client → server, always masked)
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Build a single-fragment WebSocket frame with the given opcode
 *
 * @param opcode WebSocket opcode (TEXT, BINARY, PING, PONG, CLOSE)
 * @param payload Payload data
 * @param payload_len Payload length
 * @param mask_key 4-byte masking key
 * @return Encoded frame (header + masked payload)
 */
inline std::string build_websocket_frame(WebSocketOpcode opcode,
                                         const uint8_t* payload, size_t payload_len,
                                         const uint8_t mask_key[4]) {
    std::string out;
    out.reserve(MAX_WS_HEADER_SIZE + payload_len);

    // Byte 0: FIN + opcode
    out.push_back(static_cast<char>(0x80 | (static_cast<uint8_t>(opcode) & 0x0F)));

    // Byte 1: MASK + payload length
    if (payload_len <= 125) {
        out.push_back(static_cast<char>(0x80 | payload_len));
    } else if (payload_len <= 65535) {
        out.push_back(static_cast<char>(0x80 | 126));
        out.push_back(static_cast<char>((payload_len >> 8) & 0xFF));
        out.push_back(static_cast<char>(payload_len & 0xFF));
    } else {
        out.push_back(static_cast<char>(0x80 | 127));
        for (int i = 0; i < 8; i++) {
            out.push_back(static_cast<char>((static_cast<uint64_t>(payload_len) >> (56 - i * 8)) & 0xFF));
        }
    }

    out.append(reinterpret_cast<const char*>(mask_key), 4);

    for (size_t i = 0; i < payload_len; i++) {
        out.push_back(static_cast<char>(payload[i] ^ mask_key[i % 4]));
    }
    return out;
}

inline std::string build_text_frame(std::string_view text, const uint8_t mask_key[4]) {
    return build_websocket_frame(WebSocketOpcode::TEXT,
                                 reinterpret_cast<const uint8_t*>(text.data()), text.size(),
                                 mask_key);
}

/**
 * Build WebSocket PONG frame echoing a PING payload (truncated to 125 bytes)
 */
inline std::string build_pong_frame(const uint8_t* payload, size_t payload_len,
                                    const uint8_t mask_key[4]) {
    if (payload_len > MAX_CONTROL_PAYLOAD) {
        payload_len = MAX_CONTROL_PAYLOAD;
    }
    return build_websocket_frame(WebSocketOpcode::PONG, payload, payload_len, mask_key);
}

/**
 * Build WebSocket CLOSE frame
 *
 * @param status_code Close status code (1000 = normal closure)
 * @param reason Close reason (truncated to 123 bytes)
 */
inline std::string build_close_frame(uint16_t status_code, std::string_view reason,
                                     const uint8_t mask_key[4]) {
    if (reason.size() > MAX_CONTROL_PAYLOAD - 2) {
        reason = reason.substr(0, MAX_CONTROL_PAYLOAD - 2);
    }
    uint8_t payload[MAX_CONTROL_PAYLOAD];
    payload[0] = static_cast<uint8_t>((status_code >> 8) & 0xFF);
    payload[1] = static_cast<uint8_t>(status_code & 0xFF);
    if (!reason.empty()) {
        memcpy(payload + 2, reason.data(), reason.size());
    }
    return build_websocket_frame(WebSocketOpcode::CLOSE, payload, 2 + reason.size(), mask_key);
}

}  // namespace http
}  // namespace anagram
