// test/unittest/test_core_http.cpp
// Unit tests for core/http.hpp - upgrade handshake and WebSocket frame parsing/building

#include "../../src/core/http.hpp"
#include <cassert>
#include <cstdio>
#include <cstring>

using namespace anagram::http;

void test_generate_websocket_key() {
    printf("Testing generate_websocket_key()...\n");

    std::string key1 = generate_websocket_key();
    std::string key2 = generate_websocket_key();

    // 16 bytes base64-encoded
    assert(key1.size() == 24);
    assert(key2.size() == 24);
    assert(key1.substr(22) == "==");

    // Keys should be different (random)
    assert(key1 != key2);

    printf("  ✅ generate_websocket_key() works\n");
}

void test_compute_accept_key() {
    printf("Testing compute_accept_key()...\n");

    // RFC 6455 section 1.3 example
    assert(compute_accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");

    printf("  ✅ compute_accept_key() works\n");
}

void test_build_websocket_upgrade_request() {
    printf("Testing build_websocket_upgrade_request()...\n");

    std::string req = build_websocket_upgrade_request("mc.chenk.my.id:3000", "/ws/anagram/1",
                                                      "dGhlIHNhbXBsZSBub25jZQ==");

    assert(req.find("GET /ws/anagram/1 HTTP/1.1\r\n") == 0);
    assert(req.find("Host: mc.chenk.my.id:3000\r\n") != std::string::npos);
    assert(req.find("Upgrade: websocket\r\n") != std::string::npos);
    assert(req.find("Connection: Upgrade\r\n") != std::string::npos);
    assert(req.find("Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n") != std::string::npos);
    assert(req.find("Sec-WebSocket-Version: 13\r\n") != std::string::npos);

    // Head ends the request, no body
    assert(req.find("\r\n\r\n") == req.size() - 4);
    assert(req.substr(req.size() - 4) == "\r\n\r\n");

    printf("  ✅ build_websocket_upgrade_request() works\n");
}

void test_find_header_end() {
    printf("Testing find_header_end()...\n");

    const char* partial = "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n";
    assert(find_header_end(reinterpret_cast<const uint8_t*>(partial), strlen(partial)) == 0);

    // Frame bytes right behind the head
    const char head[] = "HTTP/1.1 101 OK\r\n\r\n\x81\x02hi";
    size_t len = sizeof(head) - 1;
    size_t end = find_header_end(reinterpret_cast<const uint8_t*>(head), len);
    assert(end == 19);
    assert(len - end == 4);

    printf("  ✅ find_header_end() works\n");
}

void test_validate_http_upgrade_response() {
    printf("Testing validate_http_upgrade_response()...\n");

    const std::string key = "dGhlIHNhbXBsZSBub25jZQ==";
    std::string error;

    // Valid, header names in mixed case
    {
        const char* valid = "HTTP/1.1 101 Switching Protocols\r\n"
                            "Upgrade: websocket\r\n"
                            "Connection: Upgrade\r\n"
                            "sec-websocket-accept:   s3pPLMBiTxaQ9kYGzzhZRbK+xOo=  \r\n\r\n";
        HttpResponse resp;
        assert(parse_http_response(valid, resp));
        assert(resp.status_code == 101);
        assert(resp.reason == "Switching Protocols");
        assert(validate_http_upgrade_response(resp, key, error));
    }

    // Wrong status
    {
        HttpResponse resp;
        assert(parse_http_response("HTTP/1.1 200 OK\r\n\r\n", resp));
        assert(!validate_http_upgrade_response(resp, key, error));
        assert(error == "expected handshake response status code 101 but got 200");
    }

    // Missing accept
    {
        HttpResponse resp;
        assert(parse_http_response("HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n\r\n", resp));
        assert(!validate_http_upgrade_response(resp, key, error));
        assert(error == "missing Sec-WebSocket-Accept header");
    }

    // Wrong accept
    {
        HttpResponse resp;
        assert(parse_http_response("HTTP/1.1 101 Switching Protocols\r\n"
                                   "Sec-WebSocket-Accept: AAAA\r\n\r\n", resp));
        assert(!validate_http_upgrade_response(resp, key, error));
        assert(error.find("invalid Sec-WebSocket-Accept") == 0);
    }

    // Malformed status lines
    {
        HttpResponse resp;
        assert(!parse_http_response("HTTP", resp));
        assert(!parse_http_response("SSH-2.0-OpenSSH\r\n\r\n", resp));
        assert(!parse_http_response("HTTP/1.1 1x1 Nope\r\n\r\n", resp));
    }

    printf("  ✅ validate_http_upgrade_response() works\n");
}

void test_parse_websocket_frame() {
    printf("Testing parse_websocket_frame()...\n");

    // Simple unmasked TEXT frame
    {
        uint8_t frame[] = {0x81, 0x05, 'H', 'e', 'l', 'l', 'o'};

        WebSocketFrame parsed;
        assert(parse_websocket_frame(frame, sizeof(frame), parsed));
        assert(parsed.fin == true);
        assert(parsed.opcode == 0x01);
        assert(parsed.masked == false);
        assert(parsed.payload_len == 5);
        assert(parsed.header_len == 2);
        assert(memcmp(parsed.payload, "Hello", 5) == 0);
    }

    // Masked PING, unmasked in place
    {
        uint8_t frame[] = {
            0x89, 0x84,
            0x12, 0x34, 0x56, 0x78,
            'p' ^ 0x12, 'i' ^ 0x34, 'n' ^ 0x56, 'g' ^ 0x78
        };

        WebSocketFrame parsed;
        assert(parse_websocket_frame(frame, sizeof(frame), parsed));
        assert(parsed.opcode == 0x09);
        assert(parsed.masked == true);
        assert(parsed.payload_len == 4);
        assert(parsed.header_len == 6);

        unmask_payload(const_cast<uint8_t*>(parsed.payload), 4, parsed.mask_key);
        assert(memcmp(parsed.payload, "ping", 4) == 0);
    }

    // Non-final fragment
    {
        uint8_t frame[] = {0x01, 0x03, 'a', 'b', 'c'};
        WebSocketFrame parsed;
        assert(parse_websocket_frame(frame, sizeof(frame), parsed));
        assert(parsed.fin == false);
        assert(parsed.opcode == 0x01);
    }

    // 16-bit extended length, payload not yet received
    {
        uint8_t frame[] = {0x81, 126, 0x00, 0x80};
        WebSocketFrame parsed;
        assert(!parse_websocket_frame(frame, sizeof(frame), parsed));
    }

    // Only one byte
    {
        uint8_t frame[] = {0x81};
        WebSocketFrame parsed;
        assert(!parse_websocket_frame(frame, 1, parsed));
    }

    printf("  ✅ parse_websocket_frame() works\n");
}

void test_build_text_frame() {
    printf("Testing build_text_frame()...\n");

    const std::string text = "apple";
    uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};
    std::string frame = build_text_frame(text, mask);

    assert(frame.size() == 2 + 4 + text.size());
    assert(static_cast<uint8_t>(frame[0]) == 0x81);
    assert(static_cast<uint8_t>(frame[1]) == (0x80 | text.size()));
    assert(memcmp(frame.data() + 2, mask, 4) == 0);
    for (size_t i = 0; i < text.size(); i++) {
        assert(static_cast<uint8_t>(frame[6 + i]) == (static_cast<uint8_t>(text[i]) ^ mask[i % 4]));
    }

    // 16-bit length form
    std::string big(300, 'x');
    std::string big_frame = build_text_frame(big, mask);
    assert(static_cast<uint8_t>(big_frame[1]) == (0x80 | 126));
    assert(static_cast<uint8_t>(big_frame[2]) == 0x01);
    assert(static_cast<uint8_t>(big_frame[3]) == 0x2C);
    assert(big_frame.size() == 4 + 4 + 300);

    // A built frame parses back, as the server would see it
    WebSocketFrame parsed;
    assert(parse_websocket_frame(reinterpret_cast<const uint8_t*>(big_frame.data()),
                                 big_frame.size(), parsed));
    assert(parsed.masked);
    assert(parsed.payload_len == 300);

    printf("  ✅ build_text_frame() works\n");
}

void test_build_control_frames() {
    printf("Testing build_pong_frame() / build_close_frame()...\n");

    uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};

    {
        std::string pong = build_pong_frame(nullptr, 0, mask);
        assert(pong.size() == 6);
        assert(static_cast<uint8_t>(pong[0]) == 0x8A);
        assert(static_cast<uint8_t>(pong[1]) == 0x80);
    }

    // Truncated to 125 bytes
    {
        uint8_t payload[200];
        memset(payload, 'A', sizeof(payload));
        std::string pong = build_pong_frame(payload, sizeof(payload), mask);
        assert(pong.size() == 2 + 4 + 125);
        assert(static_cast<uint8_t>(pong[1]) == 0xFD);
    }

    {
        std::string close = build_close_frame(1000, "Goodbye", mask);
        assert(close.size() == 2 + 4 + 2 + 7);
        assert(static_cast<uint8_t>(close[0]) == 0x88);
        assert(static_cast<uint8_t>(close[1]) == (0x80 | 9));
        // Status code, unmasked
        assert((static_cast<uint8_t>(close[6]) ^ mask[0]) == 0x03);
        assert((static_cast<uint8_t>(close[7]) ^ mask[1]) == 0xE8);
    }

    printf("  ✅ control frame builders work\n");
}

int main() {
    printf("╔════════════════════════════════════════════════════════════════════╗\n");
    printf("║        core/http.hpp Unit Tests                                   ║\n");
    printf("╚════════════════════════════════════════════════════════════════════╝\n\n");

    test_generate_websocket_key();
    test_compute_accept_key();
    test_build_websocket_upgrade_request();
    test_find_header_end();
    test_validate_http_upgrade_response();
    test_parse_websocket_frame();
    test_build_text_frame();
    test_build_control_frames();

    printf("\n╔════════════════════════════════════════════════════════════════════╗\n");
    printf("║ All tests passed! ✅                                              ║\n");
    printf("╚════════════════════════════════════════════════════════════════════╝\n");

    return 0;
}
