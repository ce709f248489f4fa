// test/unittest/test_url.cpp
// Unit tests for core/url.hpp

#include "../../src/core/url.hpp"
#include "../../src/client_config.hpp"
#include <cassert>
#include <cstdio>

using namespace anagram;

void test_default_endpoint() {
    printf("Testing default endpoint...\n");

    ParsedURL u = parse_url(DEFAULT_SERVER_URL);
    assert(u.valid);
    assert(u.is_wss);
    assert(u.host == "mc.chenk.my.id");
    assert(u.port == 3000);
    assert(u.path == "/ws/anagram/1");
    assert(u.host_header() == "mc.chenk.my.id:3000");

    printf("  ✅ default endpoint parses\n");
}

void test_default_ports() {
    printf("Testing default ports and paths...\n");

    ParsedURL a = parse_url("wss://example.com");
    assert(a.valid && a.is_wss && a.port == 443 && a.path == "/");
    assert(a.host_header() == "example.com");

    ParsedURL b = parse_url("ws://example.com/game");
    assert(b.valid && !b.is_wss && b.port == 80 && b.path == "/game");

    // Scheme is case-insensitive
    ParsedURL c = parse_url("WSS://Example.com:8443/x");
    assert(c.valid && c.is_wss && c.port == 8443);
    assert(c.host_header() == "Example.com:8443");

    printf("  ✅ default ports work\n");
}

void test_query_fragment_userinfo() {
    printf("Testing query, fragment and userinfo...\n");

    ParsedURL u = parse_url("ws://user:secret@localhost:9000/ws/anagram/2?lang=id#top");
    assert(u.valid);
    assert(u.host == "localhost");
    assert(u.port == 9000);
    assert(u.path == "/ws/anagram/2?lang=id");

    ParsedURL q = parse_url("ws://localhost?room=1");
    assert(q.valid);
    assert(q.path == "/?room=1");

    printf("  ✅ query/fragment/userinfo handled\n");
}

void test_ipv6() {
    printf("Testing IPv6 literals...\n");

    ParsedURL u = parse_url("ws://[::1]:9000/ws");
    assert(u.valid);
    assert(u.host == "::1");
    assert(u.port == 9000);
    assert(u.host_header() == "[::1]:9000");

    ParsedURL d = parse_url("wss://[2001:db8::2]");
    assert(d.valid && d.port == 443);
    assert(d.host_header() == "[2001:db8::2]");

    assert(!parse_url("ws://[::1/ws").valid);
    assert(!parse_url("ws://[::1]x/ws").valid);

    printf("  ✅ IPv6 literals work\n");
}

void test_invalid() {
    printf("Testing invalid URLs...\n");

    ParsedURL scheme = parse_url("https://example.com/ws");
    assert(!scheme.valid);
    assert(scheme.error.find("unsupported URL scheme") == 0);

    ParsedURL host = parse_url("ws:///path");
    assert(!host.valid);
    assert(host.error.find("missing host") == 0);

    assert(parse_url("ws://example.com:http/").error.find("invalid port") == 0);
    assert(parse_url("ws://example.com:123456/").error.find("invalid port") == 0);
    assert(parse_url("ws://example.com:0/").error.find("port out of range") == 0);
    assert(parse_url("ws://example.com:65536/").error.find("port out of range") == 0);
    assert(parse_url("ws://example.com:65535/").valid);

    assert(!parse_url("").valid);

    printf("  ✅ invalid URLs rejected\n");
}

int main() {
    printf("╔════════════════════════════════════════════════════════════════════╗\n");
    printf("║        core/url.hpp Unit Tests                                    ║\n");
    printf("╚════════════════════════════════════════════════════════════════════╝\n\n");

    test_default_endpoint();
    test_default_ports();
    test_query_fragment_userinfo();
    test_ipv6();
    test_invalid();

    printf("\n✅ All URL tests passed\n");
    return 0;
}
