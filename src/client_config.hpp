// client_config.hpp
// Client configuration constants and the immutable runtime configuration
#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace anagram {

// ============================================================================
// Compile-time Configuration
// ============================================================================

inline constexpr const char* DEFAULT_SERVER_URL = "wss://mc.chenk.my.id:3000/ws/anagram/1";

// Layout: every UI line is rendered at this width (columns)
inline constexpr int APP_WIDTH = 56;

// Chat log keeps the newest N lines
inline constexpr size_t CHAT_CAPACITY = 12;

// ============================================================================
// Timing
// ============================================================================

inline constexpr std::chrono::milliseconds KEEPALIVE_INTERVAL{10000};
inline constexpr std::chrono::milliseconds TICK_INTERVAL{100};

// Pause before serving the next read after a transport read failure
inline constexpr std::chrono::milliseconds READ_RETRY_PAUSE{100};

inline constexpr int CONNECT_TIMEOUT_MS = 5000;

// Outbound text the keepalive driver writes; users may not send it themselves
inline constexpr const char* PING_PAYLOAD = "/ping";

static_assert(APP_WIDTH >= 20, "APP_WIDTH too small for the header line");
static_assert(CHAT_CAPACITY > 0, "CHAT_CAPACITY must be positive");
static_assert(TICK_INTERVAL < KEEPALIVE_INTERVAL, "ticker must run faster than keepalive");

// ============================================================================
// Runtime Configuration
// ============================================================================

/**
 * Built once from argv, then passed by const reference
 */
struct ClientConfig {
    std::string url = DEFAULT_SERVER_URL;
    int app_width = APP_WIDTH;
    size_t chat_capacity = CHAT_CAPACITY;
    std::chrono::milliseconds keepalive_interval = KEEPALIVE_INTERVAL;
    std::chrono::milliseconds tick_interval = TICK_INTERVAL;
    std::chrono::milliseconds read_retry_pause = READ_RETRY_PAUSE;
    int connect_timeout_ms = CONNECT_TIMEOUT_MS;
};

} // namespace anagram
