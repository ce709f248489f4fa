// session/state.hpp
// Session state, events fed to the reducer, effects it requests
//
// SessionState is plain data; the connection handle lives in the runtime.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "../client_config.hpp"
#include "../protocol/messages.hpp"
#include "chat_log.hpp"
#include "input.hpp"
#include "round.hpp"

namespace anagram::session {

enum class ConnectionStatus : uint8_t {
    Connecting,
    Connected,
    Failed,
};

inline const char* to_string(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected:  return "connected";
        case ConnectionStatus::Failed:     return "failed";
    }
    return "unknown";
}

struct SessionState {
    ConnectionStatus connection = ConnectionStatus::Connecting;
    std::optional<std::string> error;      // single slot, latest wins
    ChatLog chat;
    RoundPhase phase = AwaitingStart{};
    InputBuffer input;

    uint64_t ticker_generation = 0;        // bumped on every (re)start and stop
    bool ticker_running = false;
    bool read_outstanding = false;
    bool quit = false;

    SessionState() = default;
    explicit SessionState(const ClientConfig& config) : chat(config.chat_capacity) {}

    bool connected() const { return connection == ConnectionStatus::Connected; }
};

// ============================================================================
// Events
// ============================================================================

namespace events {

struct ConnectSucceeded {};
struct ConnectFailed { std::string message; };

// Decoded frame; error set when a timestamp did not parse
struct Inbound {
    protocol::InboundEvent event;
    std::optional<std::string> error;
};

struct DecodeFailed { std::string message; };
struct ReadFailed { std::string message; };
struct Tick { uint64_t generation; };
struct KeyPressed { Key key; };
struct SubmitSucceeded {};
struct SubmitFailed { std::string message; };
struct KeepaliveFailed { std::string message; };

} // namespace events

using SessionEvent = std::variant<
    events::ConnectSucceeded,
    events::ConnectFailed,
    events::Inbound,
    events::DecodeFailed,
    events::ReadFailed,
    events::Tick,
    events::KeyPressed,
    events::SubmitSucceeded,
    events::SubmitFailed,
    events::KeepaliveFailed>;

// ============================================================================
// Effects
// ============================================================================

namespace effects {

struct Connect {};
struct ReadNext {};
struct StartKeepalive {};
struct SendText { std::string text; };
struct StartTicker { uint64_t generation; };
struct StopTicker {};
struct Quit {};

} // namespace effects

using Effect = std::variant<
    effects::Connect,
    effects::ReadNext,
    effects::StartKeepalive,
    effects::SendText,
    effects::StartTicker,
    effects::StopTicker,
    effects::Quit>;

} // namespace anagram::session
