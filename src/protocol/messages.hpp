// protocol/messages.hpp
// Inbound game events
//
// Every server frame is {"type": <tag>, "content": <payload>}. The decoder turns
// one frame into exactly one of the shapes below; nothing else crosses from the
// wire into the session.
#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include "../core/clock.hpp"

namespace anagram::protocol {

// Wire tags
inline constexpr const char* TAG_CHAT = "ChatMessage";
inline constexpr const char* TAG_ONGOING_ROUND = "OngoingRoundInfo";
inline constexpr const char* TAG_FINISHED_ROUND = "FinishedRoundInfo";
inline constexpr const char* TAG_FINISHED_GAME = "FinishedGame";
inline constexpr const char* TAG_PONG = "PongMessage";

struct Chat {
    std::string text;
};

// deadline is nullopt when the server timestamp did not parse
struct RoundStarted {
    std::string word;
    std::optional<TimePoint> finish_at;
};

struct RoundFinished {
    std::string answer;
    std::optional<TimePoint> next_round_at;
};

struct GameFinished {};

struct Pong {};

struct Unrecognized {
    std::string tag;
};

using InboundEvent = std::variant<Chat, RoundStarted, RoundFinished, GameFinished, Pong, Unrecognized>;

inline const char* event_name(const InboundEvent& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, Chat>) return TAG_CHAT;
        else if constexpr (std::is_same_v<T, RoundStarted>) return TAG_ONGOING_ROUND;
        else if constexpr (std::is_same_v<T, RoundFinished>) return TAG_FINISHED_ROUND;
        else if constexpr (std::is_same_v<T, GameFinished>) return TAG_FINISHED_GAME;
        else if constexpr (std::is_same_v<T, Pong>) return TAG_PONG;
        else return "Unrecognized";
    }, event);
}

} // namespace anagram::protocol
