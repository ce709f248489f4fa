// session/round.hpp
// Round phase state machine and countdown
//
//   AwaitingStart --RoundStarted--> Active --RoundFinished--> Revealed
//        ^                                                       |
//        +------------------------GameFinished-------------------+
//
// Every round event replaces the phase unconditionally, whatever the current
// phase is. Other inbound events leave it unchanged.
#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <variant>

#include "../core/clock.hpp"
#include "../protocol/messages.hpp"

namespace anagram::session {

inline constexpr const char* GUIDE_AWAITING = "WAITING ROUND START!";
inline constexpr const char* GUIDE_ACTIVE = "PLEASE GUESS!";
inline constexpr const char* GUIDE_REVEALED = "TIME'S UP! THE ANSWER:";

struct AwaitingStart {};

struct Active {
    std::string word;
    TimePoint deadline;
};

struct Revealed {
    std::string answer;
    TimePoint deadline;
};

using RoundPhase = std::variant<AwaitingStart, Active, Revealed>;

inline const char* guide_text(const RoundPhase& phase) {
    if (std::holds_alternative<Active>(phase)) return GUIDE_ACTIVE;
    if (std::holds_alternative<Revealed>(phase)) return GUIDE_REVEALED;
    return GUIDE_AWAITING;
}

// Word shown in the word box: puzzle while active, answer once revealed
inline std::string word_text(const RoundPhase& phase) {
    if (const auto* a = std::get_if<Active>(&phase)) return a->word;
    if (const auto* r = std::get_if<Revealed>(&phase)) return r->answer;
    return {};
}

inline std::optional<TimePoint> deadline_of(const RoundPhase& phase) {
    if (const auto* a = std::get_if<Active>(&phase)) return a->deadline;
    if (const auto* r = std::get_if<Revealed>(&phase)) return r->deadline;
    return std::nullopt;
}

/**
 * Apply an inbound event to the phase
 *
 * An unresolved deadline (timestamp failed to parse) becomes `now`, so the
 * countdown is expired from the start but the transition still happens.
 *
 * @return New phase, or nullopt when the event does not affect the round
 */
inline std::optional<RoundPhase> transition(const protocol::InboundEvent& event, TimePoint now) {
    return std::visit([now](const auto& e) -> std::optional<RoundPhase> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, protocol::RoundStarted>) {
            return RoundPhase{Active{e.word, e.finish_at.value_or(now)}};
        } else if constexpr (std::is_same_v<T, protocol::RoundFinished>) {
            return RoundPhase{Revealed{e.answer, e.next_round_at.value_or(now)}};
        } else if constexpr (std::is_same_v<T, protocol::GameFinished>) {
            return RoundPhase{AwaitingStart{}};
        } else {
            return std::nullopt;
        }
    }, event);
}

// max(0, deadline - now); zero in AwaitingStart
inline Millis countdown(const RoundPhase& phase, TimePoint now) {
    std::optional<TimePoint> deadline = deadline_of(phase);
    return deadline ? clock::remaining(*deadline, now) : Millis{0};
}

// "GUIDE - S.Ds" while time remains, the guide alone once expired
inline std::string header_text(const RoundPhase& phase, TimePoint now) {
    Millis left = countdown(phase, now);
    if (left.count() <= 0) {
        return guide_text(phase);
    }
    return std::string(guide_text(phase)) + " - " + clock::format_countdown(left);
}

} // namespace anagram::session
