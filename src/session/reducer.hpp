// session/reducer.hpp
// Pure session transition: (state, event, now) -> (state', effects)
//
// The only place session state changes. The runtime executes the returned
// effects; nothing here touches the network, threads or the terminal, so every
// rule can be driven directly from tests.
//
// Read discipline: ReadNext is emitted exactly once per resolved read
// (Inbound, DecodeFailed, ReadFailed) and once after connecting, so at most one
// read is ever outstanding. A failed read is followed by another read on the
// same connection; there is no reconnect.
#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../core/clock.hpp"
#include "../protocol/messages.hpp"
#include "round.hpp"
#include "state.hpp"

namespace anagram::session {

struct Transition {
    SessionState state;
    std::vector<Effect> effects;
};

inline std::vector<Effect> initial_effects() {
    return {effects::Connect{}};
}

namespace detail {

inline void request_read(SessionState& s, std::vector<Effect>& out) {
    if (!s.connected() || s.read_outstanding) return;
    s.read_outstanding = true;
    out.push_back(effects::ReadNext{});
}

inline void restart_ticker(SessionState& s, std::vector<Effect>& out) {
    s.ticker_generation++;
    s.ticker_running = true;
    out.push_back(effects::StartTicker{s.ticker_generation});
}

inline void stop_ticker(SessionState& s, std::vector<Effect>& out) {
    if (!s.ticker_running) return;
    s.ticker_generation++;
    s.ticker_running = false;
    out.push_back(effects::StopTicker{});
}

inline void quit(SessionState& s, std::vector<Effect>& out) {
    s.quit = true;
    out.push_back(effects::Quit{});
}

inline void on_inbound(SessionState& s, const events::Inbound& ev, TimePoint now,
                       std::vector<Effect>& out) {
    s.read_outstanding = false;

    if (std::optional<RoundPhase> next = transition(ev.event, now)) {
        s.phase = std::move(*next);
        if (std::holds_alternative<AwaitingStart>(s.phase)) {
            stop_ticker(s, out);
        } else {
            restart_ticker(s, out);
        }
    } else if (const auto* chat = std::get_if<protocol::Chat>(&ev.event)) {
        s.chat.append(chat->text);
    } else if (const auto* unknown = std::get_if<protocol::Unrecognized>(&ev.event)) {
        s.error = "unknown message type: " + unknown->tag;
    }

    if (ev.error) {
        s.error = *ev.error;
    }
    request_read(s, out);
}

inline void on_key(SessionState& s, const Key& key, std::vector<Effect>& out) {
    switch (key.code) {
        case KeyCode::CtrlC:
            quit(s, out);
            return;
        case KeyCode::CtrlE:
            s.error.reset();
            return;
        case KeyCode::Enter:
            break;
        default:
            s.input.apply(key);
            return;
    }

    SubmitOutcome outcome = classify(s.input.text(), s.connected());
    std::visit([&](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, submit::Quit>) {
            quit(s, out);
        } else if constexpr (std::is_same_v<T, submit::ClearChat>) {
            s.chat.clear();
            s.input.clear();
        } else if constexpr (std::is_same_v<T, submit::Rejected>) {
            s.error = o.message;
        } else if constexpr (std::is_same_v<T, submit::Send>) {
            out.push_back(effects::SendText{o.text});
        }
    }, outcome);
}

} // namespace detail

/**
 * Apply one event
 *
 * @param now Wall clock at dispatch (resolves unparsed deadlines, expires ticks)
 */
inline Transition reduce(SessionState state, const SessionEvent& event, TimePoint now) {
    std::vector<Effect> out;
    if (state.quit) {
        return {std::move(state), std::move(out)};
    }

    SessionState& s = state;
    std::visit([&](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;

        if constexpr (std::is_same_v<T, events::ConnectSucceeded>) {
            s.connection = ConnectionStatus::Connected;
            out.push_back(effects::StartKeepalive{});
            detail::request_read(s, out);
        } else if constexpr (std::is_same_v<T, events::ConnectFailed>) {
            s.connection = ConnectionStatus::Failed;
            s.error = "websocket.Dial: " + ev.message;
        } else if constexpr (std::is_same_v<T, events::Inbound>) {
            detail::on_inbound(s, ev, now, out);
        } else if constexpr (std::is_same_v<T, events::DecodeFailed>) {
            s.read_outstanding = false;
            s.error = ev.message;
            detail::request_read(s, out);
        } else if constexpr (std::is_same_v<T, events::ReadFailed>) {
            s.read_outstanding = false;
            s.error = "wsjson.Read: " + ev.message;
            detail::request_read(s, out);
        } else if constexpr (std::is_same_v<T, events::Tick>) {
            // Ticks from a replaced or stopped ticker are stale
            if (ev.generation == s.ticker_generation && s.ticker_running &&
                countdown(s.phase, now).count() <= 0) {
                detail::stop_ticker(s, out);
            }
        } else if constexpr (std::is_same_v<T, events::KeyPressed>) {
            detail::on_key(s, ev.key, out);
        } else if constexpr (std::is_same_v<T, events::SubmitSucceeded>) {
            s.input.clear();
        } else if constexpr (std::is_same_v<T, events::SubmitFailed>) {
            s.error = "c.Write: " + ev.message;
        } else if constexpr (std::is_same_v<T, events::KeepaliveFailed>) {
            s.error = "c.Write: " + ev.message;
        }
    }, event);

    return {std::move(state), std::move(out)};
}

} // namespace anagram::session
