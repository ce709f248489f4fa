// test/unittest/test_reducer.cpp
// Unit tests for session/reducer.hpp - the session transition rules

#include "session/reducer.hpp"
#include "protocol/decoder.hpp"
#include "unit_test.hpp"

#include <string>
#include <variant>
#include <vector>

using namespace anagram;
using namespace anagram::session;
using namespace std::chrono;

// Helpers
// ============================================================================

template<typename E>
static size_t count_effects(const std::vector<Effect>& effects) {
    size_t n = 0;
    for (const auto& e : effects) {
        if (std::holds_alternative<E>(e)) n++;
    }
    return n;
}

template<typename E>
static const E* find_effect(const std::vector<Effect>& effects) {
    for (const auto& e : effects) {
        if (const E* hit = std::get_if<E>(&e)) return hit;
    }
    return nullptr;
}

static Transition step(SessionState s, SessionEvent ev, TimePoint now = Clock::now()) {
    return reduce(std::move(s), ev, now);
}

// Connected state with its first read outstanding
static SessionState connected_state() {
    return step(SessionState{}, events::ConnectSucceeded{}).state;
}

static SessionState type_line(SessionState s, const std::string& text) {
    for (char c : text) {
        s = step(std::move(s), events::KeyPressed{Key::typed(std::string(1, c))}).state;
    }
    return s;
}

static Transition press_enter(SessionState s) {
    return step(std::move(s), events::KeyPressed{Key::of(KeyCode::Enter)});
}

// Decode a frame as the reader would and feed the result
static Transition receive(SessionState s, const std::string& frame, TimePoint now) {
    protocol::DecodeResult r = protocol::decode_frame(frame);
    if (r.event) {
        return step(std::move(s), events::Inbound{*r.event, r.error}, now);
    }
    return step(std::move(s), events::DecodeFailed{*r.error}, now);
}

// ============================================================================
// Connection lifecycle
// ============================================================================

TEST(initial_state) {
    SessionState s;
    ASSERT_TRUE(s.connection == ConnectionStatus::Connecting);
    ASSERT_FALSE(s.error.has_value());
    ASSERT_TRUE(std::holds_alternative<AwaitingStart>(s.phase));
    ASSERT_EQ(s.chat.capacity(), CHAT_CAPACITY);

    std::vector<Effect> first = initial_effects();
    ASSERT_EQ(first.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<effects::Connect>(first[0]));
}

TEST(connect_succeeded) {
    Transition t = step(SessionState{}, events::ConnectSucceeded{});
    ASSERT_TRUE(t.state.connected());
    ASSERT_TRUE(t.state.read_outstanding);
    ASSERT_EQ(count_effects<effects::StartKeepalive>(t.effects), 1u);
    ASSERT_EQ(count_effects<effects::ReadNext>(t.effects), 1u);
}

TEST(connect_failed) {
    Transition t = step(SessionState{}, events::ConnectFailed{"dial tcp: connection refused"});
    ASSERT_TRUE(t.state.connection == ConnectionStatus::Failed);
    ASSERT_EQ(*t.state.error, "websocket.Dial: dial tcp: connection refused");
    ASSERT_TRUE(t.effects.empty());
    ASSERT_FALSE(t.state.read_outstanding);
}

// ============================================================================
// Read discipline
// ============================================================================

TEST(one_read_per_resolution) {
    SessionState s = connected_state();
    TimePoint now = Clock::now();

    Transition a = step(s, events::Inbound{protocol::Chat{"a"}, std::nullopt}, now);
    ASSERT_EQ(count_effects<effects::ReadNext>(a.effects), 1u);
    ASSERT_TRUE(a.state.read_outstanding);

    Transition b = step(a.state, events::DecodeFailed{"wsjson.Read: bad"}, now);
    ASSERT_EQ(count_effects<effects::ReadNext>(b.effects), 1u);

    Transition c = step(b.state, events::ReadFailed{"failed to get reader: EOF"}, now);
    ASSERT_EQ(count_effects<effects::ReadNext>(c.effects), 1u);
    ASSERT_EQ(*c.state.error, "wsjson.Read: failed to get reader: EOF");

    // Non-read events never issue a read
    Transition d = step(c.state, events::KeyPressed{Key::typed("x")}, now);
    ASSERT_EQ(count_effects<effects::ReadNext>(d.effects), 0u);
    Transition e = step(d.state, events::SubmitSucceeded{}, now);
    ASSERT_EQ(count_effects<effects::ReadNext>(e.effects), 0u);
    Transition f = step(e.state, events::KeepaliveFailed{"broken pipe"}, now);
    ASSERT_EQ(count_effects<effects::ReadNext>(f.effects), 0u);
}

TEST(connect_twice_keeps_single_read) {
    SessionState s = connected_state();
    Transition t = step(s, events::ConnectSucceeded{});
    ASSERT_EQ(count_effects<effects::ReadNext>(t.effects), 0u);
}

// ============================================================================
// Inbound events
// ============================================================================

TEST(chat_appends) {
    SessionState s = connected_state();
    for (int i = 0; i < 20; i++) {
        s = step(s, events::Inbound{protocol::Chat{"line " + std::to_string(i)}, std::nullopt}).state;
    }
    ASSERT_EQ(s.chat.size(), 12u);
    ASSERT_EQ(s.chat.lines().front(), "line 8");
    ASSERT_EQ(s.chat.lines().back(), "line 19");
    ASSERT_TRUE(std::holds_alternative<AwaitingStart>(s.phase));
}

TEST(ongoing_round_scenario) {
    TimePoint now = Clock::now();
    Transition t = receive(connected_state(),
        R"({"type":"OngoingRoundInfo","content":{"word_to_guess":"apple","round_finish_time":"2099-01-01T00:00:10Z"}})",
        now);

    ASSERT_TRUE(std::holds_alternative<Active>(t.state.phase));
    const Active& a = std::get<Active>(t.state.phase);
    ASSERT_EQ(a.word, "apple");
    ASSERT_EQ(duration_cast<seconds>(a.deadline.time_since_epoch()).count(), 4070908810LL);
    ASSERT_EQ(std::string(guide_text(t.state.phase)), "PLEASE GUESS!");
    ASSERT_FALSE(t.state.error.has_value());

    const auto* start = find_effect<effects::StartTicker>(t.effects);
    ASSERT_TRUE(start != nullptr);
    ASSERT_EQ(start->generation, t.state.ticker_generation);
    ASSERT_TRUE(t.state.ticker_running);
}

TEST(finished_round_revealed) {
    TimePoint now = Clock::now();
    Transition t = receive(connected_state(),
        R"({"type":"FinishedRoundInfo","content":{"word_answer":"apple","to_next_round_time":"2099-01-01T00:00:05Z"}})",
        now);
    ASSERT_TRUE(std::holds_alternative<Revealed>(t.state.phase));
    ASSERT_EQ(std::get<Revealed>(t.state.phase).answer, "apple");
}

TEST(bad_timestamp_still_transitions) {
    TimePoint now = Clock::now();
    Transition t = receive(connected_state(),
        R"({"type":"OngoingRoundInfo","content":{"word_to_guess":"tca","round_finish_time":"later"}})",
        now);
    ASSERT_TRUE(std::holds_alternative<Active>(t.state.phase));
    ASSERT_EQ(countdown(t.state.phase, now).count(), 0);
    ASSERT_TRUE(t.state.error.has_value());
    ASSERT_EQ(count_effects<effects::ReadNext>(t.effects), 1u);
}

TEST(game_finished_from_any_phase) {
    TimePoint now = Clock::now();
    SessionState s = connected_state();

    // From AwaitingStart: nothing running to stop
    Transition idle = receive(s, R"({"type":"FinishedGame"})", now);
    ASSERT_TRUE(std::holds_alternative<AwaitingStart>(idle.state.phase));
    ASSERT_EQ(count_effects<effects::StopTicker>(idle.effects), 0u);

    // From Active
    s = step(s, events::Inbound{protocol::RoundStarted{"tca", now + seconds(5)}, std::nullopt}, now).state;
    uint64_t gen = s.ticker_generation;
    Transition t = receive(s, R"({"type":"FinishedGame"})", now);
    ASSERT_TRUE(std::holds_alternative<AwaitingStart>(t.state.phase));
    ASSERT_EQ(count_effects<effects::StopTicker>(t.effects), 1u);
    ASSERT_FALSE(t.state.ticker_running);
    ASSERT_NE(t.state.ticker_generation, gen);

    // From Revealed
    s = step(s, events::Inbound{protocol::RoundFinished{"cat", now + seconds(5)}, std::nullopt}, now).state;
    Transition r = receive(s, R"({"type":"FinishedGame"})", now);
    ASSERT_TRUE(std::holds_alternative<AwaitingStart>(r.state.phase));
}

TEST(unknown_tag_records_error) {
    TimePoint now = Clock::now();
    SessionState s = connected_state();
    s = step(s, events::Inbound{protocol::RoundStarted{"tca", now + seconds(5)}, std::nullopt}, now).state;

    Transition t = receive(s, R"({"type":"Weird"})", now);
    ASSERT_TRUE(std::holds_alternative<Active>(t.state.phase));
    ASSERT_TRUE(t.state.error.has_value());
    ASSERT_TRUE(t.state.error->find("Weird") != std::string::npos);
    ASSERT_EQ(count_effects<effects::ReadNext>(t.effects), 1u);
}

TEST(decode_error_keeps_phase) {
    TimePoint now = Clock::now();
    SessionState s = connected_state();
    s = step(s, events::Inbound{protocol::RoundStarted{"tca", now + seconds(5)}, std::nullopt}, now).state;

    Transition t = receive(s, R"({"type":"ChatMessage","content":5})", now);
    ASSERT_TRUE(std::holds_alternative<Active>(t.state.phase));
    ASSERT_TRUE(t.state.error.has_value());
    ASSERT_EQ(t.state.chat.size(), 0u);
}

TEST(pong_is_silent) {
    SessionState s = connected_state();
    Transition t = step(s, events::Inbound{protocol::Pong{}, std::nullopt});
    ASSERT_FALSE(t.state.error.has_value());
    ASSERT_EQ(t.effects.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<effects::ReadNext>(t.effects[0]));
}

// ============================================================================
// Ticker
// ============================================================================

TEST(tick_expiry_stops_ticker) {
    TimePoint now = Clock::now();
    SessionState s = connected_state();
    s = step(s, events::Inbound{protocol::RoundStarted{"tca", now + milliseconds(300)}, std::nullopt}, now).state;
    uint64_t gen = s.ticker_generation;

    // Still counting
    Transition early = step(s, events::Tick{gen}, now + milliseconds(100));
    ASSERT_TRUE(early.effects.empty());
    ASSERT_TRUE(early.state.ticker_running);

    // Expired
    Transition late = step(early.state, events::Tick{gen}, now + milliseconds(400));
    ASSERT_EQ(count_effects<effects::StopTicker>(late.effects), 1u);
    ASSERT_FALSE(late.state.ticker_running);
    // Phase stays; only the display expires
    ASSERT_TRUE(std::holds_alternative<Active>(late.state.phase));
}

TEST(stale_tick_ignored) {
    TimePoint now = Clock::now();
    SessionState s = connected_state();
    s = step(s, events::Inbound{protocol::RoundStarted{"tca", now}, std::nullopt}, now).state;
    uint64_t old_gen = s.ticker_generation;

    // New round replaces the ticker
    s = step(s, events::Inbound{protocol::RoundFinished{"cat", now + seconds(5)}, std::nullopt}, now).state;
    ASSERT_NE(s.ticker_generation, old_gen);

    Transition t = step(s, events::Tick{old_gen}, now + seconds(10));
    ASSERT_TRUE(t.effects.empty());
    ASSERT_TRUE(t.state.ticker_running);
}

// ============================================================================
// Input
// ============================================================================

TEST(exit_quits_in_any_state) {
    for (SessionState s : {SessionState{}, connected_state()}) {
        s = type_line(s, "/exit");
        Transition t = press_enter(s);
        ASSERT_TRUE(t.state.quit);
        ASSERT_EQ(count_effects<effects::Quit>(t.effects), 1u);
    }

    Transition ctrl_c = step(SessionState{}, events::KeyPressed{Key::of(KeyCode::CtrlC)});
    ASSERT_TRUE(ctrl_c.state.quit);
    ASSERT_EQ(count_effects<effects::Quit>(ctrl_c.effects), 1u);
}

TEST(events_after_quit_ignored) {
    SessionState s = step(connected_state(), events::KeyPressed{Key::of(KeyCode::CtrlC)}).state;
    Transition t = step(s, events::Inbound{protocol::Chat{"late"}, std::nullopt});
    ASSERT_TRUE(t.effects.empty());
    ASSERT_EQ(t.state.chat.size(), 0u);
}

TEST(ping_rejected) {
    for (SessionState s : {SessionState{}, connected_state()}) {
        s = type_line(s, "/ping");
        Transition t = press_enter(s);
        ASSERT_EQ(count_effects<effects::SendText>(t.effects), 0u);
        ASSERT_EQ(*t.state.error, MANUAL_PING_REJECTION);
        ASSERT_EQ(t.state.input.text(), "/ping");
    }
}

TEST(clear_while_disconnected) {
    SessionState s;
    s.chat.append("old");
    s = type_line(s, "/clear");
    Transition t = press_enter(s);
    ASSERT_TRUE(t.state.chat.empty());
    ASSERT_TRUE(t.state.input.empty());
    ASSERT_TRUE(t.effects.empty());
}

TEST(text_while_disconnected_is_noop) {
    SessionState s = type_line(SessionState{}, "apple");
    Transition t = press_enter(s);
    ASSERT_TRUE(t.effects.empty());
    ASSERT_EQ(t.state.input.text(), "apple");
    ASSERT_FALSE(t.state.error.has_value());
}

TEST(send_then_clear_on_success) {
    SessionState s = type_line(connected_state(), "  apple ");
    Transition t = press_enter(s);
    const auto* send = find_effect<effects::SendText>(t.effects);
    ASSERT_TRUE(send != nullptr);
    ASSERT_EQ(send->text, "apple");
    // Input stays until the write resolves
    ASSERT_EQ(t.state.input.text(), "  apple ");

    Transition ok = step(t.state, events::SubmitSucceeded{});
    ASSERT_TRUE(ok.state.input.empty());
}

TEST(write_failure_keeps_input) {
    SessionState s = type_line(connected_state(), "apple");
    s = press_enter(s).state;
    Transition t = step(s, events::SubmitFailed{"broken pipe"});
    ASSERT_EQ(t.state.input.text(), "apple");
    ASSERT_EQ(*t.state.error, "c.Write: broken pipe");
}

TEST(empty_enter_ignored) {
    SessionState s = type_line(connected_state(), "   ");
    Transition t = press_enter(s);
    ASSERT_TRUE(t.effects.empty());
    ASSERT_EQ(t.state.input.text(), "   ");
}

TEST(error_slot) {
    SessionState s = connected_state();
    s = step(s, events::KeepaliveFailed{"first"}).state;
    s = step(s, events::DecodeFailed{"second"}).state;
    ASSERT_EQ(*s.error, "second");

    // Ctrl-E dismisses
    s = step(s, events::KeyPressed{Key::of(KeyCode::CtrlE)}).state;
    ASSERT_FALSE(s.error.has_value());
}

int main() {
    return run_all_tests("session reducer");
}
