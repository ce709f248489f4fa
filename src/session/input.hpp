// session/input.hpp
// Single-line input editing and Enter-submission rules
//
// InputBuffer stores UTF-8 text with a byte cursor that always sits on a code
// point boundary. classify() decides what a submitted line means:
//   /exit  -> Quit
//   /clear -> ClearChat
//   /ping  -> Rejected (keepalive owns the ping)
//   empty  -> Ignored
//   text   -> Send (connected) or Ignored (still connecting / failed)
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "../client_config.hpp"

namespace anagram::session {

// ============================================================================
// Keys
// ============================================================================

enum class KeyCode : uint8_t {
    Text,        // printable input, UTF-8 in Key::text
    Enter,
    Backspace,
    Delete,
    Left,
    Right,
    Home,
    End,
    CtrlC,       // quit
    CtrlE,       // clear error
    CtrlU,       // kill to start of line
    CtrlW,       // delete previous word
};

struct Key {
    KeyCode code = KeyCode::Text;
    std::string text;

    static Key of(KeyCode code) { return Key{code, {}}; }
    static Key typed(std::string text) { return Key{KeyCode::Text, std::move(text)}; }
};

// ============================================================================
// InputBuffer
// ============================================================================

class InputBuffer {
public:
    const std::string& text() const { return text_; }
    size_t cursor() const { return cursor_; }
    bool empty() const { return text_.empty(); }

    void set_text(std::string text) {
        text_ = std::move(text);
        cursor_ = text_.size();
    }

    void clear() {
        text_.clear();
        cursor_ = 0;
    }

    void insert(std::string_view utf8) {
        text_.insert(cursor_, utf8);
        cursor_ += utf8.size();
    }

    void backspace() {
        if (cursor_ == 0) return;
        size_t start = prev_boundary(cursor_);
        text_.erase(start, cursor_ - start);
        cursor_ = start;
    }

    void del() {
        if (cursor_ >= text_.size()) return;
        text_.erase(cursor_, next_boundary(cursor_) - cursor_);
    }

    void left() {
        if (cursor_ > 0) cursor_ = prev_boundary(cursor_);
    }

    void right() {
        if (cursor_ < text_.size()) cursor_ = next_boundary(cursor_);
    }

    void home() { cursor_ = 0; }
    void end() { cursor_ = text_.size(); }

    void kill_to_start() {
        text_.erase(0, cursor_);
        cursor_ = 0;
    }

    // Spaces before the cursor, then the word before them
    void delete_word_back() {
        size_t start = cursor_;
        while (start > 0 && is_space(text_[start - 1])) start--;
        while (start > 0 && !is_space(text_[start - 1])) start--;
        text_.erase(start, cursor_ - start);
        cursor_ = start;
    }

    // Code points before the cursor (terminal column of the cursor)
    size_t cursor_column() const {
        size_t cols = 0;
        for (size_t i = 0; i < cursor_; i++) {
            if (!is_continuation(static_cast<uint8_t>(text_[i]))) cols++;
        }
        return cols;
    }

    /**
     * Apply an editing key
     *
     * @return false if the key is not an editing key (Enter, hotkeys)
     */
    bool apply(const Key& key) {
        switch (key.code) {
            case KeyCode::Text:      insert(key.text); return true;
            case KeyCode::Backspace: backspace(); return true;
            case KeyCode::Delete:    del(); return true;
            case KeyCode::Left:      left(); return true;
            case KeyCode::Right:     right(); return true;
            case KeyCode::Home:      home(); return true;
            case KeyCode::End:       end(); return true;
            case KeyCode::CtrlU:     kill_to_start(); return true;
            case KeyCode::CtrlW:     delete_word_back(); return true;
            default:                 return false;
        }
    }

private:
    static bool is_continuation(uint8_t b) { return (b & 0xC0) == 0x80; }
    static bool is_space(char c) { return c == ' ' || c == '\t'; }

    size_t prev_boundary(size_t pos) const {
        do {
            pos--;
        } while (pos > 0 && is_continuation(static_cast<uint8_t>(text_[pos])));
        return pos;
    }

    size_t next_boundary(size_t pos) const {
        do {
            pos++;
        } while (pos < text_.size() && is_continuation(static_cast<uint8_t>(text_[pos])));
        return pos;
    }

    std::string text_;
    size_t cursor_ = 0;
};

// ============================================================================
// Submission
// ============================================================================

inline constexpr const char* MANUAL_PING_REJECTION =
    "don't ping manually! this is handled automatically by the client";

namespace submit {

struct Quit {};
struct ClearChat {};
struct Rejected { std::string message; };
struct Ignored {};
struct Send { std::string text; };

} // namespace submit

using SubmitOutcome = std::variant<submit::Quit, submit::ClearChat, submit::Rejected,
                                   submit::Ignored, submit::Send>;

inline std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string_view::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

inline SubmitOutcome classify(std::string_view raw, bool connected) {
    std::string_view line = trim(raw);

    if (line == "/exit") return submit::Quit{};
    if (line == "/clear") return submit::ClearChat{};
    if (line == PING_PAYLOAD) return submit::Rejected{MANUAL_PING_REJECTION};
    if (line.empty() || !connected) return submit::Ignored{};
    return submit::Send{std::string(line)};
}

} // namespace anagram::session
