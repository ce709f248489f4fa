// tui/view.hpp
// SessionState -> styled lines (no terminal I/O)
//
// Layout, top to bottom (width = ClientConfig::app_width):
//   blank
//   header band   padding + "GUIDE - S.Ds" (or the guide alone once expired)
//   word band     'word' (bold) + padding
//   ╭────╮
//   │ chat │ x chat_capacity, bottom-aligned, long lines wrapped
//   ╰────╯
//   > input (or placeholder)
//   error lines (only when an error is set)
//   blank
//   Ctrl+C exit  Ctrl+E clear errors
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../client_config.hpp"
#include "../core/clock.hpp"
#include "../session/round.hpp"
#include "../session/state.hpp"

namespace anagram::tui {

inline constexpr const char* PLACEHOLDER_CONNECTING = "connecting...";
inline constexpr const char* PLACEHOLDER_READY = "message/answer here, send with Enter";
inline constexpr const char* INPUT_PROMPT = "> ";

enum class Style : uint8_t {
    Plain,
    Header,       // header band
    Word,         // word band (bold)
    Border,       // chat box frame
    Placeholder,
    Error,
    Hotkey,       // key name (bold)
    HotkeyHint,
};

struct Span {
    std::string text;
    Style style = Style::Plain;
};

struct Line {
    std::vector<Span> spans;

    Line() = default;
    Line(std::string text, Style style) { spans.push_back(Span{std::move(text), style}); }

    std::string text() const {
        std::string out;
        for (const Span& s : spans) out += s.text;
        return out;
    }
};

struct Frame {
    std::vector<Line> lines;
    int cursor_row = 0;
    int cursor_col = 0;
};

// ============================================================================
// UTF-8 column helpers (one column per code point)
// ============================================================================

inline bool is_utf8_continuation(char c) {
    return (static_cast<uint8_t>(c) & 0xC0) == 0x80;
}

inline size_t display_width(std::string_view s) {
    size_t cols = 0;
    for (char c : s) {
        if (!is_utf8_continuation(c)) cols++;
    }
    return cols;
}

// Byte offset of column `col` (clamped to the end)
inline size_t byte_offset(std::string_view s, size_t col) {
    size_t i = 0;
    while (i < s.size() && col > 0) {
        i++;
        while (i < s.size() && is_utf8_continuation(s[i])) i++;
        col--;
    }
    return i;
}

inline std::string columns(std::string_view s, size_t first, size_t count) {
    size_t begin = byte_offset(s, first);
    size_t end = begin + byte_offset(s.substr(begin), count);
    return std::string(s.substr(begin, end - begin));
}

inline std::string pad_right(std::string s, size_t width) {
    size_t w = display_width(s);
    if (w < width) s.append(width - w, ' ');
    return s;
}

inline std::string center(std::string_view s, size_t width) {
    size_t w = display_width(s);
    if (w >= width) return columns(s, 0, width);
    size_t left = (width - w) / 2;
    std::string out(left, ' ');
    out += s;
    out.append(width - w - left, ' ');
    return out;
}

/**
 * Wrap text at `width` columns, preferring spaces as break points
 *
 * Embedded newlines start a new line.
 */
inline std::vector<std::string> wrap(std::string_view text, size_t width) {
    std::vector<std::string> out;
    if (width == 0) return out;

    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        std::string_view para = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);

        while (display_width(para) > width) {
            size_t cut = byte_offset(para, width);
            size_t space = para.substr(0, cut + 1).find_last_of(' ');
            if (space != std::string_view::npos && space > 0) {
                out.emplace_back(para.substr(0, space));
                para.remove_prefix(space + 1);
            } else {
                out.emplace_back(para.substr(0, cut));
                para.remove_prefix(cut);
            }
        }
        out.emplace_back(para);

        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    return out;
}

inline std::string repeat(std::string_view unit, size_t n) {
    std::string out;
    out.reserve(unit.size() * n);
    for (size_t i = 0; i < n; i++) out += unit;
    return out;
}

// ============================================================================
// View
// ============================================================================

inline Frame render_view(const session::SessionState& state, TimePoint now, const ClientConfig& config) {
    const size_t width = static_cast<size_t>(config.app_width);
    const size_t inner = width - 2;          // inside the chat box borders
    const size_t text_width = inner - 2;     // minus one column of padding each side
    Frame frame;
    auto& lines = frame.lines;

    lines.emplace_back("", Style::Plain);

    // Header band
    lines.emplace_back(std::string(width, ' '), Style::Header);
    lines.emplace_back(center(session::header_text(state.phase, now), width), Style::Header);

    // Word band
    lines.emplace_back(center("'" + session::word_text(state.phase) + "'", width), Style::Word);
    lines.emplace_back(std::string(width, ' '), Style::Word);

    // Chat box
    lines.emplace_back("╭" + repeat("─", inner) + "╮", Style::Border);

    std::vector<std::string> chat_lines;
    for (const std::string& msg : state.chat.lines()) {
        for (std::string& l : wrap(msg, text_width)) {
            chat_lines.push_back(std::move(l));
        }
    }
    const size_t rows = state.chat.capacity();
    size_t skip = chat_lines.size() > rows ? chat_lines.size() - rows : 0;
    for (size_t i = 0; i < rows; i++) {
        // Bottom-aligned: blank rows first
        size_t filled = chat_lines.size() - skip;
        std::string content;
        if (i >= rows - filled) {
            content = chat_lines[skip + (i - (rows - filled))];
        }
        Line row;
        row.spans.push_back(Span{"│", Style::Border});
        row.spans.push_back(Span{" " + pad_right(content, text_width) + " ", Style::Plain});
        row.spans.push_back(Span{"│", Style::Border});
        lines.push_back(std::move(row));
    }

    lines.emplace_back("╰" + repeat("─", inner) + "╯", Style::Border);

    // Input line
    frame.cursor_row = static_cast<int>(lines.size());
    const size_t prompt_width = display_width(INPUT_PROMPT);
    const size_t field = width - prompt_width - 1;   // keep a column for the cursor
    Line input;
    input.spans.push_back(Span{INPUT_PROMPT, Style::Plain});
    if (state.input.empty()) {
        const char* placeholder = state.connected() ? PLACEHOLDER_READY : PLACEHOLDER_CONNECTING;
        input.spans.push_back(Span{columns(placeholder, 0, field), Style::Placeholder});
        frame.cursor_col = static_cast<int>(prompt_width);
    } else {
        size_t cursor = state.input.cursor_column();
        size_t offset = cursor > field ? cursor - field : 0;
        input.spans.push_back(Span{columns(state.input.text(), offset, field), Style::Plain});
        frame.cursor_col = static_cast<int>(prompt_width + cursor - offset);
    }
    lines.push_back(std::move(input));

    // Error
    if (state.error) {
        for (std::string& l : wrap(*state.error, width)) {
            lines.emplace_back(std::move(l), Style::Error);
        }
    }

    lines.emplace_back("", Style::Plain);

    Line hotkeys;
    hotkeys.spans.push_back(Span{"Ctrl+C", Style::Hotkey});
    hotkeys.spans.push_back(Span{" exit  ", Style::HotkeyHint});
    hotkeys.spans.push_back(Span{"Ctrl+E", Style::Hotkey});
    hotkeys.spans.push_back(Span{" clear errors", Style::HotkeyHint});
    lines.push_back(std::move(hotkeys));

    return frame;
}

} // namespace anagram::tui
