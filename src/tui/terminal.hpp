// tui/terminal.hpp
// ncurses renderer and key reader
//
// Satisfies the SessionRuntime Renderer concept. Every curses call happens on
// the thread that owns the Terminal (the runtime's main thread); the stdin
// pump only reports readiness.
//
// Colors (256-color terminals): header/word 255 on 26, chat border 68,
// error 9, hotkeys 8. Fewer colors fall back to the basic palette, no colors
// to plain attributes.
#pragma once

#include <clocale>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

#include "../client_config.hpp"
#include "../core/clock.hpp"
#include "../core/log.hpp"
#include "../session/input.hpp"
#include "../session/state.hpp"
#include "view.hpp"

// Real functions instead of move()/erase()/clear() macros, which collide with
// std::move and container members
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#ifndef NCURSES_WIDECHAR
#define NCURSES_WIDECHAR 1   // get_wch() and UTF-8 output (ncursesw)
#endif
#include <curses.h>

namespace anagram::tui {

class Terminal {
public:
    explicit Terminal(const ClientConfig& config) : config_(config) {}

    ~Terminal() {
        stop();
    }

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    /**
     * Take over the terminal
     *
     * @throws std::runtime_error if stdin/stdout is not a usable terminal
     */
    void start() {
        if (screen_) return;

        std::setlocale(LC_ALL, "");
        screen_ = newterm(nullptr, stdout, stdin);
        if (!screen_) {
            throw std::runtime_error("newterm() failed: not a terminal or unknown TERM");
        }
        set_term(screen_);

        raw();                  // Ctrl+C arrives as a key, not SIGINT
        noecho();
        nonl();
        keypad(stdscr, TRUE);
        nodelay(stdscr, TRUE);
        set_escdelay(25);
        init_styles();

        // Log lines would tear the screen unless stderr goes elsewhere
        if (isatty(STDERR_FILENO)) {
            saved_sink_ = log::sink().load();
            log::set_sink(nullptr);
            sink_muted_ = true;
        }
    }

    void stop() {
        if (!screen_) return;
        endwin();
        delscreen(screen_);
        screen_ = nullptr;
        if (sink_muted_) {
            log::set_sink(saved_sink_);
            sink_muted_ = false;
        }
    }

    // ========================================================================
    // Renderer concept
    // ========================================================================

    void render(const session::SessionState& state, TimePoint now) {
        Frame frame = render_view(state, now, config_);

        ::erase();
        int row = 0;
        for (const Line& line : frame.lines) {
            if (row >= LINES) break;
            ::move(row, 0);
            for (const Span& span : line.spans) {
                attrset(attr_for(span.style));
                addstr(span.text.c_str());
            }
            row++;
        }
        attrset(A_NORMAL);

        if (frame.cursor_row < LINES && frame.cursor_col < COLS) {
            ::move(frame.cursor_row, frame.cursor_col);
            curs_set(1);
        } else {
            curs_set(0);
        }
        ::refresh();
    }

    int input_fd() const {
        return STDIN_FILENO;
    }

    // Drain every pending key without blocking
    void read_keys(std::vector<session::Key>& out) {
        using session::Key;
        using session::KeyCode;

        wint_t ch;
        int ret;
        while ((ret = get_wch(&ch)) != ERR) {
            if (ret == KEY_CODE_YES) {
                switch (ch) {
                    case KEY_BACKSPACE: out.push_back(Key::of(KeyCode::Backspace)); break;
                    case KEY_DC:        out.push_back(Key::of(KeyCode::Delete)); break;
                    case KEY_LEFT:      out.push_back(Key::of(KeyCode::Left)); break;
                    case KEY_RIGHT:     out.push_back(Key::of(KeyCode::Right)); break;
                    case KEY_HOME:      out.push_back(Key::of(KeyCode::Home)); break;
                    case KEY_END:       out.push_back(Key::of(KeyCode::End)); break;
                    case KEY_ENTER:     out.push_back(Key::of(KeyCode::Enter)); break;
                    default:            break;  // KEY_RESIZE and the rest: redraw only
                }
                continue;
            }

            switch (ch) {
                case 0x01: out.push_back(Key::of(KeyCode::Home)); break;       // Ctrl+A
                case 0x03: out.push_back(Key::of(KeyCode::CtrlC)); break;
                case 0x05: out.push_back(Key::of(KeyCode::CtrlE)); break;
                case 0x08:
                case 0x7F: out.push_back(Key::of(KeyCode::Backspace)); break;
                case '\n':
                case '\r': out.push_back(Key::of(KeyCode::Enter)); break;
                case 0x15: out.push_back(Key::of(KeyCode::CtrlU)); break;
                case 0x17: out.push_back(Key::of(KeyCode::CtrlW)); break;
                default:
                    if (ch >= 0x20) {
                        out.push_back(Key::typed(encode_utf8(static_cast<uint32_t>(ch))));
                    }
                    break;
            }
        }
    }

private:
    enum Pair : short {
        PAIR_BAND = 1,
        PAIR_BORDER,
        PAIR_ERROR,
        PAIR_HOTKEY,
    };

    void init_styles() {
        colors_ = has_colors();
        if (!colors_) return;

        start_color();
        use_default_colors();
        if (COLORS >= 256) {
            init_pair(PAIR_BAND, 255, 26);
            init_pair(PAIR_BORDER, 68, -1);
            init_pair(PAIR_ERROR, 9, -1);
            init_pair(PAIR_HOTKEY, 8, -1);
        } else {
            init_pair(PAIR_BAND, COLOR_WHITE, COLOR_BLUE);
            init_pair(PAIR_BORDER, COLOR_BLUE, -1);
            init_pair(PAIR_ERROR, COLOR_RED, -1);
            init_pair(PAIR_HOTKEY, COLOR_WHITE, -1);
        }
    }

    attr_t attr_for(Style style) const {
        if (!colors_) {
            switch (style) {
                case Style::Header:      return A_REVERSE;
                case Style::Word:        return A_REVERSE | A_BOLD;
                case Style::Placeholder: return A_DIM;
                case Style::Error:       return A_BOLD;
                case Style::Hotkey:      return A_BOLD;
                case Style::HotkeyHint:  return A_DIM;
                default:                 return A_NORMAL;
            }
        }
        switch (style) {
            case Style::Header:      return COLOR_PAIR(PAIR_BAND);
            case Style::Word:        return COLOR_PAIR(PAIR_BAND) | A_BOLD;
            case Style::Border:      return COLOR_PAIR(PAIR_BORDER);
            case Style::Placeholder: return A_DIM;
            case Style::Error:       return COLOR_PAIR(PAIR_ERROR);
            case Style::Hotkey:      return COLOR_PAIR(PAIR_HOTKEY) | A_BOLD;
            case Style::HotkeyHint:  return COLOR_PAIR(PAIR_HOTKEY);
            default:                 return A_NORMAL;
        }
    }

    static std::string encode_utf8(uint32_t cp) {
        std::string out;
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x110000) {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
        return out;
    }

    ClientConfig config_;
    SCREEN* screen_ = nullptr;
    bool colors_ = false;
    FILE* saved_sink_ = nullptr;
    bool sink_muted_ = false;
};

} // namespace anagram::tui
