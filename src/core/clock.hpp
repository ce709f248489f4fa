// core/clock.hpp
// Wall-clock helpers for server-supplied deadlines
//
// Round deadlines arrive as RFC-3339 timestamps (absolute instants), so all
// countdown arithmetic is done against std::chrono::system_clock.
#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

namespace anagram {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

namespace clock {

namespace detail {

inline bool read_digits(std::string_view s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; i++) {
        char c = s[pos + i];
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    pos += count;
    out = v;
    return true;
}

inline bool expect(std::string_view s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    pos++;
    return true;
}

} // namespace detail

/**
 * Parse an RFC-3339 timestamp
 *
 * Accepts YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM). 'T' may also be
 * 't' or a space, 'Z' may be 'z'. Fractions beyond nanoseconds are truncated
 * to the clock's precision. Leap second 60 is rejected (as Go's time.Parse does).
 *
 * @param text Timestamp text
 * @param error Set to a description when parsing fails (optional)
 * @return Instant, or std::nullopt when the text is not a valid timestamp
 */
inline std::optional<TimePoint> parse_rfc3339(std::string_view text, std::string* error = nullptr) {
    auto fail = [&](const char* why) -> std::optional<TimePoint> {
        if (error) {
            *error = "parsing time \"" + std::string(text) + "\": " + why;
        }
        return std::nullopt;
    };

    using namespace detail;
    size_t pos = 0;
    int year, month, day, hour, minute, second;

    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day)) {
        return fail("bad date");
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return fail("missing date/time separator");
    }
    pos++;
    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, second)) {
        return fail("bad time of day");
    }

    // Fractional seconds
    int64_t frac_ns = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        size_t digits = 0;
        int64_t scale = 100000000;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                frac_ns += (text[pos] - '0') * scale;
                scale /= 10;
            }
            digits++;
            pos++;
        }
        if (digits == 0) return fail("empty fractional seconds");
    }

    // Zone offset
    int offset_minutes = 0;
    if (pos >= text.size()) return fail("missing zone offset");
    if (text[pos] == 'Z' || text[pos] == 'z') {
        pos++;
    } else if (text[pos] == '+' || text[pos] == '-') {
        int sign = text[pos] == '-' ? -1 : 1;
        pos++;
        int oh, om;
        if (!read_digits(text, pos, 2, oh) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, om)) {
            return fail("bad zone offset");
        }
        if (oh > 23 || om > 59) return fail("zone offset out of range");
        offset_minutes = sign * (oh * 60 + om);
    } else {
        return fail("bad zone offset");
    }
    if (pos != text.size()) return fail("extra text after timestamp");

    if (month < 1 || month > 12) return fail("month out of range");
    if (hour > 23) return fail("hour out of range");
    if (minute > 59) return fail("minute out of range");
    if (second > 59) return fail("second out of range");

    std::chrono::year_month_day ymd{std::chrono::year{year},
                                    std::chrono::month{static_cast<unsigned>(month)},
                                    std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok()) return fail("day out of range");

    auto since_epoch = std::chrono::sys_days{ymd}.time_since_epoch()
        + std::chrono::hours{hour}
        + std::chrono::minutes{minute - offset_minutes}
        + std::chrono::seconds{second}
        + std::chrono::nanoseconds{frac_ns};

    return TimePoint{std::chrono::duration_cast<Clock::duration>(since_epoch)};
}

// Remaining time until deadline, clamped at zero
inline Millis remaining(TimePoint deadline, TimePoint now) {
    if (deadline <= now) return Millis{0};
    return std::chrono::duration_cast<Millis>(deadline - now);
}

// Round to the nearest 100ms (halves away from zero)
inline Millis round_to_tenths(Millis d) {
    int64_t ms = d.count();
    int64_t rounded = ms >= 0 ? ((ms + 50) / 100) * 100 : -(((-ms) + 50) / 100) * 100;
    return Millis{rounded};
}

/**
 * Format a countdown as "S.Ds" (seconds and tenths), e.g. 9.4s, 61.0s
 */
inline std::string format_countdown(Millis d) {
    int64_t ms = round_to_tenths(d).count();
    if (ms < 0) ms = 0;
    char buf[32];
    snprintf(buf, sizeof(buf), "%lld.%llds",
             static_cast<long long>(ms / 1000),
             static_cast<long long>((ms % 1000) / 100));
    return buf;
}

} // namespace clock
} // namespace anagram
