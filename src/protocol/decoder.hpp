// protocol/decoder.hpp
// Frame text -> InboundEvent
//
// Decoding never throws. Every failure mode is reported in DecodeResult:
//   - event + no error:   well-formed frame
//   - event + error:      round frame with an unparseable timestamp (deadline unset)
//   - no event + error:   invalid JSON, wrong shape, missing or mistyped field
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../core/clock.hpp"
#include "messages.hpp"

namespace anagram::protocol {

struct DecodeResult {
    std::optional<InboundEvent> event;
    std::optional<std::string> error;

    bool ok() const { return event.has_value() && !error.has_value(); }
};

namespace detail {

using nlohmann::json;

inline DecodeResult fail(std::string message) {
    DecodeResult r;
    r.error = "wsjson.Read: " + std::move(message);
    return r;
}

// Non-null pointer to a string member of obj, nullptr if absent or not a string
inline const std::string* string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return nullptr;
    return it->get_ptr<const std::string*>();
}

/**
 * Round frames: {"<text_key>": string, "<time_key>": RFC-3339 string}
 *
 * A bad timestamp still produces the event; the error rides along.
 */
template<typename Event>
inline DecodeResult decode_round(const json& frame, const char* tag,
                                 const char* text_key, const char* time_key) {
    auto content = frame.find("content");
    if (content == frame.end() || !content->is_object()) {
        return fail(std::string(tag) + ": content must be an object");
    }
    const std::string* text = string_field(*content, text_key);
    if (!text) {
        return fail(std::string(tag) + ": missing or non-string \"" + text_key + "\"");
    }
    const std::string* stamp = string_field(*content, time_key);
    if (!stamp) {
        return fail(std::string(tag) + ": missing or non-string \"" + time_key + "\"");
    }

    DecodeResult r;
    std::string time_error;
    std::optional<TimePoint> deadline = clock::parse_rfc3339(*stamp, &time_error);
    r.event = Event{*text, deadline};
    if (!deadline) {
        r.error = time_error;
    }
    return r;
}

} // namespace detail

/**
 * Decode one complete text frame
 */
inline DecodeResult decode_frame(std::string_view text) {
    using detail::json;

    json frame;
    try {
        frame = json::parse(text.begin(), text.end());
    } catch (const json::exception& e) {
        // parse_error, and out_of_range for numbers that overflow a double
        return detail::fail(std::string("failed to unmarshal JSON: ") + e.what());
    }

    if (!frame.is_object()) {
        return detail::fail("frame is not a JSON object");
    }
    const std::string* tag = detail::string_field(frame, "type");
    if (!tag) {
        return detail::fail("missing or non-string \"type\" field");
    }

    DecodeResult r;
    if (*tag == TAG_CHAT) {
        const std::string* content = detail::string_field(frame, "content");
        if (!content) {
            return detail::fail(std::string(TAG_CHAT) + ": content must be a string");
        }
        r.event = Chat{*content};
    } else if (*tag == TAG_ONGOING_ROUND) {
        return detail::decode_round<RoundStarted>(frame, TAG_ONGOING_ROUND,
                                                  "word_to_guess", "round_finish_time");
    } else if (*tag == TAG_FINISHED_ROUND) {
        return detail::decode_round<RoundFinished>(frame, TAG_FINISHED_ROUND,
                                                   "word_answer", "to_next_round_time");
    } else if (*tag == TAG_FINISHED_GAME) {
        r.event = GameFinished{};
    } else if (*tag == TAG_PONG) {
        r.event = Pong{};
    } else {
        r.event = Unrecognized{*tag};
    }
    return r;
}

} // namespace anagram::protocol
