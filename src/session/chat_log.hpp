// session/chat_log.hpp
// Bounded chat history (oldest line evicted first)
#pragma once

#include <cstddef>
#include <deque>
#include <string>

#include "../client_config.hpp"

namespace anagram::session {

class ChatLog {
public:
    explicit ChatLog(size_t capacity = CHAT_CAPACITY) : capacity_(capacity > 0 ? capacity : 1) {}

    void append(std::string line) {
        lines_.push_back(std::move(line));
        while (lines_.size() > capacity_) {
            lines_.pop_front();
        }
    }

    void clear() { lines_.clear(); }

    const std::deque<std::string>& lines() const { return lines_; }
    size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }
    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::deque<std::string> lines_;
};

} // namespace anagram::session
