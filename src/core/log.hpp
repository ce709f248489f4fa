// core/log.hpp
// Printf-style logging for the client
//
// Two levels of output:
//   - ANAGRAM_DEBUG_PRINT: compiled in only with -DDEBUG (zero cost otherwise)
//   - ANAGRAM_LOG_INFO / ANAGRAM_LOG_WARN: always compiled, written to the log sink
//
// The sink is a process-wide FILE* (stderr by default). The terminal UI turns it
// off while curses owns an interactive terminal, since stray writes would tear the
// screen; redirecting stderr to a file keeps the log.
#pragma once

#include <atomic>
#include <cstdio>

namespace anagram {
namespace log {

inline std::atomic<FILE*>& sink() {
    static std::atomic<FILE*> s{stderr};
    return s;
}

// nullptr disables logging
inline void set_sink(FILE* fp) {
    sink().store(fp, std::memory_order_release);
}

template<typename... Args>
inline void write(const char* level, const char* fmt, Args... args) {
    FILE* fp = sink().load(std::memory_order_acquire);
    if (!fp) return;
    fprintf(fp, "%s ", level);
    if constexpr (sizeof...(Args) == 0) {
        fputs(fmt, fp);
    } else {
        fprintf(fp, fmt, args...);
    }
    fputc('\n', fp);
    fflush(fp);
}

} // namespace log
} // namespace anagram

#define ANAGRAM_LOG_INFO(...) ::anagram::log::write("[INFO]", __VA_ARGS__)
#define ANAGRAM_LOG_WARN(...) ::anagram::log::write("[WARN]", __VA_ARGS__)

#ifdef DEBUG
#define ANAGRAM_DEBUG_PRINT(...) ::anagram::log::write("[DEBUG]", __VA_ARGS__)
#else
#define ANAGRAM_DEBUG_PRINT(...) ((void)0)
#endif
