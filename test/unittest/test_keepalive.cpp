// test/unittest/test_keepalive.cpp
// Unit tests for session/keepalive.hpp

#include "session/keepalive.hpp"
#include "unit_test.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace anagram;
using namespace anagram::session;
using namespace std::chrono;

// Records writes; fails every write once fail_after writes have succeeded
struct RecordingConnection {
    std::mutex mutex;
    std::vector<std::string> writes;
    std::vector<steady_clock::time_point> stamps;
    int fail_after = -1;
    std::atomic<int> attempts{0};

    void write_text(std::string_view text) {
        int n = attempts.fetch_add(1);
        if (fail_after >= 0 && n >= fail_after) {
            throw WriteError("broken pipe");
        }
        std::lock_guard<std::mutex> lock(mutex);
        writes.emplace_back(text);
        stamps.push_back(steady_clock::now());
    }

    size_t count() {
        std::lock_guard<std::mutex> lock(mutex);
        return writes.size();
    }
};

TEST(pings_on_interval) {
    RecordingConnection conn;
    KeepaliveDriver<RecordingConnection> driver;

    auto started = steady_clock::now();
    driver.start(conn, milliseconds(40), [](const std::string&) {});
    ASSERT_TRUE(driver.running());

    std::this_thread::sleep_for(milliseconds(230));
    driver.stop();
    ASSERT_FALSE(driver.running());

    size_t n = conn.count();
    ASSERT_GE(n, 3u);
    ASSERT_LE(n, 6u);
    ASSERT_EQ(driver.pings_sent(), n);

    for (const auto& w : conn.writes) {
        ASSERT_EQ(w, "/ping");
    }
    // First ping one interval after start, not immediately
    ASSERT_GE(duration_cast<milliseconds>(conn.stamps.front() - started).count(), 35);
}

TEST(stop_before_first_ping) {
    RecordingConnection conn;
    KeepaliveDriver<RecordingConnection> driver;
    driver.start(conn, seconds(10), [](const std::string&) {});

    auto t0 = steady_clock::now();
    driver.stop();
    ASSERT_LT(duration_cast<milliseconds>(steady_clock::now() - t0).count(), 1000);
    ASSERT_EQ(conn.count(), 0u);
}

TEST(failure_reported_once_then_exits) {
    RecordingConnection conn;
    conn.fail_after = 2;

    std::atomic<int> failures{0};
    std::string message;
    std::mutex message_mutex;

    KeepaliveDriver<RecordingConnection> driver;
    driver.start(conn, milliseconds(20), [&](const std::string& m) {
        failures.fetch_add(1);
        std::lock_guard<std::mutex> lock(message_mutex);
        message = m;
    });

    for (int i = 0; i < 100 && failures.load() == 0; i++) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    // Driver gone: no further attempts
    std::this_thread::sleep_for(milliseconds(100));

    ASSERT_EQ(failures.load(), 1);
    ASSERT_EQ(conn.attempts.load(), 3);
    ASSERT_EQ(conn.count(), 2u);
    ASSERT_FALSE(driver.running());
    {
        std::lock_guard<std::mutex> lock(message_mutex);
        ASSERT_EQ(message, "broken pipe");
    }

    driver.stop();
}

TEST(start_twice_is_noop) {
    RecordingConnection conn;
    KeepaliveDriver<RecordingConnection> driver;
    driver.start(conn, milliseconds(30), [](const std::string&) {});
    driver.start(conn, milliseconds(1), [](const std::string&) {});

    std::this_thread::sleep_for(milliseconds(100));
    driver.stop();
    // A 1 ms driver would have written far more
    ASSERT_LE(conn.count(), 5u);
}

int main() {
    return run_all_tests("keepalive driver");
}
