// session/runtime.hpp
// Threads-and-queue host for the session reducer
//
// Thread layout:
//   main      run(): pops events, reduces, executes effects, renders
//   connector one dial attempt, posts ConnectSucceeded / ConnectFailed
//   reader    one read_message() per ReadNext, posts Inbound / DecodeFailed / ReadFailed
//   outbox    user sends, in order, posts SubmitSucceeded / SubmitFailed
//   keepalive periodic "/ping" (KeepaliveDriver), posts KeepaliveFailed once
//   ticker    countdown ticks (Ticker), posts Tick{generation}
//   pump      stdin readiness; keys are read on the main thread
//
// Only the main thread touches SessionState and the Renderer. Workers talk to
// it exclusively through the event queue.
//
// Connection concept (duck typing):
//   std::string read_message()            // throws ReadError
//   void write_text(std::string_view)     // throws WriteError
//   void close()                          // any thread, wakes the reader
//
// Renderer concept:
//   void render(const SessionState&, TimePoint now)
//   int input_fd() const                  // -1: no key input
//   void read_keys(std::vector<Key>&)     // non-blocking drain
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../client_config.hpp"
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/event_queue.hpp"
#include "../core/log.hpp"
#include "../core/readiness_pump.hpp"
#include "../protocol/decoder.hpp"
#include "keepalive.hpp"
#include "reducer.hpp"
#include "state.hpp"
#include "ticker.hpp"

namespace anagram::session {

// Stdin has keys waiting (posted by the pump)
struct KeysPending {};

using RuntimeEvent = std::variant<SessionEvent, KeysPending>;

template<typename Connection, typename Renderer>
class SessionRuntime {
public:
    using Dialer = std::function<std::unique_ptr<Connection>(const ClientConfig&)>;
    using Queue = EventQueue<RuntimeEvent>;

    SessionRuntime(const ClientConfig& config, Renderer& renderer, Dialer dialer)
        : config_(config)
        , renderer_(renderer)
        , dialer_(std::move(dialer))
        , queue_(std::make_shared<Queue>())
        , dial_slot_(std::make_shared<DialSlot>())
        , state_(config)
    {}

    ~SessionRuntime() {
        shutdown();
    }

    SessionRuntime(const SessionRuntime&) = delete;
    SessionRuntime& operator=(const SessionRuntime&) = delete;

    // Any thread
    void post(SessionEvent event) {
        queue_->push(RuntimeEvent{std::move(event)});
    }

    /**
     * Run until quit
     *
     * @return Process exit code (0)
     */
    int run() {
        int fd = renderer_.input_fd();
        if (fd >= 0) {
            std::shared_ptr<Queue> queue = queue_;
            pump_.start(fd, [queue]() { queue->push(RuntimeEvent{KeysPending{}}); });
        }
        {
            std::shared_ptr<Queue> queue = queue_;
            ticker_.start(config_.tick_interval, [queue](uint64_t generation) {
                queue->push(RuntimeEvent{SessionEvent{events::Tick{generation}}});
            });
        }

        execute(initial_effects());
        renderer_.render(state_, Clock::now());

        while (!state_.quit) {
            std::optional<RuntimeEvent> event = queue_->pop();
            if (!event) break;

            if (std::holds_alternative<KeysPending>(*event)) {
                std::vector<Key> keys;
                renderer_.read_keys(keys);
                for (Key& key : keys) {
                    dispatch(events::KeyPressed{std::move(key)});
                    if (state_.quit) break;
                }
                pump_.rearm();
            } else {
                dispatch(std::get<SessionEvent>(std::move(*event)));
            }

            renderer_.render(state_, Clock::now());
        }

        shutdown();
        return 0;
    }

    /**
     * Stop every producer, close the connection, join workers (idempotent)
     *
     * In-flight frames and queued sends are discarded.
     */
    void shutdown() {
        if (shut_down_) return;
        shut_down_ = true;

        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            stopping_ = true;
        }
        io_cv_.notify_all();

        if (conn_) {
            conn_->close();
        }
        keepalive_.stop();
        ticker_.shutdown();
        pump_.stop();
        if (reader_.joinable()) reader_.join();
        if (outbox_thread_.joinable()) outbox_thread_.join();

        // A dial still in progress cannot be interrupted; let it finish on its
        // own and discard the result
        {
            std::lock_guard<std::mutex> lock(dial_slot_->mutex);
            dial_slot_->abandoned = true;
        }
        if (connector_.joinable()) {
            if (dial_slot_->done.load(std::memory_order_acquire)) {
                connector_.join();
            } else {
                connector_.detach();
            }
        }

        queue_->close();
        ANAGRAM_DEBUG_PRINT("[Runtime] shut down");
    }

    const SessionState& state() const { return state_; }

private:
    // Hand-off between the connector thread and the runtime
    struct DialSlot {
        std::mutex mutex;
        std::unique_ptr<Connection> conn;
        bool abandoned = false;
        std::atomic<bool> done{false};
    };

    void dispatch(SessionEvent event) {
        if (std::holds_alternative<events::ConnectSucceeded>(event)) {
            std::lock_guard<std::mutex> lock(dial_slot_->mutex);
            conn_ = std::move(dial_slot_->conn);
        }

        Transition t = reduce(std::move(state_), event, Clock::now());
        state_ = std::move(t.state);
        execute(t.effects);
    }

    void execute(const std::vector<Effect>& effects) {
        for (const Effect& effect : effects) {
            std::visit([this](const auto& e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, effects::Connect>) {
                    start_connector();
                } else if constexpr (std::is_same_v<T, effects::ReadNext>) {
                    request_read();
                } else if constexpr (std::is_same_v<T, effects::StartKeepalive>) {
                    std::shared_ptr<Queue> queue = queue_;
                    keepalive_.start(*conn_, config_.keepalive_interval, [queue](const std::string& msg) {
                        queue->push(RuntimeEvent{SessionEvent{events::KeepaliveFailed{msg}}});
                    });
                } else if constexpr (std::is_same_v<T, effects::SendText>) {
                    enqueue_send(e.text);
                } else if constexpr (std::is_same_v<T, effects::StartTicker>) {
                    ticker_.arm(e.generation);
                } else if constexpr (std::is_same_v<T, effects::StopTicker>) {
                    ticker_.disarm();
                } else if constexpr (std::is_same_v<T, effects::Quit>) {
                    ANAGRAM_LOG_INFO("[Runtime] quit requested");
                }
            }, effect);
        }
    }

    // ========================================================================
    // Connector
    // ========================================================================

    void start_connector() {
        if (connector_.joinable()) return;

        std::shared_ptr<Queue> queue = queue_;
        std::shared_ptr<DialSlot> slot = dial_slot_;
        Dialer dialer = dialer_;
        ClientConfig config = config_;

        connector_ = std::thread([queue, slot, dialer, config]() {
            std::unique_ptr<Connection> conn;
            std::string error;
            try {
                conn = dialer(config);
            } catch (const std::exception& e) {
                // ConnectError, or anything else the dialer let escape
                error = e.what();
            }

            if (conn) {
                std::lock_guard<std::mutex> lock(slot->mutex);
                if (slot->abandoned) {
                    conn->close();
                } else {
                    slot->conn = std::move(conn);
                    queue->push(RuntimeEvent{SessionEvent{events::ConnectSucceeded{}}});
                }
            } else {
                if (error.empty()) error = "dialer returned no connection";
                ANAGRAM_LOG_WARN("[Runtime] connect failed: %s", error.c_str());
                queue->push(RuntimeEvent{SessionEvent{events::ConnectFailed{error}}});
            }
            slot->done.store(true, std::memory_order_release);
        });
    }

    // ========================================================================
    // Reader
    // ========================================================================

    void request_read() {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            read_requests_++;
        }
        io_cv_.notify_all();
        if (!reader_.joinable()) {
            reader_ = std::thread([this]() { reader_loop(); });
        }
    }

    void reader_loop() {
        for (;;) {
            {
                std::unique_lock<std::mutex> lock(io_mutex_);
                io_cv_.wait(lock, [this] { return stopping_ || read_requests_ > 0; });
                if (stopping_) return;
                read_requests_--;
            }

            bool failed = false;
            try {
                std::string text = conn_->read_message();
                protocol::DecodeResult result = protocol::decode_frame(text);
                if (result.event) {
                    post(events::Inbound{std::move(*result.event), std::move(result.error)});
                } else {
                    post(events::DecodeFailed{result.error.value_or("wsjson.Read: undecodable frame")});
                }
            } catch (const ReadError& e) {
                post(events::ReadFailed{e.what()});
                failed = true;
            } catch (const std::exception& e) {
                // Frame arrived but could not be turned into an event
                ANAGRAM_LOG_WARN("[Runtime] undecodable frame: %s", e.what());
                post(events::DecodeFailed{std::string("wsjson.Read: ") + e.what()});
            }

            // The next read on a broken connection fails at once; keep the
            // retry cadence bounded
            if (failed) {
                std::unique_lock<std::mutex> lock(io_mutex_);
                io_cv_.wait_for(lock, config_.read_retry_pause, [this] { return stopping_; });
            }
        }
    }

    // ========================================================================
    // Outbox
    // ========================================================================

    void enqueue_send(const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            outbox_.push_back(text);
        }
        io_cv_.notify_all();
        if (!outbox_thread_.joinable()) {
            outbox_thread_ = std::thread([this]() { outbox_loop(); });
        }
    }

    void outbox_loop() {
        for (;;) {
            std::string text;
            {
                std::unique_lock<std::mutex> lock(io_mutex_);
                io_cv_.wait(lock, [this] { return stopping_ || !outbox_.empty(); });
                if (stopping_) return;
                text = std::move(outbox_.front());
                outbox_.pop_front();
            }

            try {
                conn_->write_text(text);
                post(events::SubmitSucceeded{});
            } catch (const WriteError& e) {
                post(events::SubmitFailed{e.what()});
            }
        }
    }

    const ClientConfig config_;
    Renderer& renderer_;
    Dialer dialer_;

    std::shared_ptr<Queue> queue_;
    std::shared_ptr<DialSlot> dial_slot_;
    std::unique_ptr<Connection> conn_;

    SessionState state_;

    std::thread connector_;
    std::thread reader_;
    std::thread outbox_thread_;
    KeepaliveDriver<Connection> keepalive_;
    Ticker ticker_;
    ReadinessPump pump_;

    std::mutex io_mutex_;
    std::condition_variable io_cv_;
    bool stopping_ = false;
    int read_requests_ = 0;
    std::deque<std::string> outbox_;

    bool shut_down_ = false;
};

} // namespace anagram::session
