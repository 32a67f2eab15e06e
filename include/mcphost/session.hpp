#pragma once
#include "telemetry.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mcphost {

/// One open server-to-client stream. Single producer (the server), single
/// consumer (the connection writing it out).
class PushChannel {
public:
    explicit PushChannel(std::string session_id);

    const std::string& session_id() const { return session_id_; }

    /// Queue a message. Returns false once the channel is closed.
    bool push(std::string message);

    /// Wait up to `timeout` for the next message. Returns nullopt on timeout
    /// and once the channel is closed and drained.
    std::optional<std::string> pop(std::chrono::milliseconds timeout);

    /// Wakes a waiting consumer. Queued messages are discarded.
    void close();

    [[nodiscard]] bool is_open() const;

    /// Monotonic id for the next event written on this channel.
    uint64_t next_event_id() { return ++event_seq_; }

private:
    std::string session_id_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    bool closed_ = false;
    std::atomic<uint64_t> event_seq_{0};
};

class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(std::string id, Implementation client_info, nlohmann::json client_capabilities);

    const std::string& id() const { return id_; }
    const Implementation& client_info() const { return client_info_; }
    const nlohmann::json& client_capabilities() const { return client_capabilities_; }
    Clock::time_point created_at() const { return created_at_; }
    Clock::time_point last_activity() const;

    /// Register a new open channel. Returns null once the session is closed.
    std::shared_ptr<PushChannel> open_channel();
    void remove_channel(const std::shared_ptr<PushChannel>& channel);
    [[nodiscard]] size_t channel_count() const;

    /// Push to every open channel. Returns how many accepted it.
    size_t broadcast(const std::string& message);

    [[nodiscard]] bool is_closed() const;

private:
    friend class SessionManager;

    void mark_active(Clock::time_point now);
    void close();

    const std::string id_;
    const Implementation client_info_;
    const nlohmann::json client_capabilities_;
    const Clock::time_point created_at_;

    mutable std::mutex mutex_;
    Clock::time_point last_activity_;
    std::vector<std::shared_ptr<PushChannel>> channels_;
    bool closed_ = false;
};

/// Creates, validates and expires sessions. Touching a session and the
/// expiry sweep take the same lock, so a sweep never evicts a session
/// between a successful touch and its use.
class SessionManager {
public:
    using Clock = Session::Clock;

    struct Options {
        std::chrono::milliseconds session_timeout{30 * 60 * 1000};
        std::chrono::milliseconds sweep_interval{60 * 1000};
        size_t max_sessions = 0;  // 0 = unlimited
    };

    explicit SessionManager(Options opts, std::shared_ptr<ITelemetrySink> telemetry = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// New session with a random id. Throws McpError when max_sessions is hit.
    std::shared_ptr<Session> create(Implementation client_info,
                                    nlohmann::json client_capabilities = nlohmann::json::object());

    /// Extend an unexpired session. An expired one is evicted and false
    /// returned.
    bool touch(const std::string& id);

    /// touch() and return the session, or null.
    std::shared_ptr<Session> acquire(const std::string& id);

    /// Exists and has not timed out. Does not extend it.
    [[nodiscard]] bool valid(const std::string& id) const;

    /// Close every channel and drop the session now.
    bool destroy(const std::string& id);

    /// Evict everything idle past the timeout. Returns the eviction count.
    size_t sweep();

    /// Run sweep() every sweep_interval on a background thread.
    void start_sweeper();
    void stop_sweeper();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::vector<std::shared_ptr<Session>> sessions() const;
    [[nodiscard]] const Options& options() const { return opts_; }

    /// 128 random bits from the system CSPRNG, formatted as a UUID v4.
    [[nodiscard]] static std::string generate_id();

private:
    bool expired(const Session& s, Clock::time_point now) const;

    Options opts_;
    std::shared_ptr<ITelemetrySink> telemetry_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_running_ = false;
    std::thread sweeper_;
};

} // namespace mcphost
