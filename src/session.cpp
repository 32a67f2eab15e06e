#include "mcphost/session.hpp"
#include "mcphost/error.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace mcphost {

// ---------- PushChannel ----------

PushChannel::PushChannel(std::string session_id)
    : session_id_(std::move(session_id)) {
}

bool PushChannel::push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> PushChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (closed_ || queue_.empty()) return std::nullopt;
    std::string msg = std::move(queue_.front());
    queue_.pop_front();
    return msg;
}

void PushChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
    }
    cv_.notify_all();
}

bool PushChannel::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_;
}

// ---------- Session ----------

Session::Session(std::string id, Implementation client_info, nlohmann::json client_capabilities)
    : id_(std::move(id))
    , client_info_(std::move(client_info))
    , client_capabilities_(std::move(client_capabilities))
    , created_at_(Clock::now())
    , last_activity_(created_at_) {
}

Session::Clock::time_point Session::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

void Session::mark_active(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = now;
}

std::shared_ptr<PushChannel> Session::open_channel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return nullptr;
    auto channel = std::make_shared<PushChannel>(id_);
    channels_.push_back(channel);
    return channel;
}

void Session::remove_channel(const std::shared_ptr<PushChannel>& channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_.erase(std::remove(channels_.begin(), channels_.end(), channel), channels_.end());
}

size_t Session::channel_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

size_t Session::broadcast(const std::string& message) {
    std::vector<std::shared_ptr<PushChannel>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = channels_;
    }
    size_t delivered = 0;
    for (auto& c : targets) {
        if (c->push(message)) ++delivered;
    }
    return delivered;
}

bool Session::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void Session::close() {
    std::vector<std::shared_ptr<PushChannel>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        to_close.swap(channels_);
    }
    for (auto& c : to_close) c->close();
}

// ---------- SessionManager ----------

SessionManager::SessionManager(Options opts, std::shared_ptr<ITelemetrySink> telemetry)
    : opts_(opts)
    , telemetry_(telemetry ? std::move(telemetry) : null_telemetry()) {
}

SessionManager::~SessionManager() {
    stop_sweeper();
    std::map<std::string, std::shared_ptr<Session>> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(sessions_);
    }
    for (auto& [id, s] : remaining) s->close();
}

std::string SessionManager::generate_id() {
    std::random_device rd;
    auto next64 = [&rd]() {
        return (static_cast<uint64_t>(rd()) << 32) | static_cast<uint64_t>(rd());
    };
    uint64_t a = next64(), b = next64();
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

bool SessionManager::expired(const Session& s, Clock::time_point now) const {
    return now - s.last_activity() > opts_.session_timeout;
}

std::shared_ptr<Session> SessionManager::create(Implementation client_info,
                                                nlohmann::json client_capabilities) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (opts_.max_sessions > 0 && sessions_.size() >= opts_.max_sessions) {
            throw McpError("Session limit reached");
        }
        std::string id;
        do {
            id = generate_id();
        } while (sessions_.count(id));
        session = std::make_shared<Session>(id, std::move(client_info),
                                            std::move(client_capabilities));
        sessions_[id] = session;
    }
    telemetry_->event(LogLevel::Info, "session.created",
                      {{"session", session->id()}, {"client", session->client_info()}});
    return session;
}

bool SessionManager::touch(const std::string& id) {
    return acquire(id) != nullptr;
}

std::shared_ptr<Session> SessionManager::acquire(const std::string& id) {
    std::shared_ptr<Session> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return nullptr;
        auto now = Clock::now();
        if (!expired(*it->second, now)) {
            it->second->mark_active(now);
            return it->second;
        }
        evicted = it->second;
        sessions_.erase(it);
    }
    evicted->close();
    telemetry_->event(LogLevel::Info, "session.expired", {{"session", id}});
    return nullptr;
}

bool SessionManager::valid(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() && !expired(*it->second, Clock::now());
}

bool SessionManager::destroy(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        session = it->second;
        sessions_.erase(it);
    }
    session->close();
    telemetry_->event(LogLevel::Info, "session.terminated", {{"session", id}});
    return true;
}

size_t SessionManager::sweep() {
    std::vector<std::shared_ptr<Session>> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        for (auto it = sessions_.begin(); it != sessions_.end(); ) {
            if (expired(*it->second, now)) {
                evicted.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& s : evicted) {
        s->close();
        telemetry_->event(LogLevel::Info, "session.expired", {{"session", s->id()}});
    }
    return evicted.size();
}

void SessionManager::start_sweeper() {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (sweeper_running_) return;
    sweeper_running_ = true;
    // A zero interval would turn the wait into a busy loop.
    const auto interval = std::max(opts_.sweep_interval, std::chrono::milliseconds(1));
    sweeper_ = std::thread([this, interval] {
        std::unique_lock<std::mutex> lk(sweeper_mutex_);
        while (sweeper_running_) {
            if (sweeper_cv_.wait_for(lk, interval, [this] { return !sweeper_running_; })) {
                break;
            }
            lk.unlock();
            sweep();
            lk.lock();
        }
    });
}

void SessionManager::stop_sweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        if (!sweeper_running_) return;
        sweeper_running_ = false;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) sweeper_.join();
}

size_t SessionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::shared_ptr<Session>> SessionManager::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Session>> out;
    out.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) out.push_back(s);
    return out;
}

} // namespace mcphost
