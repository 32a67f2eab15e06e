#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include "../rate_limiter.hpp"
#include "../session.hpp"
#include "../telemetry.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace mcphost {

/// Streamable HTTP server transport. One endpoint path carries POST
/// (messages), GET (server push stream) and DELETE (session termination).
/// Sessions are created on a successful `initialize` and travel in the
/// `Mcp-Session-Id` header.
class HttpServerTransport : public ITransport {
public:
    static constexpr const char* kSessionHeader = "Mcp-Session-Id";

    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;              // 0 binds any free port
        std::string mcp_path = "/mcp";
        std::string health_path = "/health";
        std::vector<std::string> allowed_origins;  // empty = any origin
        std::vector<std::string> allowed_hosts;    // empty = any Host header
        std::chrono::milliseconds keepalive{15000};
        int worker_threads = 16;
        SessionManager::Options sessions;
        RateLimiter::Options rate_limit;
    };

    /// Supplies the server-specific part of the health document.
    using HealthProvider = std::function<nlohmann::json()>;

    explicit HttpServerTransport(Options opts, std::shared_ptr<ITelemetrySink> telemetry = nullptr);
    ~HttpServerTransport() override;

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    /// Binds, then serves until shutdown(). Throws McpTransportError when
    /// the address cannot be bound.
    void start(MessageHandler on_message, ErrorCallback on_error = nullptr) override;

    /// Push to every open channel of every session.
    void send(const JsonRpcMessage& msg) override;

    /// Push to the channels of one session. Returns false for an unknown session.
    bool send_to_session(const std::string& session_id, const JsonRpcMessage& msg);

    void shutdown() override;
    bool is_connected() const override;

    void set_health_provider(HealthProvider provider);

    /// The bound port once listening (the configured one, or the one picked
    /// for port 0).
    uint16_t port() const { return bound_port_.load(); }

    /// Poll until the server accepts connections or `timeout` elapses.
    bool wait_until_ready(std::chrono::milliseconds timeout) const;

    SessionManager& sessions() { return *sessions_; }

private:
    void setup_routes();

    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_get(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    /// Origin, Host and rate-limit checks. Returns false when `res` already
    /// holds the rejection.
    bool admit(const httplib::Request& req, httplib::Response& res);
    bool origin_allowed(const std::string& origin) const;
    bool host_allowed(const std::string& host) const;

    /// Router call with the transport's last-resort error boundary.
    std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg);
    void report(const std::string& what);

    Options opts_;
    std::shared_ptr<ITelemetrySink> telemetry_;
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<SessionManager> sessions_;
    RateLimiter rate_limiter_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<uint16_t> bound_port_{0};

    MessageHandler message_handler_;
    ErrorCallback error_callback_;

    std::mutex health_mutex_;
    HealthProvider health_provider_;
};

} // namespace mcphost
