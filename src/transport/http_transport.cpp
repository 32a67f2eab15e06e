#include "mcphost/transport/http_transport.hpp"
#include "mcphost/error.hpp"
#include "mcphost/router.hpp"
#include "mcphost/version.hpp"

#include <httplib.h>

#include <algorithm>
#include <cmath>
#include <thread>

namespace mcphost {

namespace {

constexpr const char* kJson = "application/json";
constexpr const char* kEventStream = "text/event-stream";
constexpr const char* kAllow = "GET, POST, DELETE, OPTIONS";

void set_error(httplib::Response& res, int status, const RequestId& id,
               ErrorKind kind, const std::string& message,
               nlohmann::json data = nlohmann::json::object()) {
    res.status = status;
    res.set_content(Codec::serialize(error_response(id, make_error(kind, message, std::move(data)))), kJson);
}

bool accepts(const httplib::Request& req, const char* type) {
    return req.get_header_value("Accept").find(type) != std::string::npos;
}

/// SSE framing for one message.
bool write_event(httplib::DataSink& sink, uint64_t event_id, const std::string& payload) {
    std::string event = "id: " + std::to_string(event_id) + "\nevent: message\ndata: " + payload + "\n\n";
    return sink.write(event.data(), event.size());
}

RequestId request_id_of(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) return req->id;
    return RequestId{nullptr};
}

} // anonymous namespace

HttpServerTransport::HttpServerTransport(Options opts, std::shared_ptr<ITelemetrySink> telemetry)
    : opts_(std::move(opts))
    , telemetry_(telemetry ? std::move(telemetry) : null_telemetry())
    , server_(std::make_unique<httplib::Server>())
    , sessions_(std::make_unique<SessionManager>(opts_.sessions, telemetry_))
    , rate_limiter_(opts_.rate_limit) {
    int threads = opts_.worker_threads > 0 ? opts_.worker_threads : 1;
    server_->new_task_queue = [threads] {
        return new httplib::ThreadPool(static_cast<size_t>(threads));
    };
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

bool HttpServerTransport::origin_allowed(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), origin)
        != opts_.allowed_origins.end();
}

bool HttpServerTransport::host_allowed(const std::string& host) const {
    if (opts_.allowed_hosts.empty()) return true;
    std::string bare = host;
    auto colon = bare.rfind(':');
    if (colon != std::string::npos && bare.find(']') == std::string::npos) {
        bare = bare.substr(0, colon);
    }
    for (const auto& allowed : opts_.allowed_hosts) {
        if (host == allowed || bare == allowed) return true;
    }
    return false;
}

bool HttpServerTransport::admit(const httplib::Request& req, httplib::Response& res) {
    // DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !origin_allowed(origin)) {
        telemetry_->event(LogLevel::Warning, "http.origin_rejected", {{"origin", origin}});
        set_error(res, 403, RequestId{nullptr}, ErrorKind::OriginRejected,
                  "Origin not allowed", {{"origin", origin}});
        return false;
    }
    auto host = req.get_header_value("Host");
    if (!host_allowed(host)) {
        telemetry_->event(LogLevel::Warning, "http.host_rejected", {{"host", host}});
        set_error(res, 403, RequestId{nullptr}, ErrorKind::OriginRejected,
                  "Host not allowed", {{"host", host}});
        return false;
    }

    if (auto retry = rate_limiter_.acquire(req.remote_addr)) {
        auto seconds = static_cast<long long>(std::ceil(static_cast<double>(retry->count()) / 1000.0));
        res.set_header("Retry-After", std::to_string(std::max<long long>(seconds, 1)));
        set_error(res, 429, RequestId{nullptr}, ErrorKind::RateLimited,
                  "Too many requests", {{"retry_after_ms", retry->count()}});
        return false;
    }
    return true;
}

std::optional<JsonRpcMessage> HttpServerTransport::dispatch(const JsonRpcMessage& msg) {
    try {
        return message_handler_(msg);
    } catch (const std::exception& e) {
        report(std::string("Unhandled error in message handler: ") + e.what());
        if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            return JsonRpcMessage{error_response(req->id, make_error(
                ErrorKind::Internal, std::string("Internal error: ") + e.what()))};
        }
        return std::nullopt;
    }
}

void HttpServerTransport::report(const std::string& what) {
    telemetry_->event(LogLevel::Error, "http.request_failed", {{"error", what}});
    if (error_callback_) {
        error_callback_(std::make_exception_ptr(McpTransportError(what)));
    }
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    if (!admit(req, res)) return;

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(req.body);
    } catch (const McpParseError& e) {
        res.status = 400;
        res.set_content(Codec::serialize(Router::parse_error_response(e)), kJson);
        return;
    } catch (const McpInvalidRequestError& e) {
        res.status = 400;
        res.set_content(Codec::serialize(Router::invalid_request_response(e)), kJson);
        return;
    }

    const auto* request = std::get_if<JsonRpcRequest>(&msg);
    const bool is_initialize = request && request->method == Router::kInitializeMethod;

    if (is_initialize) {
        auto reply = dispatch(msg);
        const auto* response = reply ? std::get_if<JsonRpcResponse>(&*reply) : nullptr;
        if (response && !response->error) {
            InitializeParams params;
            try {
                from_json(request->params.value_or(nlohmann::json::object()), params);
            } catch (const nlohmann::json::exception&) {
                // The handler accepted the params; keep the session without client info.
            }
            try {
                auto session = sessions_->create(params.client_info, params.capabilities);
                res.set_header(kSessionHeader, session->id());
            } catch (const McpError& e) {
                set_error(res, 503, request->id, ErrorKind::Internal, e.what());
                return;
            }
        }
        res.status = 200;
        res.set_content(reply ? Codec::serialize(*reply) : std::string("{}"), kJson);
        return;
    }

    // Every other message is bound to a live session before it reaches the router.
    const std::string session_id = req.get_header_value(kSessionHeader);
    if (session_id.empty()) {
        set_error(res, 400, request_id_of(msg), ErrorKind::SessionInvalid,
                  "Missing Mcp-Session-Id header");
        return;
    }
    auto session = sessions_->acquire(session_id);
    if (!session) {
        set_error(res, 404, request_id_of(msg), ErrorKind::SessionInvalid,
                  "Session not found or expired", {{"session_id", session_id}});
        return;
    }

    if (!request) {
        // Notifications and client responses produce no reply.
        auto ignored = dispatch(msg);
        (void)ignored;
        res.status = 202;
        return;
    }

    if (accepts(req, kEventStream) && !accepts(req, kJson)) {
        auto channel = session->open_channel();
        if (!channel) {
            set_error(res, 404, request->id, ErrorKind::SessionInvalid,
                      "Session closed", {{"session_id", session_id}});
            return;
        }
        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider(kEventStream,
            [this, msg, channel](size_t /*offset*/, httplib::DataSink& sink) -> bool {
                auto reply = dispatch(msg);
                // Anything pushed to the session while the request ran goes first.
                while (auto pending = channel->pop(std::chrono::milliseconds(0))) {
                    if (!write_event(sink, channel->next_event_id(), *pending)) return false;
                }
                if (reply && !write_event(sink, channel->next_event_id(), Codec::serialize(*reply))) {
                    return false;
                }
                sink.done();
                return true;
            },
            [session, channel](bool /*success*/) {
                session->remove_channel(channel);
                channel->close();
            });
        return;
    }

    auto reply = dispatch(msg);
    res.status = 200;
    res.set_content(reply ? Codec::serialize(*reply) : std::string("{}"), kJson);
}

void HttpServerTransport::handle_get(const httplib::Request& req, httplib::Response& res) {
    if (!admit(req, res)) return;

    if (!accepts(req, kEventStream)) {
        set_error(res, 406, RequestId{nullptr}, ErrorKind::MalformedRequest,
                  "GET requires Accept: text/event-stream");
        return;
    }

    const std::string session_id = req.get_header_value(kSessionHeader);
    if (session_id.empty()) {
        set_error(res, 400, RequestId{nullptr}, ErrorKind::SessionInvalid,
                  "Missing Mcp-Session-Id header");
        return;
    }
    auto session = sessions_->acquire(session_id);
    auto channel = session ? session->open_channel() : nullptr;
    if (!channel) {
        set_error(res, 404, RequestId{nullptr}, ErrorKind::SessionInvalid,
                  "Session not found or expired", {{"session_id", session_id}});
        return;
    }

    auto last_event_id = req.get_header_value("Last-Event-ID");
    if (!last_event_id.empty()) {
        // TODO: replay needs a bounded per-session event log keyed by event id.
        telemetry_->event(LogLevel::Info, "http.resume_requested",
            {{"session_id", session_id}, {"last_event_id", last_event_id}});
    }

    telemetry_->event(LogLevel::Debug, "http.stream_opened", {{"session_id", session_id}});

    const auto keepalive = opts_.keepalive.count() > 0 ? opts_.keepalive : std::chrono::milliseconds(15000);
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider(kEventStream,
        [channel, keepalive](size_t /*offset*/, httplib::DataSink& sink) -> bool {
            auto next = channel->pop(keepalive);
            if (next) {
                return write_event(sink, channel->next_event_id(), *next);
            }
            if (!channel->is_open()) {
                sink.done();
                return true;
            }
            static const std::string ping = ": keepalive\n\n";
            return sink.write(ping.data(), ping.size());
        },
        [this, session, channel, session_id](bool /*success*/) {
            session->remove_channel(channel);
            channel->close();
            telemetry_->event(LogLevel::Debug, "http.stream_closed", {{"session_id", session_id}});
        });
}

void HttpServerTransport::handle_delete(const httplib::Request& req, httplib::Response& res) {
    if (!admit(req, res)) return;

    const std::string session_id = req.get_header_value(kSessionHeader);
    if (session_id.empty()) {
        set_error(res, 400, RequestId{nullptr}, ErrorKind::SessionInvalid,
                  "Missing Mcp-Session-Id header");
        return;
    }
    if (!sessions_->destroy(session_id)) {
        set_error(res, 404, RequestId{nullptr}, ErrorKind::SessionInvalid,
                  "Session not found or expired", {{"session_id", session_id}});
        return;
    }
    res.status = 200;
}

void HttpServerTransport::handle_health(const httplib::Request& req, httplib::Response& res) {
    if (!admit(req, res)) return;

    nlohmann::json doc;
    {
        std::lock_guard<std::mutex> lock(health_mutex_);
        doc = health_provider_ ? health_provider_() : nlohmann::json{{"status", "ok"}};
    }
    doc["transport"] = "http";
    doc["sessions"] = sessions_->size();
    res.status = 200;
    res.set_content(doc.dump(), kJson);
}

void HttpServerTransport::setup_routes() {
    const std::string path = opts_.mcp_path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        try {
            handle_post(req, res);
        } catch (const std::exception& e) {
            report(std::string("POST ") + req.path + ": " + e.what());
            set_error(res, 500, RequestId{nullptr}, ErrorKind::Internal, "Internal server error");
        }
    });

    server_->Get(path, [this](const httplib::Request& req, httplib::Response& res) {
        try {
            handle_get(req, res);
        } catch (const std::exception& e) {
            report(std::string("GET ") + req.path + ": " + e.what());
            set_error(res, 500, RequestId{nullptr}, ErrorKind::Internal, "Internal server error");
        }
    });

    server_->Delete(path, [this](const httplib::Request& req, httplib::Response& res) {
        try {
            handle_delete(req, res);
        } catch (const std::exception& e) {
            report(std::string("DELETE ") + req.path + ": " + e.what());
            set_error(res, 500, RequestId{nullptr}, ErrorKind::Internal, "Internal server error");
        }
    });

    server_->Options(path, [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Allow", kAllow);
        res.status = 204;
    });

    auto not_allowed = [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Allow", kAllow);
        res.status = 405;
        res.set_content("{\"error\":\"Method not allowed\"}", kJson);
    };
    server_->Put(path, not_allowed);
    server_->Patch(path, not_allowed);

    server_->Get(opts_.health_path, [this](const httplib::Request& req, httplib::Response& res) {
        try {
            handle_health(req, res);
        } catch (const std::exception& e) {
            report(std::string("GET ") + req.path + ": " + e.what());
            set_error(res, 500, RequestId{nullptr}, ErrorKind::Internal, "Internal server error");
        }
    });
}

void HttpServerTransport::start(MessageHandler on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;

    message_handler_ = std::move(on_message);
    error_callback_ = std::move(on_error);

    setup_routes();

    int port = -1;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
    } else if (server_->bind_to_port(opts_.host, opts_.port)) {
        port = opts_.port;
    }
    if (port <= 0) {
        running_ = false;
        throw McpTransportError("Failed to start HTTP server on " + opts_.host + ":" + std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);

    sessions_->start_sweeper();
    telemetry_->event(LogLevel::Info, "http.listening",
        {{"host", opts_.host}, {"port", port}, {"path", opts_.mcp_path}});

    bool clean = server_->listen_after_bind();

    sessions_->stop_sweeper();
    running_ = false;
    if (!clean && !shutdown_requested_.load()) {
        throw McpTransportError("HTTP server on " + opts_.host + ":" + std::to_string(port) + " stopped unexpectedly");
    }
}

void HttpServerTransport::send(const JsonRpcMessage& msg) {
    const std::string payload = Codec::serialize(msg);
    for (const auto& session : sessions_->sessions()) {
        session->broadcast(payload);
    }
}

bool HttpServerTransport::send_to_session(const std::string& session_id, const JsonRpcMessage& msg) {
    for (const auto& session : sessions_->sessions()) {
        if (session->id() == session_id) {
            session->broadcast(Codec::serialize(msg));
            return true;
        }
    }
    return false;
}

void HttpServerTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    // Closing the channels ends every open stream so the server can stop.
    for (const auto& session : sessions_->sessions()) {
        sessions_->destroy(session->id());
    }
    server_->stop();
}

bool HttpServerTransport::is_connected() const {
    return running_;
}

void HttpServerTransport::set_health_provider(HealthProvider provider) {
    std::lock_guard<std::mutex> lock(health_mutex_);
    health_provider_ = std::move(provider);
}

bool HttpServerTransport::wait_until_ready(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (bound_port_.load() != 0 && server_->is_running()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

} // namespace mcphost
