#include "mcphost/router.hpp"
#include "mcphost/codec.hpp"
#include "mcphost/error.hpp"

namespace mcphost {

namespace {

nlohmann::json id_to_json(const RequestId& id) {
    nlohmann::json j;
    to_json(j, id);
    return j;
}

} // anonymous namespace

Router::Router(std::shared_ptr<ITelemetrySink> telemetry)
    : telemetry_(telemetry ? std::move(telemetry) : null_telemetry()) {
}

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

JsonRpcResponse Router::parse_error_response(const McpParseError& e) {
    return error_response(nullptr, make_error(ErrorKind::ParseFailure,
                                              std::string("Parse error: ") + e.what()));
}

JsonRpcResponse Router::invalid_request_response(const McpInvalidRequestError& e) {
    RequestId id = nullptr;
    if (e.id.is_string() || e.id.is_number_integer()) from_json(e.id, id);
    return error_response(std::move(id), make_error(ErrorKind::MalformedRequest,
                                                    std::string("Invalid request: ") + e.what()));
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return dispatch_request(*req);
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        dispatch_notification(*notif);
        return std::nullopt;
    }
    if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
        // This server issues no requests of its own.
        telemetry_->event(LogLevel::Debug, "rpc.unexpected_response", {{"id", id_to_json(resp->id)}});
    }
    return std::nullopt;
}

JsonRpcResponse Router::dispatch_request(const JsonRpcRequest& req) {
    const bool is_initialize = req.method == kInitializeMethod;

    if (!is_initialize && !initialized_.load()) {
        return error_response(req.id, make_error(
            ErrorKind::NotInitialized, "Server not initialized",
            {{"method", req.method}, {"hint", "Call 'initialize' method first"}}));
    }

    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_handlers_.find(req.method);
        if (it == request_handlers_.end()) {
            return error_response(req.id, make_error(
                ErrorKind::UnknownMethod, "Method not found: " + req.method,
                {{"method", req.method}}));
        }
        handler = it->second;
    }

    const nlohmann::json params = req.params ? *req.params : nlohmann::json::object();

    // Handlers run without the lock so they may call back into the router.
    try {
        auto result = handler(params);

        JsonRpcResponse resp;
        resp.id = req.id;
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            resp.result = std::move(*ok);
            if (is_initialize && !initialized_.exchange(true)) {
                telemetry_->event(LogLevel::Info, "rpc.initialized");
            }
        } else {
            resp.error = std::get<JsonRpcError>(std::move(result));
        }
        return resp;
    } catch (const McpProtocolError& e) {
        JsonRpcError err{e.code, e.what(), e.data};
        return error_response(req.id, std::move(err));
    } catch (const nlohmann::json::exception& e) {
        return error_response(req.id, make_error(
            ErrorKind::InvalidParameters, std::string("Invalid params: ") + e.what(),
            {{"method", req.method}}));
    } catch (const std::exception& e) {
        telemetry_->event(LogLevel::Error, "rpc.handler_failed",
                          {{"method", req.method}, {"error", e.what()}});
        return error_response(req.id, make_error(
            ErrorKind::Internal, std::string("Internal error: ") + e.what(),
            {{"method", req.method}}));
    } catch (...) {
        telemetry_->event(LogLevel::Error, "rpc.handler_failed",
                          {{"method", req.method}, {"error", "non-standard exception"}});
        return error_response(req.id, make_error(
            ErrorKind::Internal, "Internal error", {{"method", req.method}}));
    }
}

void Router::dispatch_notification(const JsonRpcNotification& notif) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) {
            telemetry_->event(LogLevel::Debug, "rpc.notification_ignored",
                              {{"method", notif.method}});
            return;
        }
        handler = it->second;
    }
    try {
        handler(notif.params ? *notif.params : nlohmann::json::object());
    } catch (const std::exception& e) {
        telemetry_->event(LogLevel::Warning, "rpc.notification_failed",
                          {{"method", notif.method}, {"error", e.what()}});
    } catch (...) {
        telemetry_->event(LogLevel::Warning, "rpc.notification_failed",
                          {{"method", notif.method}, {"error", "non-standard exception"}});
    }
}

std::optional<std::string> Router::handle_raw(std::string_view raw) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(raw);
    } catch (const McpParseError& e) {
        return Codec::serialize(parse_error_response(e));
    } catch (const McpInvalidRequestError& e) {
        return Codec::serialize(invalid_request_response(e));
    }

    auto response = dispatch(msg);
    if (!response) return std::nullopt;
    return Codec::serialize(*response);
}

} // namespace mcphost
