#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>
#include <optional>

namespace mcphost {

/// Handles one inbound message and returns the reply, if it has one.
/// Called concurrently from transport worker threads.
using MessageHandler = std::function<std::optional<JsonRpcMessage>(const JsonRpcMessage& msg)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until shutdown or end of input.
    virtual void start(MessageHandler on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Send a server-initiated message to every connected peer.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Graceful shutdown. Safe to call from any thread.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcphost
