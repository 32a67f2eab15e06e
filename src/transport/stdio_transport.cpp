#include "mcphost/transport/stdio_transport.hpp"
#include "mcphost/error.hpp"
#include "mcphost/router.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace mcphost {

namespace {

void report(const ErrorCallback& on_error, const std::string& what) {
    if (!on_error) return;
    on_error(std::make_exception_ptr(McpTransportError(what)));
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(Options()) {
}

StdioTransport::StdioTransport(Options opts)
    : opts_(opts), read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : opts_(opts), read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    shutdown();
    stop_workers();
    if (writer_thread_.joinable()) {
        running_ = false;
        write_cv_.notify_all();
        writer_thread_.join();
    }
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageHandler on_message, ErrorCallback on_error) {
    // shutdown() before start() means there is nothing to serve.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    handler_ = std::move(on_message);
    connected_ = true;

    if (pipe(wakeup_pipe_) < 0) {
        running_ = false;
        connected_ = false;
        throw McpTransportError("Failed to create wakeup pipe");
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);

    writer_thread_ = std::thread([this]() { write_loop(); });
    start_workers();

    read_loop(std::move(on_error));

    // Let in-flight requests finish and their replies drain before returning.
    connected_ = false;
    stop_workers();
    running_ = false;
    write_cv_.notify_all();
    if (writer_thread_.joinable()) writer_thread_.join();
}

void StdioTransport::read_loop(ErrorCallback on_error) {
    std::string buffer;
    buffer.reserve(4096);
    bool discarding = false;
    auto reject_oversize = [this] {
        enqueue_write(Codec::serialize(Router::parse_error_response(
            McpParseError("Message exceeds " + std::to_string(opts_.max_line_bytes) + " bytes"))));
    };

    char chunk[4096];

    while (!shutdown_requested_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(on_error, std::string("poll failed: ") + strerror(errno));
            break;
        }

        // shutdown() wrote to the wakeup pipe
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            report(on_error, std::string("Read error: ") + strerror(errno));
            break;
        }
        if (n == 0) break;  // EOF

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            const size_t length = nl - pos;
            const size_t start = pos;
            pos = nl + 1;

            // Tail of a line already reported as oversize.
            if (discarding) {
                discarding = false;
                continue;
            }
            if (length > opts_.max_line_bytes) {
                reject_oversize();
                continue;
            }

            std::string line = buffer.substr(start, length);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            handle_line(line);
        }

        if (pos > 0) buffer.erase(0, pos);

        // One error per oversize line, however many reads it spans.
        if (buffer.size() > opts_.max_line_bytes) {
            buffer.clear();
            if (!discarding) {
                discarding = true;
                reject_oversize();
            }
        }
    }
}

void StdioTransport::handle_line(const std::string& line) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const McpParseError& e) {
        enqueue_write(Codec::serialize(Router::parse_error_response(e)));
        return;
    } catch (const McpInvalidRequestError& e) {
        enqueue_write(Codec::serialize(Router::invalid_request_response(e)));
        return;
    }

    post([this, msg = std::move(msg)]() {
        std::optional<JsonRpcMessage> reply;
        try {
            reply = handler_(msg);
        } catch (const std::exception& e) {
            if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
                reply = error_response(req->id, make_error(
                    ErrorKind::Internal, std::string("Internal error: ") + e.what()));
            }
        }
        if (reply) enqueue_write(Codec::serialize(*reply));
    });
}

void StdioTransport::write_loop() {
    while (true) {
        std::string msg_to_write;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });

            if (!running_ && write_queue_.empty()) break;
            msg_to_write = std::move(write_queue_.front());
            write_queue_.pop();
        }

        msg_to_write += '\n';
        const char* data = msg_to_write.data();
        size_t remaining = msg_to_write.size();

        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                break; // peer gone
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::enqueue_write(std::string serialized) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    // Messages queued before start() are written once the writer runs.
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }
    enqueue_write(Codec::serialize(msg));
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored;  // non-blocking; a full pipe already wakes the reader
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

void StdioTransport::start_workers() {
    std::lock_guard<std::mutex> lock(task_mutex_);
    workers_running_ = true;
    int n = opts_.worker_threads > 0 ? opts_.worker_threads : 1;
    for (int i = 0; i < n; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lk(task_mutex_);
                    task_cv_.wait(lk, [this] { return !tasks_.empty() || !workers_running_; });
                    if (!workers_running_ && tasks_.empty()) return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }
}

void StdioTransport::stop_workers() {
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        workers_running_ = false;
    }
    task_cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void StdioTransport::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        tasks_.push(std::move(task));
    }
    task_cv_.notify_one();
}

} // namespace mcphost
