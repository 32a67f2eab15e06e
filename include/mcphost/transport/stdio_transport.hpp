#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace mcphost {

// Defined at namespace scope so Options() can serve as a default argument
// inside StdioTransport.
struct StdioTransportOptions {
    int worker_threads = 4;
    size_t max_line_bytes = 16 * 1024 * 1024;
};

/// Newline-delimited JSON over a pair of file descriptors (stdin/stdout by
/// default). Reads on the calling thread, handles messages on a small
/// worker pool and writes from a dedicated writer thread.
class StdioTransport : public ITransport {
public:
    using Options = StdioTransportOptions;

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport using specified file descriptors, which it then owns.
    StdioTransport(int read_fd, int write_fd, Options opts = Options());

    ~StdioTransport() override;

    void start(MessageHandler on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(ErrorCallback on_error);
    void write_loop();
    void handle_line(const std::string& line);
    void enqueue_write(std::string serialized);

    void start_workers();
    void stop_workers();
    void post(std::function<void()> task);

    Options opts_;
    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    MessageHandler handler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex task_mutex_;
    std::condition_variable task_cv_;
    bool workers_running_ = false;

    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in read_loop
};

} // namespace mcphost
