#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace mcphost {

/// Cooperative cancellation flag shared between a caller and the work it
/// started. Copies share the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    [[nodiscard]] bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

template <typename R>
struct TimedResult {
    bool timed_out = false;
    std::optional<R> value;
    std::exception_ptr error;

    [[nodiscard]] bool ok() const { return !timed_out && !error && value.has_value(); }
};

/// Run `fn` on a worker thread and wait at most `timeout` for it.
///
/// On timeout the wait is abandoned: `token` is cancelled and the worker is
/// detached. Anything `fn` captures must stay valid until it returns on its
/// own, so capture by value or by shared_ptr. A non-positive timeout runs
/// `fn` inline without a deadline.
template <typename R>
TimedResult<R> run_with_timeout(std::function<R()> fn,
                                std::chrono::milliseconds timeout,
                                const CancelToken& token = CancelToken{}) {
    TimedResult<R> out;

    if (timeout.count() <= 0) {
        try {
            out.value = fn();
        } catch (...) {
            out.error = std::current_exception();
        }
        return out;
    }

    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<R> value;
        std::exception_ptr error;
    };
    auto state = std::make_shared<State>();

    std::thread worker([state, fn = std::move(fn)]() {
        std::optional<R> value;
        std::exception_ptr error;
        try {
            value = fn();
        } catch (...) {
            error = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->value = std::move(value);
            state->error = error;
            state->done = true;
        }
        state->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(state->mutex);
    if (!state->cv.wait_for(lock, timeout, [&] { return state->done; })) {
        lock.unlock();
        token.cancel();
        worker.detach();
        out.timed_out = true;
        return out;
    }
    lock.unlock();
    worker.join();

    out.value = std::move(state->value);
    out.error = state->error;
    return out;
}

} // namespace mcphost
