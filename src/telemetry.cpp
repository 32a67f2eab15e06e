#include "mcphost/telemetry.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace mcphost {

namespace {

std::string iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // anonymous namespace

StderrTelemetry::StderrTelemetry(LogLevel min_level, std::FILE* out)
    : min_level_(min_level), out_(out) {
}

bool StderrTelemetry::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

void StderrTelemetry::event(LogLevel level, std::string_view name, const nlohmann::json& data) {
    if (!enabled(level)) return;

    nlohmann::json line = {
        {"ts", iso_timestamp()},
        {"level", log_level_to_string(level)},
        {"event", std::string(name)},
        {"data", data}
    };
    // Replace invalid UTF-8 rather than throwing out of a log call.
    std::string text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    std::fputs(text.c_str(), out_);
    std::fputc('\n', out_);
    std::fflush(out_);
}

std::shared_ptr<ITelemetrySink> null_telemetry() {
    static auto sink = std::make_shared<NullTelemetry>();
    return sink;
}

} // namespace mcphost
