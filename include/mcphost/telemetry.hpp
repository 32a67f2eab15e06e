#pragma once
#include "types.hpp"
#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string_view>
#include <nlohmann/json.hpp>

namespace mcphost {

/// Sink for named structured events. Implementations must be thread-safe.
class ITelemetrySink {
public:
    virtual ~ITelemetrySink() = default;

    virtual void event(LogLevel level, std::string_view name,
                       const nlohmann::json& data = nlohmann::json::object()) = 0;

    [[nodiscard]] virtual bool enabled(LogLevel level) const { (void)level; return true; }
};

/// Discards everything.
class NullTelemetry : public ITelemetrySink {
public:
    void event(LogLevel, std::string_view, const nlohmann::json&) override {}
    bool enabled(LogLevel) const override { return false; }
};

/// One JSON object per line on a FILE* (stderr by default; stdout belongs
/// to the pipe transport).
class StderrTelemetry : public ITelemetrySink {
public:
    explicit StderrTelemetry(LogLevel min_level = LogLevel::Info, std::FILE* out = stderr);

    void event(LogLevel level, std::string_view name,
               const nlohmann::json& data = nlohmann::json::object()) override;
    bool enabled(LogLevel level) const override;

    void set_min_level(LogLevel level) { min_level_ = level; }

private:
    std::atomic<LogLevel> min_level_;
    std::FILE* out_;
    std::mutex mutex_;
};

/// Sink used when a component is given none.
std::shared_ptr<ITelemetrySink> null_telemetry();

} // namespace mcphost
