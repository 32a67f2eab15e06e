#pragma once
#include <string_view>

namespace mcphost {

constexpr std::string_view LIBRARY_VERSION     = "0.3.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Bumped whenever the shared-library module interface changes.
constexpr int MODULE_ABI_VERSION = 1;

} // namespace mcphost
