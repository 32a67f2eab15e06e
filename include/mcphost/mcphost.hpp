#pragma once

/// Umbrella header for the mcphost library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "telemetry.hpp"
#include "schema_validator.hpp"
#include "timed_call.hpp"
#include "tool_registry.hpp"
#include "router.hpp"
#include "session.hpp"
#include "rate_limiter.hpp"
#include "config.hpp"
#include "server.hpp"
#include "module/module.hpp"
#include "module/manifest.hpp"
#include "module/dependency_graph.hpp"
#include "module/shared_library.hpp"
#include "module/module_loader.hpp"
#include "modules/builtin.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
#include "transport/http_transport.hpp"
