#include "mcphost/error.hpp"

namespace mcphost {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseFailure:             return "parse-failure";
        case ErrorKind::MalformedRequest:         return "malformed-request";
        case ErrorKind::UnknownMethod:            return "unknown-method";
        case ErrorKind::InvalidParameters:        return "invalid-parameters";
        case ErrorKind::Internal:                 return "internal-error";
        case ErrorKind::NotInitialized:           return "not-initialized";
        case ErrorKind::ToolNotFound:             return "tool-not-found";
        case ErrorKind::ToolInvalidParameters:    return "tool-invalid-parameters";
        case ErrorKind::ToolExecutionFailure:     return "tool-execution-failure";
        case ErrorKind::ToolTimeout:              return "tool-timeout";
        case ErrorKind::SessionInvalid:           return "session-invalid";
        case ErrorKind::RateLimited:              return "rate-limited";
        case ErrorKind::OriginRejected:           return "origin-rejected";
        case ErrorKind::ModuleMissingDependency:  return "module-missing-dependency";
        case ErrorKind::ModuleCircularDependency: return "module-circular-dependency";
        case ErrorKind::ModuleStartFailure:       return "module-start-failure";
        case ErrorKind::ModuleStopTimeout:        return "module-stop-timeout";
        case ErrorKind::ModuleLoadFailure:        return "module-load-failure";
    }
    return "internal-error";
}

int error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseFailure:             return error::ParseError;
        case ErrorKind::MalformedRequest:         return error::InvalidRequest;
        case ErrorKind::UnknownMethod:            return error::MethodNotFound;
        case ErrorKind::InvalidParameters:        return error::InvalidParams;
        case ErrorKind::Internal:                 return error::InternalError;
        case ErrorKind::NotInitialized:           return error::NotInitialized;
        case ErrorKind::ToolNotFound:             return error::ToolNotFound;
        case ErrorKind::ToolInvalidParameters:    return error::InvalidToolParams;
        case ErrorKind::ToolExecutionFailure:     return error::ToolExecutionFailed;
        case ErrorKind::ToolTimeout:              return error::ToolTimeout;
        case ErrorKind::SessionInvalid:           return error::SessionInvalid;
        case ErrorKind::RateLimited:              return error::RateLimited;
        case ErrorKind::OriginRejected:           return error::OriginRejected;
        case ErrorKind::ModuleMissingDependency:  return error::ModuleMissingDependency;
        case ErrorKind::ModuleCircularDependency: return error::ModuleCircularDependency;
        case ErrorKind::ModuleStartFailure:       return error::ModuleStartFailure;
        case ErrorKind::ModuleStopTimeout:        return error::ModuleStopTimeout;
        case ErrorKind::ModuleLoadFailure:        return error::ModuleLoadFailure;
    }
    return error::InternalError;
}

} // namespace mcphost
