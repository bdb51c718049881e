#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace hashdup::infra {

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ExecutionContextUnavailable: return "ExecutionContextUnavailable";
        case ErrorCode::MalformedRequest:            return "MalformedRequest";
        case ErrorCode::ConfigInvalid:               return "ConfigInvalid";
        case ErrorCode::FileNotFound:                return "FileNotFound";
        case ErrorCode::PermissionDenied:            return "PermissionDenied";
        case ErrorCode::RunInProgress:               return "RunInProgress";
        case ErrorCode::ProtocolViolation:           return "ProtocolViolation";
        case ErrorCode::HashComputationFailed:       return "HashComputationFailed";
        case ErrorCode::Cancelled:                   return "Cancelled";
        case ErrorCode::Unknown:                     return "Unknown";
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::ExecutionContextUnavailable:
        case ErrorCode::MalformedRequest:
        case ErrorCode::ConfigInvalid:
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::ProtocolViolation:
        case ErrorCode::Unknown:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::Cancelled:             return 130; // SIGINT
        case ErrorCode::HashComputationFailed: return 2;   // частичный успех
        case ErrorCode::RunInProgress:         return 3;
        default:                               return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace hashdup::infra
