#pragma once

/// @file error.h
/// @brief promptguard error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace promptguard {

/// @brief Error codes specific to promptguard
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kResourceExhausted,
    kFailedPrecondition,
    kOutOfRange,
    kUnimplemented,
    kInternal,
    kUnavailable,

    // promptguard-specific error codes
    kPatternCompileError,
    kPayloadTooLarge,
    kConfigurationError,
    kValidationError,
};

/// @brief Convert promptguard error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create a validation error (reported to HTTP callers as 400)
inline absl::Status ValidationError(std::string_view message) {
    return MakeError(ErrorCode::kValidationError, message);
}

/// @brief Create a configuration error
inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

/// @brief Create an internal error
inline absl::Status InternalError(std::string_view message) {
    return absl::InternalError(absl::string_view(message.data(), message.size()));
}

/// @brief Map a status onto the HTTP status code a caller should see
///
/// InvalidArgument, FailedPrecondition and OutOfRange are client errors (400),
/// NotFound is 404, ResourceExhausted is 413, anything else is 500.
int HttpStatusFromStatus(const absl::Status& status);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define PROMPTGUARD_RETURN_IF_ERROR(expr)                                      \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define PROMPTGUARD_ASSIGN_OR_RETURN(lhs, rhs)                                 \
    PROMPTGUARD_ASSIGN_OR_RETURN_IMPL(                                         \
        PROMPTGUARD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define PROMPTGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                  \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define PROMPTGUARD_CONCAT(a, b) PROMPTGUARD_CONCAT_IMPL(a, b)
#define PROMPTGUARD_CONCAT_IMPL(a, b) a##b

}  // namespace promptguard
