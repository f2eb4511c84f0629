#include "error.h"

namespace promptguard {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kPatternCompileError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kResourceExhausted:
        case ErrorCode::kPayloadTooLarge:
            return absl::StatusCode::kResourceExhausted;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kUnimplemented:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

int HttpStatusFromStatus(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kOk:
            return 200;
        case absl::StatusCode::kInvalidArgument:
        case absl::StatusCode::kFailedPrecondition:
        case absl::StatusCode::kOutOfRange:
            return 400;
        case absl::StatusCode::kNotFound:
            return 404;
        case absl::StatusCode::kResourceExhausted:
            return 413;
        default:
            return 500;
    }
}

}  // namespace promptguard
