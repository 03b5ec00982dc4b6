#include "error.h"

namespace aegis {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
        case ErrorCode::kMalformedResponse:
            return absl::StatusCode::kInternal;
        case ErrorCode::kProviderUnavailable:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kProviderTimeout:
            return absl::StatusCode::kDeadlineExceeded;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

std::string_view ProviderFailureKind(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kOk:
            return "ok";
        case absl::StatusCode::kUnavailable:
            return "unavailable";
        case absl::StatusCode::kDeadlineExceeded:
            return "timeout";
        case absl::StatusCode::kInternal:
            return "malformed response";
        case absl::StatusCode::kInvalidArgument:
            return "bad request";
        default:
            return "error";
    }
}

}  // namespace aegis
