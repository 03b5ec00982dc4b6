#pragma once

/// @file error.h
/// @brief Aegis error codes on top of absl::Status
///
/// Remote moderation failures are reported with dedicated codes so the
/// failure policy and the logs can tell a dead endpoint from a slow one or
/// from a response that could not be understood.

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace aegis {

/// @brief Error codes specific to Aegis
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kInternal,

    // Remote moderation
    kProviderUnavailable,   ///< Not configured, unreachable or non-2xx
    kProviderTimeout,       ///< No complete response within timeout_ms
    kMalformedResponse,     ///< Response body did not match the expected shape

    // Settings
    kConfigurationError,    ///< Configuration could not be loaded
    kValidationError,       ///< A loaded value is out of range
};

/// @brief Convert Aegis error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Short label for a status produced by a moderation provider,
/// e.g. "timeout" or "malformed response"
std::string_view ProviderFailureKind(const absl::Status& status);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define AEGIS_RETURN_IF_ERROR(expr)                                            \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define AEGIS_ASSIGN_OR_RETURN(lhs, rhs)                                       \
    AEGIS_ASSIGN_OR_RETURN_IMPL(                                               \
        AEGIS_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define AEGIS_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                        \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define AEGIS_CONCAT(a, b) AEGIS_CONCAT_IMPL(a, b)
#define AEGIS_CONCAT_IMPL(a, b) a##b

}  // namespace aegis
