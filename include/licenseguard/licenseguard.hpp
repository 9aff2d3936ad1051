#pragma once

/**
 * @file licenseguard.hpp
 * @brief licenseguard C++ SDK
 *
 * Client-side license entitlement controller for License Manager style
 * HTTP APIs. Core types shared by every module: error codes, the Result
 * type, license state and parsed response data.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace licenseguard {

/// Library version
constexpr const char* VERSION = "0.3.0";

/// Error codes returned by SDK operations
enum class ErrorCode {
    Success = 0,

    // API client taxonomy
    ConfigError,    // Missing/invalid configuration or input shape, never reaches the network
    RequestError,   // Transport failure or HTTP status >= 400
    ContractError,  // HTTP success but the body reports a failure

    // User-facing controller failures
    LicenseKeyRequired,
    TokenRequired,
    LicenseExpired,
    ActivationLimitReached,
    ActivationSettling,
    OperationFailed,
    StorageError,
    UnexpectedError,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::ConfigError:
            return "Configuration error";
        case ErrorCode::RequestError:
            return "Request error";
        case ErrorCode::ContractError:
            return "Contract error";
        case ErrorCode::LicenseKeyRequired:
            return "License key required";
        case ErrorCode::TokenRequired:
            return "Activation token required";
        case ErrorCode::LicenseExpired:
            return "License expired";
        case ErrorCode::ActivationLimitReached:
            return "Activation limit reached";
        case ErrorCode::ActivationSettling:
            return "Activation still settling";
        case ErrorCode::OperationFailed:
            return "Operation failed";
        case ErrorCode::StorageError:
            return "Storage error";
        case ErrorCode::UnexpectedError:
            return "Unexpected error";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Diagnostic payload attached to a failed Result
 *
 * Filled by the API client for RequestError and ContractError so the
 * controller can classify the failure and keep the raw body for support.
 */
struct ErrorDetail {
    std::optional<int> status;  // HTTP status, or the embedded error_data status
    std::string remote_code;    // Embedded error code (e.g. "lmfwc_rest_license_expired")
    std::string payload;        // Raw JSON text of the failing response
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "", ErrorDetail detail = {}) {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        r.detail_ = std::move(detail);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

    /// Get the diagnostic detail of an error
    [[nodiscard]] const ErrorDetail& error_detail() const noexcept { return detail_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
    ErrorDetail detail_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "", ErrorDetail detail = {}) {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        r.detail_ = std::move(detail);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }
    [[nodiscard]] const ErrorDetail& error_detail() const noexcept { return detail_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
    ErrorDetail detail_;
};

/// Timestamp type used throughout the SDK
using Timestamp = std::chrono::system_clock::time_point;

/// License status held in the local state document
enum class LicenseStatus {
    Unconfigured,
    Active,
    Validated,
    Deactivated,
    Expired,
    Revoked,
    GraceSoft,
    LockHard
};

/// Convert license status to its persisted name
[[nodiscard]] constexpr const char* license_status_to_string(LicenseStatus status) noexcept {
    switch (status) {
        case LicenseStatus::Unconfigured:
            return "UNCONFIGURED";
        case LicenseStatus::Active:
            return "ACTIVE";
        case LicenseStatus::Validated:
            return "VALIDATED";
        case LicenseStatus::Deactivated:
            return "DEACTIVATED";
        case LicenseStatus::Expired:
            return "EXPIRED";
        case LicenseStatus::Revoked:
            return "REVOKED";
        case LicenseStatus::GraceSoft:
            return "GRACE_SOFT";
        case LicenseStatus::LockHard:
            return "LOCK_HARD";
    }
    return "UNCONFIGURED";
}

/// Parse license status from its persisted name (unknown names map to Unconfigured)
[[nodiscard]] inline LicenseStatus license_status_from_string(const std::string& str) noexcept {
    if (str == "ACTIVE")
        return LicenseStatus::Active;
    if (str == "VALIDATED")
        return LicenseStatus::Validated;
    if (str == "DEACTIVATED")
        return LicenseStatus::Deactivated;
    if (str == "EXPIRED")
        return LicenseStatus::Expired;
    if (str == "REVOKED")
        return LicenseStatus::Revoked;
    if (str == "GRACE_SOFT")
        return LicenseStatus::GraceSoft;
    if (str == "LOCK_HARD")
        return LicenseStatus::LockHard;
    return LicenseStatus::Unconfigured;
}

/// True for the degraded states entered by the grace policy
[[nodiscard]] constexpr bool is_grace_status(LicenseStatus status) noexcept {
    return status == LicenseStatus::GraceSoft || status == LicenseStatus::LockHard;
}

/**
 * @brief Durable license state document
 *
 * Singleton owned by the lifecycle controller. The request-gating layer
 * only reads `status` and `grace_until`.
 */
struct LicenseState {
    std::string license_key;
    LicenseStatus status = LicenseStatus::Unconfigured;
    std::string activation_token;  // Empty means no token held locally
    std::optional<Timestamp> expires_at;
    std::optional<Timestamp> grace_until;
    std::string reason;
    std::optional<Timestamp> last_validated;
    std::string last_response_raw;
    std::string last_error_raw;
};

/**
 * @brief One activation as reported by the remote service
 *
 * Transient: observed by the token selector and discarded afterwards.
 */
struct ActivationRecord {
    std::string token;
    std::optional<Timestamp> created_at;
    std::optional<Timestamp> updated_at;
    std::string deactivated_at;  // Raw value; empty means still active

    /// Check if this activation is currently active
    [[nodiscard]] bool is_active() const noexcept { return deactivated_at.empty(); }
};

/// Shape of `activationData` in a response
enum class ActivationShape { None, Single, List };

/**
 * @brief Normalized successful response from the license API
 *
 * Only the fields the lifecycle needs are typed; everything else stays
 * in the raw JSON text.
 */
struct ResponseData {
    std::string body;  // Compact JSON of the whole response body
    std::string data;  // Compact JSON of `data`, or of the body if there is no `data` key

    std::optional<std::string> expires_at;  // Raw `expiresAt`
    ActivationShape activation_shape = ActivationShape::None;
    std::vector<ActivationRecord> activations;
    std::optional<int> times_activated;
};

/**
 * @brief Configuration for the licenseguard SDK
 */
struct Config {
    /// Base URL of the license route, e.g. https://shop.example.com/wp-json/lmfwc/v2/licenses
    std::string base_url;

    /// HTTP Basic credentials
    std::string api_key;
    std::string api_secret;

    /// Allow plain http:// and disable TLS verification (testing only!)
    bool allow_insecure_http = false;

    /// Verify TLS certificates (derived from allow_insecure_http by the loader)
    bool verify_tls = true;

    /// spdlog level name
    std::string log_level = "info";

    /// Rotating log file; empty logs to stderr only
    std::string log_file;

    /// Size at which the log file rotates
    std::size_t log_max_bytes = 5 * 1024 * 1024;

    /// Rotated log files kept
    std::size_t log_file_count = 5;

    /// HTTP request timeout in seconds
    int timeout_seconds = 30;

    /// Additional attempts after a transport failure
    int retry_count = 3;

    /// Base of the exponential backoff between attempts
    double retry_backoff_seconds = 2.0;

    /// TTL of the activate idempotency guard
    int idempotency_window_seconds = 8;

    std::string user_agent = "licenseguard-cpp/0.3.0";

    // Paths below are shared by every process using the license. The file
    // loader anchors relative values at the config file's directory; other
    // sources should set absolute paths.

    /// License state document
    std::string state_path = "licenseguard_state.json";

    /// Directory holding activation guard files
    std::string lock_dir = "licenseguard_locks";

    /// Lock file used by the scheduled revalidation job
    std::string scheduler_lock_path = "licenseguard_auto_validate.lock";

    // ========== Grace Policy ==========

    double soft_grace_hours = 24.0;
    double hard_grace_hours = 48.0;

    // ========== Scheduler ==========

    double revalidate_interval_hours = 6.0;
    int scheduler_lock_timeout_ms = 2000;
};

}  // namespace licenseguard
