#pragma once

/**
 * @file api_client.hpp
 * @brief Remote license API client for licenseguard SDK
 *
 * Issues authenticated GET calls to `{base_url}/{activate|deactivate|validate}/{license_key}`
 * and maps responses onto a two-layer error contract:
 * - HTTP status >= 400 → RequestError (status + payload)
 * - HTTP success with `data.errors` / `data.error_data` → ContractError
 *
 * Only transport failures (timeout, connection) are retried, with
 * exponential backoff `retry_backoff_seconds * 2^attempt`.
 */

#include "licenseguard/licenseguard.hpp"
#include "licenseguard/http.hpp"
#include "licenseguard/lock.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace licenseguard {

/// remote_code set on the local 409 raised by the activate idempotency guard
constexpr const char* IDEMPOTENCY_GUARD_CODE = "licenseguard_idempotency_guard";

/**
 * @brief License API operations consumed by the lifecycle controller
 *
 * Empty `token` means "no token". Can be faked for testing.
 */
class LicenseApiInterface {
  public:
    virtual ~LicenseApiInterface() = default;

    [[nodiscard]] virtual Result<ResponseData> activate(const std::string& license_key,
                                                        const std::string& token) = 0;

    [[nodiscard]] virtual Result<ResponseData> deactivate(const std::string& license_key,
                                                          const std::string& token) = 0;

    [[nodiscard]] virtual Result<ResponseData> validate(const std::string& license_key) = 0;

    /// Activate with a required token
    [[nodiscard]] Result<ResponseData> reactivate(const std::string& license_key,
                                                  const std::string& token) {
        if (token.empty()) {
            return Result<ResponseData>::error(ErrorCode::ConfigError,
                                               "token must be a non-empty string");
        }
        return activate(license_key, token);
    }
};

/// True when `result` is the local duplicate-activate rejection
[[nodiscard]] inline bool is_idempotency_block(const ErrorCode code, const ErrorDetail& detail) {
    return code == ErrorCode::RequestError && detail.remote_code == IDEMPOTENCY_GUARD_CODE;
}

/**
 * @brief HTTP implementation of LicenseApiInterface
 */
class LicenseApiClient : public LicenseApiInterface {
  public:
    struct Options {
        std::string api_key;
        std::string api_secret;
        std::string user_agent = "licenseguard-cpp/0.3.0";
        int retry_count = 3;
        double retry_backoff_seconds = 2.0;
        int idempotency_window_seconds = 8;
    };

    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    /**
     * @param options Credentials and retry policy
     * @param http Transport (shared so tests can keep a handle on a mock)
     * @param locks Idempotency lock store; nullptr disables the guard (always acquired)
     */
    LicenseApiClient(Options options, std::shared_ptr<http::HttpClientInterface> http,
                     std::shared_ptr<LockStoreInterface> locks = nullptr);

    /// Options derived from the SDK configuration
    [[nodiscard]] static Options options_from(const Config& config);

    [[nodiscard]] Result<ResponseData> activate(const std::string& license_key,
                                                const std::string& token) override;

    [[nodiscard]] Result<ResponseData> deactivate(const std::string& license_key,
                                                  const std::string& token) override;

    [[nodiscard]] Result<ResponseData> validate(const std::string& license_key) override;

    /// Replace the sleep used between retries
    void set_sleep_function(SleepFunction sleep);

    /// Replace the clock used for the cache-busting parameter
    void set_clock(Clock clock);

    // ========== Contract helpers ==========

    /// Classify a received HTTP response (both error layers)
    [[nodiscard]] static Result<ResponseData> handle_response(const http::Response& response);

    /// Uppercase alnum + dashes, length >= 10
    [[nodiscard]] static bool is_valid_license_key(const std::string& license_key);

    /// 16-128 hex characters
    [[nodiscard]] static bool is_valid_token(const std::string& token);

    /// Lock key guarding activate for (license_key, token prefix)
    [[nodiscard]] static std::string idempotency_key(const std::string& license_key,
                                                     const std::string& token);

  private:
    Result<void> check_license_key(const std::string& license_key) const;
    Result<void> check_token(const std::string& token) const;
    Result<ResponseData> get(const std::string& path, const http::Fields& params);
    http::Fields headers() const;

    Options options_;
    std::shared_ptr<http::HttpClientInterface> http_;
    std::shared_ptr<LockStoreInterface> locks_;
    SleepFunction sleep_;
    Clock clock_;
    std::string authorization_;
};

}  // namespace licenseguard
