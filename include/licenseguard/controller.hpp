#pragma once

/**
 * @file controller.hpp
 * @brief License lifecycle controller for licenseguard SDK
 *
 * Owns the license state machine: activate, validate, reactivate and
 * deactivate against the remote API, token rotation, expiry detection and
 * recovery, and the grace-degradation policy applied when validation fails.
 *
 * Every public operation is serialized by an internal mutex, loads the
 * state document, mutates it and saves it back. Failures are returned as
 * short user-facing messages; the full detail goes to the log and to
 * `last_error_raw`.
 *
 * @code
 * auto config = licenseguard::config::resolve();
 * auto controller = licenseguard::make_controller(config.value());
 * auto result = controller->validate("ABCD-1234-EFGH");
 * if (result.is_error()) {
 *     std::cerr << result.error_message() << "\n";
 * }
 * @endcode
 */

#include "licenseguard/licenseguard.hpp"
#include "licenseguard/api_client.hpp"
#include "licenseguard/events.hpp"
#include "licenseguard/lock.hpp"
#include "licenseguard/storage.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace licenseguard {

/// Tuning of the lifecycle controller
struct ControllerOptions {
    double soft_grace_hours = 24.0;
    double hard_grace_hours = 48.0;
    Clock clock = system_clock();
};

/// Read-only status view for health endpoints
struct HealthSummary {
    LicenseStatus status = LicenseStatus::Unconfigured;
    std::optional<Timestamp> grace_until;
    std::string reason;
    std::optional<Timestamp> last_validated;
    bool ok = false;
};

/**
 * @brief License lifecycle controller
 *
 * Empty `license_key` falls back to the stored key; empty `token` means
 * none was supplied.
 */
class LicenseController {
  public:
    LicenseController(std::shared_ptr<LicenseApiInterface> api,
                      std::shared_ptr<StateStoreInterface> store,
                      ControllerOptions options = ControllerOptions());

    LicenseController(const LicenseController&) = delete;
    LicenseController& operator=(const LicenseController&) = delete;

    // ==================== Lifecycle Operations ====================

    /// Activate the license, adopting any token the server returns
    Result<ResponseData> activate(const std::string& license_key = "",
                                  const std::string& token = "");

    /**
     * @brief Re-activate with a refreshed token
     *
     * Validates first to pick up a rotated token, then activates. When the
     * server reports its activation limit, refreshes the token once more
     * and retries a single time with a different token.
     */
    Result<ResponseData> reactivate(const std::string& token = "",
                                    const std::string& license_key = "");

    /// Deactivate and hard-lock locally; empty token after preflight deactivates all
    Result<ResponseData> deactivate(const std::string& token = "",
                                    const std::string& license_key = "");

    /// Always asks the server, even when the stored status is EXPIRED
    Result<ResponseData> validate(const std::string& license_key = "");

    // ==================== Queries ====================

    /// Current state document (default state when nothing is stored)
    [[nodiscard]] LicenseState state();

    [[nodiscard]] HealthSummary health();

    /// Subscribe to a lifecycle event (see events.hpp)
    Subscription on(const std::string& event, EventHandler handler);

    /// Publish `event` with the current state (used by the revalidation job)
    void notify(const std::string& event, const std::string& message = "");

    // ==================== State Policy ====================

    /// Shared success rule for validate: expiry first, then activation presence
    void apply_validation_update(LicenseState& state, const ResponseData& data) const;

    /// Grace-degradation policy for a failed validate
    void apply_grace_on_failure(LicenseState& state, const std::string& error_message) const;

    /// Parse "... expired on <timestamp> (UTC)" out of an error message
    [[nodiscard]] static std::optional<Timestamp> parse_expiry_from_message(const std::string& message);

    /// True when a client failure reports an expired license
    [[nodiscard]] static bool is_expiry_error(ErrorCode code, const std::string& message,
                                              const ErrorDetail& detail);

    /// True when a client failure reports the server-side activation limit
    [[nodiscard]] static bool is_activation_limit_error(ErrorCode code, const std::string& message);

  private:
    using Operation = std::function<Result<ResponseData>(LicenseState&)>;

    /// Lock, load, run, convert stray exceptions, then publish queued events
    Result<ResponseData> run(const char* name, const Operation& op);

    Result<ResponseData> activate_locked(LicenseState& state, const std::string& license_key,
                                         const std::string& token);
    Result<ResponseData> reactivate_locked(LicenseState& state, const std::string& token,
                                           const std::string& license_key);
    Result<ResponseData> deactivate_locked(LicenseState& state, const std::string& token,
                                           const std::string& license_key);
    Result<ResponseData> validate_locked(LicenseState& state, const std::string& license_key);

    /// One activate call with the shared success and expiry handling
    Result<ResponseData> attempt_activate(LicenseState& state, const std::string& license_key,
                                          const std::string& token);

    /// Validate only to pick up a rotated token; failures are logged and ignored
    void preflight_refresh_token(LicenseState& state, const std::string& license_key);

    void apply_activation_update(LicenseState& state, const ResponseData& data) const;
    void apply_deactivation_update(LicenseState& state, const ResponseData& data) const;
    void apply_expiry(LicenseState& state, const ResponseData& data) const;
    void mark_expired(LicenseState& state, const std::string& message) const;
    void lock_hard(LicenseState& state, std::string reason) const;
    void record_error(LicenseState& state, ErrorCode code, const std::string& message,
                      const ErrorDetail& detail) const;
    bool update_token(LicenseState& state, const ResponseData& data) const;

    std::string resolve_key(const LicenseState& state, const std::string& license_key) const;
    LicenseState load_state();
    /// Save the state; a failed save replaces `result` with StorageError
    Result<ResponseData> finish(const LicenseState& state, Result<ResponseData> result);
    void queue(const char* event, const LicenseState& state, const std::string& message = "",
               ErrorCode error = ErrorCode::Success);

    std::shared_ptr<LicenseApiInterface> api_;
    std::shared_ptr<StateStoreInterface> store_;
    ControllerOptions options_;
    EventBus events_;
    std::vector<std::pair<std::string, EventData>> pending_events_;
    std::mutex mutex_;
};

/**
 * @brief Wire a controller from configuration
 *
 * HTTP transport (cpp-httplib), file lock store under `lock_dir` and file
 * state store at `state_path`. `config` must already be finalized.
 */
[[nodiscard]] std::shared_ptr<LicenseController> make_controller(const Config& config);

}  // namespace licenseguard
