#include "licenseguard/controller.hpp"
#include "licenseguard/http.hpp"
#include "licenseguard/json.hpp"
#include "licenseguard/logging.hpp"
#include "licenseguard/token.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace licenseguard {

namespace {

constexpr const char* KEY_REQUIRED_MESSAGE = "License key is required in settings or as parameter.";
constexpr const char* OPERATION_FAILED_MESSAGE = "Operation failed. See error log for details.";
constexpr const char* EXPIRED_MESSAGE = "License is expired. Please renew your license.";
constexpr const char* UNEXPECTED_MESSAGE =
    "Operation failed due to unexpected error. See logs for details.";

std::string trimmed(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Result<ResponseData> failure(ErrorCode code, const std::string& message) {
    return Result<ResponseData>::error(code, message);
}

}  // namespace

LicenseController::LicenseController(std::shared_ptr<LicenseApiInterface> api,
                                     std::shared_ptr<StateStoreInterface> store,
                                     ControllerOptions options)
    : api_(std::move(api)), store_(std::move(store)), options_(std::move(options)) {}

// ==================== Public API ====================

Result<ResponseData> LicenseController::activate(const std::string& license_key,
                                                 const std::string& token) {
    return run("activate", [&](LicenseState& state) {
        return activate_locked(state, license_key, token);
    });
}

Result<ResponseData> LicenseController::reactivate(const std::string& token,
                                                   const std::string& license_key) {
    return run("reactivate", [&](LicenseState& state) {
        return reactivate_locked(state, token, license_key);
    });
}

Result<ResponseData> LicenseController::deactivate(const std::string& token,
                                                   const std::string& license_key) {
    return run("deactivate", [&](LicenseState& state) {
        return deactivate_locked(state, token, license_key);
    });
}

Result<ResponseData> LicenseController::validate(const std::string& license_key) {
    return run("validate", [&](LicenseState& state) {
        return validate_locked(state, license_key);
    });
}

LicenseState LicenseController::state() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_state();
}

HealthSummary LicenseController::health() {
    auto current = state();
    auto now = options_.clock();

    HealthSummary summary;
    summary.status = current.status;
    summary.grace_until = current.grace_until;
    summary.reason = current.reason;
    summary.last_validated = current.last_validated;
    summary.ok = current.status == LicenseStatus::Active ||
                 current.status == LicenseStatus::Validated ||
                 (current.status == LicenseStatus::Expired && current.grace_until &&
                  *current.grace_until > now);
    return summary;
}

Subscription LicenseController::on(const std::string& event, EventHandler handler) {
    return events_.on(event, std::move(handler));
}

void LicenseController::notify(const std::string& event, const std::string& message) {
    EventData data;
    data.state = state();
    data.message = message;
    events_.emit(event, data);
}

Result<ResponseData> LicenseController::run(const char* name, const Operation& op) {
    std::vector<std::pair<std::string, EventData>> published;

    auto result = [&]() -> Result<ResponseData> {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_events_.clear();
        try {
            auto state = load_state();
            auto before = state.status;
            auto outcome = op(state);
            if (state.status != before) {
                LICENSEGUARD_LOG_INFO("{}: status {} -> {}", name, license_status_to_string(before),
                                      license_status_to_string(state.status));
                queue(events::STATUS_CHANGED, state);
            }
            published.swap(pending_events_);
            return outcome;
        } catch (const std::exception& e) {
            LICENSEGUARD_LOG_ERROR("{}: unexpected error: {}", name, e.what());
            pending_events_.clear();
            return failure(ErrorCode::UnexpectedError, UNEXPECTED_MESSAGE);
        } catch (...) {
            LICENSEGUARD_LOG_ERROR("{}: unexpected non-standard exception", name);
            pending_events_.clear();
            return failure(ErrorCode::UnexpectedError, UNEXPECTED_MESSAGE);
        }
    }();

    // Handlers may call back into the controller
    for (const auto& [event, data] : published) {
        events_.emit(event, data);
    }
    return result;
}

// ==================== Operations ====================

Result<ResponseData> LicenseController::activate_locked(LicenseState& state,
                                                        const std::string& license_key,
                                                        const std::string& token) {
    auto key = resolve_key(state, license_key);
    LICENSEGUARD_LOG_INFO("activate_license: start lk={} token={}", key, log::mask_token(token));
    if (key.empty()) {
        return failure(ErrorCode::LicenseKeyRequired, KEY_REQUIRED_MESSAGE);
    }
    state.license_key = key;

    auto result = attempt_activate(state, key, trimmed(token));
    if (result.is_ok()) {
        auto finished = finish(state, std::move(result));
        queue(finished.is_ok() ? events::ACTIVATION_SUCCESS : events::ACTIVATION_ERROR, state,
              finished.error_message(), finished.error_code());
        return finished;
    }

    if (result.error_code() == ErrorCode::ConfigError) {
        // Rejected before any network I/O; nothing to persist
        queue(events::ACTIVATION_ERROR, state, result.error_message(), result.error_code());
        return failure(ErrorCode::ConfigError, result.error_message());
    }

    if (result.error_code() == ErrorCode::LicenseExpired) {
        auto finished = finish(state, std::move(result));
        queue(events::LICENSE_EXPIRED, state);
        queue(events::ACTIVATION_ERROR, state, finished.error_message(), finished.error_code());
        return finished;
    }

    LICENSEGUARD_LOG_ERROR("activate_license: API error: {}", result.error_message());
    auto finished = finish(state, failure(ErrorCode::OperationFailed, OPERATION_FAILED_MESSAGE));
    queue(events::ACTIVATION_ERROR, state, finished.error_message(), finished.error_code());
    return finished;
}

Result<ResponseData> LicenseController::reactivate_locked(LicenseState& state,
                                                          const std::string& token,
                                                          const std::string& license_key) {
    auto key = resolve_key(state, license_key);
    LICENSEGUARD_LOG_INFO("reactivate_license: start lk={} incoming_token={} saved_token={}", key,
                          log::mask_token(token), log::mask_token(state.activation_token));
    if (key.empty()) {
        return failure(ErrorCode::LicenseKeyRequired, KEY_REQUIRED_MESSAGE);
    }
    state.license_key = key;

    preflight_refresh_token(state, key);

    // Preflight token first, then the caller's
    auto effective = !state.activation_token.empty() ? state.activation_token : trimmed(token);
    LICENSEGUARD_LOG_INFO("reactivate_license: effective_token={}", log::mask_token(effective));
    if (effective.empty()) {
        return finish(state, failure(ErrorCode::TokenRequired,
                                     "Activation token is required (not found in settings or "
                                     "validation response)."));
    }

    auto report = [this, &state](Result<ResponseData> finished) {
        queue(finished.is_ok() ? events::ACTIVATION_SUCCESS : events::ACTIVATION_ERROR, state,
              finished.error_message(), finished.error_code());
        if (finished.error_code() == ErrorCode::LicenseExpired) {
            queue(events::LICENSE_EXPIRED, state);
        }
        return finished;
    };

    auto first = attempt_activate(state, key, effective);
    if (first.is_ok() || first.error_code() == ErrorCode::LicenseExpired ||
        first.error_code() == ErrorCode::ConfigError) {
        return report(finish(state, std::move(first)));
    }

    LICENSEGUARD_LOG_WARN("reactivate_license: first attempt failed with: {}", first.error_message());
    if (!is_activation_limit_error(first.error_code(), first.error_message())) {
        LICENSEGUARD_LOG_ERROR("reactivate_license: non-retryable error: {}", first.error_message());
        return report(finish(state, failure(ErrorCode::OperationFailed, OPERATION_FAILED_MESSAGE)));
    }

    // Exactly one retry, and only with a token different from the first attempt
    preflight_refresh_token(state, key);
    auto refreshed = !state.activation_token.empty() ? state.activation_token : effective;
    if (refreshed == effective) {
        LICENSEGUARD_LOG_INFO("reactivate_license: retry skipped (no fresh token from preflight)");
        return report(finish(state, failure(ErrorCode::ActivationLimitReached,
                                            "Activation limit reached on the server and no fresh "
                                            "token was issued. Please deactivate an existing "
                                            "activation or increase the limit.")));
    }

    LICENSEGUARD_LOG_INFO("reactivate_license: retry with token={}", log::mask_token(refreshed));
    auto second = attempt_activate(state, key, refreshed);
    if (second.is_ok() || second.error_code() == ErrorCode::LicenseExpired ||
        second.error_code() == ErrorCode::ConfigError) {
        return report(finish(state, std::move(second)));
    }
    if (is_idempotency_block(second.error_code(), second.error_detail())) {
        LICENSEGUARD_LOG_WARN("reactivate_license: idempotency guard hit on retry");
        return report(finish(state, failure(ErrorCode::ActivationSettling,
                                            "Another activation attempt is still settling. "
                                            "Please retry in a few seconds.")));
    }

    LICENSEGUARD_LOG_ERROR("reactivate_license: retry failed: {}", second.error_message());
    return report(finish(state, failure(ErrorCode::OperationFailed, OPERATION_FAILED_MESSAGE)));
}

Result<ResponseData> LicenseController::deactivate_locked(LicenseState& state,
                                                          const std::string& token,
                                                          const std::string& license_key) {
    auto key = resolve_key(state, license_key);
    LICENSEGUARD_LOG_INFO("deactivate_license: start lk={} incoming_token={} saved_token={}", key,
                          log::mask_token(token), log::mask_token(state.activation_token));
    if (key.empty()) {
        return failure(ErrorCode::LicenseKeyRequired, KEY_REQUIRED_MESSAGE);
    }
    state.license_key = key;

    auto tok = trimmed(token);
    if (tok.empty()) {
        preflight_refresh_token(state, key);
        tok = state.activation_token;
        LICENSEGUARD_LOG_INFO("deactivate_license: token after preflight={} (empty means bulk)",
                              log::mask_token(tok));
    }

    auto result = api_->deactivate(key, tok);
    if (result.is_error()) {
        LICENSEGUARD_LOG_ERROR("deactivate_license: API error: {}", result.error_message());
        record_error(state, result.error_code(), result.error_message(), result.error_detail());
        lock_hard(state, "Deactivate failed: " + result.error_message());

        auto code = result.error_code() == ErrorCode::ConfigError ? ErrorCode::ConfigError
                                                                  : ErrorCode::OperationFailed;
        auto message =
            code == ErrorCode::ConfigError ? result.error_message() : OPERATION_FAILED_MESSAGE;
        auto finished = finish(state, failure(code, message));
        queue(events::DEACTIVATION_ERROR, state, finished.error_message(), finished.error_code());
        return finished;
    }

    state.last_response_raw = result.value().body;
    apply_deactivation_update(state, result.value());
    lock_hard(state, "License deactivated");
    state.activation_token.clear();

    // Best effort: refresh expiry and counters only
    auto post = api_->validate(key);
    if (post.is_ok()) {
        state.last_response_raw = post.value().body;
        apply_validation_update(state, post.value());
    } else {
        LICENSEGUARD_LOG_WARN("deactivate_license: post-validate skipped due to: {}",
                              post.error_message());
    }

    // Deactivation is sticky regardless of what the post-validate reported
    lock_hard(state, "License deactivated");

    auto finished = finish(state, std::move(result));
    queue(finished.is_ok() ? events::DEACTIVATION_SUCCESS : events::DEACTIVATION_ERROR, state,
          finished.error_message(), finished.error_code());
    return finished;
}

Result<ResponseData> LicenseController::validate_locked(LicenseState& state,
                                                        const std::string& license_key) {
    auto key = resolve_key(state, license_key);
    LICENSEGUARD_LOG_INFO("validate_license: start lk={}", key);
    if (key.empty()) {
        return failure(ErrorCode::LicenseKeyRequired, KEY_REQUIRED_MESSAGE);
    }
    state.license_key = key;

    auto result = api_->validate(key);
    if (result.is_ok()) {
        state.last_response_raw = result.value().body;
        apply_validation_update(state, result.value());
        bool changed = update_token(state, result.value());
        LICENSEGUARD_LOG_INFO("validate_license: token_changed={} current_token={}", changed,
                              log::mask_token(state.activation_token));

        auto finished = finish(state, std::move(result));
        if (finished.is_ok()) {
            queue(events::VALIDATION_SUCCESS, state);
            if (state.status == LicenseStatus::Expired) {
                queue(events::LICENSE_EXPIRED, state);
            }
        } else {
            queue(events::VALIDATION_ERROR, state, finished.error_message(), finished.error_code());
        }
        return finished;
    }

    LICENSEGUARD_LOG_ERROR("validate_license: API error: {}", result.error_message());
    record_error(state, result.error_code(), result.error_message(), result.error_detail());
    apply_grace_on_failure(state, result.error_message());

    auto code = result.error_code() == ErrorCode::ConfigError ? ErrorCode::ConfigError
                                                              : ErrorCode::OperationFailed;
    auto message = code == ErrorCode::ConfigError ? result.error_message() : OPERATION_FAILED_MESSAGE;
    auto finished = finish(state, failure(code, message));
    queue(events::GRACE_ENGAGED, state, result.error_message(), result.error_code());
    queue(events::VALIDATION_ERROR, state, finished.error_message(), finished.error_code());
    return finished;
}

// ==================== Internals ====================

Result<ResponseData> LicenseController::attempt_activate(LicenseState& state,
                                                         const std::string& license_key,
                                                         const std::string& token) {
    auto result = api_->activate(license_key, token);
    if (result.is_ok()) {
        state.last_response_raw = result.value().body;
        apply_activation_update(state, result.value());
        bool changed = update_token(state, result.value());
        LICENSEGUARD_LOG_INFO("activate_license: token_changed={} current_token={}", changed,
                              log::mask_token(state.activation_token));
        return result;
    }

    if (result.error_code() == ErrorCode::ConfigError) {
        return result;
    }

    record_error(state, result.error_code(), result.error_message(), result.error_detail());
    if (is_expiry_error(result.error_code(), result.error_message(), result.error_detail())) {
        mark_expired(state, result.error_message());
        LICENSEGUARD_LOG_WARN("activate_license: expired -> status set EXPIRED. msg={}",
                              result.error_message());
        return failure(ErrorCode::LicenseExpired, EXPIRED_MESSAGE);
    }
    return result;
}

void LicenseController::preflight_refresh_token(LicenseState& state,
                                                const std::string& license_key) {
    LICENSEGUARD_LOG_INFO("preflight_refresh_token: validating lk={}", license_key);
    auto result = api_->validate(license_key);
    if (result.is_error()) {
        LICENSEGUARD_LOG_ERROR("preflight_refresh_token: failed with {}", result.error_message());
        return;
    }

    state.last_response_raw = result.value().body;
    auto before = state.activation_token;
    bool changed = update_token(state, result.value());
    LICENSEGUARD_LOG_INFO("preflight_refresh_token: token_changed={} before={} after={}", changed,
                          log::mask_token(before), log::mask_token(state.activation_token));
    if (changed) {
        state.reason = "Token rotated from validate";
    }
}

void LicenseController::apply_expiry(LicenseState& state, const ResponseData& data) const {
    if (!data.expires_at) {
        return;
    }
    auto parsed = json::parse_timestamp(*data.expires_at);
    if (parsed) {
        state.expires_at = parsed;
    } else {
        LICENSEGUARD_LOG_WARN("apply_expiry: unparsable expiresAt '{}'", *data.expires_at);
    }
}

void LicenseController::apply_activation_update(LicenseState& state,
                                                const ResponseData& data) const {
    apply_expiry(state, data);
    state.status = LicenseStatus::Active;
    state.reason = "Activated";
    state.last_validated = options_.clock();
    state.grace_until.reset();
    LICENSEGUARD_LOG_INFO("apply_activation_update: status={} expires_at={}",
                          license_status_to_string(state.status),
                          state.expires_at ? json::format_timestamp(*state.expires_at) : "none");
}

void LicenseController::apply_deactivation_update(LicenseState& state,
                                                  const ResponseData& data) const {
    apply_expiry(state, data);
    state.status = LicenseStatus::Deactivated;
    state.reason = "Deactivated";
}

void LicenseController::apply_validation_update(LicenseState& state,
                                                const ResponseData& data) const {
    const auto previous = state.status;
    const auto now = options_.clock();

    apply_expiry(state, data);

    // Judged on the fresh expiry, never on the previous status
    if (state.expires_at && now > *state.expires_at) {
        state.status = LicenseStatus::Expired;
        if (state.reason.empty()) {
            state.reason = "License expired";
        }
        if (!state.grace_until) {
            state.grace_until = now;
        }
        state.last_validated = now;
        LICENSEGUARD_LOG_INFO("apply_validation_update: expires_at in past -> EXPIRED");
        return;
    }

    bool active = std::any_of(data.activations.begin(), data.activations.end(),
                              [](const ActivationRecord& record) { return record.is_active(); }) ||
                  data.times_activated.value_or(0) > 0;

    if (active) {
        state.status = LicenseStatus::Validated;
        state.reason = "Validated";
    } else {
        state.status = LicenseStatus::Deactivated;
        state.reason = "Validated (no active activation)";
    }
    state.last_validated = now;
    state.grace_until.reset();

    if (is_grace_status(previous) && state.status == LicenseStatus::Validated) {
        state.reason = "Grace cleared after success";
    }

    LICENSEGUARD_LOG_INFO("apply_validation_update: status={} active={}",
                          license_status_to_string(state.status), active);
}

void LicenseController::apply_grace_on_failure(LicenseState& state,
                                               const std::string& error_message) const {
    const auto now = options_.clock();
    state.reason = "Grace policy engaged: " + error_message;

    if (!state.last_validated) {
        state.status = LicenseStatus::GraceSoft;
        state.grace_until = now;
        LICENSEGUARD_LOG_WARN("apply_grace_on_failure: no last_validated -> GRACE_SOFT");
        return;
    }

    double delta_hours =
        std::chrono::duration<double, std::ratio<3600>>(now - *state.last_validated).count();

    if (delta_hours <= options_.soft_grace_hours) {
        state.status = LicenseStatus::GraceSoft;
    } else if (delta_hours >= options_.hard_grace_hours) {
        state.status = LicenseStatus::LockHard;
    } else {
        state.status = LicenseStatus::GraceSoft;
    }
    state.grace_until = now;

    LICENSEGUARD_LOG_WARN("apply_grace_on_failure: status={} delta_h={:.2f}",
                          license_status_to_string(state.status), delta_hours);
}

void LicenseController::mark_expired(LicenseState& state, const std::string& message) const {
    const auto now = options_.clock();
    auto expiry = parse_expiry_from_message(message);
    if (expiry) {
        state.expires_at = expiry;
    }
    state.status = LicenseStatus::Expired;
    state.reason = message.empty() ? "License expired" : message;
    if (!state.grace_until) {
        state.grace_until = now;
    }
    state.last_validated = now;
}

void LicenseController::lock_hard(LicenseState& state, std::string reason) const {
    state.status = LicenseStatus::LockHard;
    state.reason = std::move(reason);
    state.grace_until = options_.clock();
}

void LicenseController::record_error(LicenseState& state, ErrorCode code,
                                     const std::string& message, const ErrorDetail& detail) const {
    json::json entry;
    entry["ts"] = json::format_timestamp(options_.clock());
    entry["code"] = detail.remote_code.empty() ? error_code_to_string(code) : detail.remote_code;
    if (detail.status) {
        entry["status"] = *detail.status;
    } else {
        entry["status"] = nullptr;
    }
    entry["message"] = message;
    state.last_error_raw = entry.dump();
}

bool LicenseController::update_token(LicenseState& state, const ResponseData& data) const {
    auto latest = extract_latest_token(data);
    if (!latest || latest->empty()) {
        return false;
    }
    if (*latest == state.activation_token) {
        return false;
    }
    state.activation_token = *latest;
    return true;
}

std::optional<Timestamp> LicenseController::parse_expiry_from_message(const std::string& message) {
    static const std::regex pattern("expired on\\s+([0-9:\\-\\sT]+)\\s*\\(UTC\\)",
                                    std::regex::icase);
    std::smatch match;
    if (!std::regex_search(message, match, pattern)) {
        return std::nullopt;
    }
    return json::parse_timestamp(trimmed(match[1].str()));
}

bool LicenseController::is_expiry_error(ErrorCode code, const std::string& message,
                                        const ErrorDetail& detail) {
    if (code != ErrorCode::RequestError && code != ErrorCode::ContractError) {
        return false;
    }
    return to_lower(message).find("expire") != std::string::npos ||
           detail.remote_code == json::LICENSE_EXPIRED_CODE;
}

bool LicenseController::is_activation_limit_error(ErrorCode code, const std::string& message) {
    if (code != ErrorCode::ContractError) {
        return false;
    }
    auto lower = to_lower(message);
    return lower.find("activation limit") != std::string::npos ||
           lower.find("maximum activation") != std::string::npos;
}

std::string LicenseController::resolve_key(const LicenseState& state,
                                           const std::string& license_key) const {
    auto key = trimmed(license_key);
    return key.empty() ? trimmed(state.license_key) : key;
}

LicenseState LicenseController::load_state() {
    auto stored = store_->load();
    return stored ? *stored : LicenseState{};
}

Result<ResponseData> LicenseController::finish(const LicenseState& state,
                                               Result<ResponseData> result) {
    if (!store_->save(state)) {
        LICENSEGUARD_LOG_ERROR("failed to save license state (status={})",
                               license_status_to_string(state.status));
        return failure(ErrorCode::StorageError, "Failed to save license state.");
    }
    return result;
}

void LicenseController::queue(const char* event, const LicenseState& state,
                              const std::string& message, ErrorCode error) {
    EventData data;
    data.state = state;
    data.message = message;
    data.error = error;
    pending_events_.emplace_back(event, std::move(data));
}

// ==================== Factory ====================

std::shared_ptr<LicenseController> make_controller(const Config& config) {
    http::HttpClient::Config http_config;
    http_config.base_url = config.base_url;
    http_config.timeout_seconds = config.timeout_seconds;
    http_config.verify_tls = config.verify_tls;

    auto transport = std::make_shared<http::HttpClient>(http_config);
    auto locks = std::make_shared<FileLockStore>(config.lock_dir);
    auto api = std::make_shared<LicenseApiClient>(LicenseApiClient::options_from(config),
                                                  std::move(transport), std::move(locks));
    auto store = std::make_shared<FileStateStore>(config.state_path);

    ControllerOptions options;
    options.soft_grace_hours = config.soft_grace_hours;
    options.hard_grace_hours = config.hard_grace_hours;

    return std::make_shared<LicenseController>(std::move(api), std::move(store), options);
}

}  // namespace licenseguard
