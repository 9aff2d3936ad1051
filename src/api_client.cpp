#include "licenseguard/api_client.hpp"
#include "licenseguard/crypto.hpp"
#include "licenseguard/json.hpp"
#include "licenseguard/logging.hpp"

#include <cmath>
#include <regex>
#include <thread>

namespace licenseguard {

namespace {

const std::regex& license_key_pattern() {
    static const std::regex pattern("^[A-Z0-9\\-]{10,}$");
    return pattern;
}

const std::regex& token_pattern() {
    static const std::regex pattern("^[A-Fa-f0-9]{16,128}$");
    return pattern;
}

std::string trimmed(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

ErrorDetail detail_with(std::optional<int> status, std::string remote_code, std::string payload) {
    ErrorDetail detail;
    detail.status = status;
    detail.remote_code = std::move(remote_code);
    detail.payload = std::move(payload);
    return detail;
}

}  // namespace

LicenseApiClient::LicenseApiClient(Options options, std::shared_ptr<http::HttpClientInterface> http,
                                   std::shared_ptr<LockStoreInterface> locks)
    : options_(std::move(options)),
      http_(std::move(http)),
      locks_(std::move(locks)),
      sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }),
      clock_(system_clock()) {
    authorization_ = crypto::basic_auth_header(options_.api_key, options_.api_secret);
    LICENSEGUARD_LOG_INFO("api_client: retries={} backoff={}s idempotency_window={}s UA={}",
                          options_.retry_count, options_.retry_backoff_seconds,
                          options_.idempotency_window_seconds, options_.user_agent);
}

LicenseApiClient::Options LicenseApiClient::options_from(const Config& config) {
    Options options;
    options.api_key = config.api_key;
    options.api_secret = config.api_secret;
    options.user_agent = config.user_agent;
    options.retry_count = config.retry_count;
    options.retry_backoff_seconds = config.retry_backoff_seconds;
    options.idempotency_window_seconds = config.idempotency_window_seconds;
    return options;
}

void LicenseApiClient::set_sleep_function(SleepFunction sleep) { sleep_ = std::move(sleep); }

void LicenseApiClient::set_clock(Clock clock) { clock_ = std::move(clock); }

// ==================== Public API ====================

Result<ResponseData> LicenseApiClient::activate(const std::string& license_key,
                                                const std::string& token) {
    auto key_check = check_license_key(license_key);
    if (key_check.is_error()) {
        return Result<ResponseData>::error(key_check.error_code(), key_check.error_message());
    }
    if (!token.empty()) {
        auto token_check = check_token(token);
        if (token_check.is_error()) {
            return Result<ResponseData>::error(token_check.error_code(),
                                               token_check.error_message());
        }
    }

    auto lock_key = idempotency_key(license_key, token);
    LICENSEGUARD_LOG_INFO("activate: lk={} token={} lock={}", license_key, log::mask_token(token),
                          lock_key);

    if (locks_) {
        auto acquired =
            locks_->try_acquire(lock_key, std::chrono::seconds(options_.idempotency_window_seconds));
        if (acquired.is_error()) {
            LICENSEGUARD_LOG_WARN("activate: lock store unavailable ({}); failing open",
                                  acquired.error_message());
        } else if (!acquired.value()) {
            LICENSEGUARD_LOG_ERROR("activate: idempotency guard hit");
            return Result<ResponseData>::error(
                ErrorCode::RequestError, "Duplicate activate blocked by idempotency guard",
                detail_with(409, IDEMPOTENCY_GUARD_CODE, ""));
        }
    }

    http::Fields params;
    if (!token.empty()) {
        params.emplace_back("token", trimmed(token));
    }
    auto result = get("/activate/" + license_key, params);
    if (result.is_ok()) {
        LICENSEGUARD_LOG_INFO("activate: response={}", log::compact(result.value().body));
    }
    return result;
}

Result<ResponseData> LicenseApiClient::deactivate(const std::string& license_key,
                                                  const std::string& token) {
    auto key_check = check_license_key(license_key);
    if (key_check.is_error()) {
        return Result<ResponseData>::error(key_check.error_code(), key_check.error_message());
    }
    if (!token.empty()) {
        auto token_check = check_token(token);
        if (token_check.is_error()) {
            return Result<ResponseData>::error(token_check.error_code(),
                                               token_check.error_message());
        }
    }
    LICENSEGUARD_LOG_INFO("deactivate: lk={} token={}", license_key, log::mask_token(token));

    http::Fields params;
    if (!token.empty()) {
        params.emplace_back("token", trimmed(token));
    }
    auto result = get("/deactivate/" + license_key, params);
    if (result.is_ok()) {
        LICENSEGUARD_LOG_INFO("deactivate: response={}", log::compact(result.value().body));
    }
    return result;
}

Result<ResponseData> LicenseApiClient::validate(const std::string& license_key) {
    auto key_check = check_license_key(license_key);
    if (key_check.is_error()) {
        return Result<ResponseData>::error(key_check.error_code(), key_check.error_message());
    }
    LICENSEGUARD_LOG_INFO("validate: lk={}", license_key);

    auto result = get("/validate/" + license_key, {});
    if (result.is_ok()) {
        LICENSEGUARD_LOG_INFO("validate: response={}", log::compact(result.value().body));
    }
    return result;
}

// ==================== Internals ====================

bool LicenseApiClient::is_valid_license_key(const std::string& license_key) {
    return std::regex_match(license_key, license_key_pattern());
}

bool LicenseApiClient::is_valid_token(const std::string& token) {
    return std::regex_match(token, token_pattern());
}

std::string LicenseApiClient::idempotency_key(const std::string& license_key,
                                              const std::string& token) {
    std::string fragment = token.empty() ? "none" : token.substr(0, 16);
    return "licenseguard:activate_lock:" + license_key + ":" + fragment;
}

Result<void> LicenseApiClient::check_license_key(const std::string& license_key) const {
    if (license_key.empty()) {
        LICENSEGUARD_LOG_ERROR("validate_license_key: empty");
        return Result<void>::error(ErrorCode::ConfigError,
                                   "license_key must be a non-empty string");
    }
    if (!is_valid_license_key(license_key)) {
        LICENSEGUARD_LOG_ERROR("validate_license_key: invalid format lk={}", license_key);
        return Result<void>::error(ErrorCode::ConfigError,
                                   "license_key format looks invalid (expect A-Z, 0-9 and dashes)");
    }
    return Result<void>::ok();
}

Result<void> LicenseApiClient::check_token(const std::string& token) const {
    if (!is_valid_token(token)) {
        LICENSEGUARD_LOG_ERROR("validate_token: invalid token format token={}",
                               log::mask_token(token));
        return Result<void>::error(ErrorCode::ConfigError,
                                   "token format looks invalid (expect hex-like string)");
    }
    return Result<void>::ok();
}

http::Fields LicenseApiClient::headers() const {
    return {
        {"Accept", "application/json"},
        {"User-Agent", options_.user_agent},
        {"Cache-Control", "no-cache"},
        {"Pragma", "no-cache"},
        {"Authorization", authorization_},
    };
}

Result<ResponseData> LicenseApiClient::get(const std::string& path, const http::Fields& params) {
    http::Request request;
    request.path = path;
    request.headers = headers();

    std::string last_error;
    for (int attempt = 0; attempt <= options_.retry_count; ++attempt) {
        // Fresh cache buster per attempt
        request.query = params;
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          clock_().time_since_epoch())
                          .count();
        request.query.emplace_back("_", std::to_string(now_ms));

        LICENSEGUARD_LOG_DEBUG("HTTP GET {} attempt={}/{}", path, attempt, options_.retry_count);
        auto response = http_->send(request);

        if (response.received()) {
            LICENSEGUARD_LOG_INFO("HTTP {} {}", response.status_code, path);
            return handle_response(response);
        }

        last_error = response.error_message.empty()
                         ? http::transport_error_to_string(response.transport_error)
                         : response.error_message;
        LICENSEGUARD_LOG_WARN("network error on GET {} attempt={}/{}: {}", path, attempt,
                              options_.retry_count, last_error);

        bool retryable = response.transport_error == http::TransportError::Timeout ||
                         response.transport_error == http::TransportError::Connection;
        if (!retryable || attempt == options_.retry_count) {
            break;
        }

        auto delay = options_.retry_backoff_seconds * std::pow(2.0, attempt);
        sleep_(std::chrono::milliseconds(static_cast<int64_t>(delay * 1000.0)));
    }

    return Result<ResponseData>::error(ErrorCode::RequestError, "Network error: " + last_error);
}

Result<ResponseData> LicenseApiClient::handle_response(const http::Response& response) {
    const int status = response.status_code;

    // HTTP layer errors first
    if (status >= 400) {
        json::json payload;
        try {
            payload = json::json::parse(response.body);
        } catch (const nlohmann::json::exception&) {
            payload = json::json{{"raw", response.body}};
        }

        auto message = json::extract_http_error_message(payload).value_or(
            "HTTP " + std::to_string(status));
        std::string remote_code;
        if (payload.is_object() && payload.contains("code") && payload["code"].is_string()) {
            remote_code = payload["code"].get<std::string>();
        }

        LICENSEGUARD_LOG_ERROR("http_error: status={} message={} payload={}", status, message,
                               log::compact(payload.dump()));
        return Result<ResponseData>::error(ErrorCode::RequestError, message,
                                           detail_with(status, remote_code, payload.dump()));
    }

    json::json body;
    try {
        body = json::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        LICENSEGUARD_LOG_ERROR("invalid_json: {}; raw={}", e.what(), log::compact(response.body));
        json::json raw{{"raw", response.body}};
        return Result<ResponseData>::error(ErrorCode::ContractError,
                                           std::string("Invalid JSON response: ") + e.what(),
                                           detail_with(status, "", raw.dump()));
    }

    // 200 with an error embedded in data
    if (body.is_object() && body.contains("data")) {
        const auto& data = body["data"];
        if (data.is_object() && (data.contains("errors") || data.contains("error_data"))) {
            static const json::json empty_object = json::json::object();
            const auto& errors = data.contains("errors") ? data["errors"] : empty_object;
            const auto& error_data = data.contains("error_data") ? data["error_data"] : empty_object;

            auto embedded = json::extract_embedded_error(errors, error_data);
            auto message = embedded.message.value_or("Operation failed");
            LICENSEGUARD_LOG_ERROR("contract_error: code={} status={} msg={} body={}", embedded.code,
                                   embedded.status ? std::to_string(*embedded.status) : "none",
                                   message, log::compact(body.dump()));
            return Result<ResponseData>::error(
                ErrorCode::ContractError, message,
                detail_with(embedded.status, embedded.code, body.dump()));
        }
    }

    return Result<ResponseData>::ok(json::parse_response_data(body));
}

}  // namespace licenseguard
