#include "licenseguard/config.hpp"
#include "licenseguard/json.hpp"
#include "licenseguard/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace licenseguard {
namespace config {

namespace {

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool flag_from_json(const json::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        return parse_flag(value.get<std::string>());
    }
    return false;
}

template <typename T> void read_number(const json::json& j, const char* key, T& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<T>();
    }
}

void read_string(const json::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
    }
}

void anchor(const std::filesystem::path& base, std::string& path) {
    if (path.empty() || std::filesystem::path(path).is_absolute()) {
        return;
    }
    path = (base / path).lexically_normal().string();
}

}  // namespace

bool parse_flag(const std::string& value) noexcept {
    auto v = lowered(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

Result<void> finalize(Config& config) {
    while (!config.base_url.empty() && config.base_url.back() == '/') {
        config.base_url.pop_back();
    }

    if (config.base_url.empty() || config.api_key.empty() || config.api_secret.empty()) {
        LICENSEGUARD_LOG_ERROR("config: missing base_url / api_key / api_secret");
        return Result<void>::error(ErrorCode::ConfigError,
                                   "Missing base_url / api_key / api_secret in configuration");
    }

    bool https = config.base_url.rfind("https://", 0) == 0;
    bool http = config.base_url.rfind("http://", 0) == 0;
    if (!https && !http) {
        return Result<void>::error(ErrorCode::ConfigError,
                                   "base_url must start with http:// or https://");
    }
    if (http && !config.allow_insecure_http) {
        return Result<void>::error(ErrorCode::ConfigError,
                                   "Plain http:// base_url requires allow_insecure_http");
    }

    config.verify_tls = !config.allow_insecure_http;

    if (config.timeout_seconds <= 0 || config.retry_count < 0 ||
        config.retry_backoff_seconds < 0 || config.idempotency_window_seconds <= 0) {
        return Result<void>::error(ErrorCode::ConfigError,
                                   "timeout, retry and idempotency settings must be positive");
    }
    if (config.log_max_bytes == 0) {
        return Result<void>::error(ErrorCode::ConfigError, "log_max_bytes must be positive");
    }
    if (config.soft_grace_hours < 0 || config.hard_grace_hours < config.soft_grace_hours) {
        return Result<void>::error(ErrorCode::ConfigError,
                                   "hard_grace_hours must be >= soft_grace_hours >= 0");
    }

    LICENSEGUARD_LOG_INFO("config: base={} verify_tls={} timeout={}s", config.base_url,
                          config.verify_tls, config.timeout_seconds);
    return Result<void>::ok();
}

Result<Config> load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config>::error(ErrorCode::ConfigError, "Cannot read config file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    json::json j;
    try {
        j = json::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        LICENSEGUARD_LOG_ERROR("config: {} is not valid JSON: {}", path, e.what());
        return Result<Config>::error(ErrorCode::ConfigError,
                                     "Failed to parse config file " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        return Result<Config>::error(ErrorCode::ConfigError,
                                     "Config file must contain a JSON object: " + path);
    }

    Config config;
    read_string(j, "base_url", config.base_url);
    read_string(j, "api_key", config.api_key);
    read_string(j, "api_secret", config.api_secret);
    if (j.contains("allow_insecure_http")) {
        config.allow_insecure_http = flag_from_json(j["allow_insecure_http"]);
    }
    read_string(j, "log_level", config.log_level);
    read_string(j, "log_file", config.log_file);
    read_number(j, "log_max_bytes", config.log_max_bytes);
    read_number(j, "log_file_count", config.log_file_count);
    read_number(j, "timeout_seconds", config.timeout_seconds);
    read_number(j, "retry_count", config.retry_count);
    read_number(j, "retry_backoff_seconds", config.retry_backoff_seconds);
    read_number(j, "idempotency_window_seconds", config.idempotency_window_seconds);
    read_string(j, "user_agent", config.user_agent);
    read_string(j, "state_path", config.state_path);
    read_string(j, "lock_dir", config.lock_dir);
    read_string(j, "scheduler_lock_path", config.scheduler_lock_path);
    read_number(j, "soft_grace_hours", config.soft_grace_hours);
    read_number(j, "hard_grace_hours", config.hard_grace_hours);
    read_number(j, "revalidate_interval_hours", config.revalidate_interval_hours);
    read_number(j, "scheduler_lock_timeout_ms", config.scheduler_lock_timeout_ms);

    std::error_code ec;
    auto base = std::filesystem::absolute(path, ec).parent_path();
    if (ec) {
        return Result<Config>::error(ErrorCode::ConfigError,
                                     "Cannot resolve config directory for " + path);
    }
    anchor(base, config.state_path);
    anchor(base, config.lock_dir);
    anchor(base, config.scheduler_lock_path);
    anchor(base, config.log_file);

    auto finalized = finalize(config);
    if (finalized.is_error()) {
        return Result<Config>::error(finalized.error_code(), finalized.error_message());
    }
    return Result<Config>::ok(std::move(config));
}

Result<Config> load_env() {
    LICENSEGUARD_LOG_INFO("config: reading from environment");

    Config config;
    config.base_url = get_env("LICENSEGUARD_BASE_URL");
    config.api_key = get_env("LICENSEGUARD_API_KEY");
    config.api_secret = get_env("LICENSEGUARD_API_SECRET");
    config.allow_insecure_http = parse_flag(get_env("LICENSEGUARD_ALLOW_INSECURE_HTTP"));

    auto level = get_env("LICENSEGUARD_LOG_LEVEL");
    if (!level.empty()) {
        config.log_level = level;
    }
    auto log_file = get_env("LICENSEGUARD_LOG_FILE");
    if (!log_file.empty()) {
        config.log_file = log_file;
    }
    auto state_path = get_env("LICENSEGUARD_STATE_PATH");
    if (!state_path.empty()) {
        config.state_path = state_path;
    }

    auto finalized = finalize(config);
    if (finalized.is_error()) {
        return Result<Config>::error(finalized.error_code(), finalized.error_message());
    }
    return Result<Config>::ok(std::move(config));
}

Result<Config> resolve(const std::string& path) {
    std::string file_path = path.empty() ? get_env("LICENSEGUARD_CONFIG") : path;
    if (file_path.empty()) {
        return load_env();
    }

    auto loaded = load_file(file_path);
    if (loaded.is_ok()) {
        auto level = get_env("LICENSEGUARD_LOG_LEVEL");
        if (!level.empty()) {
            loaded.value().log_level = level;
        }
    }
    return loaded;
}

}  // namespace config
}  // namespace licenseguard
