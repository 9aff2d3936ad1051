#pragma once

/**
 * @file config.hpp
 * @brief Configuration loading for licenseguard SDK
 *
 * Resolves the base URL, Basic credentials and TLS policy from a JSON
 * config file or, when no file is available, from environment variables.
 *
 * File keys: base_url, api_key, api_secret, allow_insecure_http, log_level,
 * log_file, log_max_bytes, log_file_count, timeout_seconds, retry_count, retry_backoff_seconds,
 * idempotency_window_seconds, user_agent, state_path, lock_dir,
 * scheduler_lock_path, soft_grace_hours, hard_grace_hours,
 * revalidate_interval_hours, scheduler_lock_timeout_ms.
 *
 * Environment: LICENSEGUARD_CONFIG (file path), LICENSEGUARD_BASE_URL,
 * LICENSEGUARD_API_KEY, LICENSEGUARD_API_SECRET,
 * LICENSEGUARD_ALLOW_INSECURE_HTTP, LICENSEGUARD_LOG_LEVEL,
 * LICENSEGUARD_LOG_FILE, LICENSEGUARD_STATE_PATH.
 */

#include "licenseguard/licenseguard.hpp"

#include <string>

namespace licenseguard {
namespace config {

/// Parse a boolean flag ("1", "true", "yes", "on"; case-insensitive)
[[nodiscard]] bool parse_flag(const std::string& value) noexcept;

/**
 * @brief Load configuration from a JSON file and validate it
 *
 * Relative state_path, lock_dir, scheduler_lock_path and log_file values,
 * defaults included, are resolved against the directory holding the file.
 */
[[nodiscard]] Result<Config> load_file(const std::string& path);

/// Load configuration from environment variables and validate it
[[nodiscard]] Result<Config> load_env();

/**
 * @brief Resolve configuration from the first available source
 *
 * Order: `path` if non-empty, then $LICENSEGUARD_CONFIG, then the
 * environment. $LICENSEGUARD_LOG_LEVEL overrides the file's log level.
 */
[[nodiscard]] Result<Config> resolve(const std::string& path = "");

/**
 * @brief Check required fields and derive verify_tls
 *
 * Strips trailing slashes from base_url. Fails with ConfigError when
 * base_url/api_key/api_secret is empty, the scheme is not http(s), or
 * http:// is used without allow_insecure_http.
 */
[[nodiscard]] Result<void> finalize(Config& config);

}  // namespace config
}  // namespace licenseguard
