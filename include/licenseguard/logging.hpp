#pragma once

/**
 * @file logging.hpp
 * @brief Logging for licenseguard SDK
 *
 * A single named spdlog logger writing to stderr and, when configured,
 * to a rotating log file. Masking helpers keep tokens and secrets out of
 * the log.
 */

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace licenseguard {
namespace log {

/// Logger name registered with spdlog
constexpr const char* LOGGER_NAME = "licenseguard";

constexpr std::size_t DEFAULT_LOG_MAX_BYTES = 5 * 1024 * 1024;
constexpr std::size_t DEFAULT_LOG_FILE_COUNT = 5;

/**
 * @brief Create (or replace) the SDK logger
 *
 * When `log_file` is non-empty a rotating file sink is attached next to
 * stderr; missing parent directories are created. If the file cannot be
 * opened the logger keeps only the stderr sink and warns about it.
 *
 * @param level spdlog level name ("debug", "INFO", ...); unknown names mean info
 * @param log_file Rotating log file path, empty for stderr only
 * @param max_bytes Size at which the file rotates
 * @param file_count Rotated files kept next to the live one
 */
void init(const std::string& level, const std::string& log_file = "",
          std::size_t max_bytes = DEFAULT_LOG_MAX_BYTES,
          std::size_t file_count = DEFAULT_LOG_FILE_COUNT);

/// Get the SDK logger, creating a default info-level logger on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

/// Map a level name to spdlog, case-insensitive, defaulting to info
[[nodiscard]] spdlog::level::level_enum level_from_string(const std::string& level);

/// Mask a token/secret for logs, keeping the first `keep` chars
[[nodiscard]] std::string mask_token(const std::string& token, std::size_t keep = 6);

/// Truncate a payload for a log line
[[nodiscard]] std::string compact(const std::string& text, std::size_t limit = 1200);

}  // namespace log
}  // namespace licenseguard

#define LICENSEGUARD_LOG_DEBUG(...) ::licenseguard::log::get()->debug(__VA_ARGS__)
#define LICENSEGUARD_LOG_INFO(...) ::licenseguard::log::get()->info(__VA_ARGS__)
#define LICENSEGUARD_LOG_WARN(...) ::licenseguard::log::get()->warn(__VA_ARGS__)
#define LICENSEGUARD_LOG_ERROR(...) ::licenseguard::log::get()->error(__VA_ARGS__)
