#include "licenseguard/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

namespace licenseguard {
namespace log {

namespace {

std::mutex g_init_mutex;

std::shared_ptr<spdlog::logger> create_logger(spdlog::level::level_enum level,
                                              const std::string& log_file, std::size_t max_bytes,
                                              std::size_t file_count) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file_error;
    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_bytes, file_count));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %n: %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);

    if (!file_error.empty()) {
        logger->warn("cannot open log file {}: {}; logging to stderr only", log_file, file_error);
    }
    return logger;
}

}  // namespace

spdlog::level::level_enum level_from_string(const std::string& level) {
    std::string lowered = level;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "warning") {
        lowered = "warn";
    }

    // spdlog maps unknown names to off; we want info instead
    auto parsed = spdlog::level::from_str(lowered);
    if (parsed == spdlog::level::off && lowered != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

void init(const std::string& level, const std::string& log_file, std::size_t max_bytes,
          std::size_t file_count) {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    create_logger(level_from_string(level), log_file, max_bytes, file_count);
}

std::shared_ptr<spdlog::logger> get() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (logger) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(g_init_mutex);
    logger = spdlog::get(LOGGER_NAME);
    if (logger) {
        return logger;
    }
    return create_logger(spdlog::level::info, "", DEFAULT_LOG_MAX_BYTES, DEFAULT_LOG_FILE_COUNT);
}

std::string mask_token(const std::string& token, std::size_t keep) {
    if (token.empty()) {
        return "<none>";
    }
    if (token.size() <= keep) {
        return std::string(token.size(), '*');
    }
    std::string masked = token.substr(0, keep) + "...";
    if (token.size() > keep + 1) {
        masked.append(token.size() - keep - 1, '*');
    }
    return masked;
}

std::string compact(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "...(truncated)";
}

}  // namespace log
}  // namespace licenseguard
