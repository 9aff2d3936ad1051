#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization utilities for licenseguard SDK types
 *
 * Uses nlohmann/json for parsing API responses into SDK types. Object key
 * order matters for embedded error maps ("first error code"), so parsing
 * goes through ordered_json.
 */

#include "licenseguard.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace licenseguard {
namespace json {

using json = nlohmann::ordered_json;

/// Error code the remote service uses for an expired license
constexpr const char* LICENSE_EXPIRED_CODE = "lmfwc_rest_license_expired";

// ==================== Timestamp Helpers ====================

/**
 * @brief Parse a server timestamp as UTC
 *
 * Accepts "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS[Z|.fff|+hh:mm]" and
 * "YYYY-MM-DD". Fractions and offsets are ignored.
 */
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    std::string normalized = str;
    if (normalized.size() > 10 && normalized[10] == 'T') {
        normalized[10] = ' ';
    }

    std::tm tm = {};
    std::istringstream ss(normalized);
    if (normalized.size() <= 10) {
        ss >> std::get_time(&tm, "%Y-%m-%d");
    } else {
        ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    }

    if (ss.fail()) {
        return std::nullopt;
    }

#if defined(_MSC_VER)
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    if (time == -1) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(time);
}

/// Format Timestamp to ISO 8601 string
[[nodiscard]] inline std::string format_timestamp(const Timestamp& ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm = {};
#if defined(_MSC_VER)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

/// Read an optional timestamp string field
[[nodiscard]] inline std::optional<Timestamp> timestamp_field(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return parse_timestamp(j[key].get<std::string>());
    }
    return std::nullopt;
}

/// Render any scalar as text ("" for null)
[[nodiscard]] inline std::string scalar_to_string(const json& j) {
    if (j.is_null()) {
        return "";
    }
    if (j.is_string()) {
        return j.get<std::string>();
    }
    return j.dump();
}

// ==================== Activation Parsing ====================

/// Parse ActivationRecord from an `activationData` entry
[[nodiscard]] inline ActivationRecord parse_activation_record(const json& j) {
    ActivationRecord record;

    if (j.contains("token") && !j["token"].is_null()) {
        record.token = scalar_to_string(j["token"]);
    }

    record.created_at = timestamp_field(j, "created_at");
    record.updated_at = timestamp_field(j, "updated_at");

    // Any truthy deactivated_at marks the record as inactive
    if (j.contains("deactivated_at")) {
        const auto& value = j["deactivated_at"];
        if (value.is_boolean()) {
            record.deactivated_at = value.get<bool>() ? "true" : "";
        } else if (!(value.is_number() && value == 0)) {
            record.deactivated_at = scalar_to_string(value);
        }
    }

    return record;
}

// ==================== Response Parsing ====================

/**
 * @brief Normalize a successful response body
 *
 * The lifecycle reads `data.expiresAt`, `data.activationData` (object or
 * list) and `data.timesActivated`; everything else is carried as raw JSON.
 */
[[nodiscard]] inline ResponseData parse_response_data(const json& body) {
    ResponseData result;
    result.body = body.dump();

    const json* data = &body;
    if (body.is_object() && body.contains("data")) {
        data = &body["data"];
    }
    result.data = data->dump();

    if (!data->is_object()) {
        return result;
    }

    if (data->contains("expiresAt") && (*data)["expiresAt"].is_string()) {
        auto expires = (*data)["expiresAt"].get<std::string>();
        if (!expires.empty()) {
            result.expires_at = std::move(expires);
        }
    }

    if (data->contains("activationData")) {
        const auto& activation = (*data)["activationData"];
        if (activation.is_object()) {
            result.activation_shape = ActivationShape::Single;
            result.activations.push_back(parse_activation_record(activation));
        } else if (activation.is_array()) {
            result.activation_shape = ActivationShape::List;
            for (const auto& item : activation) {
                if (item.is_object()) {
                    result.activations.push_back(parse_activation_record(item));
                }
            }
        }
    }

    if (data->contains("timesActivated")) {
        const auto& times = (*data)["timesActivated"];
        if (times.is_number_integer()) {
            result.times_activated = times.get<int>();
        } else if (times.is_string()) {
            try {
                result.times_activated = std::stoi(times.get<std::string>());
            } catch (const std::exception&) {
                result.times_activated.reset();
            }
        }
    }

    return result;
}

// ==================== Error Parsing ====================

/**
 * @brief Pick a message out of an HTTP error body
 *
 * Uses `message` when present, otherwise the first string found in any
 * list-valued field.
 */
[[nodiscard]] inline std::optional<std::string> extract_http_error_message(const json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }

    if (payload.contains("message")) {
        auto message = scalar_to_string(payload["message"]);
        if (!message.empty()) {
            return message;
        }
    }

    for (const auto& [key, value] : payload.items()) {
        if (!value.is_array()) {
            continue;
        }
        for (const auto& item : value) {
            if (item.is_string()) {
                return item.get<std::string>();
            }
        }
    }

    return std::nullopt;
}

/// Error embedded in a 200 response (`data.errors` / `data.error_data`)
struct EmbeddedError {
    std::string code = "lmfwc_error";
    std::optional<std::string> message;
    std::optional<int> status;
};

/// Pick the first error code, its first message and its status
[[nodiscard]] inline EmbeddedError extract_embedded_error(const json& errors,
                                                        const json& error_data) {
    EmbeddedError result;

    if (errors.is_object() && !errors.empty()) {
        auto first = errors.begin();
        result.code = first.key();
        const auto& messages = first.value();
        if (messages.is_array() && !messages.empty()) {
            result.message = scalar_to_string(messages.front());
        } else if (messages.is_string()) {
            result.message = messages.get<std::string>();
        }
    }

    if (error_data.is_object() && error_data.contains(result.code)) {
        const auto& entry = error_data[result.code];
        if (entry.is_object() && entry.contains("status")) {
            const auto& status = entry["status"];
            if (status.is_number_integer()) {
                result.status = status.get<int>();
            } else if (status.is_string()) {
                try {
                    result.status = std::stoi(status.get<std::string>());
                } catch (const std::exception&) {
                    result.status.reset();
                }
            }
        }
    }

    return result;
}

// ==================== License State ====================

/// Serialize the license state document
[[nodiscard]] inline json state_to_json(const LicenseState& state) {
    auto ts_or_null = [](const std::optional<Timestamp>& ts) -> json {
        if (ts) {
            return format_timestamp(*ts);
        }
        return nullptr;
    };

    json j;
    j["license_key"] = state.license_key;
    j["status"] = license_status_to_string(state.status);
    j["activation_token"] = state.activation_token;
    j["expires_at"] = ts_or_null(state.expires_at);
    j["grace_until"] = ts_or_null(state.grace_until);
    j["reason"] = state.reason;
    j["last_validated"] = ts_or_null(state.last_validated);
    j["last_response_raw"] = state.last_response_raw;
    j["last_error_raw"] = state.last_error_raw;
    return j;
}

/// Parse the license state document; missing fields keep their defaults
[[nodiscard]] inline LicenseState state_from_json(const json& j) {
    LicenseState state;
    if (!j.is_object()) {
        return state;
    }

    state.license_key = j.value("license_key", "");
    state.status = license_status_from_string(j.value("status", ""));
    state.activation_token = j.value("activation_token", "");
    state.expires_at = timestamp_field(j, "expires_at");
    state.grace_until = timestamp_field(j, "grace_until");
    state.reason = j.value("reason", "");
    state.last_validated = timestamp_field(j, "last_validated");
    state.last_response_raw = j.value("last_response_raw", "");
    state.last_error_raw = j.value("last_error_raw", "");
    return state;
}

}  // namespace json
}  // namespace licenseguard
