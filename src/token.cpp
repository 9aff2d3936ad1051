#include "licenseguard/token.hpp"
#include "licenseguard/logging.hpp"

#include <cstdint>
#include <tuple>

namespace licenseguard {

namespace {

std::string trimmed(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

int64_t recency(const ActivationRecord& record) {
    const auto& ts = record.updated_at ? record.updated_at : record.created_at;
    if (!ts) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(ts->time_since_epoch()).count();
}

}  // namespace

std::optional<std::string> extract_latest_token(const ResponseData& response) {
    switch (response.activation_shape) {
        case ActivationShape::None:
            LICENSEGUARD_LOG_DEBUG("extract_latest_token: no activationData present");
            return std::nullopt;

        case ActivationShape::Single: {
            auto token = response.activations.empty() ? std::string()
                                                      : trimmed(response.activations.front().token);
            LICENSEGUARD_LOG_DEBUG("extract_latest_token: single-object token={}",
                                   log::mask_token(token));
            if (token.empty()) {
                return std::nullopt;
            }
            return token;
        }

        case ActivationShape::List:
            break;
    }

    const ActivationRecord* best = nullptr;
    std::tuple<int, int64_t> best_score{-1, 0};
    int candidates = 0;

    for (const auto& record : response.activations) {
        if (trimmed(record.token).empty()) {
            continue;
        }
        ++candidates;

        std::tuple<int, int64_t> score{record.is_active() ? 1 : 0, recency(record)};
        // Strictly greater keeps the first of equal candidates
        if (best == nullptr || score > best_score) {
            best = &record;
            best_score = score;
        }
    }

    LICENSEGUARD_LOG_DEBUG("extract_latest_token: candidates={}", candidates);
    if (best == nullptr) {
        return std::nullopt;
    }

    auto token = trimmed(best->token);
    LICENSEGUARD_LOG_INFO("extract_latest_token: chosen_token={} active={}", log::mask_token(token),
                          best->is_active());
    return token;
}

}  // namespace licenseguard
