#pragma once

/**
 * @file token.hpp
 * @brief Activation token selection for licenseguard SDK
 */

#include "licenseguard/licenseguard.hpp"

#include <optional>
#include <string>

namespace licenseguard {

/**
 * @brief Choose the current activation token from a response
 *
 * A single activation object yields its token (or nullopt when it has
 * none). For a list, records without a token are dropped and the rest are
 * ranked by (is_active, recency): any active record beats any deactivated
 * one, then the newest `updated_at` (falling back to `created_at`, then 0)
 * wins. Ties keep the earliest record in list order.
 */
[[nodiscard]] std::optional<std::string> extract_latest_token(const ResponseData& response);

}  // namespace licenseguard
