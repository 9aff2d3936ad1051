#pragma once

/**
 * @file crypto.hpp
 * @brief Cryptographic utilities for licenseguard SDK
 *
 * Base64 for the HTTP Basic credential and SHA-256 for lock file names,
 * both via OpenSSL.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace licenseguard {
namespace crypto {

/// Encode bytes to standard Base64 (no line breaks)
[[nodiscard]] std::string base64_encode(const std::vector<uint8_t>& data);

/// Encode a string to standard Base64
[[nodiscard]] std::string base64_encode(const std::string& data);

/// SHA-256 of the input as lowercase hex, empty on failure
[[nodiscard]] std::string sha256_hex(const std::string& input);

/// Value of an `Authorization` header for HTTP Basic auth
[[nodiscard]] std::string basic_auth_header(const std::string& user, const std::string& password);

}  // namespace crypto
}  // namespace licenseguard
