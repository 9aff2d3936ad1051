#pragma once

/**
 * @file http.hpp
 * @brief HTTP transport abstraction for licenseguard SDK
 *
 * Provides a small HTTP client interface using cpp-httplib under the hood.
 * Retries are the API client's business; the transport only reports what
 * kind of failure happened.
 */

#include "licenseguard.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace licenseguard {
namespace http {

/// Ordered list of name/value pairs (query parameters, headers)
using Fields = std::vector<std::pair<std::string, std::string>>;

/// Transport-level failure classification
enum class TransportError { None, Timeout, Connection, Tls, Other };

/// HTTP response structure
struct Response {
    int status_code = 0;
    std::string body;
    std::string content_type;
    bool success = false;  // 2xx received
    TransportError transport_error = TransportError::None;
    std::string error_message;  // Set when no response was received

    /// True when an HTTP response (any status) came back
    [[nodiscard]] bool received() const noexcept {
        return transport_error == TransportError::None;
    }
};

/// HTTP GET request structure
struct Request {
    std::string path;  // Appended to the base URL path
    Fields query;
    Fields headers;
};

/**
 * @brief HTTP client interface
 *
 * Abstract interface for HTTP operations. Can be mocked for testing.
 */
class HttpClientInterface {
  public:
    virtual ~HttpClientInterface() = default;

    /// Send a GET request and return the response
    [[nodiscard]] virtual Response send(const Request& request) = 0;
};

/**
 * @brief HTTP client using cpp-httplib
 *
 * Supports HTTPS with certificate verification (on unless disabled).
 */
class HttpClient : public HttpClientInterface {
  public:
    /// Configuration for the HTTP client
    struct Config {
        std::string base_url;
        int timeout_seconds = 30;
        bool verify_tls = true;
    };

    /// Construct with configuration
    explicit HttpClient(Config config);

    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    [[nodiscard]] Response send(const Request& request) override;

    /// Get the base URL
    [[nodiscard]] const std::string& base_url() const;

    /// Path prefix parsed out of the base URL ("" when none)
    [[nodiscard]] const std::string& base_path() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Percent-encode a query component (RFC 3986 unreserved set kept as is)
[[nodiscard]] inline std::string url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                          c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

/// Build "a=1&b=2" from ordered parameters (no leading '?')
[[nodiscard]] inline std::string build_query_string(const Fields& params) {
    std::string query;
    for (const auto& [name, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += url_encode(name) + "=" + url_encode(value);
    }
    return query;
}

/// Human-readable transport error name
[[nodiscard]] constexpr const char* transport_error_to_string(TransportError error) noexcept {
    switch (error) {
        case TransportError::None:
            return "none";
        case TransportError::Timeout:
            return "timeout";
        case TransportError::Connection:
            return "connection failed";
        case TransportError::Tls:
            return "tls failure";
        case TransportError::Other:
            return "transport failure";
    }
    return "transport failure";
}

}  // namespace http
}  // namespace licenseguard
