#include "licenseguard/http.hpp"

#include <httplib.h>

#include <mutex>

// Detect SSL support in cpp-httplib
#if defined(CPPHTTPLIB_OPENSSL_SUPPORT)
#define LICENSEGUARD_HTTP_HAS_SSL 1
#else
#define LICENSEGUARD_HTTP_HAS_SSL 0
#endif

namespace licenseguard {
namespace http {

// ==================== HttpClient Implementation ====================

class HttpClient::Impl {
  public:
    explicit Impl(Config config) : config_(std::move(config)) {
        std::string url = config_.base_url;

        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }

        bool use_https = false;
        if (url.rfind("https://", 0) == 0) {
            use_https = true;
            url = url.substr(8);
        } else if (url.rfind("http://", 0) == 0) {
            url = url.substr(7);
        }

        std::string host;
        int port = use_https ? 443 : 80;

        auto colon_pos = url.find(':');
        auto slash_pos = url.find('/');

        if (colon_pos != std::string::npos && (slash_pos == std::string::npos || colon_pos < slash_pos)) {
            host = url.substr(0, colon_pos);
            std::string port_str;
            if (slash_pos != std::string::npos) {
                port_str = url.substr(colon_pos + 1, slash_pos - colon_pos - 1);
                base_path_ = url.substr(slash_pos);
            } else {
                port_str = url.substr(colon_pos + 1);
            }
            try {
                port = std::stoi(port_str);
            } catch (const std::exception&) {
                port = use_https ? 443 : 80;
            }
        } else {
            if (slash_pos != std::string::npos) {
                host = url.substr(0, slash_pos);
                base_path_ = url.substr(slash_pos);
            } else {
                host = url;
            }
        }

        if (use_https) {
#if LICENSEGUARD_HTTP_HAS_SSL
            ssl_client_ = std::make_unique<httplib::SSLClient>(host, port);
            apply_timeouts(*ssl_client_);
            ssl_client_->enable_server_certificate_verification(config_.verify_tls);
#else
            https_requested_ = true;
#endif
        } else {
            client_ = std::make_unique<httplib::Client>(host, port);
            apply_timeouts(*client_);
        }
    }

    Response send(const Request& request) {
        std::lock_guard<std::mutex> lock(mutex_);

        Response response;

#if !LICENSEGUARD_HTTP_HAS_SSL
        if (https_requested_) {
            response.transport_error = TransportError::Tls;
            response.error_message = "HTTPS not supported: cpp-httplib was compiled without SSL support";
            return response;
        }
#endif

        std::string full_path = base_path_ + request.path;
        if (!request.query.empty()) {
            full_path += "?" + build_query_string(request.query);
        }

        httplib::Headers headers;
        for (const auto& [name, value] : request.headers) {
            headers.emplace(name, value);
        }

        if (!has_client()) {
            response.transport_error = TransportError::Other;
            response.error_message = "HTTP client not configured";
            return response;
        }

#if LICENSEGUARD_HTTP_HAS_SSL
        auto result = ssl_client_ ? ssl_client_->Get(full_path, headers)
                                  : client_->Get(full_path, headers);
#else
        auto result = client_->Get(full_path, headers);
#endif

        if (result) {
            response.status_code = result->status;
            response.body = result->body;
            response.content_type = result->get_header_value("Content-Type");
            response.success = (result->status >= 200 && result->status < 300);
            return response;
        }

        switch (result.error()) {
            case httplib::Error::Connection:
                response.transport_error = TransportError::Connection;
                response.error_message = "Connection failed";
                break;
            case httplib::Error::Read:
                response.transport_error = TransportError::Timeout;
                response.error_message = "Read failed or timed out";
                break;
            case httplib::Error::Write:
                response.transport_error = TransportError::Timeout;
                response.error_message = "Write failed or timed out";
                break;
#if LICENSEGUARD_HTTP_HAS_SSL
            case httplib::Error::SSLConnection:
                response.transport_error = TransportError::Tls;
                response.error_message = "SSL connection failed";
                break;
            case httplib::Error::SSLServerVerification:
                response.transport_error = TransportError::Tls;
                response.error_message = "SSL certificate verification failed";
                break;
#endif
            default:
                response.transport_error = TransportError::Other;
                response.error_message = "Unknown network error";
        }

        return response;
    }

    const std::string& base_url() const { return config_.base_url; }

    const std::string& base_path() const { return base_path_; }

  private:
    bool has_client() const {
#if LICENSEGUARD_HTTP_HAS_SSL
        if (ssl_client_) {
            return true;
        }
#endif
        return client_ != nullptr;
    }

    template <typename ClientT> void apply_timeouts(ClientT& client) {
        client.set_connection_timeout(config_.timeout_seconds);
        client.set_read_timeout(config_.timeout_seconds);
        client.set_write_timeout(config_.timeout_seconds);
    }

    Config config_;
    std::string base_path_;
    std::unique_ptr<httplib::Client> client_;
#if LICENSEGUARD_HTTP_HAS_SSL
    std::unique_ptr<httplib::SSLClient> ssl_client_;
#else
    bool https_requested_ = false;
#endif
    std::mutex mutex_;
};

HttpClient::HttpClient(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Response HttpClient::send(const Request& request) {
    return impl_->send(request);
}

const std::string& HttpClient::base_url() const {
    return impl_->base_url();
}

const std::string& HttpClient::base_path() const {
    return impl_->base_path();
}

}  // namespace http
}  // namespace licenseguard
