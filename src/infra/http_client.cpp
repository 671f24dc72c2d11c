#include "mcpevals/infra/http_client.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"
#include "mcpevals/infra/sync.hpp"

#include <httplib.h>

#include <utility>

namespace mcpevals::infra {

namespace {

auto to_http_response(const httplib::Result& result) -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        std::string detail;
        switch (err) {
            case httplib::Error::Connection:
                detail = "Connection failed";
                break;
            case httplib::Error::BindIPAddress:
                detail = "Bind IP address failed";
                break;
            case httplib::Error::Read:
                detail = "Read error";
                break;
            case httplib::Error::Write:
                detail = "Write error";
                break;
            case httplib::Error::ExceedRedirectCount:
                detail = "Exceeded redirect count";
                break;
            case httplib::Error::Canceled:
                detail = "Request canceled";
                break;
            case httplib::Error::SSLConnection:
                detail = "SSL connection error";
                break;
            case httplib::Error::SSLLoadingCerts:
                detail = "SSL certificate loading error";
                break;
            case httplib::Error::SSLServerVerification:
                detail = "SSL server verification failed";
                break;
            case httplib::Error::ConnectionTimeout:
                return std::unexpected(make_error(ErrorCode::Timeout,
                                                  "HTTP request timed out",
                                                  "Connection timeout"));
            default:
                detail = "Unknown HTTP error";
                break;
        }
        return std::unexpected(make_error(ErrorCode::ConnectionFailed,
                                          "HTTP request failed", detail));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }

    return response;
}

auto to_headers(const std::map<std::string, std::string>& map) -> httplib::Headers {
    httplib::Headers hdrs;
    for (const auto& [k, v] : map) {
        hdrs.emplace(k, v);
    }
    return hdrs;
}

} // anonymous namespace

auto HttpResponse::header(std::string_view name) const -> std::string {
    auto wanted = utils::to_lower(name);
    for (const auto& [key, value] : headers) {
        if (utils::to_lower(key) == wanted) return value;
    }
    return {};
}

struct HttpClient::Impl {
    HttpClientConfig config;

    explicit Impl(HttpClientConfig config_) : config(std::move(config_)) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    /// httplib::Client is not thread-safe, so every request builds its own.
    auto make_client() const -> std::unique_ptr<httplib::Client> {
        auto client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(config.connect_timeout_seconds);
        client->set_read_timeout(config.timeout_seconds);
        client->set_write_timeout(config.timeout_seconds);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (!config.verify_ssl) {
            client->enable_server_certificate_verification(false);
        }
#endif
        client->set_default_headers(to_headers(config.default_headers));
        return client;
    }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

auto HttpClient::get(std::string_view path,
                     const std::map<std::string, std::string>& headers,
                     const CancelToken& cancel)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    LOG_DEBUG("GET {}{}", impl_->config.base_url, path);
    auto client = std::shared_ptr<httplib::Client>(impl_->make_client());
    co_return co_await offload<HttpResponse>(
        [client, cancel, p = std::string(path), hdrs = to_headers(headers)]() {
            if (is_cancelled(cancel)) return Result<HttpResponse>(std::unexpected(cancelled_error()));
            return to_http_response(client->Get(p, hdrs));
        },
        cancel, [client] { client->stop(); });
}

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers,
                      const CancelToken& cancel)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    LOG_DEBUG("POST {}{}", impl_->config.base_url, path);
    auto client = std::shared_ptr<httplib::Client>(impl_->make_client());
    co_return co_await offload<HttpResponse>(
        [client, cancel, p = std::string(path), b = std::string(body),
         ct = std::string(content_type), hdrs = to_headers(headers)]() {
            if (is_cancelled(cancel)) return Result<HttpResponse>(std::unexpected(cancelled_error()));
            return to_http_response(client->Post(p, hdrs, b, ct));
        },
        cancel, [client] { client->stop(); });
}

void HttpClient::set_default_header(std::string key, std::string value) {
    impl_->config.default_headers[std::move(key)] = std::move(value);
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace mcpevals::infra
