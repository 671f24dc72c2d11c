#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <utility>
#include <boost/asio/awaitable.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/infra/cancellation.hpp"

namespace mcpevals::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }

    /// Case-insensitive header lookup; empty when absent.
    [[nodiscard]] auto header(std::string_view name) const -> std::string;
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;  // scheme://host[:port]
    int timeout_seconds = 30;
    int connect_timeout_seconds = 10;
    bool verify_ssl = true;
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib. Each request runs on its own
/// background thread with a fresh httplib::Client, so one HttpClient may be
/// shared by concurrent coroutines.
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    auto get(std::string_view path,
             const std::map<std::string, std::string>& headers = {},
             const CancelToken& cancel = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              const std::map<std::string, std::string>& headers = {},
              const CancelToken& cancel = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Sets a default header that will be sent with every request.
    void set_default_header(std::string key, std::string value);

    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpevals::infra
