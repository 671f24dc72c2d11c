#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpevals::utils {

/// Components of an absolute http or https URL.
struct HttpUrl {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path = "/";  // includes the query string, if any

    /// scheme://host:port, the form cpp-httplib clients are constructed with.
    [[nodiscard]] auto origin() const -> std::string;
};

auto timestamp_ms() -> int64_t;
auto timestamp_iso() -> std::string;
auto format_iso(std::chrono::system_clock::time_point tp) -> std::string;
auto trim(std::string_view s) -> std::string;
auto trim_chars(std::string_view s, std::string_view chars) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto truncate(std::string_view s, std::size_t max_len) -> std::string;

/// Removes a surrounding Markdown code fence (```json ... ```), if any.
auto strip_code_fences(std::string_view text) -> std::string;

/// Returns nullopt unless `url` is an absolute http/https URL with a host.
auto parse_http_url(std::string_view url) -> std::optional<HttpUrl>;

} // namespace mcpevals::utils
