#include "mcpevals/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace mcpevals::utils {

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto timestamp_iso() -> std::string {
    return format_iso(std::chrono::system_clock::now());
}

auto format_iso(std::chrono::system_clock::time_point tp) -> std::string {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    gmtime_r(&time, &tm_val);
    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%FT%TZ");
    return oss.str();
}

auto trim(std::string_view s) -> std::string {
    return trim_chars(s, " \t\n\r");
}

auto trim_chars(std::string_view s, std::string_view chars) -> std::string {
    auto start = s.find_first_not_of(chars);
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(chars);
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto truncate(std::string_view s, std::size_t max_len) -> std::string {
    if (s.size() <= max_len) return std::string(s);
    return std::string(s.substr(0, max_len));
}

auto strip_code_fences(std::string_view text) -> std::string {
    auto body = trim(text);
    if (!body.starts_with("```")) return body;

    // Drop the opening fence line, including any language tag.
    auto newline = body.find('\n');
    if (newline == std::string::npos) return trim(trim_chars(body, "`"));
    body.erase(0, newline + 1);

    auto closing = body.rfind("```");
    if (closing != std::string::npos) body.erase(closing);
    return trim(body);
}

auto HttpUrl::origin() const -> std::string {
    return scheme + "://" + host + ":" + std::to_string(port);
}

auto parse_http_url(std::string_view url) -> std::optional<HttpUrl> {
    static const std::regex url_re(
        R"(^(https?)://([^/:?#\s]+)(?::(\d{1,5}))?([/?][^#\s]*)?(#.*)?$)",
        std::regex::icase);

    std::string input(trim(url));
    std::smatch m;
    if (!std::regex_match(input, m, url_re)) return std::nullopt;

    HttpUrl out;
    out.scheme = to_lower(m[1].str());
    out.host = m[2].str();
    if (m[3].matched) {
        out.port = std::stoi(m[3].str());
        if (out.port <= 0 || out.port > 65535) return std::nullopt;
    } else {
        out.port = out.scheme == "https" ? 443 : 80;
    }
    if (m[4].matched) {
        out.path = m[4].str();
        if (out.path.front() == '?') out.path.insert(out.path.begin(), '/');
    }
    return out;
}

} // namespace mcpevals::utils
