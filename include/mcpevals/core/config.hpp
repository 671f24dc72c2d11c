#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "mcpevals/core/error.hpp"
#include "mcpevals/core/types.hpp"

// std::optional serializer for nlohmann/json so optional fields round-trip
// through the NLOHMANN_DEFINE macros.
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace mcpevals {

/// Identifies one target server. Empty strings mean "not set".
struct ServerConfiguration {
    std::string transport;  // "stdio", "http" or empty (inferred)
    std::string path;
    std::string url;
    std::vector<std::string> args;
    int timeout_seconds = 30;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ServerConfiguration, transport, path, url, args, timeout_seconds)

struct LanguageModelConfiguration {
    std::string provider = "openai";  // "openai", "anthropic", "azure-openai"
    std::string name = "gpt-4o";
    std::string api_key;
    std::string endpoint;             // base URL override; required for azure-openai
    int max_tokens = 4000;
    double temperature = 0.1;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LanguageModelConfiguration, provider, name, api_key, endpoint, max_tokens, temperature)

struct EvaluationConfiguration {
    std::string name;
    std::string description;
    LanguageModelConfiguration model;
    ServerConfiguration server;
    std::vector<EvaluationRequest> evals;
};

void to_json(json& j, const EvaluationRequest& r);

inline constexpr std::string_view kValidProviders[] = {"openai", "anthropic", "azure-openai"};

/// Parse an already-loaded JSON document. Relative server paths are resolved
/// against `base_dir`.
auto parse_config(const json& j, const std::filesystem::path& base_dir)
    -> Result<EvaluationConfiguration>;

/// Load an evaluation suite from a JSON file, or YAML when the extension is
/// `.yaml` or `.yml`.
auto load_config(const std::filesystem::path& path) -> Result<EvaluationConfiguration>;

/// Returns every problem found; an empty list means the configuration is valid.
auto validate_configuration(const EvaluationConfiguration& config) -> std::vector<std::string>;
auto validate_model(const LanguageModelConfiguration& model) -> std::vector<std::string>;
auto validate_server(const ServerConfiguration& server) -> std::vector<std::string>;
auto validate_request(const EvaluationRequest& request) -> std::vector<std::string>;

/// Replaces ${VAR} references with environment values. Unresolved references
/// are preserved; "$${VAR}" yields a literal "${VAR}".
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace mcpevals
