#include "mcpevals/core/config.hpp"
#include "mcpevals/core/logger.hpp"
#include "mcpevals/core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <yaml-cpp/yaml.h>

namespace mcpevals {

namespace {

constexpr size_t kMaxNameLength = 100;
constexpr size_t kMaxDescriptionLength = 500;
constexpr size_t kMaxPromptLength = 10000;
constexpr int kMaxTokensCeiling = 100000;
constexpr int kMaxTimeoutSeconds = 600;

/// First present key among `keys`, or nullptr.
auto find_any(const json& j, std::initializer_list<const char*> keys) -> const json* {
    for (const auto* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

auto parse_request(const json& j, size_t index) -> Result<EvaluationRequest> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "evals[" + std::to_string(index) + "] must be an object"));
    }
    EvaluationRequest r;
    r.name = j.value("name", "");
    r.description = j.value("description", "");
    auto prompt = j.find("prompt");
    if (prompt == j.end() || !prompt->is_string()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Evaluation is missing a prompt",
            r.name.empty() ? "evals[" + std::to_string(index) + "]" : r.name));
    }
    r.prompt = prompt->get<std::string>();
    if (const auto* expected = find_any(j, {"expected_result", "expectedResult"})) {
        r.expected_result = expected->get<std::string>();
    }
    return r;
}

auto is_yaml_path(const std::filesystem::path& path) -> bool {
    auto ext = utils::to_lower(path.extension().string());
    return ext == ".yaml" || ext == ".yml";
}

/// Plain scalars are typed the way JSON would read them; quoted ones stay strings.
auto yaml_scalar_to_json(const YAML::Node& node) -> json {
    const auto& text = node.Scalar();
    if (node.Tag() == "!") return text;

    auto lower = utils::to_lower(text);
    if (lower.empty() || lower == "~" || lower == "null") return nullptr;
    if (lower == "true") return true;
    if (lower == "false") return false;

    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer)) return integer;
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) return number;
    return text;
}

auto yaml_to_json(const YAML::Node& node) -> json {
    switch (node.Type()) {
        case YAML::NodeType::Sequence: {
            auto arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = json::object();
            for (const auto& entry : node) {
                obj[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return obj;
        }
        case YAML::NodeType::Scalar:
            return yaml_scalar_to_json(node);
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return nullptr;
}

auto read_document(const std::filesystem::path& path, std::ifstream& file) -> Result<json> {
    if (is_yaml_path(path)) {
        try {
            return yaml_to_json(YAML::Load(file));
        } catch (const YAML::Exception& e) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              "Failed to parse configuration " + path.string(),
                                              e.what()));
        }
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Failed to parse configuration " + path.string(),
                                          e.what()));
    }
}

} // anonymous namespace

void to_json(json& j, const EvaluationRequest& r) {
    j = json{{"name", r.name}, {"description", r.description}, {"prompt", r.prompt}};
    if (r.expected_result) j["expected_result"] = *r.expected_result;
}

auto parse_config(const json& j, const std::filesystem::path& base_dir)
    -> Result<EvaluationConfiguration> {
    if (!j.is_object()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Configuration root must be an object"));
    }

    EvaluationConfiguration config;
    try {
        config.name = j.value("name", "");
        config.description = j.value("description", "");

        if (j.contains("model")) {
            config.model = j["model"].get<LanguageModelConfiguration>();
        }
        config.model.api_key = resolve_env_refs(config.model.api_key);
        config.model.endpoint = resolve_env_refs(config.model.endpoint);

        if (!j.contains("server") || !j["server"].is_object()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              "Server configuration is required"));
        }
        config.server = j["server"].get<ServerConfiguration>();

        if (const auto* evals = find_any(j, {"evals", "evaluations"})) {
            if (!evals->is_array()) {
                return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                                  "evals must be a list"));
            }
            for (size_t i = 0; i < evals->size(); ++i) {
                auto request = parse_request((*evals)[i], i);
                if (!request) return std::unexpected(request.error());
                config.evals.push_back(std::move(*request));
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Invalid configuration", e.what()));
    }

    if (config.evals.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "No evaluations found in configuration"));
    }

    if (!config.server.path.empty()) {
        std::filesystem::path server_path(config.server.path);
        if (server_path.is_relative()) {
            config.server.path = (base_dir / server_path).lexically_normal().string();
        }
    }

    return config;
}

auto load_config(const std::filesystem::path& path) -> Result<EvaluationConfiguration> {
    LOG_DEBUG("Loading configuration from: {}", path.string());

    if (!std::filesystem::exists(path)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Configuration file not found", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Cannot open configuration file", path.string()));
    }

    auto document = read_document(path, file);
    if (!document) return std::unexpected(document.error());

    auto base_dir = std::filesystem::absolute(path).parent_path();
    auto config = parse_config(*document, base_dir);
    if (config) {
        LOG_INFO("Loaded {} evaluations from {}", config->evals.size(), path.string());
    }
    return config;
}

auto validate_model(const LanguageModelConfiguration& model) -> std::vector<std::string> {
    std::vector<std::string> errors;
    if (model.provider.empty()) {
        errors.emplace_back("Provider is required");
    } else if (std::ranges::find(kValidProviders, utils::to_lower(model.provider)) ==
               std::end(kValidProviders)) {
        errors.emplace_back("Provider must be one of: openai, anthropic, azure-openai");
    }
    if (model.name.empty()) {
        errors.emplace_back("Model name is required");
    }
    if (model.max_tokens <= 0) {
        errors.emplace_back("MaxTokens must be greater than 0");
    } else if (model.max_tokens > kMaxTokensCeiling) {
        errors.emplace_back("MaxTokens must not exceed 100000");
    }
    if (model.temperature < 0.0) {
        errors.emplace_back("Temperature must be >= 0.0");
    } else if (model.temperature > 2.0) {
        errors.emplace_back("Temperature must be <= 2.0");
    }
    return errors;
}

auto validate_server(const ServerConfiguration& server) -> std::vector<std::string> {
    std::vector<std::string> errors;
    auto transport = utils::to_lower(server.transport);

    if (!transport.empty() && transport != "stdio" && transport != "http") {
        errors.emplace_back("Transport must be one of: stdio, http");
    }
    if (transport == "stdio" && server.path.empty()) {
        errors.emplace_back("Server path is required for stdio transport");
    }
    if (transport == "http" && server.path.empty() && server.url.empty()) {
        errors.emplace_back(
            "For HTTP transport, either Path (server file) or Url (direct connection) "
            "must be specified");
    }
    if (transport.empty() && server.path.empty() && server.url.empty()) {
        errors.emplace_back("Server configuration requires a path or a url");
    }
    if (!server.url.empty() && !utils::parse_http_url(server.url)) {
        errors.emplace_back("Url must be a valid HTTP or HTTPS URL");
    }
    if (server.timeout_seconds <= 0) {
        errors.emplace_back("Timeout must be greater than zero");
    } else if (server.timeout_seconds > kMaxTimeoutSeconds) {
        errors.emplace_back("Timeout must not exceed 10 minutes");
    }
    return errors;
}

auto validate_request(const EvaluationRequest& request) -> std::vector<std::string> {
    std::vector<std::string> errors;
    if (request.name.empty()) {
        errors.emplace_back("Evaluation name is required");
    } else if (request.name.size() > kMaxNameLength) {
        errors.emplace_back("Evaluation name must not exceed 100 characters");
    }
    if (request.description.empty()) {
        errors.emplace_back("Evaluation description is required");
    } else if (request.description.size() > kMaxDescriptionLength) {
        errors.emplace_back("Evaluation description must not exceed 500 characters");
    }
    if (request.prompt.empty()) {
        errors.emplace_back("Evaluation prompt is required");
    } else if (request.prompt.size() > kMaxPromptLength) {
        errors.emplace_back("Evaluation prompt must not exceed 10000 characters");
    }
    return errors;
}

auto validate_configuration(const EvaluationConfiguration& config) -> std::vector<std::string> {
    std::vector<std::string> errors;

    auto append = [&errors](const std::string& prefix, std::vector<std::string> found) {
        for (auto& e : found) {
            errors.push_back(prefix + std::move(e));
        }
    };

    append("model: ", validate_model(config.model));
    append("server: ", validate_server(config.server));

    if (config.evals.empty()) {
        errors.emplace_back("At least one evaluation is required");
    }
    for (size_t i = 0; i < config.evals.size(); ++i) {
        append("evals[" + std::to_string(i) + "]: ", validate_request(config.evals[i]));
    }
    return errors;
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string var_name(input.substr(i + 2, close - i - 2));
                if (auto* val = std::getenv(var_name.c_str())) {
                    result += val;
                } else {
                    result += input.substr(i, close - i + 1);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }
    return result;
}

} // namespace mcpevals
