#include "mcpevals/providers/factory.hpp"
#include "mcpevals/core/utils.hpp"
#include "mcpevals/providers/anthropic.hpp"
#include "mcpevals/providers/openai.hpp"

namespace mcpevals::providers {

namespace {

auto endpoint_config(const LanguageModelConfiguration& model) -> Result<ProviderConfig> {
    ProviderConfig config{
        .api_key = model.api_key,
        .model = model.name,
    };
    auto endpoint = utils::trim(model.endpoint);
    if (endpoint.empty()) return config;

    auto url = utils::parse_http_url(endpoint);
    if (!url) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "Invalid model endpoint: " + endpoint));
    }
    config.base_url = url->origin();
    config.path_prefix = url->path == "/" ? std::string() : url->path;
    return config;
}

} // anonymous namespace

auto create_provider(const LanguageModelConfiguration& model)
    -> Result<std::unique_ptr<Provider>> {
    auto kind = utils::to_lower(utils::trim(model.provider));

    if (utils::trim(model.api_key).empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "API key is required for provider: " + kind));
    }

    auto config = endpoint_config(model);
    if (!config) return std::unexpected(config.error());

    if (kind == "openai") {
        return std::make_unique<OpenAIProvider>(*config);
    }
    if (kind == "azure-openai") {
        if (config->base_url.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              "Azure OpenAI requires an endpoint"));
        }
        return std::make_unique<OpenAIProvider>(*config, OpenAIProvider::Flavor::Azure);
    }
    if (kind == "anthropic") {
        return std::make_unique<AnthropicProvider>(*config);
    }
    return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                      "Unsupported language model provider: " + model.provider));
}

} // namespace mcpevals::providers
