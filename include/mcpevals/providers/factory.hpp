#pragma once

#include <memory>

#include "mcpevals/core/config.hpp"
#include "mcpevals/core/error.hpp"
#include "mcpevals/providers/provider.hpp"

namespace mcpevals::providers {

/// Builds the provider named by `model.provider`. The configuration must
/// already carry the API key (and endpoint, for azure-openai).
auto create_provider(const LanguageModelConfiguration& model)
    -> Result<std::unique_ptr<Provider>>;

} // namespace mcpevals::providers
