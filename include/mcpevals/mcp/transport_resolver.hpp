#pragma once

#include <string>

#include "mcpevals/core/config.hpp"

namespace mcpevals::mcp {

/// Explicit transport (lower-cased) wins; otherwise a url means "http", and
/// anything else "stdio". Unsupported explicit values are returned as-is and
/// rejected later when the transport is created.
auto resolve_transport_type(const ServerConfiguration& config) -> std::string;

} // namespace mcpevals::mcp
