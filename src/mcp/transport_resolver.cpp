#include "mcpevals/mcp/transport_resolver.hpp"
#include "mcpevals/core/utils.hpp"

namespace mcpevals::mcp {

auto resolve_transport_type(const ServerConfiguration& config) -> std::string {
    auto explicit_transport = utils::trim(config.transport);
    if (!explicit_transport.empty()) {
        return utils::to_lower(explicit_transport);
    }
    if (!utils::trim(config.url).empty()) return "http";
    if (!utils::trim(config.path).empty()) return "stdio";
    return "stdio";
}

} // namespace mcpevals::mcp
