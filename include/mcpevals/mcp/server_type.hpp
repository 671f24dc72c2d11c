#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "mcpevals/core/types.hpp"

namespace mcpevals::mcp {

/// Program, arguments and working directory for launching a server.
struct LaunchCommand {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_dir;
};

/// How one runtime launches an artifact: `program` followed by `prefix_args`,
/// then the artifact path and configured args. An empty program runs the
/// artifact itself.
struct RuntimeLauncher {
    ServerType type;
    std::string_view program;
    std::vector<std::string_view> prefix_args;
};

/// Classifies a server artifact by extension, then by keywords in the path.
///
/// | extension | type             |
/// |-----------|------------------|
/// | .exe      | NativeExecutable |
/// | .ts       | TypeScriptScript |
/// | .js       | NodeScript       |
/// | .py       | PythonScript     |
///
/// Keyword fallback, checked in order on the lower-cased path:
/// "typescript" or "node" -> TypeScriptScript, "csharp" or "dotnet" ->
/// NativeExecutable, "python" or "py" -> PythonScript.
auto detect_server_type(std::string_view path) -> ServerType;

/// Launcher for `type`, or nullptr for Unknown.
auto find_launcher(ServerType type) -> const RuntimeLauncher*;

/// Launch command for an artifact. Unknown types run the artifact directly.
/// The working directory is the artifact's directory.
auto build_launch_command(ServerType type, const std::filesystem::path& artifact,
                          const std::vector<std::string>& args) -> LaunchCommand;

} // namespace mcpevals::mcp
