#include "mcpevals/mcp/server_type.hpp"
#include "mcpevals/core/utils.hpp"

#include <array>
#include <utility>

namespace mcpevals::mcp {

namespace {

const std::array<std::pair<std::string_view, ServerType>, 4> kExtensions = {{
    {".exe", ServerType::NativeExecutable},
    {".ts", ServerType::TypeScriptScript},
    {".js", ServerType::NodeScript},
    {".py", ServerType::PythonScript},
}};

struct KeywordRule {
    std::vector<std::string_view> keywords;
    ServerType type;
};

const std::vector<KeywordRule> kKeywordRules = {
    {{"typescript", "node"}, ServerType::TypeScriptScript},
    {{"csharp", "dotnet"}, ServerType::NativeExecutable},
    {{"python", "py"}, ServerType::PythonScript},
};

const std::vector<RuntimeLauncher> kLaunchers = {
    {ServerType::TypeScriptScript, "npx", {"tsx"}},
    {ServerType::NodeScript, "node", {}},
    {ServerType::NativeExecutable, "", {}},
    {ServerType::PythonScript, "python3", {}},
};

} // anonymous namespace

auto detect_server_type(std::string_view path) -> ServerType {
    if (utils::trim(path).empty()) return ServerType::Unknown;

    auto lowered = utils::to_lower(path);
    auto extension = std::filesystem::path(lowered).extension().string();
    for (const auto& [ext, type] : kExtensions) {
        if (extension == ext) return type;
    }

    for (const auto& rule : kKeywordRules) {
        for (auto keyword : rule.keywords) {
            if (lowered.find(keyword) != std::string::npos) return rule.type;
        }
    }
    return ServerType::Unknown;
}

auto find_launcher(ServerType type) -> const RuntimeLauncher* {
    for (const auto& launcher : kLaunchers) {
        if (launcher.type == type) return &launcher;
    }
    return nullptr;
}

auto build_launch_command(ServerType type, const std::filesystem::path& artifact,
                          const std::vector<std::string>& args) -> LaunchCommand {
    auto full_path = std::filesystem::absolute(artifact).lexically_normal();

    LaunchCommand command;
    command.working_dir = full_path.parent_path();

    const auto* launcher = find_launcher(type);
    if (launcher && !launcher->program.empty()) {
        command.program = std::string(launcher->program);
        for (auto prefix : launcher->prefix_args) {
            command.args.emplace_back(prefix);
        }
        command.args.push_back(full_path.string());
    } else {
        command.program = full_path.string();
    }
    command.args.insert(command.args.end(), args.begin(), args.end());
    return command;
}

} // namespace mcpevals::mcp
