#include "engine/builtin_interceptor.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace compass::engine {
namespace {

std::filesystem::path Canonicalize(const std::filesystem::path& path) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
        return path;
    }
#if defined(_WIN32)
    auto text = canonical.string();
    if (compass::utils::StartsWith(text, "\\\\?\\")) {
        return std::filesystem::path(text.substr(4));
    }
#endif
    return canonical;
}

void HandleCd(const std::string& rest, ExecutionState& state, std::string& simulated) {
    const auto target = compass::utils::TrimQuotes(compass::utils::Trim(rest));
    const auto candidate = state.current_dir / target;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec) || !std::filesystem::is_directory(candidate, ec)) {
        compass::utils::Log(compass::utils::LogLevel::kDebug, "builtin", "cd target missing",
                            {{"path", candidate.string()}});
        return;
    }
    state.current_dir = Canonicalize(candidate);
    simulated += "cd: " + state.current_dir.string() + " (Handled by Compass)\n";
}

void HandleExport(const std::string& rest, ExecutionState& state, std::string& simulated) {
    const auto assignment = compass::utils::Trim(rest);
    const auto eq = assignment.find('=');
    if (eq == std::string::npos) {
        return;
    }
    const auto key = compass::utils::Trim(assignment.substr(0, eq));
    const auto value = compass::utils::TrimQuotes(assignment.substr(eq + 1));
    state.env_vars[key] = value;
    simulated += "export: " + key + "=" + value + " (Handled by Compass)\n";
}

}  // namespace

InterceptResult BuiltinInterceptor::Process(const std::string& content, ExecutionState& state) {
    InterceptResult result{};
    std::vector<std::string> remaining;

    for (const auto& line : compass::utils::SplitLines(content)) {
        const auto trimmed = compass::utils::Trim(line);
        bool handled = false;

        if (compass::utils::StartsWith(trimmed, "cd ")) {
            HandleCd(trimmed.substr(3), state, result.simulated_output);
            handled = true;
        }
        if (compass::utils::StartsWith(trimmed, "export ")) {
            HandleExport(trimmed.substr(7), state, result.simulated_output);
            handled = true;
        }

        if (!handled) {
            remaining.push_back(line);
        }
    }

    result.forwarded = compass::utils::Join(remaining, "\n");
    return result;
}

}  // namespace compass::engine
