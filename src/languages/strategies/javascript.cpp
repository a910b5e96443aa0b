#include "languages/strategies/javascript.hpp"

namespace compass::languages {
namespace {

EnvMap NodeEnv() {
    return {
        {"CI", "true"},
        {"NO_UPDATE_NOTIFIER", "1"}
    };
}

}  // namespace

std::filesystem::path JavaScriptStrategy::Prepare(const std::string& code,
                                                  const std::filesystem::path& temp_dir) const {
    const auto path = UniqueArtifactPath(temp_dir, "script", Extension());
    WriteArtifact(path, code, "JS script");
    return path;
}

std::vector<std::string> JavaScriptStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    return {RequiredCommand(), prepared_path.string()};
}

const std::vector<std::string>& JavaScriptStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "child_process",
        "exec(",
        "spawn(",
        "fs.rm",
        "fs.unlink",
        "fs.writeFile",
        "process.kill"
    };
    return kPatterns;
}

EnvMap JavaScriptStrategy::EnvVars() const {
    return NodeEnv();
}

std::string TypeScriptStrategy::RequiredCommand() const {
#if defined(_WIN32)
    return "ts-node.cmd";
#else
    return "ts-node";
#endif
}

std::filesystem::path TypeScriptStrategy::Prepare(const std::string& code,
                                                  const std::filesystem::path& temp_dir) const {
    const auto path = UniqueArtifactPath(temp_dir, "script", Extension());
    WriteArtifact(path, code, "TS script");
    return path;
}

std::vector<std::string> TypeScriptStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    return {RequiredCommand(), prepared_path.string()};
}

const std::vector<std::string>& TypeScriptStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "child_process",
        "exec(",
        "Deno.run",
        "fs.rm",
        "fs.unlink"
    };
    return kPatterns;
}

EnvMap TypeScriptStrategy::EnvVars() const {
    return NodeEnv();
}

}  // namespace compass::languages
