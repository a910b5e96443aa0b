#include "languages/strategies/scripting.hpp"

#include "utils/common.hpp"

namespace compass::languages {

std::filesystem::path PhpStrategy::Prepare(const std::string& code,
                                           const std::filesystem::path& temp_dir) const {
    const auto path = UniqueArtifactPath(temp_dir, "script", Extension());
    const auto content = compass::utils::StartsWith(code, "<?php") ? code : "<?php\n" + code;
    WriteArtifact(path, content, "PHP script");
    return path;
}

std::vector<std::string> PhpStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    return {RequiredCommand(), prepared_path.string()};
}

const std::vector<std::string>& PhpStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "exec(",
        "shell_exec",
        "system(",
        "passthru",
        "proc_open",
        "unlink("
    };
    return kPatterns;
}

std::filesystem::path RubyStrategy::Prepare(const std::string& code,
                                            const std::filesystem::path& temp_dir) const {
    const auto path = UniqueArtifactPath(temp_dir, "script", Extension());
    WriteArtifact(path, code, "Ruby script");
    return path;
}

std::vector<std::string> RubyStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    return {RequiredCommand(), prepared_path.string()};
}

const std::vector<std::string>& RubyStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "system(",
        "exec(",
        "`",
        "FileUtils.rm",
        "File.delete",
        "syscall"
    };
    return kPatterns;
}

}  // namespace compass::languages
