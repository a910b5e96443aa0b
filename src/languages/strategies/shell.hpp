#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "languages/artifact.hpp"

namespace compass::languages {

enum class ShellFlavor {
    Default,
    Sh,
    Bash,
    Zsh,
    Fish,
    PowerShell,
    Cmd
};

struct ShellStrategy {
    ShellFlavor flavor = ShellFlavor::Default;

    std::string RequiredCommand() const;
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const { return {}; }
    std::string Extension() const;
    void Cleanup(const std::filesystem::path& prepared_path) const { RemoveArtifact(prepared_path); }

    bool IsPowerShell() const;
    bool IsCmd() const;
};

}  // namespace compass::languages
