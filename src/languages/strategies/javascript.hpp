#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "languages/artifact.hpp"

namespace compass::languages {

struct JavaScriptStrategy {
    std::string RequiredCommand() const { return "node"; }
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const;
    std::string Extension() const { return "js"; }
    void Cleanup(const std::filesystem::path& prepared_path) const { RemoveArtifact(prepared_path); }
};

struct TypeScriptStrategy {
    std::string RequiredCommand() const;
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const;
    std::string Extension() const { return "ts"; }
    void Cleanup(const std::filesystem::path& prepared_path) const { RemoveArtifact(prepared_path); }
};

}  // namespace compass::languages
