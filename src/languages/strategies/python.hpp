#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "languages/artifact.hpp"

namespace compass::languages {

struct PythonStrategy {
    std::string RequiredCommand() const;
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const { return {{"PYTHONUNBUFFERED", "1"}}; }
    std::string Extension() const { return "py"; }
    void Cleanup(const std::filesystem::path& prepared_path) const { RemoveArtifact(prepared_path); }
};

}  // namespace compass::languages
