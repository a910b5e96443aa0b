#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "languages/artifact.hpp"

namespace compass::languages {

// Source not starting with "<?php" gets the open tag prepended.
struct PhpStrategy {
    std::string RequiredCommand() const { return "php"; }
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const { return {}; }
    std::string Extension() const { return "php"; }
    void Cleanup(const std::filesystem::path& prepared_path) const { RemoveArtifact(prepared_path); }
};

struct RubyStrategy {
    std::string RequiredCommand() const { return "ruby"; }
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const { return {}; }
    std::string Extension() const { return "rb"; }
    void Cleanup(const std::filesystem::path& prepared_path) const { RemoveArtifact(prepared_path); }
};

}  // namespace compass::languages
