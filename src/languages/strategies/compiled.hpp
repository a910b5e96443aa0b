#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "languages/artifact.hpp"

namespace compass::languages {

// Go source lacking "package main" gets it prepended verbatim.
struct GoStrategy {
    std::string RequiredCommand() const { return "go"; }
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const { return {{"GO111MODULE", "auto"}}; }
    std::string Extension() const { return "go"; }
    void Cleanup(const std::filesystem::path& prepared_path) const { RemoveArtifact(prepared_path); }
};

// Compiles with rustc next to the source and runs the binary in one shell
// invocation. Source lacking "fn main" is wrapped in a main function.
struct RustStrategy {
    std::string RequiredCommand() const { return "rustc"; }
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const { return {}; }
    std::string Extension() const { return "rs"; }
    void Cleanup(const std::filesystem::path& prepared_path) const;

    static std::filesystem::path BinaryPath(const std::filesystem::path& prepared_path);
};

// Scaffolds a console project with "dotnet new console" and overwrites
// Program.cs; the prepared artifact is the project directory.
struct CSharpStrategy {
    std::string RequiredCommand() const { return "dotnet"; }
    std::filesystem::path Prepare(const std::string& code, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const;
    std::string Extension() const { return "cs"; }
    void Cleanup(const std::filesystem::path& prepared_path) const { RemoveArtifact(prepared_path); }
};

}  // namespace compass::languages
