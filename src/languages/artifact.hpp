#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace compass::languages {

using EnvMap = std::unordered_map<std::string, std::string>;

// I/O or tooling failure while materialising source for one execution.
class PrepareError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 32 lowercase hex characters, fresh for every call.
std::string GenerateArtifactId();

// Builds "<temp_dir>/<prefix>_<id>.<extension>".
std::filesystem::path UniqueArtifactPath(const std::filesystem::path& temp_dir,
                                         const std::string& prefix,
                                         const std::string& extension);

// Writes content, throwing PrepareError("Failed to write <what> to <path>").
void WriteArtifact(const std::filesystem::path& path,
                   const std::string& content,
                   const std::string& what);

// Best-effort removal of a file or directory tree.
void RemoveArtifact(const std::filesystem::path& path);

}  // namespace compass::languages
