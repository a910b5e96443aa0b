#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

namespace compass::engine {

inline constexpr const char* kDefaultDockerImage = "ubuntu:latest";
inline constexpr const char* kDefaultContainerRuntime = "docker";

// Session-wide execution context. Copied by value into every dispatched
// execution; only the caller's copy is authoritative.
struct ExecutionState {
    std::filesystem::path current_dir;
    std::unordered_map<std::string, std::string> env_vars;
    bool sandbox_enabled = false;
    std::string docker_image = kDefaultDockerImage;
    std::string container_runtime = kDefaultContainerRuntime;

    // current_dir starts at the process working directory.
    static ExecutionState FromCurrentProcess();
};

}  // namespace compass::engine
