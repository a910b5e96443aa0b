#pragma once

#include <string>
#include <unordered_map>

namespace compass::config {

struct SandboxConfig {
    bool enabled = false;
    std::string image = "ubuntu:latest";
    std::string runtime = "docker";
};

struct ExecutionConfig {
    bool bypass_safety = false;
    // Empty means the process working directory.
    std::string working_dir;
};

struct HooksConfig {
    std::string pre_run;
    std::string post_run;
    std::string on_success;
    std::string on_failure;
    bool trusted = false;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    ExecutionConfig execution;
    HooksConfig hooks;
    LoggingConfig logging;
    // Default placeholder values, overridden by --var on the command line.
    std::unordered_map<std::string, std::string> variables;
};

}  // namespace compass::config
