#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "engine/execution_state.hpp"
#include "languages/language_strategy.hpp"
#include "models/step_types.hpp"

namespace compass::engine {

using OutputSink = std::function<void(const std::string&)>;

inline constexpr unsigned short kPtyRows = 24;
inline constexpr unsigned short kPtyCols = 80;
inline constexpr std::size_t kReadChunkSize = 4096;
inline constexpr const char* kContainerWorkspace = "/workspace";
inline constexpr const char* kContainerTempDir = "/tmp/compass";

// Final process invocation for one prepared artifact.
struct Invocation {
    std::vector<std::string> argv;
    std::filesystem::path working_dir;
    // Entries layered over the inherited environment of the spawned process.
    std::map<std::string, std::string> env;
};

// One pty-backed execution: prepare, spawn, stream, wait, clean up.
class ProcessSession {
public:
    explicit ProcessSession(ExecutionState state);

    // Never throws. Failures are reported as one line on the sink and a
    // Failed status.
    compass::models::StepStatus Run(const std::string& content,
                                    const std::optional<std::string>& language,
                                    const OutputSink& sink) const;

    // Direct invocation, or the container-wrapped one when sandboxing is on.
    static Invocation BuildInvocation(const ExecutionState& state,
                                      const compass::languages::LanguageStrategy& strategy,
                                      const std::filesystem::path& prepared_path);

    // State env first, strategy env on top.
    static std::map<std::string, std::string> MergeEnvironment(
        const ExecutionState& state,
        const compass::languages::LanguageStrategy& strategy);

private:
    ExecutionState state_;
};

}  // namespace compass::engine
