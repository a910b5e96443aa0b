#include "infrastructure/container_runtime.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/process.hpp>
#include <system_error>
#include <vector>

#include "utils/logging.hpp"

namespace compass::infrastructure {
namespace bp = boost::process;

namespace {

// Exit code of `<executable> <argument>` with all output discarded, or -1
// when it could not be run.
int Probe(const boost::filesystem::path& executable, const std::string& argument) {
    std::error_code ec;
    const int code = bp::system(bp::exe = executable, bp::args = std::vector<std::string>{argument},
                                bp::std_out > bp::null, bp::std_err > bp::null,
                                bp::std_in < bp::null, ec);
    if (ec) {
        compass::utils::Log(compass::utils::LogLevel::kDebug, "runtime", "probe failed",
                            {{"exe", executable.string()}, {"arg", argument}, {"error", ec.message()}});
        return -1;
    }
    return code;
}

}  // namespace

std::optional<std::string> EnsureRuntimeAvailable(const std::string& runtime) {
    const auto executable = bp::search_path(runtime);
    if (executable.empty()) {
        return runtime + " is not installed or not in PATH.\n"
                         "Sandbox mode requires a container runtime to isolate execution.";
    }
    if (Probe(executable, "info") == 0) {
        return std::nullopt;
    }
    if (Probe(executable, "--version") == 0) {
        return runtime + " is installed but its daemon is not running. "
                         "Start it and try again.";
    }
    return runtime + " is installed but not responding.";
}

}  // namespace compass::infrastructure
