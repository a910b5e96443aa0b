#include "languages/strategies/compiled.hpp"

#include <boost/process.hpp>
#include <iterator>
#include <sstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace compass::languages {
namespace bp = boost::process;

std::filesystem::path GoStrategy::Prepare(const std::string& code,
                                          const std::filesystem::path& temp_dir) const {
    const auto path = UniqueArtifactPath(temp_dir, "main", Extension());
    const auto content = compass::utils::Contains(code, "package main")
                             ? code
                             : "package main\n\n" + code;
    WriteArtifact(path, content, "Go script");
    return path;
}

std::vector<std::string> GoStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    return {RequiredCommand(), "run", prepared_path.string()};
}

const std::vector<std::string>& GoStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "os/exec",
        "os.Remove",
        "syscall.Exec",
        "os.RemoveAll"
    };
    return kPatterns;
}

std::filesystem::path RustStrategy::BinaryPath(const std::filesystem::path& prepared_path) {
    auto output = prepared_path;
    output.replace_extension("exe");
    return output;
}

std::filesystem::path RustStrategy::Prepare(const std::string& code,
                                            const std::filesystem::path& temp_dir) const {
    const auto path = UniqueArtifactPath(temp_dir, "script", Extension());
    const auto content = compass::utils::Contains(code, "fn main")
                             ? code
                             : "fn main() {\n" + code + "\n}";
    WriteArtifact(path, content, "Rust script");
    return path;
}

std::vector<std::string> RustStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    const auto source = prepared_path.string();
    const auto binary = BinaryPath(prepared_path).string();
    std::ostringstream script;
#if defined(_WIN32)
    script << "rustc \"" << source << "\" -o \"" << binary << "\"; if ($?) { & \"" << binary << "\" }";
    return {"powershell", "-Command", script.str()};
#else
    script << "rustc \"" << source << "\" -o \"" << binary << "\" && \"" << binary << "\"";
    return {"sh", "-c", script.str()};
#endif
}

const std::vector<std::string>& RustStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "std::process",
        "std::fs::remove",
        "Command::new"
    };
    return kPatterns;
}

void RustStrategy::Cleanup(const std::filesystem::path& prepared_path) const {
    RemoveArtifact(prepared_path);
    RemoveArtifact(BinaryPath(prepared_path));
}

std::filesystem::path CSharpStrategy::Prepare(const std::string& code,
                                              const std::filesystem::path& temp_dir) const {
    const auto project_dir = temp_dir / ("compass_cs_" + GenerateArtifactId());
    std::error_code ec;
    std::filesystem::create_directories(project_dir, ec);
    if (ec) {
        throw PrepareError("Failed to create " + project_dir.string() + ": " + ec.message());
    }

    const auto dotnet = bp::search_path(RequiredCommand());
    if (dotnet.empty()) {
        RemoveArtifact(project_dir);
        throw PrepareError("Failed to create .NET console project: dotnet not found");
    }

    std::string errors;
    int exit_code = -1;
    try {
        bp::ipstream error_stream;
        bp::child scaffold(
            dotnet,
            "new",
            "console",
            "--force",
            bp::start_dir = project_dir.string(),
            bp::std_out > bp::null,
            bp::std_err > error_stream);
        errors.assign(std::istreambuf_iterator<char>(error_stream), std::istreambuf_iterator<char>());
        scaffold.wait();
        exit_code = scaffold.exit_code();
    } catch (const bp::process_error& ex) {
        RemoveArtifact(project_dir);
        throw PrepareError(std::string("Failed to create .NET console project: ") + ex.what());
    }
    if (exit_code != 0) {
        compass::utils::Log(compass::utils::LogLevel::kWarn, "csharp", "scaffold failed",
                            {{"exit", std::to_string(exit_code)}});
        RemoveArtifact(project_dir);
        throw PrepareError("Failed to initialize C# project: " + errors);
    }

    // Top-level statements are valid as the whole of Program.cs.
    WriteArtifact(project_dir / "Program.cs", code, "C# code");
    return project_dir;
}

std::vector<std::string> CSharpStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    return {
        RequiredCommand(),
        "run",
        "--project",
        prepared_path.string(),
        "--verbosity",
        "quiet",
        "--nologo"
    };
}

const std::vector<std::string>& CSharpStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "System.Diagnostics.Process",
        "File.Delete",
        "Directory.Delete",
        "File.Move",
        "WebClient",
        "HttpClient"
    };
    return kPatterns;
}

EnvMap CSharpStrategy::EnvVars() const {
    return {
        {"CI", "true"},
        {"DOTNET_NOLOGO", "true"},
        {"DOTNET_CLI_TELEMETRY_OPTOUT", "true"}
    };
}

}  // namespace compass::languages
