#include "languages/strategies/python.hpp"

namespace compass::languages {

std::string PythonStrategy::RequiredCommand() const {
#if defined(_WIN32)
    return "python";
#else
    return "python3";
#endif
}

std::filesystem::path PythonStrategy::Prepare(const std::string& code,
                                              const std::filesystem::path& temp_dir) const {
    const auto path = UniqueArtifactPath(temp_dir, "script", Extension());
    WriteArtifact(path, code, "python script");
    return path;
}

std::vector<std::string> PythonStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    return {RequiredCommand(), prepared_path.string()};
}

const std::vector<std::string>& PythonStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "os.system",
        "subprocess.call",
        "subprocess.run",
        "subprocess.Popen",
        "shutil.rmtree",
        "exec(",
        "eval(",
        "__import__"
    };
    return kPatterns;
}

}  // namespace compass::languages
