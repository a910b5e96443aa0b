#include "languages/strategies/shell.hpp"

#include "utils/common.hpp"

namespace compass::languages {

bool ShellStrategy::IsPowerShell() const {
#if defined(_WIN32)
    if (flavor == ShellFlavor::Default) {
        return true;
    }
#endif
    return flavor == ShellFlavor::PowerShell;
}

bool ShellStrategy::IsCmd() const {
    return flavor == ShellFlavor::Cmd;
}

std::string ShellStrategy::RequiredCommand() const {
    if (IsPowerShell()) {
        return "powershell";
    }
    switch (flavor) {
        case ShellFlavor::Cmd:
            return "cmd";
        case ShellFlavor::Bash:
            return "bash";
        case ShellFlavor::Zsh:
            return "zsh";
        case ShellFlavor::Fish:
            return "fish";
        case ShellFlavor::Sh:
        case ShellFlavor::Default:
        case ShellFlavor::PowerShell:
            break;
    }
    return "sh";
}

std::string ShellStrategy::Extension() const {
    if (IsPowerShell()) {
        return "ps1";
    }
    if (IsCmd()) {
        return "bat";
    }
    return "sh";
}

std::filesystem::path ShellStrategy::Prepare(const std::string& code,
                                             const std::filesystem::path& temp_dir) const {
    const auto path = UniqueArtifactPath(temp_dir, "script", Extension());
    WriteArtifact(path, code, "shell script");
    return path;
}

std::vector<std::string> ShellStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    const auto command = RequiredCommand();
    if (IsPowerShell()) {
        return {command, "-ExecutionPolicy", "Bypass", "-File", prepared_path.string()};
    }
    if (IsCmd()) {
        return {command, "/C", prepared_path.string()};
    }
#if defined(_WIN32)
    // sh-compatible shells on Windows expect forward slashes.
    return {command, compass::utils::ReplaceAll(prepared_path.string(), "\\", "/")};
#else
    return {command, prepared_path.string()};
#endif
}

const std::vector<std::string>& ShellStrategy::DangerousPatterns() const {
    static const std::vector<std::string> kPatterns = {
        "rm -rf /",
        "rm -rf *",
        "mkfs",
        "> /dev/sd",
        "dd if=",
        ":(){:|:&};:",
        "mv /",
        "chmod -R 777 /"
    };
    return kPatterns;
}

}  // namespace compass::languages
