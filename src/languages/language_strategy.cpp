#include "languages/language_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "utils/common.hpp"

namespace compass::languages {
namespace {

const std::unordered_map<std::string, LanguageStrategy::Variant>& TagTable() {
    static const std::unordered_map<std::string, LanguageStrategy::Variant> kTable = {
        {"sh", ShellStrategy{ShellFlavor::Sh}},
        {"shell", ShellStrategy{ShellFlavor::Bash}},
        {"bash", ShellStrategy{ShellFlavor::Bash}},
        {"zsh", ShellStrategy{ShellFlavor::Zsh}},
        {"fish", ShellStrategy{ShellFlavor::Fish}},
        {"powershell", ShellStrategy{ShellFlavor::PowerShell}},
        {"pwsh", ShellStrategy{ShellFlavor::PowerShell}},
        {"ps1", ShellStrategy{ShellFlavor::PowerShell}},
        {"cmd", ShellStrategy{ShellFlavor::Cmd}},
        {"batch", ShellStrategy{ShellFlavor::Cmd}},
        {"bat", ShellStrategy{ShellFlavor::Cmd}},
        {"python", PythonStrategy{}},
        {"python3", PythonStrategy{}},
        {"py", PythonStrategy{}},
        {"javascript", JavaScriptStrategy{}},
        {"js", JavaScriptStrategy{}},
        {"node", JavaScriptStrategy{}},
        {"typescript", TypeScriptStrategy{}},
        {"ts", TypeScriptStrategy{}},
        {"go", GoStrategy{}},
        {"golang", GoStrategy{}},
        {"rust", RustStrategy{}},
        {"rs", RustStrategy{}},
        {"csharp", CSharpStrategy{}},
        {"cs", CSharpStrategy{}},
        {"c#", CSharpStrategy{}},
        {"dotnet", CSharpStrategy{}},
        {"php", PhpStrategy{}},
        {"ruby", RubyStrategy{}},
        {"rb", RubyStrategy{}}
    };
    return kTable;
}

}  // namespace

std::string LanguageStrategy::NormalizeTag(const std::string& tag) {
    auto normalized = compass::utils::Trim(tag);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return normalized;
}

LanguageStrategy LanguageStrategy::FromTag(const std::optional<std::string>& tag) {
    if (tag.has_value()) {
        const auto& table = TagTable();
        auto it = table.find(NormalizeTag(*tag));
        if (it != table.end()) {
            return LanguageStrategy(it->second);
        }
    }
    return LanguageStrategy(ShellStrategy{ShellFlavor::Default});
}

bool LanguageStrategy::IsShellTag(const std::optional<std::string>& tag) {
    if (!tag.has_value()) {
        return true;
    }
    const auto& table = TagTable();
    auto it = table.find(NormalizeTag(*tag));
    return it != table.end() && std::holds_alternative<ShellStrategy>(it->second);
}

std::string LanguageStrategy::RequiredCommand() const {
    return std::visit([](const auto& strategy) { return strategy.RequiredCommand(); }, strategy_);
}

std::filesystem::path LanguageStrategy::Prepare(const std::string& source,
                                                const std::filesystem::path& temp_dir) const {
    return std::visit([&](const auto& strategy) { return strategy.Prepare(source, temp_dir); }, strategy_);
}

std::vector<std::string> LanguageStrategy::RunCommand(const std::filesystem::path& prepared_path) const {
    return std::visit([&](const auto& strategy) { return strategy.RunCommand(prepared_path); }, strategy_);
}

const std::vector<std::string>& LanguageStrategy::DangerousPatterns() const {
    return std::visit(
        [](const auto& strategy) -> const std::vector<std::string>& { return strategy.DangerousPatterns(); },
        strategy_);
}

EnvMap LanguageStrategy::EnvVars() const {
    return std::visit([](const auto& strategy) { return strategy.EnvVars(); }, strategy_);
}

std::string LanguageStrategy::Extension() const {
    return std::visit([](const auto& strategy) { return strategy.Extension(); }, strategy_);
}

void LanguageStrategy::Cleanup(const std::filesystem::path& prepared_path) const {
    std::visit([&](const auto& strategy) { strategy.Cleanup(prepared_path); }, strategy_);
}

bool LanguageStrategy::IsGenericShell() const {
    const auto command = RequiredCommand();
    return command == "sh" || command == "powershell" || command == "cmd";
}

}  // namespace compass::languages
