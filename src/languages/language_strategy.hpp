#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "languages/artifact.hpp"
#include "languages/strategies/compiled.hpp"
#include "languages/strategies/javascript.hpp"
#include "languages/strategies/python.hpp"
#include "languages/strategies/scripting.hpp"
#include "languages/strategies/shell.hpp"

namespace compass::languages {

// Uniform front for the per-language strategies. Stateless: build a fresh one
// from the code block's tag for every call.
class LanguageStrategy {
public:
    using Variant = std::variant<
        ShellStrategy,
        PythonStrategy,
        JavaScriptStrategy,
        TypeScriptStrategy,
        GoStrategy,
        RustStrategy,
        CSharpStrategy,
        PhpStrategy,
        RubyStrategy>;

    // Unknown or missing tags select the default shell.
    static LanguageStrategy FromTag(const std::optional<std::string>& tag);
    // True for a missing tag or an explicit shell-family tag.
    static bool IsShellTag(const std::optional<std::string>& tag);
    static std::string NormalizeTag(const std::string& tag);

    std::string RequiredCommand() const;
    // Throws PrepareError on I/O or scaffolding failure.
    std::filesystem::path Prepare(const std::string& source, const std::filesystem::path& temp_dir) const;
    std::vector<std::string> RunCommand(const std::filesystem::path& prepared_path) const;
    const std::vector<std::string>& DangerousPatterns() const;
    EnvMap EnvVars() const;
    std::string Extension() const;
    void Cleanup(const std::filesystem::path& prepared_path) const;

    bool IsShell() const { return std::holds_alternative<ShellStrategy>(strategy_); }
    // sh, powershell and cmd are what the fallback resolves to; they say
    // nothing about what a document actually needs installed.
    bool IsGenericShell() const;

    const Variant& Get() const { return strategy_; }

private:
    explicit LanguageStrategy(Variant strategy) : strategy_(std::move(strategy)) {}

    Variant strategy_;
};

}  // namespace compass::languages
