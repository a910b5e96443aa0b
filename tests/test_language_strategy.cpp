#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "languages/language_strategy.hpp"

using compass::languages::LanguageStrategy;

namespace {

std::string ReadAll(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

}  // namespace

TEST(LanguageStrategy, UnknownOrMissingTagFallsBackToShell) {
    EXPECT_TRUE(LanguageStrategy::FromTag(std::nullopt).IsShell());
    EXPECT_TRUE(LanguageStrategy::FromTag(std::string("brainfuck")).IsShell());
#if !defined(_WIN32)
    EXPECT_EQ(LanguageStrategy::FromTag(std::nullopt).RequiredCommand(), "sh");
#endif
}

TEST(LanguageStrategy, TagLookupIsNormalized) {
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("  Python ")).RequiredCommand(),
              LanguageStrategy::FromTag(std::string("py")).RequiredCommand());
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("JS")).RequiredCommand(), "node");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("golang")).RequiredCommand(), "go");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("rs")).RequiredCommand(), "rustc");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("C#")).RequiredCommand(), "dotnet");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("rb")).RequiredCommand(), "ruby");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("shell")).RequiredCommand(), "bash");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("zsh")).RequiredCommand(), "zsh");
}

TEST(LanguageStrategy, ShellTagClassification) {
    EXPECT_TRUE(LanguageStrategy::IsShellTag(std::nullopt));
    EXPECT_TRUE(LanguageStrategy::IsShellTag(std::string("bash")));
    EXPECT_TRUE(LanguageStrategy::IsShellTag(std::string("PowerShell")));
    EXPECT_FALSE(LanguageStrategy::IsShellTag(std::string("python")));
    EXPECT_FALSE(LanguageStrategy::IsShellTag(std::string("unknown-lang")));
}

TEST(LanguageStrategy, GenericShellOnlyForFallbacks) {
    EXPECT_TRUE(LanguageStrategy::FromTag(std::string("sh")).IsGenericShell());
    EXPECT_TRUE(LanguageStrategy::FromTag(std::string("cmd")).IsGenericShell());
    EXPECT_FALSE(LanguageStrategy::FromTag(std::string("bash")).IsGenericShell());
    EXPECT_FALSE(LanguageStrategy::FromTag(std::string("go")).IsGenericShell());
}

TEST(LanguageStrategy, ShellArtifactKeepsContent) {
    const auto strategy = LanguageStrategy::FromTag(std::string("bash"));
    const auto path = strategy.Prepare("echo hi\n", std::filesystem::temp_directory_path());
    EXPECT_EQ(path.extension(), ".sh");
    EXPECT_EQ(ReadAll(path), "echo hi\n");
    const auto argv = strategy.RunCommand(path);
    ASSERT_EQ(argv.size(), 2u);
    EXPECT_EQ(argv[0], "bash");
    strategy.Cleanup(path);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(LanguageStrategy, ArtifactPathsAreUnique) {
    const auto strategy = LanguageStrategy::FromTag(std::string("python"));
    const auto temp_dir = std::filesystem::temp_directory_path();
    const auto first = strategy.Prepare("print(1)", temp_dir);
    const auto second = strategy.Prepare("print(1)", temp_dir);
    EXPECT_NE(first, second);
    EXPECT_EQ(first.extension(), ".py");
    strategy.Cleanup(first);
    strategy.Cleanup(second);
}

TEST(LanguageStrategy, GoSourceGetsPackageClause) {
    const auto strategy = LanguageStrategy::FromTag(std::string("go"));
    const auto temp_dir = std::filesystem::temp_directory_path();
    const auto wrapped = strategy.Prepare("func main() {}", temp_dir);
    EXPECT_EQ(ReadAll(wrapped), "package main\n\nfunc main() {}");
    EXPECT_EQ(wrapped.filename().string().rfind("main_", 0), 0u);
    const auto untouched = strategy.Prepare("package main\nfunc main() {}", temp_dir);
    EXPECT_EQ(ReadAll(untouched), "package main\nfunc main() {}");
    EXPECT_EQ(strategy.RunCommand(wrapped)[1], "run");
    EXPECT_EQ(strategy.EnvVars().at("GO111MODULE"), "auto");
    strategy.Cleanup(wrapped);
    strategy.Cleanup(untouched);
}

TEST(LanguageStrategy, RustSourceGetsMainWrapper) {
    const auto strategy = LanguageStrategy::FromTag(std::string("rust"));
    const auto path = strategy.Prepare("println!(\"hi\");", std::filesystem::temp_directory_path());
    EXPECT_EQ(ReadAll(path), "fn main() {\nprintln!(\"hi\");\n}");
    const auto argv = strategy.RunCommand(path);
    ASSERT_FALSE(argv.empty());
    EXPECT_NE(argv.back().find("rustc"), std::string::npos);
    EXPECT_NE(argv.back().find(path.string()), std::string::npos);
    strategy.Cleanup(path);
}

TEST(LanguageStrategy, PhpSourceGetsOpeningTag) {
    const auto strategy = LanguageStrategy::FromTag(std::string("php"));
    const auto temp_dir = std::filesystem::temp_directory_path();
    const auto wrapped = strategy.Prepare("echo 1;", temp_dir);
    EXPECT_EQ(ReadAll(wrapped), "<?php\necho 1;");
    const auto untouched = strategy.Prepare("<?php echo 1;", temp_dir);
    EXPECT_EQ(ReadAll(untouched), "<?php echo 1;");
    strategy.Cleanup(wrapped);
    strategy.Cleanup(untouched);
}

TEST(LanguageStrategy, EnvironmentInjection) {
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("node")).EnvVars().at("CI"), "true");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("ts")).EnvVars().at("NO_UPDATE_NOTIFIER"), "1");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("csharp")).EnvVars().at("DOTNET_NOLOGO"), "true");
    EXPECT_EQ(LanguageStrategy::FromTag(std::string("python")).EnvVars().at("PYTHONUNBUFFERED"), "1");
    EXPECT_TRUE(LanguageStrategy::FromTag(std::string("ruby")).EnvVars().empty());
}
