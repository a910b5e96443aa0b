#include <gtest/gtest.h>

#include "languages/language_strategy.hpp"
#include "security/dependency_gate.hpp"
#include "security/safety_gate.hpp"

using compass::languages::LanguageStrategy;
using compass::security::DependencyGate;
using compass::security::SafetyGate;

TEST(SafetyGate, DetectsShellPattern) {
    const auto& patterns = LanguageStrategy::FromTag(std::string("bash")).DangerousPatterns();
    EXPECT_EQ(SafetyGate::Check("rm -rf /", patterns), std::optional<std::string>("rm -rf /"));
    EXPECT_EQ(SafetyGate::Check("ls -la", patterns), std::nullopt);
}

TEST(SafetyGate, ReportsFirstPatternInListOrder) {
    const std::vector<std::string> patterns = {"b", "a"};
    EXPECT_EQ(SafetyGate::Check("a then b", patterns), std::optional<std::string>("b"));
}

TEST(SafetyGate, PatternsArePerLanguage) {
    const auto& python = LanguageStrategy::FromTag(std::string("python")).DangerousPatterns();
    EXPECT_TRUE(SafetyGate::Check("import os\nos.system('ls')", python).has_value());
    EXPECT_FALSE(SafetyGate::Check("print('rm -rf /')", python).has_value());
}

TEST(DependencyGate, BuiltinsAreExempt) {
    EXPECT_EQ(DependencyGate::Validate("cd /tmp"), std::nullopt);
    EXPECT_EQ(DependencyGate::Validate("export A=1"), std::nullopt);
    EXPECT_EQ(DependencyGate::Validate("FOO=bar definitely-not-a-real-binary-xyz"), std::nullopt);
    EXPECT_EQ(DependencyGate::Validate("   "), std::nullopt);
}

TEST(DependencyGate, MissingBinaryIsReported) {
    const auto error = DependencyGate::Validate("definitely-not-a-real-binary-xyz --help");
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("definitely-not-a-real-binary-xyz"), std::string::npos);
}

TEST(DependencyGate, SudoIsSkipped) {
    EXPECT_TRUE(DependencyGate::Validate("sudo definitely-not-a-real-binary-xyz").has_value());
    EXPECT_EQ(DependencyGate::Validate("sudo sh -c true"), std::nullopt);
}

TEST(DependencyGate, ValidateBinary) {
    EXPECT_EQ(DependencyGate::ValidateBinary("sh"), std::nullopt);
    const auto error = DependencyGate::ValidateBinary("definitely-not-a-real-binary-xyz");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(*error,
              "Missing dependency: 'definitely-not-a-real-binary-xyz' is not installed or not in PATH.");
}
