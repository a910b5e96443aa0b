#include <gtest/gtest.h>

#include <cctype>
#include <cstdlib>

#include "conditions/condition_evaluator.hpp"

using compass::conditions::StandardEvaluator;
using compass::models::Condition;

TEST(ConditionEvaluator, OsMatchesCaseInsensitively) {
    StandardEvaluator evaluator;
    const auto os = StandardEvaluator::CurrentOs();
    std::string upper = os;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    EXPECT_TRUE(evaluator.Evaluate(Condition::Os(os)));
    EXPECT_TRUE(evaluator.Evaluate(Condition::Os(upper)));
    EXPECT_FALSE(evaluator.Evaluate(Condition::Os("plan9")));
}

TEST(ConditionEvaluator, EnvVarExists) {
    StandardEvaluator evaluator;
    ::setenv("COMPASS_TEST_CONDITION_VAR", "1", 1);
    EXPECT_TRUE(evaluator.Evaluate(Condition::EnvVarExists("COMPASS_TEST_CONDITION_VAR")));
    ::unsetenv("COMPASS_TEST_CONDITION_VAR");
    EXPECT_FALSE(evaluator.Evaluate(Condition::EnvVarExists("COMPASS_TEST_CONDITION_VAR")));
}

TEST(ConditionEvaluator, FileExists) {
    StandardEvaluator evaluator;
    EXPECT_TRUE(evaluator.Evaluate(Condition::FileExists("/")));
    EXPECT_FALSE(evaluator.Evaluate(Condition::FileExists("/definitely/not/here")));
}
