#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "languages/artifact.hpp"
#include "models/step_json.hpp"

using namespace compass::models;

TEST(StepJson, ParsesStepsAndFillsPlaceholders) {
    const auto data = nlohmann::json::parse(R"({
        "steps": [
            {
                "title": "Install",
                "description": "deps",
                "code_blocks": [{"language": "bash", "content": "apt install <PKG> {{VERSION}}"}],
                "condition": {"Os": "linux"}
            },
            {"title": "Notes", "code_blocks": []}
        ]
    })");
    const auto steps = StepsFromJson(data);
    ASSERT_EQ(steps.size(), 2u);
    EXPECT_EQ(steps[0].title, "Install");
    EXPECT_EQ(steps[0].status, StepStatus::Pending);
    ASSERT_EQ(steps[0].code_blocks.size(), 1u);
    EXPECT_EQ(steps[0].code_blocks[0].language, std::optional<std::string>("bash"));
    EXPECT_EQ(steps[0].code_blocks[0].placeholders, (std::vector<std::string>{"PKG", "VERSION"}));
    ASSERT_TRUE(steps[0].condition.has_value());
    EXPECT_EQ(steps[0].condition->kind, ConditionKind::Os);
    EXPECT_EQ(steps[0].condition->value, "linux");
    EXPECT_TRUE(steps[0].IsExecutable());
    EXPECT_FALSE(steps[1].IsExecutable());
    EXPECT_FALSE(steps[1].condition.has_value());
}

TEST(StepJson, SerializesStatusAndCondition) {
    Step step;
    step.title = "t";
    step.status = StepStatus::Failed;
    step.condition = Condition::EnvVarExists("HOME");
    step.code_blocks.push_back(CodeBlock{std::nullopt, "ls", {}});
    const auto json = StepToJson(step);
    EXPECT_EQ(json["status"], "Failed");
    EXPECT_EQ(json["condition"]["EnvVarExists"], "HOME");
    EXPECT_TRUE(json["code_blocks"][0]["language"].is_null());
}

TEST(StepJson, RejectsNonArray) {
    EXPECT_THROW(StepsFromJson(nlohmann::json::parse(R"({"title": "x"})")), StepFileError);
}

TEST(StepJson, IgnoresFieldsOfTheWrongType) {
    const auto steps = StepsFromJson(nlohmann::json::parse(R"([
        {"title": 5, "description": [], "output": {}, "code_blocks": [{"content": 1}]}
    ])"));
    ASSERT_EQ(steps.size(), 1u);
    EXPECT_EQ(steps[0].title, "");
    EXPECT_EQ(steps[0].description, "");
    EXPECT_EQ(steps[0].output, "");
    ASSERT_EQ(steps[0].code_blocks.size(), 1u);
    EXPECT_EQ(steps[0].code_blocks[0].content, "");
    EXPECT_FALSE(steps[0].IsExecutable());
}

TEST(StepJson, LoadFromFileReportsErrors) {
    EXPECT_THROW(LoadStepsFromFile("/definitely/not/here.json"), StepFileError);

    const auto path = std::filesystem::temp_directory_path() /
                      ("compass_steps_" + compass::languages::GenerateArtifactId() + ".json");
    {
        std::ofstream output(path);
        output << "[{\"title\": ";
    }
    EXPECT_THROW(LoadStepsFromFile(path), StepFileError);
    std::filesystem::remove(path);
}
