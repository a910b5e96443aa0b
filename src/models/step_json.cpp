#include "models/step_json.hpp"

#include <fstream>

#include "engine/command_assembler.hpp"

namespace compass::models {
namespace {

const char* ConditionKindToString(ConditionKind kind) {
    switch (kind) {
        case ConditionKind::Os:
            return "Os";
        case ConditionKind::EnvVarExists:
            return "EnvVarExists";
        case ConditionKind::FileExists:
            return "FileExists";
    }
    return "Os";
}

std::string ReadString(const nlohmann::json& data, const char* key) {
    if (data.contains(key) && data[key].is_string()) {
        return data[key].get<std::string>();
    }
    return {};
}

std::optional<Condition> ConditionFromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        return std::nullopt;
    }
    for (const auto kind : {ConditionKind::Os, ConditionKind::EnvVarExists, ConditionKind::FileExists}) {
        const auto* key = ConditionKindToString(kind);
        if (data.contains(key) && data[key].is_string()) {
            return Condition{kind, data[key].get<std::string>()};
        }
    }
    return std::nullopt;
}

CodeBlock CodeBlockFromJson(const nlohmann::json& item) {
    CodeBlock block{};
    if (item.contains("language") && item["language"].is_string()) {
        block.language = item["language"].get<std::string>();
    }
    block.content = ReadString(item, "content");
    if (item.contains("placeholders") && item["placeholders"].is_array()) {
        for (const auto& name : item["placeholders"]) {
            if (name.is_string()) {
                block.placeholders.push_back(name.get<std::string>());
            }
        }
    } else {
        block.placeholders = compass::engine::CommandAssembler::ExtractPlaceholders(block.content);
    }
    return block;
}

}  // namespace

nlohmann::json StepToJson(const Step& step) {
    nlohmann::json entry;
    entry["title"] = step.title;
    entry["description"] = step.description;
    entry["code_blocks"] = nlohmann::json::array();
    for (const auto& block : step.code_blocks) {
        nlohmann::json json_block;
        json_block["language"] = block.language.has_value() ? nlohmann::json(*block.language)
                                                            : nlohmann::json(nullptr);
        json_block["content"] = block.content;
        json_block["placeholders"] = block.placeholders;
        entry["code_blocks"].push_back(json_block);
    }
    entry["status"] = ToString(step.status);
    entry["output"] = step.output;
    if (step.condition.has_value()) {
        entry["condition"] = {{ConditionKindToString(step.condition->kind), step.condition->value}};
    } else {
        entry["condition"] = nullptr;
    }
    return entry;
}

nlohmann::json StepsToJson(const std::vector<Step>& steps) {
    nlohmann::json data = nlohmann::json::array();
    for (const auto& step : steps) {
        data.push_back(StepToJson(step));
    }
    return data;
}

Step StepFromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw StepFileError("step entry is not an object");
    }
    Step step{};
    step.title = ReadString(data, "title");
    step.description = ReadString(data, "description");
    if (data.contains("code_blocks") && data["code_blocks"].is_array()) {
        for (const auto& item : data["code_blocks"]) {
            if (item.is_object()) {
                step.code_blocks.push_back(CodeBlockFromJson(item));
            }
        }
    }
    if (data.contains("status") && data["status"].is_string()) {
        step.status = StepStatusFromString(data["status"].get<std::string>());
    }
    step.output = ReadString(data, "output");
    if (data.contains("condition")) {
        step.condition = ConditionFromJson(data["condition"]);
    }
    return step;
}

std::vector<Step> StepsFromJson(const nlohmann::json& data) {
    const auto* array = &data;
    if (data.is_object() && data.contains("steps")) {
        array = &data["steps"];
    }
    if (!array->is_array()) {
        throw StepFileError("expected an array of steps");
    }
    std::vector<Step> steps;
    steps.reserve(array->size());
    for (const auto& item : *array) {
        steps.push_back(StepFromJson(item));
    }
    return steps;
}

std::vector<Step> LoadStepsFromFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw StepFileError("Failed to read file: " + path.string());
    }
    nlohmann::json data;
    try {
        input >> data;
    } catch (const nlohmann::json::exception& ex) {
        throw StepFileError("Failed to parse " + path.string() + ": " + ex.what());
    }
    return StepsFromJson(data);
}

}  // namespace compass::models
