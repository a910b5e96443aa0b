#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "models/step_types.hpp"
#include "nlohmann/json.hpp"

namespace compass::models {

class StepFileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Wire format matches the document parser's export: snake_case fields,
// status as "Pending"/"Running"/..., condition as {"Os": "linux"}.
nlohmann::json StepToJson(const Step& step);
nlohmann::json StepsToJson(const std::vector<Step>& steps);
Step StepFromJson(const nlohmann::json& data);
std::vector<Step> StepsFromJson(const nlohmann::json& data);

// Throws StepFileError when the file cannot be read or is not a step array.
std::vector<Step> LoadStepsFromFile(const std::filesystem::path& path);

}  // namespace compass::models
