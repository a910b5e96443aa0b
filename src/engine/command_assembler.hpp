#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "models/step_types.hpp"

namespace compass::engine {

using VariableStore = std::unordered_map<std::string, std::string>;

class CommandAssembler {
public:
    // Unique placeholder names over all code blocks, first-seen order.
    static std::vector<std::string> GetRequiredPlaceholders(const compass::models::Step& step);

    // Substitutes <NAME> and {{NAME}} in every block and joins the blocks,
    // each followed by '\n'. Unknown placeholders stay as literal text.
    static std::string BuildCommand(const compass::models::Step& step, const VariableStore& variables);

    // Names referenced as <NAME> or {{NAME}} in text, first-seen order.
    static std::vector<std::string> ExtractPlaceholders(const std::string& text);
};

}  // namespace compass::engine
