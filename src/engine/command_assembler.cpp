#include "engine/command_assembler.hpp"

#include <algorithm>
#include <regex>

#include "utils/common.hpp"

namespace compass::engine {
namespace {

void AddUnique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

}  // namespace

std::vector<std::string> CommandAssembler::GetRequiredPlaceholders(const compass::models::Step& step) {
    std::vector<std::string> placeholders;
    for (const auto& block : step.code_blocks) {
        for (const auto& name : block.placeholders) {
            AddUnique(placeholders, name);
        }
    }
    return placeholders;
}

std::string CommandAssembler::BuildCommand(const compass::models::Step& step, const VariableStore& variables) {
    std::string content;
    for (const auto& block : step.code_blocks) {
        auto block_content = block.content;
        for (const auto& [key, value] : variables) {
            block_content = compass::utils::ReplaceAll(block_content, "<" + key + ">", value);
            block_content = compass::utils::ReplaceAll(block_content, "{{" + key + "}}", value);
        }
        content += block_content;
        content += "\n";
    }
    return content;
}

std::vector<std::string> CommandAssembler::ExtractPlaceholders(const std::string& text) {
    static const std::regex kPattern(R"(\{\{([A-Za-z0-9_-]+)\}\}|<([A-Za-z0-9_-]+)>)");
    std::vector<std::string> names;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), kPattern); it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        AddUnique(names, match[1].matched ? match[1].str() : match[2].str());
    }
    return names;
}

}  // namespace compass::engine
