#include "checker/dependency_checker.hpp"

#include <unordered_set>

#include "languages/language_strategy.hpp"
#include "security/dependency_gate.hpp"
#include "utils/common.hpp"

namespace compass::checker {
namespace {

const std::unordered_set<std::string>& ShellKeywords() {
    static const std::unordered_set<std::string> kKeywords = {
        "cd", "echo", "printf", "export", "unset", "set", "alias", "unalias", "source", ".",
        "eval", "exec", "exit", "return", "true", "false", "test", "[", "[[", "read", "wait",
        "bg", "fg", "jobs", "kill", "history", "pwd", "pushd", "popd", "dirs", "shift", "umask",
        "if", "then", "else", "elif", "fi", "for", "while", "until", "do", "done", "case",
        "esac", "function", "select", "break", "continue"
    };
    return kKeywords;
}

std::vector<std::string> SplitSegments(const std::string& line) {
    std::vector<std::string> segments;
    std::string current;
    for (const char ch : line) {
        if (ch == '&' || ch == '|' || ch == ';') {
            segments.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    segments.push_back(current);
    return segments;
}

void CollectFromShell(const std::string& content, std::set<std::string>& candidates) {
    for (const auto& raw_line : compass::utils::SplitLines(content)) {
        const auto line = compass::utils::Trim(raw_line);
        if (line.empty() || line.front() == '#') {
            continue;
        }
        for (const auto& segment : SplitSegments(line)) {
            const auto words = compass::utils::SplitWhitespace(segment);
            if (words.empty() || words[0].find('=') != std::string::npos) {
                continue;
            }
            std::string target = words[0];
            if (target == "sudo") {
                target = words.size() > 1 ? words[1] : std::string();
            }
            if (target.empty()) {
                continue;
            }
            if (target.find('/') != std::string::npos || target.find('\\') != std::string::npos ||
                target.front() == '$' || ShellKeywords().count(target) > 0) {
                continue;
            }
            candidates.insert(target);
        }
    }
}

}  // namespace

std::set<std::string> CollectCandidates(const std::vector<compass::models::Step>& steps) {
    using compass::languages::LanguageStrategy;
    std::set<std::string> candidates;
    for (const auto& step : steps) {
        for (const auto& block : step.code_blocks) {
            if (LanguageStrategy::IsShellTag(block.language)) {
                CollectFromShell(block.content, candidates);
                continue;
            }
            const auto strategy = LanguageStrategy::FromTag(block.language);
            if (!strategy.IsGenericShell()) {
                candidates.insert(strategy.RequiredCommand());
            }
        }
    }
    return candidates;
}

CheckResult Partition(const std::set<std::string>& candidates, const BinaryResolver& resolver) {
    CheckResult result;
    // std::set iterates in ascending order, so both lists come out sorted.
    for (const auto& name : candidates) {
        if (resolver(name)) {
            result.present.push_back(name);
        } else {
            result.missing.push_back(name);
        }
    }
    return result;
}

CheckResult CheckDependencies(const std::vector<compass::models::Step>& steps) {
    return Partition(CollectCandidates(steps), [](const std::string& name) {
        return compass::security::DependencyGate::IsOnSearchPath(name);
    });
}

}  // namespace compass::checker
