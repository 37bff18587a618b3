/*
 * Intent / parameter extraction - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nl2cmd/text/patterns.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::templ {

struct EntityRef {
    std::string type;           // "folder" | "file"
    std::string name;
};

// "folder X with file Y" / "file Y in folder X"
struct NestedOperation {
    EntityRef parent;
    EntityRef child;
};

struct Analysis {
    std::string query;
    std::optional<std::string> intent;          // git_* or create/delete/rename/...
    std::optional<std::string> action;          // verb that selected the intent ("git" for git intents)
    std::vector<std::string> targets;           // file, folder, process, service, user
    std::map<std::string, std::string> parameters;
    std::optional<NestedOperation> nested;

    bool is_git() const { return intent && intent->rfind("git_", 0) == 0; }
};

class ParameterExtractor {
public:
    ParameterExtractor();

    Analysis analyze(const std::string& query) const;

    std::map<std::string, std::string> extract_parameters(const std::string& query) const;
    std::optional<NestedOperation> extract_nested(const std::string& query) const;
    std::optional<std::string> detect_git_intent(const std::string& query_lower) const;

private:
    struct VerbTable { std::string name; std::vector<std::string> words; };

    std::vector<text::PatternFamily> m_families;
    std::vector<text::LabeledPatterns> m_git_intents;
    std::vector<VerbTable> m_intents;
    std::vector<VerbTable> m_targets;
    std::regex m_nested_folder_first;
    std::regex m_nested_file_first;
};

} // namespace nl2cmd::templ
