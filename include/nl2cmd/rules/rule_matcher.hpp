// Exact phrase rules: fixed request phrases mapped to one command per OS family.
#pragma once
#include <nl2cmd/util/os_family.hpp>
#include <string>
#include <vector>

namespace nl2cmd::rules {

struct PhraseRule {
    std::vector<std::string> phrases;   // any substring hit selects the rule
    std::string windows_command;
    std::string linux_command;
    std::string description;
};

class RuleMatcher {
public:
    RuleMatcher();

    // Command for the first matching rule, or a no-op `echo "..."` placeholder.
    std::string match(const std::string& request, OsFamily os) const;
    const PhraseRule* find_rule(const std::string& request) const;

    static bool is_placeholder(const std::string& command);

    const std::vector<PhraseRule>& rules() const { return m_rules; }

private:
    std::vector<PhraseRule> m_rules;
};

} // namespace nl2cmd::rules
