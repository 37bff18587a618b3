#include <nl2cmd/text/patterns.hpp>

namespace nl2cmd::text {

std::regex icase(const char* re) { return std::regex(re, std::regex::ECMAScript | std::regex::icase); }

PatternRule rule(const char* re, int group) { return PatternRule{icase(re), group}; }

std::optional<std::string> first_match(const std::string& text, const PatternFamily& family) {
    for (auto& r : family.rules) {
        std::smatch m;
        if (std::regex_search(text, m, r.pattern) && static_cast<size_t>(r.group) < m.size() && m[r.group].matched)
            return m[r.group].str();
    }
    return std::nullopt;
}

std::map<std::string, std::string> extract_all(const std::string& text, const std::vector<PatternFamily>& families) {
    std::map<std::string, std::string> out;
    for (auto& f : families) {
        if (auto v = first_match(text, f)) out.emplace(f.name, *v);
    }
    return out;
}

std::optional<std::string> first_matching_label(const std::string& text, const std::vector<LabeledPatterns>& table) {
    for (auto& entry : table) {
        for (auto& re : entry.patterns) {
            if (std::regex_search(text, re)) return entry.label;
        }
    }
    return std::nullopt;
}

} // namespace nl2cmd::text
