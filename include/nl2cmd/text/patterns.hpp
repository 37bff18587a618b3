/*
 * Declarative pattern tables - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Extraction and intent tables are plain data: an ordered list of regex rules
 * evaluated by one generic first-match loop. Regexes are compiled once.
 */
#pragma once
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace nl2cmd::text {

struct PatternRule {
    std::regex pattern;
    int group = 1;                 // capture group to return (0 = whole match)
};

// Named, ordered rule list. The first rule that matches wins.
struct PatternFamily {
    std::string name;
    std::vector<PatternRule> rules;
};

// Label selected when any of its patterns matches.
struct LabeledPatterns {
    std::string label;
    std::vector<std::regex> patterns;
};

// Case-insensitive ECMAScript rule.
PatternRule rule(const char* re, int group = 1);
std::regex icase(const char* re);

std::optional<std::string> first_match(const std::string& text, const PatternFamily& family);

// name -> value for every family that produced a match.
std::map<std::string, std::string> extract_all(const std::string& text, const std::vector<PatternFamily>& families);

std::optional<std::string> first_matching_label(const std::string& text, const std::vector<LabeledPatterns>& table);

} // namespace nl2cmd::text
