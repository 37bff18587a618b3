/*
 * Query normalizer - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nl2cmd/text/patterns.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::query {

// Result of normalizing one request.
struct ProcessedQuery {
    std::string original;
    std::string normalized;                     // lowercase, punctuation stripped, single spaces
    std::vector<std::string> keywords;          // stop words removed, in order
    std::vector<std::string> actions;
    std::vector<std::string> targets;
    std::vector<std::string> modifiers;
    std::map<std::string, std::string> parameters; // filename, url, ip, number, port, path, extension, content
    bool is_valid = false;                      // == !keywords.empty()

    std::optional<std::string> parameter(const std::string& name) const;
};

class Normalizer {
public:
    Normalizer();

    ProcessedQuery normalize(const std::string& text) const;

    static std::string normalize_text(const std::string& text);
    static std::vector<std::string> extract_keywords(const std::string& normalized);

    static bool is_stop_word(const std::string& w);
    static bool is_action_keyword(const std::string& w);
    static bool is_target_keyword(const std::string& w);

private:
    std::vector<text::PatternFamily> m_families;
};

} // namespace nl2cmd::query
