// Small string helpers shared across the pipeline stages.
#pragma once
#include <string>
#include <vector>

namespace nl2cmd::text {

std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split_ws(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);
bool starts_with(const std::string& s, const std::string& prefix);

// true when `phrase` occurs in `text` delimited by non-word characters (\b semantics).
bool contains_word(const std::string& text, const std::string& phrase);

// Replace every `{name}` occurrence.
void replace_all(std::string& s, const std::string& from, const std::string& to);

} // namespace nl2cmd::text
