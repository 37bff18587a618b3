#include <nl2cmd/text/strings.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace nl2cmd::text {

static bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size(); while (b > a && std::isspace((unsigned char)s[b - 1])) --b;
    return s.substr(a, b - a);
}

std::vector<std::string> split_ws(const std::string& s) {
    std::vector<std::string> out; std::istringstream iss(s); std::string w;
    while (iss >> w) out.push_back(w);
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) { if (i) out += sep; out += parts[i]; }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) { return s.rfind(prefix, 0) == 0; }

bool contains_word(const std::string& text, const std::string& phrase) {
    if (phrase.empty()) return false;
    size_t pos = 0;
    while ((pos = text.find(phrase, pos)) != std::string::npos) {
        bool left = pos == 0 || !is_word_char(text[pos - 1]) || !is_word_char(phrase.front());
        size_t end = pos + phrase.size();
        bool right = end == text.size() || !is_word_char(text[end]) || !is_word_char(phrase.back());
        if (left && right) return true;
        ++pos;
    }
    return false;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) { s.replace(pos, from.size(), to); pos += to.size(); }
}

} // namespace nl2cmd::text
