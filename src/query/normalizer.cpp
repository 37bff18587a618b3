#include <nl2cmd/query/normalizer.hpp>
#include <nl2cmd/text/strings.hpp>
#include <cctype>
#include <set>

namespace nl2cmd::query {

namespace {

const std::set<std::string>& stop_words() {
    static const std::set<std::string> s{
        "a", "an", "and", "are", "as", "at", "be", "by", "for", "from", "has", "he", "in", "is",
        "it", "its", "of", "on", "that", "the", "to", "was", "will", "with", "i", "you", "we",
        "they", "can", "could", "would", "should", "do", "does", "did", "have", "had"};
    return s;
}

const std::set<std::string>& action_keywords() {
    static const std::set<std::string> s{
        "list", "show", "get", "find", "search", "display", "view", "kill", "stop", "terminate",
        "end", "close", "start", "run", "execute", "launch", "open", "delete", "remove", "erase",
        "clear", "clean", "copy", "move", "rename", "change", "create", "make", "add", "new",
        "install", "update", "upgrade", "download", "check", "verify", "test", "ping", "shutdown",
        "reboot", "restart", "logout"};
    return s;
}

const std::set<std::string>& target_keywords() {
    static const std::set<std::string> s{
        "file", "files", "directory", "folder", "path", "process", "processes", "task", "service",
        "services", "user", "users", "group", "groups", "network", "ip", "port", "ports",
        "connection", "disk", "memory", "cpu", "system", "info", "information", "package",
        "program", "application", "app", "firewall", "security", "permission", "permissions",
        "temp", "temporary", "cache", "log", "logs", "hidden", "all", "recursive"};
    return s;
}

std::vector<text::PatternFamily> build_families() {
    using text::rule;
    return {
        {"filename", {rule(R"(\b[\w\-]+\.\w+\b)", 0)}},
        {"url", {rule(R"(https?://[\w\.\-]+(?:/[\w\.\-]*)*)", 0)}},
        {"ip", {rule(R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", 0)}},
        {"number", {rule(R"(\b\d+\b)", 0)}},
        {"port", {rule(R"(port\s+(\d+))"), rule(R"(:(\d+))")}},
        {"path", {rule(R"((?:in|to|at)\s+["']([A-Za-z]:[\\/].+?)["'])"),
                  rule(R"((?:in|to|at)\s+([A-Za-z]:[\\/][^\s]+))"),
                  rule(R"((?:in|to|at)\s+["'](/[^"']+)["'])"),
                  rule(R"((?:in|to|at)\s+(/[^\s]+))")}},
        {"extension", {rule(R"(\.(\w+)\s+files?)"), rule(R"(files?\s+with\s+\.(\w+))")}},
        {"content", {rule(R"(with\s+content\s+["'](.+?)["'])"),
                     rule(R"(containing\s+["'](.+?)["'])"),
                     rule(R"(text\s+["'](.+?)["'])")}},
    };
}

} // namespace

std::optional<std::string> ProcessedQuery::parameter(const std::string& name) const {
    auto it = parameters.find(name);
    if (it == parameters.end()) return std::nullopt;
    return it->second;
}

Normalizer::Normalizer() : m_families(build_families()) {}

bool Normalizer::is_stop_word(const std::string& w) { return stop_words().count(w) > 0; }
bool Normalizer::is_action_keyword(const std::string& w) { return action_keywords().count(w) > 0; }
bool Normalizer::is_target_keyword(const std::string& w) { return target_keywords().count(w) > 0; }

std::string Normalizer::normalize_text(const std::string& text) {
    std::string lowered = text::to_lower(text::trim(text));
    std::string cleaned; cleaned.reserve(lowered.size());
    for (char c : lowered) {
        unsigned char u = static_cast<unsigned char>(c);
        // bytes >= 0x80 belong to UTF-8 letters and stay
        bool keep = u >= 0x80 || std::isalnum(u) || c == '_' || c == '-' || std::isspace(u);
        cleaned.push_back(keep ? c : ' ');
    }
    return text::join(text::split_ws(cleaned), " ");
}

std::vector<std::string> Normalizer::extract_keywords(const std::string& normalized) {
    std::vector<std::string> out;
    for (auto& w : text::split_ws(normalized))
        if (!is_stop_word(w)) out.push_back(w);
    return out;
}

ProcessedQuery Normalizer::normalize(const std::string& text) const {
    ProcessedQuery q;
    q.original = text;
    q.normalized = normalize_text(text);
    q.keywords = extract_keywords(q.normalized);
    for (auto& k : q.keywords) {
        if (is_action_keyword(k)) q.actions.push_back(k);
        else if (is_target_keyword(k)) q.targets.push_back(k);
        else q.modifiers.push_back(k);
    }
    q.parameters = text::extract_all(text, m_families);
    q.is_valid = !q.keywords.empty();
    return q;
}

} // namespace nl2cmd::query
