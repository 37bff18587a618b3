#include <nl2cmd/data/dataset.hpp>
#include <nl2cmd/util/log.hpp>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>

namespace nl2cmd::data {

Dataset::Dataset(std::vector<DatasetRecord> windows_records,
                 std::vector<DatasetRecord> linux_records,
                 std::vector<DatasetRecord> git_records)
    : m_windows(std::move(windows_records)), m_linux(std::move(linux_records)), m_git(std::move(git_records)) {
    index_section(m_windows, "windows");
    index_section(m_linux, "linux");
    index_section(m_git, "windows");
    index_section(m_git, "linux");
}

void Dataset::index_section(const std::vector<DatasetRecord>& recs, const char* os_prefix) {
    for (auto& r : recs) m_intent_commands.emplace(std::string(os_prefix) + "_" + r.intent, r.command);
}

const std::vector<DatasetRecord>& Dataset::section(RecordScope scope) const {
    switch (scope) {
        case RecordScope::Windows: return m_windows;
        case RecordScope::Linux: return m_linux;
        default: return m_git;
    }
}

std::vector<DatasetRecord> Dataset::records(OsFamily os) const {
    std::vector<DatasetRecord> out = os == OsFamily::Windows ? m_windows : m_linux;
    out.insert(out.end(), m_git.begin(), m_git.end());
    return out;
}

std::optional<std::string> Dataset::command_for_intent(const std::string& intent, OsFamily os) const {
    auto it = m_intent_commands.find(std::string(to_string(os)) + "_" + intent);
    if (it == m_intent_commands.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Dataset::labels() const {
    std::set<std::string> uniq;
    for (auto* sec : {&m_windows, &m_linux, &m_git})
        for (auto& r : *sec) uniq.insert(r.intent);
    return {uniq.begin(), uniq.end()};
}

namespace {

// Minimal string-aware scanner for the dataset shape:
// { "<section>": [ { "key": "value", ... }, ... ], ... }
class Scanner {
public:
    explicit Scanner(const std::string& s) : m_s(s) {}

    void skip_ws() { while (m_pos < m_s.size() && std::isspace((unsigned char)m_s[m_pos])) ++m_pos; }
    bool eat(char c) { skip_ws(); if (m_pos < m_s.size() && m_s[m_pos] == c) { ++m_pos; return true; } return false; }
    bool peek(char c) { skip_ws(); return m_pos < m_s.size() && m_s[m_pos] == c; }
    bool at_end() { skip_ws(); return m_pos >= m_s.size(); }

    std::optional<std::string> string_value() {
        if (!eat('"')) return std::nullopt;
        std::string out;
        while (m_pos < m_s.size()) {
            char c = m_s[m_pos++];
            if (c == '"') return out;
            if (c != '\\') { out.push_back(c); continue; }
            if (m_pos >= m_s.size()) return std::nullopt;
            char e = m_s[m_pos++];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    if (m_pos + 4 > m_s.size()) return std::nullopt;
                    unsigned cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = m_s[m_pos++]; cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= h - '0';
                        else if (h >= 'a' && h <= 'f') cp |= h - 'a' + 10;
                        else if (h >= 'A' && h <= 'F') cp |= h - 'A' + 10;
                        else return std::nullopt;
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: out.push_back(e); // \" \\ \/
            }
        }
        return std::nullopt;
    }

    // Skips any JSON value (used for unknown keys and non-string fields).
    bool skip_value() {
        skip_ws();
        if (m_pos >= m_s.size()) return false;
        char c = m_s[m_pos];
        if (c == '"') return string_value().has_value();
        if (c == '{' || c == '[') {
            int depth = 0; bool in_str = false, esc = false;
            for (; m_pos < m_s.size(); ++m_pos) {
                char ch = m_s[m_pos];
                if (in_str) { if (esc) esc = false; else if (ch == '\\') esc = true; else if (ch == '"') in_str = false; continue; }
                if (ch == '"') in_str = true;
                else if (ch == '{' || ch == '[') ++depth;
                else if (ch == '}' || ch == ']') { if (--depth == 0) { ++m_pos; return true; } }
            }
            return false;
        }
        size_t start = m_pos;
        while (m_pos < m_s.size() && m_s[m_pos] != ',' && m_s[m_pos] != '}' && m_s[m_pos] != ']') ++m_pos;
        return m_pos > start;
    }

private:
    const std::string& m_s;
    size_t m_pos = 0;

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) out.push_back(static_cast<char>(cp));
        else if (cp < 0x800) { out.push_back(static_cast<char>(0xC0 | (cp >> 6))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
        else { out.push_back(static_cast<char>(0xE0 | (cp >> 12))); out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F))); out.push_back(static_cast<char>(0x80 | (cp & 0x3F))); }
    }
};

std::optional<DatasetRecord> parse_record(Scanner& sc) {
    if (!sc.eat('{')) return std::nullopt;
    DatasetRecord rec;
    if (sc.eat('}')) return rec;
    do {
        auto key = sc.string_value();
        if (!key || !sc.eat(':')) return std::nullopt;
        if (sc.peek('"')) {
            auto val = sc.string_value();
            if (!val) return std::nullopt;
            if (*key == "query") rec.query = *val;
            else if (*key == "intent") rec.intent = *val;
            else if (*key == "command") rec.command = *val;
        } else if (!sc.skip_value()) {
            return std::nullopt;
        }
    } while (sc.eat(','));
    if (!sc.eat('}')) return std::nullopt;
    return rec;
}

bool parse_section(Scanner& sc, std::vector<DatasetRecord>& out) {
    if (!sc.eat('[')) return false;
    if (sc.eat(']')) return true;
    do {
        auto rec = parse_record(sc);
        if (!rec) return false;
        // incomplete records are dropped, not fatal
        if (!rec->query.empty() && !rec->intent.empty() && !rec->command.empty()) out.push_back(std::move(*rec));
    } while (sc.eat(','));
    return sc.eat(']');
}

} // namespace

std::optional<Dataset> parse_dataset_json(const std::string& json) {
    Scanner sc(json);
    if (!sc.eat('{')) return std::nullopt;
    std::vector<DatasetRecord> win, lin, git;
    if (!sc.eat('}')) {
        do {
            auto key = sc.string_value();
            if (!key || !sc.eat(':')) return std::nullopt;
            bool ok;
            if (*key == "windows") ok = parse_section(sc, win);
            else if (*key == "linux") ok = parse_section(sc, lin);
            else if (*key == "git") ok = parse_section(sc, git);
            else ok = sc.skip_value();
            if (!ok) return std::nullopt;
        } while (sc.eat(','));
        if (!sc.eat('}')) return std::nullopt;
    }
    if (!sc.at_end()) return std::nullopt;
    return Dataset(std::move(win), std::move(lin), std::move(git));
}

std::optional<Dataset> load_dataset(const std::string& path) {
    std::ifstream in(path);
    if (!in) { log::warn("dataset not found: " + path); return std::nullopt; }
    std::ostringstream oss; oss << in.rdbuf();
    auto ds = parse_dataset_json(oss.str());
    if (!ds) { log::warn("dataset malformed: " + path); return std::nullopt; }
    log::debug_stream() << "dataset loaded: " << path << " (" << ds->size() << " records)";
    return ds;
}

} // namespace nl2cmd::data
