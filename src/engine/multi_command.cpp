#include <nl2cmd/engine/multi_command.hpp>
#include <nl2cmd/text/patterns.hpp>
#include <nl2cmd/text/strings.hpp>
#include <nl2cmd/util/log.hpp>
#include <algorithm>
#include <regex>

namespace nl2cmd::engine {

namespace {

const std::vector<std::string>& action_verbs() {
    static const std::vector<std::string> v{
        "create", "make", "delete", "remove", "copy", "move", "list", "show", "find",
        "kill", "stop", "start", "run", "open", "close", "install", "update", "rename", "change"};
    return v;
}

const std::vector<std::string>& conjunctions() {
    static const std::vector<std::string> v{"and then", "then", "and", "also", "after that", "next"};
    return v;
}

const std::vector<std::regex>& separators() {
    static const std::vector<std::regex> v{
        text::icase(R"(\s*,\s*)"),
        text::icase(R"(\s*;\s*)"),
        text::icase(R"(\s+and\s+then\s+)"),
        text::icase(R"(\s+then\s+)"),
        text::icase(R"(\s+and\s+)"),
        text::icase(R"(\s+also\s+)"),
        text::icase(R"(\s+after\s+that\s+)"),
        text::icase(R"(\s+next\s+)"),
    };
    return v;
}

// "inside the folder", "in that folder", "in it", "inside there", ... as whole words.
const std::regex& reference_phrase() {
    static const std::regex re = text::icase(R"(\b(?:inside|in)\s+(?:(?:the|that)\s+)?folder\b|\b(?:inside|in)\s+it\b|\binside\s+there\b)");
    return re;
}

// "file named X inside the folder" -> groups: 1 lead-in, 2 name, 3 reference
const std::vector<std::regex>& reference_rewrites() {
    static const std::vector<std::regex> v{
        text::icase(R"((file\s+named?\s+|file\s+called\s+)([^\s]+)(\s+inside\s+(?:the\s+)?folder\b))"),
        text::icase(R"((file\s+named?\s+|file\s+called\s+)([^\s]+)(\s+in\s+(?:the\s+)?folder\b))"),
        text::icase(R"((file\s+named?\s+|file\s+called\s+)([^\s]+)(\s+inside\s+that\s+folder\b))"),
        text::icase(R"((file\s+named?\s+|file\s+called\s+)([^\s]+)(\s+in\s+that\s+folder\b))"),
        text::icase(R"((file\s+named?\s+|file\s+called\s+)([^\s]+)(\s+inside\s+it\b))"),
        text::icase(R"((file\s+named?\s+|file\s+called\s+)([^\s]+)(\s+in\s+it\b))"),
        text::icase(R"((file\s+named?\s+|file\s+called\s+)([^\s]+)(\s+inside\s+there\b))"),
    };
    return v;
}

// Every match becomes lead-in + dir_prefix + name; the reference words are dropped.
std::string rewrite_references(const std::string& s, const std::regex& re, const std::string& dir_prefix) {
    std::string out;
    auto last = s.cbegin();
    for (std::sregex_iterator it(s.begin(), s.end(), re), end; it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        out += m[1].str() + dir_prefix + m[2].str();
        last = m[0].second;
    }
    out.append(last, s.cend());
    return out;
}

} // namespace

MultiCommandProcessor::MultiCommandProcessor(const Arbitrator& arbitrator) : m_arbitrator(arbitrator) {}

int MultiCommandProcessor::count_action_verbs(const std::string& query) {
    int n = 0;
    for (auto& w : text::split_ws(text::to_lower(query)))
        if (std::find(action_verbs().begin(), action_verbs().end(), w) != action_verbs().end()) ++n;
    return n;
}

std::optional<std::string> MultiCommandProcessor::find_conjunction(const std::string& query) {
    std::string lower = text::to_lower(query);
    for (auto& c : conjunctions())
        if (text::contains_word(lower, c)) return c;
    return std::nullopt;
}

bool MultiCommandProcessor::is_multi_command(const std::string& query) {
    return count_action_verbs(query) >= 2 && find_conjunction(query).has_value();
}

std::vector<std::string> MultiCommandProcessor::split(const std::string& query) {
    for (auto& sep : separators()) {
        std::vector<std::string> parts;
        std::sregex_token_iterator it(query.begin(), query.end(), sep, -1), end;
        for (; it != end; ++it) {
            std::string p = text::trim(it->str());
            if (!p.empty()) parts.push_back(p);
        }
        if (parts.size() > 1) return parts;
    }
    return {text::trim(query)};
}

std::optional<std::string> MultiCommandProcessor::created_folder(const std::vector<CommandSegment>& previous) {
    static const std::regex mkdir_re(R"(\b(?:mkdir|md)\s+(?:-p\s+)?([^\s&|;]+))", std::regex::ECMAScript | std::regex::icase);
    for (auto it = previous.rbegin(); it != previous.rend(); ++it) {
        if (!it->success()) continue;
        auto cmd = it->decision.command();
        if (!cmd) continue;
        std::smatch m;
        if (std::regex_search(*cmd, m, mkdir_re)) {
            std::string path = m[1].str();
            path.erase(std::remove_if(path.begin(), path.end(), [](char c) { return c == '"' || c == '\''; }), path.end());
            if (!path.empty()) return path;
        }
    }
    return std::nullopt;
}

std::string MultiCommandProcessor::resolve_context(const std::string& segment, const std::vector<CommandSegment>& previous) const {
    auto folder = created_folder(previous);
    if (!folder) return segment;
    if (!std::regex_search(segment, reference_phrase())) return segment;
    std::string dir_prefix = *folder + path_separator(m_arbitrator.os());
    for (auto& re : reference_rewrites()) {
        std::string rewritten = rewrite_references(segment, re, dir_prefix);
        if (rewritten != segment) {
            log::debug_stream() << "context: '" << segment << "' -> '" << rewritten << "'";
            return rewritten;
        }
    }
    return segment;
}

CommandChain MultiCommandProcessor::process(const std::string& query, std::optional<Method> force) const {
    CommandChain chain;
    chain.query = query;
    if (!is_multi_command(query)) {
        CommandSegment seg;
        seg.order = 1;
        seg.source_text = seg.resolved_text = query;
        seg.decision = m_arbitrator.resolve(query, force);
        if (seg.success()) {
            chain.chained_command = seg.decision.command();
            chain.confidence = seg.decision.confidence();
        } else {
            chain.error_kind = seg.decision.error_kind;
            chain.error = seg.decision.error;
        }
        chain.segments.push_back(std::move(seg));
        return chain;
    }

    chain.is_multi_command = true;
    auto parts = split(query);
    log::debug_stream() << "multi-command: " << parts.size() << " segments";
    int failed = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        CommandSegment seg;
        seg.order = static_cast<int>(i) + 1;
        seg.source_text = parts[i];
        seg.resolved_text = i == 0 ? parts[i] : resolve_context(parts[i], chain.segments);
        seg.decision = m_arbitrator.resolve(seg.resolved_text, force);
        if (!seg.success()) ++failed;
        chain.segments.push_back(std::move(seg));
    }
    if (failed > 0) {
        chain.error_kind = ErrorKind::PartialChainFailure;
        chain.error = "Cannot chain - " + std::to_string(failed) + " of " + std::to_string(parts.size()) + " commands failed";
        return chain;
    }
    std::vector<std::string> cmds;
    double conf = 1.0;
    for (auto& s : chain.segments) {
        cmds.push_back(*s.decision.command());
        conf = std::min(conf, s.decision.confidence());
    }
    chain.chained_command = text::join(cmds, kChainSeparator);
    chain.confidence = conf;
    return chain;
}

} // namespace nl2cmd::engine
