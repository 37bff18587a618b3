#include <nl2cmd/templ/parameter_extractor.hpp>
#include <nl2cmd/text/strings.hpp>

namespace nl2cmd::templ {

namespace {

std::vector<text::PatternFamily> build_families() {
    using text::rule;
    return {
        {"filename", {rule(R"(file\s+["']([^"']+)["'])"),
                      rule(R"(file\s+named?\s+["']([^"']+)["'])"),
                      rule(R"(file\s+called\s+["']([^"']+)["'])"),
                      rule(R"(file\s+named?\s+([\w\-\.\\/]+))"),
                      rule(R"(file\s+called\s+([\w\-\.\\/]+))"),
                      rule(R"(([\w\-]+\.\w+)\s+file)")}},
        {"foldername", {rule(R"(folder\s+["']([^"']+)["'])"),
                        rule(R"(directory\s+["']([^"']+)["'])"),
                        rule(R"(folder\s+named?\s+["']([^"']+)["'])"),
                        rule(R"(folder\s+called\s+["']([^"']+)["'])"),
                        rule(R"((?:folder|directory)\s+named?\s+([\w\-]+))"),
                        rule(R"((?:folder|directory)\s+called\s+([\w\-]+))")}},
        {"process", {rule(R"(process\s+["']([^"']+)["'])"),
                     rule(R"(program\s+["']([^"']+)["'])"),
                     rule(R"(application\s+["']([^"']+)["'])"),
                     rule(R"((?:kill|stop|close|terminate)\s+(?:process\s+)?["']?(\w+)["']?(?:\s+process)?)")}},
        {"path", {rule(R"((?:in|to|at)\s+["']([A-Za-z]:[\\/].+?)["'])"),
                  rule(R"((?:in|to|at)\s+["']([/~].+?)["'])"),
                  rule(R"((?:in|to|at)\s+([A-Za-z]:[\\/]\S+))"),
                  rule(R"((?:in|to|at)\s+([/~]\S+))")}},
        {"port", {rule(R"(port\s+(\d+))"), rule(R"(on\s+port\s+(\d+))"), rule(R"(:(\d+))")}},
        {"ip", {rule(R"((\d+\.\d+\.\d+\.\d+))")}},
        {"extension", {rule(R"(\.(\w+)\s+files?)"),
                       rule(R"(files?\s+with\s+\.(\w+))"),
                       rule(R"((\w+)\s+files?)")}},
        {"number", {rule(R"((\d+)\s+(?:files?|items?|processes?))"),
                    rule(R"(top\s+(\d+))"), rule(R"(last\s+(\d+))"), rule(R"(first\s+(\d+))")}},
        {"content", {rule(R"(with\s+content\s+["'](.+?)["'])"),
                     rule(R"(containing\s+["'](.+?)["'])"),
                     rule(R"(text\s+["'](.+?)["'])")}},
        {"url", {rule(R"((https?://\S+|git@\S+))")}},
        {"message", {rule(R"((?:message|msg)\s+["']([^"']+)["'])"),
                     rule(R"(commit\s+[^"']*["']([^"']+)["'])")}},
        {"branchname", {rule(R"(branch\s+(?:named?\s+|called\s+|to\s+)?["']?([\w\-\./]+))")}},
        {"old_name", {rule(R"(rename\s+(?:the\s+)?(?:file\s+|folder\s+)?["']?([\w\-\.\\/]+)["']?\s+(?:to|as|into)\s+["']?([\w\-\.\\/]+))", 1)}},
        {"new_name", {rule(R"(rename\s+(?:the\s+)?(?:file\s+|folder\s+)?["']?([\w\-\.\\/]+)["']?\s+(?:to|as|into)\s+["']?([\w\-\.\\/]+))", 2)}},
        {"source", {rule(R"((?:copy|cp|duplicate)\s+(?:the\s+)?(?:file\s+)?["']?([\w\-\.\\/]+)["']?\s+(?:to|into)\s+["']?([\w\-\.\\/]+))", 1)}},
        {"destination", {rule(R"((?:copy|cp|duplicate)\s+(?:the\s+)?(?:file\s+)?["']?([\w\-\.\\/]+)["']?\s+(?:to|into)\s+["']?([\w\-\.\\/]+))", 2)}},
    };
}

std::vector<text::LabeledPatterns> build_git_intents() {
    using text::icase;
    return {
        {"git_status", {icase(R"(\b(git\s+status|check\s+git\s+status|show\s+git\s+status|see\s+git\s+changes)\b)")}},
        {"git_init", {icase(R"(\b(git\s+init|initialize\s+git|create\s+git\s+repo|start\s+git)\b)")}},
        {"git_add_all", {icase(R"(\b(git\s+add\s+all|stage\s+all|add\s+everything\s+to\s+git|git\s+add\s+\.|add\s+all\s+files\s+to\s+git)\b)")}},
        {"git_commit", {icase(R"(\b(commit\s+(the\s+)?changes|git\s+commit|make\s+a\s+commit|save\s+changes\s+to\s+git|commit\s+all)\b)")}},
        {"git_push", {icase(R"(\b(git\s+push|push\s+to\s+github|push\s+changes|upload\s+to\s+github|push\s+to\s+remote)\b)")}},
        {"git_pull", {icase(R"(\b(git\s+pull|pull\s+from\s+github|pull\s+changes|get\s+latest|sync\s+with\s+github)\b)")}},
        {"git_clone", {icase(R"(\b(git\s+clone|clone\s+repo|download\s+repo|copy\s+repository)\b)")}},
        {"git_create_branch", {icase(R"(\b(create\s+(a\s+)?(new\s+)?branch|make\s+(a\s+)?(new\s+)?branch|add\s+(a\s+)?branch|new\s+branch)\b)")}},
        {"git_checkout", {icase(R"(\b(switch\s+branch|change\s+branch|checkout\s+branch|go\s+to\s+branch)\b)")}},
        {"git_list_branches", {icase(R"(\b(list\s+branches|show\s+(all\s+)?branches|see\s+branches|git\s+branch$)\b)")}},
        {"git_merge", {icase(R"(\b(merge\s+branch|git\s+merge|combine\s+branches)\b)")}},
        {"git_log", {icase(R"(\b(git\s+log|show\s+commit\s+history|view\s+commit\s+log|see\s+git\s+history)\b)")}},
        {"git_diff", {icase(R"(\b(git\s+diff|show\s+file\s+changes|see\s+differences|what\s+changed)\b)")}},
        {"git_stash", {icase(R"(\b(git\s+stash|stash\s+changes|save\s+work\s+in\s+progress)\b)")}},
        {"git_fetch", {icase(R"(\b(git\s+fetch|fetch\s+from\s+remote|get\s+remote\s+changes)\b)")}},
        {"git_list_remotes", {icase(R"(\b(list\s+remotes|show\s+remote\s+repositories|git\s+remote\s+-v)\b)")}},
    };
}

} // namespace

ParameterExtractor::ParameterExtractor()
    : m_families(build_families()),
      m_git_intents(build_git_intents()),
      m_intents{{"create", {"create", "make", "new", "add", "generate"}},
                {"delete", {"delete", "remove", "del", "rm", "erase"}},
                {"rename", {"rename", "move", "mv"}},
                {"copy", {"copy", "cp", "duplicate"}},
                {"list", {"list", "show", "display", "ls", "dir"}},
                {"find", {"find", "search", "locate"}},
                {"kill", {"kill", "stop", "terminate", "close"}},
                {"start", {"start", "run", "launch", "open"}},
                {"modify", {"edit", "modify", "change", "update"}}},
      m_targets{{"file", {"file", "files", "document", "doc"}},
                {"folder", {"folder", "folders", "directory", "dir"}},
                {"process", {"process", "program", "application", "app"}},
                {"service", {"service", "daemon"}},
                {"user", {"user", "account"}}},
      m_nested_folder_first(text::icase(
          R"((?:folder|directory)\s+(?:named?\s+|called\s+)?["']?([\w\-\.]+)["']?\s+(?:with|containing|and)\s+(?:a\s+)?file\s+(?:named?\s+|called\s+)?["']?([\w\-\.]+)["']?)")),
      m_nested_file_first(text::icase(
          R"(file\s+(?:named?\s+|called\s+)?["']?([\w\-\.]+)["']?\s+(?:in|inside)\s+(?:folder|directory)\s+(?:named?\s+|called\s+)?["']?([\w\-\.]+)["']?)")) {}

std::map<std::string, std::string> ParameterExtractor::extract_parameters(const std::string& query) const {
    return text::extract_all(query, m_families);
}

std::optional<NestedOperation> ParameterExtractor::extract_nested(const std::string& query) const {
    std::smatch m;
    if (std::regex_search(query, m, m_nested_folder_first))
        return NestedOperation{{"folder", m[1].str()}, {"file", m[2].str()}};
    if (std::regex_search(query, m, m_nested_file_first))
        return NestedOperation{{"folder", m[2].str()}, {"file", m[1].str()}};
    return std::nullopt;
}

std::optional<std::string> ParameterExtractor::detect_git_intent(const std::string& query_lower) const {
    return text::first_matching_label(query_lower, m_git_intents);
}

Analysis ParameterExtractor::analyze(const std::string& query) const {
    Analysis a;
    a.query = query;
    a.parameters = extract_parameters(query);
    a.nested = extract_nested(query);
    std::string lower = text::to_lower(query);

    if (auto git = detect_git_intent(lower)) {
        a.intent = *git;
        a.action = "git";
        a.targets = {"git"};
        return a;
    }
    for (auto& table : m_intents) {
        for (auto& verb : table.words) {
            if (text::contains_word(lower, verb)) { a.intent = table.name; a.action = verb; break; }
        }
        if (a.intent) break;
    }
    for (auto& table : m_targets) {
        for (auto& word : table.words) {
            if (text::contains_word(lower, word)) { a.targets.push_back(table.name); break; }
        }
    }
    return a;
}

} // namespace nl2cmd::templ
