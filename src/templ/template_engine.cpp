#include <nl2cmd/templ/template_engine.hpp>
#include <nl2cmd/text/strings.hpp>
#include <nl2cmd/util/log.hpp>

namespace nl2cmd::templ {

namespace {

using Table = std::map<std::string, std::vector<std::string>>;

// Identical on both families.
void add_git_templates(Table& t) {
    t["git_status"] = {"git status"};
    t["git_init"] = {"git init"};
    t["git_add_all"] = {"git add ."};
    t["git_add_file"] = {"git add {filename}"};
    t["git_commit"] = {"git commit -m \"{message}\""};
    t["git_push"] = {"git push"};
    t["git_push_origin"] = {"git push origin {branch}"};
    t["git_pull"] = {"git pull"};
    t["git_clone"] = {"git clone {url}"};
    t["git_create_branch"] = {"git branch {branchname}"};
    t["git_checkout"] = {"git checkout {branchname}"};
    t["git_checkout_new"] = {"git checkout -b {branchname}"};
    t["git_list_branches"] = {"git branch"};
    t["git_delete_branch"] = {"git branch -d {branchname}"};
    t["git_merge"] = {"git merge {branchname}"};
    t["git_log"] = {"git log"};
    t["git_log_short"] = {"git log --oneline"};
    t["git_diff"] = {"git diff"};
    t["git_stash"] = {"git stash"};
    t["git_stash_pop"] = {"git stash pop"};
    t["git_stash_list"] = {"git stash list"};
    t["git_fetch"] = {"git fetch"};
    t["git_add_remote"] = {"git remote add origin {url}"};
    t["git_list_remotes"] = {"git remote -v"};
    t["git_tag"] = {"git tag {tagname}"};
    t["git_list_tags"] = {"git tag"};
    t["git_push_tags"] = {"git push --tags"};
    t["git_config_name"] = {"git config --global user.name \"{name}\""};
    t["git_config_email"] = {"git config --global user.email \"{email}\""};
    t["git_config_list"] = {"git config --list"};
}

// Placeholders in template order, e.g. {"foldername","filename"}.
std::vector<std::string> placeholders(const std::string& tpl) {
    std::vector<std::string> out;
    size_t pos = 0;
    while ((pos = tpl.find('{', pos)) != std::string::npos) {
        size_t end = tpl.find('}', pos + 1);
        if (end == std::string::npos) break;
        out.push_back(tpl.substr(pos + 1, end - pos - 1));
        pos = end + 1;
    }
    return out;
}

} // namespace

TemplateEngine::TemplateEngine() {
    m_windows = {
        {"create_file", {"echo. > {filename}", "type nul > {filename}", "copy nul {filename}"}},
        {"create_file_with_content", {"echo {content} > {filename}"}},
        {"create_folder", {"mkdir {foldername}", "md {foldername}"}},
        {"create_nested", {"mkdir {foldername} && echo. > {foldername}\\{filename}",
                           "mkdir {foldername} && type nul > {foldername}\\{filename}"}},
        {"delete_file", {"del {filename}", "del /f {filename}"}},
        {"delete_folder", {"rmdir {foldername}", "rd /s /q {foldername}"}},
        {"rename_file", {"ren {old_name} {new_name}", "rename {old_name} {new_name}"}},
        {"copy_file", {"copy {source} {destination}"}},
        {"kill_process", {"taskkill /IM {process}.exe /F", "taskkill /IM {process} /F"}},
        {"find_file", {"dir /s /b {pattern}", "where /r . {pattern}"}},
        {"list_folder", {"dir {path}", "dir /b {path}"}},
    };
    m_linux = {
        {"create_file", {"touch {filename}", "> {filename}"}},
        {"create_file_with_content", {"echo \"{content}\" > {filename}"}},
        {"create_folder", {"mkdir {foldername}", "mkdir -p {foldername}"}},
        {"create_nested", {"mkdir -p {foldername} && touch {foldername}/{filename}"}},
        {"delete_file", {"rm {filename}", "rm -f {filename}"}},
        {"delete_folder", {"rmdir {foldername}", "rm -rf {foldername}"}},
        {"rename_file", {"mv {old_name} {new_name}"}},
        {"copy_file", {"cp {source} {destination}"}},
        {"kill_process", {"pkill {process}", "killall {process}"}},
        {"find_file", {"find . -name \"{pattern}\"", "locate {pattern}"}},
        {"list_folder", {"ls {path}", "ls -la {path}"}},
    };
    add_git_templates(m_windows);
    add_git_templates(m_linux);
}

const std::map<std::string, std::string>& TemplateEngine::git_defaults() {
    static const std::map<std::string, std::string> d{
        {"message", "Update"}, {"branchname", "new-branch"}, {"filename", "."}, {"url", ""},
        {"branch", "main"}, {"tagname", "v1.0"}, {"name", "Your Name"}, {"email", "your.email@example.com"}};
    return d;
}

std::optional<std::string> TemplateEngine::template_key(const Analysis& a) const {
    if (!a.intent) return std::nullopt;
    if (a.is_git()) return *a.intent;
    if (a.nested) return std::string("create_nested");
    if (a.targets.empty()) return std::nullopt;
    std::string key = *a.intent + "_" + a.targets.front();
    if (key == "create_file" && a.parameters.count("content")) key = "create_file_with_content";
    return key;
}

bool TemplateEngine::has_template(const std::string& key, OsFamily os) const {
    auto& t = table(os);
    auto it = t.find(key);
    return it != t.end() && !it->second.empty();
}

std::optional<std::string> TemplateEngine::fill(const std::string& key, std::map<std::string, std::string> params, OsFamily os) const {
    auto& t = table(os);
    auto it = t.find(key);
    if (it == t.end() || it->second.empty()) return std::nullopt;
    if (text::starts_with(key, "git_")) {
        for (auto& [k, v] : git_defaults()) params.emplace(k, v);   // extracted values win
    }
    std::string cmd = it->second.front();
    for (auto& name : placeholders(cmd)) {
        auto p = params.find(name);
        if (p == params.end()) return std::nullopt;
        text::replace_all(cmd, "{" + name + "}", p->second);
    }
    return cmd;
}

std::optional<engine::CandidateResolution> TemplateEngine::generate(const Analysis& a, OsFamily os) const {
    auto key = template_key(a);
    if (!key) return std::nullopt;
    auto params = a.parameters;
    if (a.nested) {
        params["foldername"] = a.nested->parent.name;
        params["filename"] = a.nested->child.name;
    }
    if (!params.count("pattern")) {
        if (params.count("filename")) params["pattern"] = params["filename"];
        else if (params.count("extension")) params["pattern"] = "*." + params["extension"];
    }
    auto cmd = fill(*key, params, os);
    if (!cmd) {
        log::debug_stream() << "template " << *key << ": missing parameter";
        return std::nullopt;
    }
    auto c = engine::CandidateResolution::resolved(engine::Method::Template, *cmd, kTemplateConfidence,
                                                   "Generated from template '" + *key + "'");
    c.metadata["intent"] = *a.intent;
    c.metadata["template"] = *key;
    c.metadata["targets"] = text::join(a.targets, ",");
    return c;
}

} // namespace nl2cmd::templ
