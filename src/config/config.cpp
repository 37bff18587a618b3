#include <nl2cmd/config/config.hpp>
#include <nl2cmd/text/strings.hpp>
#include <nl2cmd/util/log.hpp>
#include <cstdlib>
#include <fstream>

namespace nl2cmd::config {

static std::string getenv_or(const char* k, const std::string& def = "") { const char* v = std::getenv(k); return v ? std::string(v) : def; }
static bool truthy(const std::string& v) { return v == "1" || v == "true" || v == "on" || v == "yes"; }

bool apply_setting(Config& cfg, const std::string& key, const std::string& val) {
    if (key == "os_family") {
        if (val != "auto" && !parse_os_family(val)) { log::warn("config: unknown os_family '" + val + "'"); return false; }
        cfg.os_family = val;
    }
    else if (key == "dataset_path") cfg.dataset_path = val;
    else if (key == "classifier") {
        if (val != "none" && val != "keyword" && val != "llm") { log::warn("config: unknown classifier '" + val + "'"); return false; }
        cfg.classifier = val;
    }
    else if (key == "confidence_threshold") {
        double v = -1.0;
        try { v = std::stod(val); } catch (const std::exception&) { v = -1.0; }
        if (v < 0.0 || v > 1.0) {
            log::warn("config: invalid confidence_threshold '" + val + "', keeping " + std::to_string(cfg.confidence_threshold));
            return false;
        }
        cfg.confidence_threshold = v;
    }
    else if (key == "color") cfg.color = truthy(val);
    else if (key == "debug") cfg.debug = truthy(val);
    else if (key == "llm_provider") cfg.llm.provider = val;
    else if (key == "llm_model") cfg.llm.model = val;
    else if (key == "llm_endpoint") cfg.llm.endpoint = val;
    else if (key == "llm_api_key_env") cfg.llm.api_key_env = val;
    else if (key == "llm_api_key") cfg.llm.api_key = val;
    else if (key == "llm_stub_file") cfg.llm.stub_file = val;
    else if (key == "llm_timeout") {
        try { cfg.llm.timeout_seconds = std::stoi(val); }
        catch (const std::exception&) { log::warn("config: invalid llm_timeout '" + val + "'"); return false; }
    }
    else { log::debug("config: ignoring unknown key '" + key + "'"); return false; }
    return true;
}

void load_config(std::istream& in, Config& cfg) {
    std::string line;
    while (std::getline(in, line)) {
        line = text::trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        apply_setting(cfg, text::trim(line.substr(0, eq)), text::trim(line.substr(eq + 1)));
    }
}

bool load_config_file(const std::string& path, Config& cfg) {
    std::ifstream in(path);
    if (!in) return false;
    load_config(in, cfg);
    return true;
}

void apply_environment(Config& cfg) {
    std::string ds = getenv_or("NL2CMD_DATASET");
    if (!ds.empty()) cfg.dataset_path = ds;
}

std::string default_config_path() {
    std::string home = getenv_or("HOME");
#ifdef _WIN32
    if (home.empty()) home = getenv_or("USERPROFILE");
#endif
    if (home.empty()) return ".nl2cmdrc";
    return home + "/.nl2cmdrc";
}

OsFamily resolve_os(const Config& cfg) {
    if (auto os = parse_os_family(cfg.os_family)) return *os;
    return host_os_family();
}

} // namespace nl2cmd::config
