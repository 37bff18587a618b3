// nl2cmd main: one-shot translation or interactive REPL
#include <nl2cmd/cli/confirm.hpp>
#include <nl2cmd/cli/formatter.hpp>
#include <nl2cmd/cli/line_editor.hpp>
#include <nl2cmd/cli/shell_runner.hpp>
#include <nl2cmd/config/config.hpp>
#include <nl2cmd/engine/context.hpp>
#include <nl2cmd/safety/risk.hpp>
#include <nl2cmd/text/strings.hpp>
#include <nl2cmd/util/log.hpp>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifndef NL2CMD_VERSION
#define NL2CMD_VERSION "0.1.0"
#endif

using namespace nl2cmd;

struct CliOptions {
    bool repl = false;
    bool explain = false;
    bool run = false;
    bool debug = false;
    std::optional<std::string> os;
    std::optional<engine::Method> method;
    std::optional<std::string> config_path;
    std::optional<std::string> dataset;
    std::optional<std::string> safety;
    std::string request;
};

static void usage(std::ostream& out) {
    out << "Usage: nl2cmd [options] \"<request>\"\n"
           "       nl2cmd -i\n\n"
           "Options:\n"
           "  -i, --repl             interactive mode\n"
           "  -d, --debug            debug logging on stderr\n"
           "      --os <windows|linux>  target shell family (default: host)\n"
           "      --method <ml|fuzzy|rule>  restrict the cascade to one strategy\n"
           "      --config <file>    configuration file (default ~/.nl2cmdrc)\n"
           "      --dataset <file>   curated dataset JSON\n"
           "      --explain          list the rejected candidates too\n"
           "      --run              offer to execute the result after the risk check\n"
           "      --safety \"<cmd>\"   print the risk report for a command and exit\n"
           "      --version          print version\n"
           "  -h, --help             this help\n";
}

// 0 ok, 2 usage error, -1 help/version already printed
static int parse_args(int argc, char* argv[], CliOptions& opt) {
    std::vector<std::string> words;
    auto need = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) { std::cerr << "nl2cmd: " << flag << " requires a value\n"; return std::nullopt; }
        return std::string(argv[++i]);
    };
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") { usage(std::cout); return -1; }
        if (a == "--version") { std::cout << "nl2cmd " << NL2CMD_VERSION << '\n'; return -1; }
        if (a == "-i" || a == "--repl") opt.repl = true;
        else if (a == "-d" || a == "--debug") opt.debug = true;
        else if (a == "--explain") opt.explain = true;
        else if (a == "--run") opt.run = true;
        else if (a == "--os") {
            auto v = need(i, a); if (!v) return 2;
            if (!parse_os_family(*v)) { std::cerr << "nl2cmd: unknown OS family '" << *v << "'\n"; return 2; }
            opt.os = *v;
        } else if (a == "--method") {
            auto v = need(i, a); if (!v) return 2;
            opt.method = engine::parse_method(*v);
            if (!opt.method) { std::cerr << "nl2cmd: unknown method '" << *v << "'\n"; return 2; }
        } else if (a == "--config") {
            auto v = need(i, a); if (!v) return 2; opt.config_path = *v;
        } else if (a == "--dataset") {
            auto v = need(i, a); if (!v) return 2; opt.dataset = *v;
        } else if (a == "--safety") {
            auto v = need(i, a); if (!v) return 2; opt.safety = *v;
        } else if (a.size() > 1 && a[0] == '-') {
            std::cerr << "nl2cmd: unknown option " << a << '\n'; usage(std::cerr); return 2;
        } else {
            words.push_back(a);
        }
    }
    opt.request = text::join(words, " ");
    if (!opt.repl && !opt.safety && opt.request.empty()) { usage(std::cerr); return 2; }
    return 0;
}

static config::Config build_config(const CliOptions& opt) {
    config::Config cfg;
    std::string path = opt.config_path ? *opt.config_path : config::default_config_path();
    if (!config::load_config_file(path, cfg) && opt.config_path) log::warn("config file not found: " + path);
    config::apply_environment(cfg);
    if (opt.dataset) cfg.dataset_path = *opt.dataset;
    if (opt.os) cfg.os_family = *opt.os;
    if (opt.debug) cfg.debug = true;
    return cfg;
}

static void offer_run(const std::string& command, bool color) {
    std::cout << "Run this command? (y/N): " << std::flush;
    std::string resp;
    if (!std::getline(std::cin, resp)) return;
    resp = text::to_lower(text::trim(resp));
    if (resp != "y" && resp != "yes") return;
    if (!cli::confirm_risky_action(command, std::cin, std::cout, color)) return;
    int st = cli::run_shell_command(command);
    if (st != 0) std::cout << cli::colorize("exit status " + std::to_string(st), "31", color) << '\n';
}

// Translates one request and prints it; true when a command was produced.
static bool handle_request(const engine::EngineContext& ctx, const std::string& request,
                           const CliOptions& opt, const cli::FormatOptions& fmt) {
    auto chain = ctx.orchestrator().process(request, opt.method);
    std::cout << cli::format_chain(chain, fmt);
    if (!chain.success()) return false;
    auto risk = safety::assess_risk(*chain.chained_command);
    if (risk.is_risky && !opt.run)
        std::cout << cli::colorize(std::string("Risk: ") + safety::to_string(*risk.severity) + " (review before running)", "33", fmt.color) << '\n';
    if (opt.run) offer_run(*chain.chained_command, fmt.color);
    return true;
}

static volatile sig_atomic_t g_interrupted = 0;
static void sigint_handler(int) { g_interrupted = 1; }

static int repl(const engine::EngineContext& ctx, const CliOptions& opt, const cli::FormatOptions& fmt) {
    std::signal(SIGINT, sigint_handler);
    std::cout << "\n" << cli::colorize("nl2cmd", "1;36", fmt.color) << " " << NL2CMD_VERSION
              << " | target: " << to_string(ctx.os()) << "\n";
    std::cout << "Describe what you want to do. Commands: :safety <cmd>, :os, exit\n\n";
    auto comp = cli::vocabulary_completion(ctx.vocabulary());
    std::vector<std::string> history;
    cli::LineEditor editor;
    int last_status = 0;
    while (true) {
        g_interrupted = 0;
        auto line = editor.read_line(cli::colorize("nl2cmd> ", "32", fmt.color), comp, history);
        if (!line) { std::cout << '\n'; break; }
        std::string req = text::trim(*line);
        if (req.empty() || g_interrupted) continue;
        history.push_back(req);
        if (req == "exit" || req == "quit") break;
        if (req == ":os") { std::cout << to_string(ctx.os()) << '\n'; continue; }
        if (text::starts_with(req, ":safety ")) {
            std::cout << safety::safety_report(text::trim(req.substr(8))) << '\n';
            continue;
        }
        last_status = handle_request(ctx, req, opt, fmt) ? 0 : 1;
        std::cout << '\n';
    }
    return last_status;
}

int main(int argc, char* argv[]) {
    CliOptions opt;
    int rc = parse_args(argc, argv, opt);
    if (rc == -1) return 0;
    if (rc != 0) return rc;

    if (opt.safety) {
        std::cout << safety::safety_report(*opt.safety) << '\n';
        return safety::is_risky_command(*opt.safety) ? 1 : 0;
    }

    config::Config cfg = build_config(opt);
    log::set_debug(cfg.debug);
    cli::FormatOptions fmt;
    fmt.color = cfg.color;
    fmt.explain = opt.explain || cfg.debug;

    engine::EngineContext ctx(cfg);
    for (auto& s : ctx.status_lines()) log::debug(s);
    if (!ctx.dataset()) log::warn("dataset unavailable (" + cfg.dataset_path + "), running with rules and templates only");

    if (opt.repl) return repl(ctx, opt, fmt);
    return handle_request(ctx, opt.request, opt, fmt) ? 0 : 1;
}
