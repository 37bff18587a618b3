#include <nl2cmd/cli/formatter.hpp>
#include <cstdio>
#include <sstream>

namespace nl2cmd::cli {

std::string colorize(const std::string& s, const char* code, bool enabled) {
    if (!enabled) return s;
    return std::string("\x1b[") + code + "m" + s + "\x1b[0m";
}

std::string method_badge(engine::Method m, bool color) {
    using engine::Method;
    const char* code = "37";
    switch (m) {
        case Method::Ml: code = "35"; break;
        case Method::Template: code = "36"; break;
        case Method::Fuzzy: code = "33"; break;
        case Method::ProblemDiagnosis: code = "34"; break;
        case Method::Rule: code = "32"; break;
        default: break;
    }
    return colorize(std::string("[") + engine::to_string(m) + "]", code, color);
}

std::string format_percent(double confidence) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", confidence * 100.0);
    return buf;
}

static void candidate_line(std::ostringstream& out, const engine::CandidateResolution& c, bool color) {
    out << "    " << method_badge(c.method, color) << ' ';
    if (c.command) out << *c.command << " (" << format_percent(c.confidence) << ")";
    else out << "<no command>";
    if (c.error) out << " - " << *c.error;
    out << '\n';
}

std::string format_decision(const engine::ArbitrationDecision& d, const FormatOptions& opt) {
    std::ostringstream out;
    if (d.success()) {
        auto& c = *d.chosen;
        out << method_badge(c.method, opt.color) << " confidence " << format_percent(c.confidence) << '\n';
        out << "  " << colorize(*c.command, "1", opt.color) << '\n';
        if (c.explanation) out << "  " << *c.explanation << '\n';
        if (!d.warning.empty()) out << "  " << colorize("Warning: " + d.warning, "33", opt.color) << '\n';
    } else {
        out << colorize("Error: " + d.error, "31", opt.color) << '\n';
    }
    if (opt.explain && !d.rejected.empty()) {
        out << "  considered:\n";
        for (auto& r : d.rejected) candidate_line(out, r, opt.color);
    }
    return out.str();
}

std::string format_chain(const engine::CommandChain& chain, const FormatOptions& opt) {
    if (!chain.is_multi_command && chain.segments.size() == 1) return format_decision(chain.segments.front().decision, opt);
    std::ostringstream out;
    out << "Multi-command request (" << chain.segments.size() << " steps)\n";
    for (auto& s : chain.segments) {
        out << "  " << s.order << ". " << s.source_text;
        if (s.resolved_text != s.source_text) out << "  ->  " << s.resolved_text;
        out << '\n';
        if (s.success()) {
            out << "     " << method_badge(s.decision.method(), opt.color) << ' ' << *s.decision.command()
                << " (" << format_percent(s.decision.confidence()) << ")\n";
            if (!s.decision.warning.empty()) out << "     " << colorize("Warning: " + s.decision.warning, "33", opt.color) << '\n';
        } else {
            out << "     " << colorize("failed: " + s.decision.error, "31", opt.color) << '\n';
        }
    }
    if (chain.chained_command) {
        out << "Chained command (confidence " << format_percent(chain.confidence) << "):\n";
        out << "  " << colorize(*chain.chained_command, "1", opt.color) << '\n';
    } else {
        out << colorize("Error: " + chain.error, "31", opt.color) << '\n';
    }
    return out.str();
}

std::string format_risk_banner(const std::string& command, const safety::RiskAssessment& risk, bool color) {
    std::ostringstream out;
    if (!risk.is_risky) return {};
    const char* code = "33";
    if (*risk.severity == safety::Severity::Critical) code = "91";
    else if (*risk.severity == safety::Severity::High) code = "31";
    else if (*risk.severity == safety::Severity::Low) code = "93";
    std::string rule(70, '=');
    out << '\n' << rule << '\n' << colorize(std::string("RISK LEVEL: ") + safety::to_string(*risk.severity), code, color) << '\n' << rule << '\n';
    int i = 1;
    for (auto& m : risk.matches) {
        out << '\n' << colorize("Risk #" + std::to_string(i++) + ": '" + m.keyword + "'", code, color) << '\n'
            << "  Explanation: " << m.explanation << '\n'
            << "  Alternative: " << m.alternative << '\n';
    }
    out << '\n' << rule << "\nCommand: " << command << '\n' << rule << '\n';
    return out.str();
}

} // namespace nl2cmd::cli
