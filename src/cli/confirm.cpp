#include <nl2cmd/cli/confirm.hpp>
#include <nl2cmd/cli/formatter.hpp>
#include <nl2cmd/safety/risk.hpp>
#include <nl2cmd/text/strings.hpp>

namespace nl2cmd::cli {

static std::string ask(std::istream& in, std::ostream& out, const std::string& prompt) {
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line)) return {};
    return text::trim(line);
}

bool confirm_risky_action(const std::string& command, std::istream& in, std::ostream& out, bool color) {
    auto risk = safety::assess_risk(command);
    if (!risk.is_risky) return true;
    out << format_risk_banner(command, risk, color);
    switch (*risk.severity) {
        case safety::Severity::Critical: {
            out << colorize("CRITICAL WARNING: This command can DESTROY DATA or SYSTEM", "91", color) << '\n';
            if (ask(in, out, "Type the FULL command to confirm (or 'cancel' to abort): ") == command &&
                ask(in, out, "FINAL CONFIRMATION - Type 'I UNDERSTAND THE RISK': ") == "I UNDERSTAND THE RISK") {
                return true;
            }
            out << "Command cancelled for safety\n";
            return false;
        }
        case safety::Severity::High:
            out << colorize("HIGH RISK: This command makes system-wide changes", "31", color) << '\n';
            if (text::to_lower(ask(in, out, "Type 'yes' to proceed or anything else to cancel: ")) == "yes") return true;
            out << "Command cancelled\n";
            return false;
        default:
            if (text::to_lower(ask(in, out, "Proceed? (yes/no): ")) == "yes") return true;
            out << "Command cancelled\n";
            return false;
    }
}

} // namespace nl2cmd::cli
