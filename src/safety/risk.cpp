#include <nl2cmd/safety/risk.hpp>
#include <nl2cmd/text/strings.hpp>
#include <cctype>
#include <sstream>

namespace nl2cmd::safety {

const char* to_string(Severity s) {
    switch (s) {
        case Severity::Critical: return "CRITICAL";
        case Severity::High: return "HIGH";
        case Severity::Medium: return "MEDIUM";
        default: return "LOW";
    }
}

const std::vector<RiskPattern>& risk_patterns() {
    static const std::vector<RiskPattern> p{
        {"del /s", Severity::Critical, "Recursively deletes files - can destroy entire directories", "Use 'del <specific_file>' to delete one file at a time"},
        {"rm -rf /", Severity::Critical, "DESTROYS ENTIRE SYSTEM - Deletes all files on system", "Never run this command! Specify exact directory instead"},
        {"rm -rf", Severity::Critical, "Forcefully deletes directory tree - no confirmation", "Use 'rm -r' for confirmation prompts or specify exact path"},
        {"format", Severity::Critical, "Formats/erases entire disk partition", "Double-check drive letter before formatting"},
        {"mkfs", Severity::Critical, "Creates new filesystem - erases all data on partition", "Ensure correct device is specified (e.g., /dev/sdb1 not /dev/sda1)"},
        {"dd", Severity::Critical, "Low-level disk copy - can overwrite wrong drive", "Triple-check 'if' and 'of' parameters before running"},
        {"shutdown", Severity::High, "Shuts down the system", "Save all work before executing"},
        {"reboot", Severity::High, "Restarts the system immediately", "Use 'shutdown -r +5' to delay 5 minutes"},
        {"systemctl stop", Severity::High, "Stops system service - may affect system functionality", "Use 'systemctl restart' to restart instead of stopping"},
        {"net user", Severity::High, "Modifies user accounts - can lock you out", "Be careful when changing passwords or disabling accounts"},
        {"chmod 777", Severity::High, "Gives full permissions to everyone - security risk", "Use minimal permissions needed (e.g., chmod 755)"},
        {"del", Severity::Medium, "Deletes files - cannot be undone easily", "Move to recycle bin first or backup important files"},
        {"rm ", Severity::Medium, "Removes files permanently", "Use 'mv file ~/.Trash' to move to trash instead"},
        {"kill -9", Severity::Medium, "Force kills process without cleanup", "Try 'kill <pid>' first (allows graceful shutdown)"},
        {"pkill", Severity::Medium, "Kills processes by name - may affect multiple processes", "Check processes with 'ps aux | grep <name>' first"},
        {"chown -r", Severity::Medium, "Recursively changes file ownership", "Specify exact directory to avoid unintended changes"},
        {"firewall", Severity::Low, "Modifies firewall settings", "Backup firewall rules before making changes"},
        {"ufw", Severity::Low, "Changes firewall configuration", "Test rules before applying permanently"},
        {"diskpart", Severity::Low, "Disk partition management tool", "Use carefully - can affect disk structure"},
    };
    return p;
}

namespace {

bool is_word_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

// Keyword occurrence starting at a word boundary; a keyword ending in a word
// character or '/' must also end at one ("dd" is not found in "git add").
bool contains_keyword(const std::string& cmd, const std::string& kw) {
    size_t pos = 0;
    while ((pos = cmd.find(kw, pos)) != std::string::npos) {
        bool left = pos == 0 || !is_word_char(cmd[pos - 1]);
        size_t end = pos + kw.size();
        bool right = true;
        if (is_word_char(kw.back())) right = end == cmd.size() || !is_word_char(cmd[end]);
        else if (kw.back() == '/') right = end == cmd.size() || std::isspace((unsigned char)cmd[end]) || cmd[end] == '*';
        if (left && right) return true;
        ++pos;
    }
    return false;
}

} // namespace

RiskAssessment assess_risk(const std::string& command) {
    RiskAssessment a;
    std::string lower = text::to_lower(command);
    for (auto& p : risk_patterns()) {
        if (!contains_keyword(lower, p.keyword)) continue;
        a.matches.push_back({p.keyword, p.severity, p.explanation, p.alternative});
        if (!a.severity || p.severity < *a.severity) a.severity = p.severity;
    }
    a.is_risky = !a.matches.empty();
    return a;
}

bool is_risky_command(const std::string& command) { return assess_risk(command).is_risky; }

std::string safety_report(const std::string& command) {
    auto a = assess_risk(command);
    if (!a.is_risky) return "This command appears safe to execute";
    std::ostringstream out;
    std::string rule(70, '=');
    out << rule << "\nSAFETY REPORT: " << command << "\n" << rule << "\n"
        << "Risk Level: " << to_string(*a.severity) << "\n"
        << "Risky Patterns Found: " << a.matches.size() << "\n\n";
    int i = 1;
    for (auto& m : a.matches) {
        out << i++ << ". " << m.keyword << " (" << to_string(m.severity) << ")\n"
            << "   " << m.explanation << "\n"
            << "   Alternative: " << m.alternative << "\n\n";
    }
    return out.str();
}

} // namespace nl2cmd::safety
