#include <nl2cmd/match/diagnosis.hpp>
#include <nl2cmd/text/strings.hpp>
#include <algorithm>
#include <set>

namespace nl2cmd::match {

const std::vector<ProblemCategory>& problem_catalog() {
    static const std::vector<ProblemCategory> catalog{
        {"network",
         {"network", "internet", "connection", "wifi", "lan", "ethernet", "offline", "not working", "no connection"},
         {{"internet not working", "ipconfig /release && ipconfig /renew && ipconfig /flushdns", "Reset network connection and flush DNS"},
          {"wifi not connecting", "netsh wlan show networks", "Show available WiFi networks"},
          {"check network status", "netsh interface show interface", "Display network adapter status"},
          {"network is slow", "netstat -ano", "Check active connections"}},
         {{"internet not working", "sudo systemctl restart NetworkManager", "Restart network service"},
          {"check network", "ping -c 4 8.8.8.8 && ip addr show", "Test connection and show IP"},
          {"wifi not connecting", "nmcli device wifi list", "List WiFi networks"}}},
        {"system_error",
         {"error", "corrupt", "broken", "damaged", "crash", "fail", "not responding", "missing", "dll", "system file"},
         {{"system files corrupted", "sfc /scannow", "Scan and repair system files"},
          {"missing dll", "sfc /scannow && DISM /Online /Cleanup-Image /RestoreHealth", "Repair system files and image"},
          {"windows update error", "net stop wuauserv && del /f/s/q %windir%\\SoftwareDistribution\\* && net start wuauserv", "Reset Windows Update"},
          {"disk errors", "chkdsk C: /f /r", "Check and repair disk errors"},
          {"hard drive error", "chkdsk C: /f /r", "Check and repair disk errors"}},
         {{"system error", "journalctl -xe | tail -50", "View recent system errors"},
          {"package broken", "sudo apt --fix-broken install", "Fix broken packages"},
          {"disk errors", "sudo fsck -y /dev/sda1", "Check filesystem"}}},
        {"performance",
         {"slow", "freeze", "lag", "hang", "stuck", "cpu", "memory", "ram"},
         {{"computer slow", "tasklist /V && wmic cpu get loadpercentage", "Check process and CPU usage"},
          {"high cpu usage", "powershell \"Get-Process | Sort-Object CPU -Descending | Select-Object -First 10\"", "Show top CPU processes"},
          {"memory full", "systeminfo | findstr /C:\"Available Physical Memory\"", "Check available RAM"},
          {"disk full", "wmic logicaldisk get size,freespace,caption", "Check disk space"}},
         {{"system slow", "top -bn1 | head -20", "Show system resource usage"},
          {"high cpu", "ps aux --sort=-%cpu | head -10", "Top CPU processes"},
          {"memory full", "free -h && ps aux --sort=-%mem | head -10", "Check memory and top processes"},
          {"disk full", "df -h && du -sh /* | sort -rh | head -10", "Check disk usage"}}},
        {"application",
         {"app", "program", "application", "not opening", "wont start", "frozen"},
         {{"app not responding", "taskkill /IM <process>.exe /F", "Force close application"},
          {"program wont start", "tasklist /FI \"IMAGENAME eq <process>.exe\"", "Check if program is running"}},
         {{"app frozen", "pkill -9 <process>", "Force kill process"},
          {"check if running", "ps aux | grep <process>", "Find running process"}}},
        {"security",
         {"virus", "malware", "hack", "security", "suspicious", "unauthorized"},
         {{"suspicious activity", "netstat -ano && tasklist /V", "Check active connections and processes"},
          {"check open ports", "netstat -ano | findstr LISTENING", "Show listening ports"}},
         {{"suspicious activity", "netstat -tulpn && ps aux --sort=-%cpu", "Check connections and processes"},
          {"unauthorized access", "last -a && who", "Check login history"}}},
        {"boot",
         {"boot", "startup", "wont start", "black screen", "grub"},
         {{"boot error", "bootrec /fixmbr && bootrec /fixboot && bootrec /rebuildbcd", "Repair boot configuration"}},
         {{"grub error", "sudo update-grub && sudo grub-install /dev/sda", "Repair GRUB bootloader"}}},
    };
    return catalog;
}

std::vector<ProblemSolution> diagnose(const std::string& query, OsFamily os) {
    std::string lower = text::to_lower(query);
    auto qwords = text::split_ws(lower);
    std::set<std::string> query_words(qwords.begin(), qwords.end());
    std::vector<ProblemSolution> out;
    for (auto& cat : problem_catalog()) {
        // keywords are substring hits ("app" also counts inside "application")
        int keyword_matches = 0;
        for (auto& kw : cat.keywords) if (lower.find(kw) != std::string::npos) ++keyword_matches;
        if (keyword_matches == 0) continue;
        auto& entries = os == OsFamily::Windows ? cat.windows_entries : cat.linux_entries;
        for (auto& e : entries) {
            auto pw = text::split_ws(text::to_lower(e.problem));
            std::set<std::string> problem_words(pw.begin(), pw.end());
            int overlap = 0;
            for (auto& w : problem_words) if (query_words.count(w)) ++overlap;
            if (overlap == 0) continue;
            out.push_back({e.solution, e.explanation, cat.name, e.problem, overlap + keyword_matches});
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ProblemSolution& a, const ProblemSolution& b) { return a.relevance > b.relevance; });
    if (out.size() > 3) out.resize(3);
    return out;
}

} // namespace nl2cmd::match
