#include <nl2cmd/rules/rule_matcher.hpp>
#include <nl2cmd/text/strings.hpp>

namespace nl2cmd::rules {

RuleMatcher::RuleMatcher() {
    m_rules = {
        {{"list hidden files", "show hidden files"}, "dir /a:h", "ls -a", "List hidden files"},
        {{"list files", "show files", "list directory", "directory contents"}, "dir", "ls -la", "List files in current directory"},
        {{"current directory", "print working directory", "where am i", "show pwd"}, "cd", "pwd", "Show current directory path"},
        {{"ip address", "my ip", "ip config"}, "ipconfig", "ip addr show", "Show network addresses"},
        {{"disk space", "free space", "disk usage"}, "wmic logicaldisk get size,freespace,caption", "df -h", "Show disk usage"},
        {{"memory usage", "ram usage", "free memory"}, "systeminfo | findstr /C:\"Available Physical Memory\"", "free -h", "Show memory usage"},
        {{"running processes", "list processes", "show processes", "task list"}, "tasklist", "ps aux", "List running processes"},
        {{"open ports", "listening ports"}, "netstat -ano | findstr LISTENING", "ss -tulpn", "Show listening ports"},
        {{"network connections", "active connections"}, "netstat -an", "ss -tunap", "Show network connections"},
        {{"system info", "system information", "os version"}, "systeminfo", "uname -a", "Show system information"},
        {{"cpu info", "processor info", "cpu information"}, "wmic cpu get name,numberofcores", "lscpu", "Show CPU information"},
        {{"uptime", "how long running"}, "net statistics workstation", "uptime", "Show system uptime"},
        {{"clear screen", "clear the screen", "clear terminal"}, "cls", "clear", "Clear the terminal"},
        {{"current date", "show date", "today's date"}, "date /t", "date", "Show current date"},
        {{"current time", "show time", "what time"}, "time /t", "date +%T", "Show current time"},
        {{"who am i", "current user", "logged in user"}, "whoami", "whoami", "Show current user"},
        {{"hostname", "computer name", "machine name"}, "hostname", "hostname", "Show host name"},
        {{"environment variables", "env vars"}, "set", "printenv", "Show environment variables"},
        {{"flush dns", "clear dns"}, "ipconfig /flushdns", "resolvectl flush-caches", "Flush DNS cache"},
        {{"ping google", "test internet"}, "ping google.com", "ping -c 4 google.com", "Test internet connectivity"},
        {{"installed programs", "installed packages", "installed software"}, "wmic product get name,version", "dpkg -l", "List installed software"},
        {{"list services", "show services", "running services"}, "sc query", "systemctl list-units --type=service", "List services"},
        {{"firewall status", "check firewall"}, "netsh advfirewall show allprofiles", "sudo ufw status", "Show firewall status"},
        {{"shutdown", "power off", "turn off computer"}, "shutdown /s /t 0", "sudo shutdown -h now", "Shut down the system"},
        {{"restart computer", "reboot"}, "shutdown /r /t 0", "sudo reboot", "Restart the system"},
        {{"folder tree", "directory tree"}, "tree /f", "tree", "Show directory tree"},
    };
}

const PhraseRule* RuleMatcher::find_rule(const std::string& request) const {
    std::string lower = text::to_lower(request);
    for (auto& r : m_rules)
        for (auto& p : r.phrases)
            if (lower.find(p) != std::string::npos) return &r;
    return nullptr;
}

std::string RuleMatcher::match(const std::string& request, OsFamily os) const {
    if (auto* r = find_rule(request)) return os == OsFamily::Windows ? r->windows_command : r->linux_command;
    std::string safe;
    for (char c : request) if (c != '"' && c != '`' && c != '$' && c != '\\') safe.push_back(c);
    return "echo \"No matching command found for: " + safe + "\"";
}

bool RuleMatcher::is_placeholder(const std::string& command) { return text::starts_with(command, "echo"); }

} // namespace nl2cmd::rules
