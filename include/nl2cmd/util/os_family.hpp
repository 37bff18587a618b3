/*
 * OS family selection - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>

namespace nl2cmd {

// Two-valued target shell family, resolved once at startup.
enum class OsFamily { Windows, Linux };

inline const char* to_string(OsFamily os) { return os == OsFamily::Windows ? "windows" : "linux"; }

inline std::optional<OsFamily> parse_os_family(const std::string& s) {
    if (s == "windows" || s == "win" || s == "win32") return OsFamily::Windows;
    if (s == "linux" || s == "posix" || s == "unix") return OsFamily::Linux;
    return std::nullopt;
}

inline OsFamily host_os_family() {
#ifdef _WIN32
    return OsFamily::Windows;
#else
    return OsFamily::Linux;
#endif
}

// Directory separator used when embedding paths into generated commands.
inline char path_separator(OsFamily os) { return os == OsFamily::Windows ? '\\' : '/'; }

} // namespace nl2cmd
