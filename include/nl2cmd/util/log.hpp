// Tagged stderr logging ([nl2cmd], [WARN], [DEBUG]); debug lines only when enabled.
#pragma once
#include <iostream>
#include <sstream>
#include <string>

namespace nl2cmd::log {

inline bool& debug_flag() { static bool enabled = false; return enabled; }
inline void set_debug(bool on) { debug_flag() = on; }
inline bool debug_enabled() { return debug_flag(); }

inline void info(const std::string& msg) { std::cerr << "[nl2cmd] " << msg << '\n'; }
inline void warn(const std::string& msg) { std::cerr << "[WARN] " << msg << '\n'; }
inline void debug(const std::string& msg) { if (debug_flag()) std::cerr << "[DEBUG] " << msg << '\n'; }

// debug_stream() << ... ; builds the line only when debug is on
class DebugLine {
public:
    ~DebugLine() { if (debug_flag()) std::cerr << "[DEBUG] " << m_out.str() << '\n'; }
    template <typename T> DebugLine& operator<<(const T& v) { if (debug_flag()) m_out << v; return *this; }
private:
    std::ostringstream m_out;
};

inline DebugLine debug_stream() { return DebugLine{}; }

} // namespace nl2cmd::log
