/*
 * Line editor - nl2cmd
 */
#include <nl2cmd/cli/line_editor.hpp>
#include <algorithm>
#include <iostream>
#ifndef _WIN32
#include <termios.h>
#include <unistd.h>
#endif

namespace nl2cmd::cli {

CompletionOptions vocabulary_completion(std::vector<std::string> words) {
    std::sort(words.begin(), words.end());
    words.erase(std::unique(words.begin(), words.end()), words.end());
    CompletionOptions opt;
    opt.provider = [words = std::move(words)](const std::string&, const std::string& prefix) {
        std::vector<std::string> out;
        if (prefix.empty()) return out;
        auto it = std::lower_bound(words.begin(), words.end(), prefix);
        for (; it != words.end() && it->compare(0, prefix.size(), prefix) == 0; ++it) out.push_back(*it);
        return out;
    };
    return opt;
}

#ifdef _WIN32

LineEditor::LineEditor() {}
LineEditor::~LineEditor() {}
void LineEditor::enable_raw() {}
void LineEditor::disable_raw() {}
int LineEditor::read_key() { return std::cin.get(); }
void LineEditor::write(const std::string& s) { std::cout << s << std::flush; }
void LineEditor::redraw(const std::string&, const std::string&, size_t) {}

std::optional<std::string> LineEditor::read_line(const std::string& prompt, const CompletionOptions&,
                                                 const std::vector<std::string>&) {
    write(prompt);
    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    return line;
}

#else

static struct termios g_orig;

LineEditor::LineEditor() : m_tty(isatty(STDIN_FILENO) != 0) {}
LineEditor::~LineEditor() { if (m_raw) disable_raw(); }

void LineEditor::enable_raw() {
    if (m_raw || !m_tty) return;
    struct termios t; tcgetattr(STDIN_FILENO, &t); g_orig = t;
    t.c_lflag &= ~(ICANON | ECHO | ISIG);
    t.c_cc[VMIN] = 1; t.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &t);
    m_raw = true;
}
void LineEditor::disable_raw() {
    if (!m_raw) return;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &g_orig); m_raw = false;
}

int LineEditor::read_key() {
    unsigned char c; if (read(STDIN_FILENO, &c, 1) != 1) return -1; return c;
}

void LineEditor::write(const std::string& s) {
    if (::write(STDOUT_FILENO, s.c_str(), s.size()) < 0) std::cout << s << std::flush;
}

void LineEditor::redraw(const std::string& prompt, const std::string& buf, size_t old_len) {
    write("\r"); write(std::string(prompt.size() + old_len, ' '));
    write("\r"); write(prompt); write(buf);
}

std::optional<std::string> LineEditor::read_line(const std::string& prompt,
                                                 const CompletionOptions& comp,
                                                 const std::vector<std::string>& history) {
    if (!m_tty) {
        // piped input: no editing, plain lines
        write(prompt);
        std::string line;
        if (!std::getline(std::cin, line)) return std::nullopt;
        return line;
    }
    enable_raw();
    write(prompt);
    std::string buf; size_t hist_index = history.size();
    bool last_was_tab = false;
    while (true) {
        int k = read_key();
        if (k == -1) { disable_raw(); return std::nullopt; }
        if (k == '\n' || k == '\r') { write("\n"); disable_raw(); return buf; }
        if (k == 3) { write("^C\n"); disable_raw(); return std::string(); }
        if (k == 4) {
            if (!buf.empty()) continue;
            write("\n"); disable_raw(); return std::nullopt;
        }
        if (k == 127 || k == 8) {
            if (!buf.empty()) { buf.pop_back(); write("\b \b"); }
            last_was_tab = false;
            continue;
        }
        if (k == '\t') {
            size_t start = buf.find_last_of(' ');
            size_t token_pos = (start == std::string::npos) ? 0 : start + 1;
            std::string prefix = buf.substr(token_pos);
            if (!comp.provider) continue;
            auto matches = comp.provider(buf, prefix);
            if (matches.empty()) continue;
            std::string common = matches[0];
            for (auto& m : matches) {
                size_t j = 0; while (j < common.size() && j < m.size() && common[j] == m[j]) ++j;
                common.resize(j);
            }
            if (matches.size() == 1) {
                std::string add = matches[0].substr(prefix.size()) + " ";
                buf += add; write(add);
                last_was_tab = false;
            } else if (common.size() > prefix.size()) {
                std::string add = common.substr(prefix.size()); buf += add; write(add);
                last_was_tab = false;
            } else if (last_was_tab) {
                write("\n");
                int col = 0;
                for (auto& m : matches) {
                    auto it = comp.colors.find(m);
                    if (it != comp.colors.end() && !it->second.empty()) {
                        write(it->second); write(m); write("\033[0m");
                    } else {
                        write(m);
                    }
                    write("  ");
                    if (++col % 6 == 0) write("\n");
                }
                if (col % 6 != 0) write("\n");
                write(prompt); write(buf);
                last_was_tab = false;
            } else {
                last_was_tab = true;
            }
            continue;
        }
        if (k == 27) {
            int k1 = read_key(); int k2 = read_key();
            if (k1 == '[') {
                size_t old_len = buf.size();
                if (k2 == 'A' && hist_index > 0) {
                    buf = history[--hist_index];
                    redraw(prompt, buf, old_len);
                } else if (k2 == 'B' && hist_index < history.size()) {
                    ++hist_index;
                    if (hist_index == history.size()) buf.clear(); else buf = history[hist_index];
                    redraw(prompt, buf, old_len);
                }
            }
            last_was_tab = false;
            continue;
        }
        if (k >= 32 && k < 127) {
            buf.push_back(static_cast<char>(k));
            write(std::string(1, static_cast<char>(k)));
            last_was_tab = false;
        }
    }
}

#endif

} // namespace nl2cmd::cli
