/*
 * Line editor - nl2cmd
 * Raw-mode input with history (Up/Down) and Tab completion over the query vocabulary.
 */
#pragma once
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::cli {

struct CompletionOptions {
    // receives the whole buffer and the word being completed
    std::function<std::vector<std::string>(const std::string& buffer, const std::string& prefix)> provider;
    std::map<std::string, std::string> colors;    // candidate -> ANSI color code for the listing
};

// Provider that completes the last word from a sorted vocabulary.
CompletionOptions vocabulary_completion(std::vector<std::string> words);

class LineEditor {
public:
    LineEditor();
    ~LineEditor();
    LineEditor(const LineEditor&) = delete;
    LineEditor& operator=(const LineEditor&) = delete;

    // nullopt on end of input (Ctrl-D on an empty line, closed stdin).
    // Ctrl-C abandons the current line and returns "".
    std::optional<std::string> read_line(const std::string& prompt,
                                         const CompletionOptions& comp,
                                         const std::vector<std::string>& history);
private:
    bool m_raw = false;
    bool m_tty = false;
    void enable_raw();
    void disable_raw();
    int read_key();
    void write(const std::string& s);
    void redraw(const std::string& prompt, const std::string& buf, size_t old_len);
};

} // namespace nl2cmd::cli
