/*
 * Curated command dataset - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nl2cmd/util/os_family.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::data {

// One curated example: natural-language request, intent label, shell command.
struct DatasetRecord {
    std::string query;
    std::string intent;
    std::string command;
};

// Which section of the dataset a record came from.
enum class RecordScope { Windows, Linux, Git };

inline const char* to_string(RecordScope s) {
    switch (s) { case RecordScope::Windows: return "windows"; case RecordScope::Linux: return "linux"; default: return "git"; }
}

class Dataset {
public:
    Dataset() = default;
    Dataset(std::vector<DatasetRecord> windows_records,
            std::vector<DatasetRecord> linux_records,
            std::vector<DatasetRecord> git_records);

    const std::vector<DatasetRecord>& section(RecordScope scope) const;

    // OS records followed by the cross-platform git records.
    std::vector<DatasetRecord> records(OsFamily os) const;

    // First command recorded for `{os}_{intent}`.
    std::optional<std::string> command_for_intent(const std::string& intent, OsFamily os) const;

    // Sorted unique intent labels across all sections.
    std::vector<std::string> labels() const;

    size_t size() const { return m_windows.size() + m_linux.size() + m_git.size(); }
    bool empty() const { return size() == 0; }

private:
    std::vector<DatasetRecord> m_windows;
    std::vector<DatasetRecord> m_linux;
    std::vector<DatasetRecord> m_git;
    std::map<std::string, std::string> m_intent_commands;   // "{os}_{intent}" -> command

    void index_section(const std::vector<DatasetRecord>& recs, const char* os_prefix);
};

// Parses the dataset document. Returns nullopt on malformed JSON.
std::optional<Dataset> parse_dataset_json(const std::string& json);

// Reads and parses `path`; logs and returns nullopt when missing or malformed.
std::optional<Dataset> load_dataset(const std::string& path);

} // namespace nl2cmd::data
