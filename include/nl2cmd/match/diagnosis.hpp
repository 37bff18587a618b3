// Problem-description -> remedy catalog.
#pragma once
#include <nl2cmd/util/os_family.hpp>
#include <string>
#include <vector>

namespace nl2cmd::match {

struct ProblemEntry {
    std::string problem;        // canonical phrase, e.g. "internet not working"
    std::string solution;       // command
    std::string explanation;
};

struct ProblemCategory {
    std::string name;
    std::vector<std::string> keywords;
    std::vector<ProblemEntry> windows_entries;
    std::vector<ProblemEntry> linux_entries;
};

struct ProblemSolution {
    std::string command;
    std::string explanation;
    std::string category;
    std::string problem;
    int relevance = 0;          // keyword hits + shared words with the problem phrase
};

const std::vector<ProblemCategory>& problem_catalog();

// Top three remedies, most relevant first.
std::vector<ProblemSolution> diagnose(const std::string& query, OsFamily os);

} // namespace nl2cmd::match
