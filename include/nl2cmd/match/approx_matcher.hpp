/*
 * Approximate (typo-tolerant) matcher - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Indexes every curated query and scores requests against it with a
 * weighted-ratio similarity; also consults the problem diagnosis catalog.
 */
#pragma once
#include <nl2cmd/data/dataset.hpp>
#include <nl2cmd/match/diagnosis.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::match {

struct CommandInfo {
    std::string command;
    std::string intent;
    data::RecordScope scope = data::RecordScope::Windows;
};

struct SearchMatch {
    std::string key;            // indexed (lowercased) query
    double score = 0.0;         // 0-100
    CommandInfo info;
};

enum class MatchSource { Similarity, ProblemDiagnosis };

struct BestMatch {
    MatchSource source = MatchSource::Similarity;
    std::string command;
    std::string explanation;
    std::string intent;         // similarity only
    std::string matched_key;    // similarity only
    std::string category;       // diagnosis only
    std::string problem;        // diagnosis only
    bool translated = false;    // command re-targeted to the requested OS family
};

struct SmartSearchResult {
    std::vector<SearchMatch> matches;
    std::vector<ProblemSolution> diagnoses;
    std::optional<BestMatch> best;
    double confidence = 0.0;    // 0-100
};

class ApproximateMatcher {
public:
    explicit ApproximateMatcher(std::shared_ptr<const data::Dataset> dataset);

    std::vector<SearchMatch> search(const std::string& query, double threshold = 70.0, size_t limit = 5) const;
    std::vector<ProblemSolution> diagnose(const std::string& query, OsFamily os) const;
    SmartSearchResult smart_search(const std::string& query, OsFamily os) const;

    size_t index_size() const { return m_index.size(); }
    // Lowercased words from the index, for REPL completion.
    std::vector<std::string> vocabulary() const;

private:
    std::shared_ptr<const data::Dataset> m_dataset;
    std::vector<std::pair<std::string, CommandInfo>> m_index;  // insertion order, unique keys

    BestMatch from_similarity(const SearchMatch& m, OsFamily os) const;
};

} // namespace nl2cmd::match
