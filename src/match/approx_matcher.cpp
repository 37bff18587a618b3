#include <nl2cmd/match/approx_matcher.hpp>
#include <nl2cmd/match/similarity.hpp>
#include <nl2cmd/text/strings.hpp>
#include <nl2cmd/util/log.hpp>
#include <algorithm>
#include <set>
#include <unordered_set>

namespace nl2cmd::match {

namespace {
constexpr double kSearchThreshold = 60.0;
constexpr size_t kSearchLimit = 5;
constexpr double kStrongSimilarity = 85.0;
}

ApproximateMatcher::ApproximateMatcher(std::shared_ptr<const data::Dataset> dataset) : m_dataset(std::move(dataset)) {
    if (!m_dataset) return;
    std::unordered_set<std::string> seen;
    for (auto scope : {data::RecordScope::Windows, data::RecordScope::Linux, data::RecordScope::Git}) {
        for (auto& r : m_dataset->section(scope)) {
            std::string key = text::to_lower(r.query);
            if (!seen.insert(key).second) continue;
            m_index.push_back({key, CommandInfo{r.command, r.intent, scope}});
        }
    }
    log::debug_stream() << "approximate matcher indexed " << m_index.size() << " queries";
}

std::vector<SearchMatch> ApproximateMatcher::search(const std::string& query, double threshold, size_t limit) const {
    std::string q = text::to_lower(text::trim(query));
    std::vector<SearchMatch> out;
    if (q.empty()) return out;
    for (auto& [key, info] : m_index) {
        double score = weighted_ratio(q, key);
        if (score >= threshold) out.push_back({key, score, info});
    }
    std::stable_sort(out.begin(), out.end(), [](const SearchMatch& a, const SearchMatch& b) { return a.score > b.score; });
    if (out.size() > limit) out.resize(limit);
    return out;
}

std::vector<ProblemSolution> ApproximateMatcher::diagnose(const std::string& query, OsFamily os) const {
    return match::diagnose(query, os);
}

BestMatch ApproximateMatcher::from_similarity(const SearchMatch& m, OsFamily os) const {
    BestMatch b;
    b.source = MatchSource::Similarity;
    b.command = m.info.command;
    b.intent = m.info.intent;
    b.matched_key = m.key;
    bool foreign = (m.info.scope == data::RecordScope::Windows && os == OsFamily::Linux) ||
                   (m.info.scope == data::RecordScope::Linux && os == OsFamily::Windows);
    if (foreign && m_dataset) {
        if (auto cmd = m_dataset->command_for_intent(m.info.intent, os)) {
            b.command = *cmd;
            b.translated = true;
        }
    }
    b.explanation = "Matched '" + m.key + "'";
    return b;
}

SmartSearchResult ApproximateMatcher::smart_search(const std::string& query, OsFamily os) const {
    SmartSearchResult res;
    res.matches = search(query, kSearchThreshold, kSearchLimit);
    res.diagnoses = diagnose(query, os);

    auto diagnosis_best = [&](const ProblemSolution& s) {
        BestMatch b;
        b.source = MatchSource::ProblemDiagnosis;
        b.command = s.command;
        b.explanation = s.explanation;
        b.category = s.category;
        b.problem = s.problem;
        return b;
    };
    auto diag_confidence = [](int relevance) { return std::min(90.0, 75.0 + 5.0 * relevance); };

    if (!res.diagnoses.empty() && res.diagnoses.front().relevance >= 2) {
        double conf = diag_confidence(res.diagnoses.front().relevance);
        if (res.matches.empty() || conf >= res.matches.front().score) {
            res.best = diagnosis_best(res.diagnoses.front());
            res.confidence = conf;
            return res;
        }
    }
    if (!res.matches.empty() && res.matches.front().score >= kStrongSimilarity) {
        res.best = from_similarity(res.matches.front(), os);
        res.confidence = res.matches.front().score;
    } else if (!res.diagnoses.empty()) {
        res.best = diagnosis_best(res.diagnoses.front());
        res.confidence = diag_confidence(res.diagnoses.front().relevance);
    } else if (!res.matches.empty()) {
        res.best = from_similarity(res.matches.front(), os);
        res.confidence = res.matches.front().score;
    }
    return res;
}

std::vector<std::string> ApproximateMatcher::vocabulary() const {
    std::set<std::string> words;
    for (auto& [key, info] : m_index)
        for (auto& w : text::split_ws(key)) words.insert(w);
    return {words.begin(), words.end()};
}

} // namespace nl2cmd::match
