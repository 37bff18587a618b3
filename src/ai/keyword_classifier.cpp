#include <nl2cmd/ai/keyword_classifier.hpp>
#include <nl2cmd/query/normalizer.hpp>
#include <nl2cmd/util/log.hpp>
#include <cmath>
#include <set>

namespace nl2cmd::ai {

namespace {

void normalize_l2(std::map<std::string, double>& v) {
    double norm = 0.0;
    for (auto& [k, w] : v) norm += w * w;
    norm = std::sqrt(norm);
    if (norm <= 0.0) return;
    for (auto& [k, w] : v) w /= norm;
}

double dot(const std::map<std::string, double>& a, const std::map<std::string, double>& b) {
    const auto& small = a.size() <= b.size() ? a : b;
    const auto& big = a.size() <= b.size() ? b : a;
    double s = 0.0;
    for (auto& [k, w] : small) {
        auto it = big.find(k);
        if (it != big.end()) s += w * it->second;
    }
    return s;
}

} // namespace

std::vector<std::string> KeywordClassifier::features(const std::string& query) {
    auto words = query::Normalizer::extract_keywords(query::Normalizer::normalize_text(query));
    std::vector<std::string> out = words;
    for (size_t i = 0; i + 1 < words.size(); ++i) out.push_back(words[i] + " " + words[i + 1]);
    return out;
}

KeywordClassifier::KeywordClassifier(std::shared_ptr<const data::Dataset> dataset) : m_dataset(std::move(dataset)) {
    if (!m_dataset) return;
    std::vector<std::pair<std::string, std::vector<std::string>>> docs;
    for (auto scope : {data::RecordScope::Windows, data::RecordScope::Linux, data::RecordScope::Git})
        for (auto& r : m_dataset->section(scope)) docs.push_back({r.intent, features(r.query)});

    std::map<std::string, int> df;
    for (auto& [label, feats] : docs) {
        std::set<std::string> uniq(feats.begin(), feats.end());
        for (auto& f : uniq) ++df[f];
    }
    double n = static_cast<double>(docs.size());
    for (auto& [f, count] : df) m_idf[f] = std::log((1.0 + n) / (1.0 + count)) + 1.0;

    for (auto& [label, feats] : docs) {
        Vector v = vectorize(feats);
        auto& centroid = m_centroids[label];
        for (auto& [k, w] : v) centroid[k] += w;
    }
    for (auto& [label, c] : m_centroids) normalize_l2(c);
    log::debug_stream() << "keyword classifier trained: " << docs.size() << " examples, " << m_centroids.size() << " intents";
}

KeywordClassifier::Vector KeywordClassifier::vectorize(const std::vector<std::string>& feats) const {
    Vector v;
    for (auto& f : feats) {
        auto it = m_idf.find(f);
        if (it != m_idf.end()) v[f] += it->second;  // unknown features carry no weight
    }
    normalize_l2(v);
    return v;
}

std::optional<Prediction> KeywordClassifier::predict(const std::string& query) const {
    Vector q = vectorize(features(query));
    if (q.empty()) return std::nullopt;
    Prediction p;
    double best = 0.0;
    for (auto& [label, c] : m_centroids) {
        double s = dot(q, c);
        p.confidence_per_label[label] = s;
        if (s > best) { best = s; p.label = label; }
    }
    if (p.label.empty()) return std::nullopt;
    return p;
}

std::optional<std::string> KeywordClassifier::label_to_command(const std::string& label, OsFamily os) const {
    if (!m_dataset) return std::nullopt;
    return m_dataset->command_for_intent(label, os);
}

} // namespace nl2cmd::ai
