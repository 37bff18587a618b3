// TF-IDF nearest-centroid intent classifier trained from the curated dataset.
#pragma once
#include <nl2cmd/ai/classifier.hpp>
#include <nl2cmd/data/dataset.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nl2cmd::ai {

class KeywordClassifier : public Classifier {
public:
    explicit KeywordClassifier(std::shared_ptr<const data::Dataset> dataset);

    std::optional<Prediction> predict(const std::string& query) const override;
    std::optional<std::string> label_to_command(const std::string& label, OsFamily os) const override;
    std::string name() const override { return "keyword"; }

    size_t label_count() const { return m_centroids.size(); }

    // Unigrams plus adjacent bigrams of the normalized, stop-word-free query.
    static std::vector<std::string> features(const std::string& query);

private:
    using Vector = std::map<std::string, double>;

    std::shared_ptr<const data::Dataset> m_dataset;
    std::map<std::string, double> m_idf;
    std::map<std::string, Vector> m_centroids;    // label -> unit vector

    Vector vectorize(const std::vector<std::string>& feats) const;
};

} // namespace nl2cmd::ai
