/*
 * Intent classifier capability - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nl2cmd/util/os_family.hpp>
#include <map>
#include <optional>
#include <string>

namespace nl2cmd::ai {

struct Prediction {
    std::string label;
    std::map<std::string, double> confidence_per_label;    // values in [0,1]

    double confidence() const {
        auto it = confidence_per_label.find(label);
        return it == confidence_per_label.end() ? 0.0 : it->second;
    }
};

// Statistical intent classifier. Implementations are immutable after construction.
class Classifier {
public:
    virtual ~Classifier() = default;
    // nullopt when the classifier has nothing to say (no overlap, backend unreachable).
    virtual std::optional<Prediction> predict(const std::string& query) const = 0;
    virtual std::optional<std::string> label_to_command(const std::string& label, OsFamily os) const = 0;
    virtual std::string name() const = 0;
};

} // namespace nl2cmd::ai
