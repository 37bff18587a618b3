/*
 * LLM-backed intent classifier - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <nl2cmd/ai/classifier.hpp>
#include <nl2cmd/ai/llm.hpp>
#include <nl2cmd/data/dataset.hpp>
#include <memory>
#include <string>
#include <vector>

namespace nl2cmd::ai {

// Asks the model to pick one dataset intent and a confidence, as JSON
// {"label": "...", "confidence": 0.0-1.0}. Labels outside the dataset are discarded.
class LlmClassifier : public Classifier {
public:
    LlmClassifier(std::unique_ptr<LLMClient> client, std::shared_ptr<const data::Dataset> dataset);

    std::optional<Prediction> predict(const std::string& query) const override;
    std::optional<std::string> label_to_command(const std::string& label, OsFamily os) const override;
    std::string name() const override { return "llm"; }

    std::string build_prompt(const std::string& query) const;
    // Parses a model reply; nullopt when no known label can be recovered.
    std::optional<Prediction> parse_reply(const std::string& reply) const;

private:
    std::unique_ptr<LLMClient> m_client;
    std::shared_ptr<const data::Dataset> m_dataset;
    std::vector<std::string> m_labels;
};

} // namespace nl2cmd::ai
