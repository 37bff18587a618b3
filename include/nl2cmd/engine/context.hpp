/*
 * Engine context - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Owns every read-only component (dataset, indexes, templates, classifier)
 * built once at startup, and the arbitrator / orchestrator wired to them.
 */
#pragma once
#include <nl2cmd/ai/classifier.hpp>
#include <nl2cmd/config/config.hpp>
#include <nl2cmd/data/dataset.hpp>
#include <nl2cmd/engine/arbitrator.hpp>
#include <nl2cmd/engine/multi_command.hpp>
#include <nl2cmd/match/approx_matcher.hpp>
#include <nl2cmd/query/normalizer.hpp>
#include <nl2cmd/rules/rule_matcher.hpp>
#include <nl2cmd/templ/parameter_extractor.hpp>
#include <nl2cmd/templ/template_engine.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::engine {

// Classifier selected by cfg.classifier; nullptr for "none" or when its inputs are missing.
std::unique_ptr<ai::Classifier> make_classifier(const config::Config& cfg, std::shared_ptr<const data::Dataset> dataset);

class EngineContext {
public:
    explicit EngineContext(const config::Config& cfg);
    EngineContext(OsFamily os, std::optional<data::Dataset> dataset,
                  std::unique_ptr<ai::Classifier> classifier, ArbitratorConfig arb = {});

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    OsFamily os() const { return m_os; }
    const Arbitrator& arbitrator() const { return *m_arbitrator; }
    const MultiCommandProcessor& orchestrator() const { return *m_multi; }

    const data::Dataset* dataset() const { return m_dataset.get(); }
    const ai::Classifier* classifier() const { return m_classifier.get(); }
    const match::ApproximateMatcher* matcher() const { return m_matcher.get(); }

    // One line per strategy: "<name>: enabled|disabled (...)".
    std::vector<std::string> status_lines() const;
    // Words offered by REPL tab completion.
    std::vector<std::string> vocabulary() const;

private:
    OsFamily m_os;
    std::shared_ptr<const data::Dataset> m_dataset;
    query::Normalizer m_normalizer;
    templ::ParameterExtractor m_extractor;
    templ::TemplateEngine m_templates;
    rules::RuleMatcher m_rules;
    std::unique_ptr<match::ApproximateMatcher> m_matcher;
    std::unique_ptr<ai::Classifier> m_classifier;
    std::unique_ptr<Arbitrator> m_arbitrator;
    std::unique_ptr<MultiCommandProcessor> m_multi;

    void wire(ArbitratorConfig arb);
};

} // namespace nl2cmd::engine
