/*
 * Resolution arbitrator - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Runs the strategies in fixed priority order (classifier, template,
 * approximate match, exact rules) and accepts the first candidate that clears
 * its stage threshold. When none does, the best below-threshold classifier or
 * approximate candidate is offered as a flagged fallback.
 */
#pragma once
#include <nl2cmd/engine/candidate.hpp>
#include <nl2cmd/util/os_family.hpp>
#include <optional>
#include <string>

namespace nl2cmd::ai { class Classifier; }
namespace nl2cmd::match { class ApproximateMatcher; }
namespace nl2cmd::query { class Normalizer; }
namespace nl2cmd::rules { class RuleMatcher; }
namespace nl2cmd::templ { class ParameterExtractor; class TemplateEngine; }

namespace nl2cmd::engine {

struct ArbitratorConfig {
    double ml_threshold = 0.6;
    double template_threshold = 0.90;
    double fuzzy_threshold = 0.75;
};

// Non-owning; a null collaborator disables its stage.
struct Collaborators {
    const query::Normalizer* normalizer = nullptr;
    const ai::Classifier* classifier = nullptr;
    const templ::ParameterExtractor* extractor = nullptr;
    const templ::TemplateEngine* templates = nullptr;
    const match::ApproximateMatcher* matcher = nullptr;
    const rules::RuleMatcher* rules = nullptr;
};

inline constexpr const char* kNoResolutionMessage =
    "No matching command found. Try rephrasing or use --help for examples.";

class Arbitrator {
public:
    Arbitrator(OsFamily os, Collaborators parts, ArbitratorConfig cfg = {});

    ArbitrationDecision resolve(const std::string& query, std::optional<Method> force_method = std::nullopt) const;

    // Individual stages; nullopt when the stage produced no candidate.
    std::optional<CandidateResolution> classify(const std::string& query) const;
    std::optional<CandidateResolution> from_template(const std::string& query) const;
    std::optional<CandidateResolution> approximate(const std::string& query) const;
    std::optional<CandidateResolution> exact_rule(const std::string& query) const;

    OsFamily os() const { return m_os; }
    const ArbitratorConfig& config() const { return m_cfg; }
    const Collaborators& collaborators() const { return m_parts; }

    static std::string low_confidence_warning(double confidence);

private:
    OsFamily m_os;
    Collaborators m_parts;
    ArbitratorConfig m_cfg;
};

} // namespace nl2cmd::engine
