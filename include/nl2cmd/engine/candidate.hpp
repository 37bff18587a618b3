/*
 * Candidate resolutions and arbitration results - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nl2cmd::engine {

enum class Method { Ml, Template, Fuzzy, ProblemDiagnosis, Rule, None };

const char* to_string(Method m);
// Strategies a caller may restrict the cascade to: "ml", "fuzzy", "rule".
std::optional<Method> parse_method(const std::string& s);

enum class ErrorKind { InvalidInput, StrategyUnavailable, StrategyError, NoResolution, PartialChainFailure };

const char* to_string(ErrorKind k);

// One strategy's proposal. A candidate without a command always has confidence 0.
struct CandidateResolution {
    Method method = Method::None;
    bool success = false;
    std::optional<std::string> command;
    double confidence = 0.0;                    // [0,1]
    std::optional<std::string> explanation;
    std::optional<std::string> error;
    std::map<std::string, std::string> metadata;

    bool usable() const { return command.has_value() && !command->empty(); }

    static CandidateResolution resolved(Method m, std::string cmd, double confidence,
                                        std::optional<std::string> explanation = std::nullopt);
    // Has a command but did not qualify on its own (below threshold, not confident).
    static CandidateResolution tentative(Method m, std::string cmd, double confidence,
                                         std::optional<std::string> explanation = std::nullopt);
    static CandidateResolution failed(Method m, std::string error);
};

enum class DecisionStatus { Resolved, ResolvedFallback, Unresolved, InvalidInput };

const char* to_string(DecisionStatus s);

struct ArbitrationDecision {
    DecisionStatus status = DecisionStatus::Unresolved;
    std::optional<CandidateResolution> chosen;
    std::vector<CandidateResolution> rejected;  // in stage order
    bool fallback_used = false;
    std::string warning;
    std::string error;
    std::optional<ErrorKind> error_kind;

    bool success() const { return chosen.has_value() && chosen->usable(); }
    double confidence() const { return chosen ? chosen->confidence : 0.0; }
    std::optional<std::string> command() const { return chosen ? chosen->command : std::nullopt; }
    Method method() const { return chosen ? chosen->method : Method::None; }
};

} // namespace nl2cmd::engine
