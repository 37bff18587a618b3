#include <nl2cmd/engine/candidate.hpp>
#include <algorithm>

namespace nl2cmd::engine {

const char* to_string(Method m) {
    switch (m) {
        case Method::Ml: return "ml";
        case Method::Template: return "template";
        case Method::Fuzzy: return "fuzzy";
        case Method::ProblemDiagnosis: return "problem_diagnosis";
        case Method::Rule: return "rule";
        default: return "none";
    }
}

std::optional<Method> parse_method(const std::string& s) {
    if (s == "ml") return Method::Ml;
    if (s == "fuzzy") return Method::Fuzzy;
    if (s == "rule") return Method::Rule;
    return std::nullopt;
}

const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::StrategyUnavailable: return "strategy_unavailable";
        case ErrorKind::StrategyError: return "strategy_error";
        case ErrorKind::NoResolution: return "no_resolution";
        default: return "partial_chain_failure";
    }
}

const char* to_string(DecisionStatus s) {
    switch (s) {
        case DecisionStatus::Resolved: return "resolved";
        case DecisionStatus::ResolvedFallback: return "resolved_fallback";
        case DecisionStatus::Unresolved: return "unresolved";
        default: return "invalid_input";
    }
}

static double clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

CandidateResolution CandidateResolution::resolved(Method m, std::string cmd, double confidence,
                                                  std::optional<std::string> explanation) {
    CandidateResolution c = tentative(m, std::move(cmd), confidence, std::move(explanation));
    c.success = c.usable();
    return c;
}

CandidateResolution CandidateResolution::tentative(Method m, std::string cmd, double confidence,
                                                   std::optional<std::string> explanation) {
    CandidateResolution c;
    c.method = m;
    c.explanation = std::move(explanation);
    if (!cmd.empty()) {
        c.command = std::move(cmd);
        c.confidence = clamp01(confidence);
    }
    return c;
}

CandidateResolution CandidateResolution::failed(Method m, std::string error) {
    CandidateResolution c;
    c.method = m;
    c.error = std::move(error);
    return c;
}

} // namespace nl2cmd::engine
