#include <nl2cmd/engine/arbitrator.hpp>
#include <nl2cmd/ai/classifier.hpp>
#include <nl2cmd/match/approx_matcher.hpp>
#include <nl2cmd/query/normalizer.hpp>
#include <nl2cmd/rules/rule_matcher.hpp>
#include <nl2cmd/templ/parameter_extractor.hpp>
#include <nl2cmd/templ/template_engine.hpp>
#include <nl2cmd/util/log.hpp>
#include <cstdio>
#include <exception>
#include <functional>
#include <initializer_list>

namespace nl2cmd::engine {

namespace {

// Strategy boundary: exceptions become failed candidates, the cascade goes on.
std::optional<CandidateResolution> guarded(Method m, const std::function<std::optional<CandidateResolution>()>& stage) {
    try {
        return stage();
    } catch (const std::exception& e) {
        log::warn(std::string(to_string(m)) + " stage failed: " + e.what());
        auto c = CandidateResolution::failed(m, e.what());
        c.metadata["error_kind"] = to_string(ErrorKind::StrategyError);
        return c;
    }
}

bool accepted(const std::optional<CandidateResolution>& c, double threshold) {
    return c && c->success && c->usable() && c->confidence >= threshold;
}

void trace(const char* stage, const std::optional<CandidateResolution>& c) {
    if (!log::debug_enabled()) return;
    if (!c) { log::debug_stream() << stage << ": no candidate"; return; }
    log::debug_stream() << stage << ": " << (c->command ? *c->command : std::string("<none>"))
                        << " confidence=" << c->confidence << (c->error ? " error=" + *c->error : std::string());
}

} // namespace

Arbitrator::Arbitrator(OsFamily os, Collaborators parts, ArbitratorConfig cfg)
    : m_os(os), m_parts(parts), m_cfg(cfg) {}

std::string Arbitrator::low_confidence_warning(double confidence) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Low confidence (%.1f%%), please verify", confidence * 100.0);
    return buf;
}

std::optional<CandidateResolution> Arbitrator::classify(const std::string& query) const {
    if (!m_parts.classifier) return std::nullopt;
    auto pred = m_parts.classifier->predict(query);
    if (!pred || pred->label.empty()) return std::nullopt;
    double conf = pred->confidence();
    auto cmd = m_parts.classifier->label_to_command(pred->label, m_os);
    if (!cmd || cmd->empty()) {
        auto c = CandidateResolution::failed(Method::Ml, "No command for intent '" + pred->label + "'");
        c.metadata["intent"] = pred->label;
        return c;
    }
    // Below the threshold the guess carries no command and is never promoted as a fallback.
    if (conf < m_cfg.ml_threshold) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.3f", conf);
        auto c = CandidateResolution::failed(Method::Ml, "Classifier not confident enough for intent '" + pred->label + "'");
        c.metadata["intent"] = pred->label;
        c.metadata["raw_confidence"] = buf;
        c.metadata["suggested_command"] = *cmd;
        return c;
    }
    std::string expl = "Predicted intent '" + pred->label + "' (" + m_parts.classifier->name() + ")";
    auto c = CandidateResolution::resolved(Method::Ml, *cmd, conf, expl);
    c.metadata["intent"] = pred->label;
    return c;
}

std::optional<CandidateResolution> Arbitrator::from_template(const std::string& query) const {
    if (!m_parts.extractor || !m_parts.templates) return std::nullopt;
    return m_parts.templates->generate(m_parts.extractor->analyze(query), m_os);
}

std::optional<CandidateResolution> Arbitrator::approximate(const std::string& query) const {
    if (!m_parts.matcher) return std::nullopt;
    auto res = m_parts.matcher->smart_search(query, m_os);
    if (!res.best || res.best->command.empty()) return std::nullopt;
    auto& best = *res.best;
    bool diagnosis = best.source == match::MatchSource::ProblemDiagnosis;
    Method m = diagnosis ? Method::ProblemDiagnosis : Method::Fuzzy;
    auto c = CandidateResolution::resolved(m, best.command, res.confidence / 100.0,
                                           best.explanation.empty() ? std::nullopt : std::optional<std::string>(best.explanation));
    if (diagnosis) {
        c.metadata["category"] = best.category;
        c.metadata["problem"] = best.problem;
    } else {
        c.metadata["intent"] = best.intent;
        c.metadata["matched_query"] = best.matched_key;
        if (best.translated) c.metadata["translated"] = "true";
    }
    return c;
}

std::optional<CandidateResolution> Arbitrator::exact_rule(const std::string& query) const {
    if (!m_parts.rules) return std::nullopt;
    std::string cmd = m_parts.rules->match(query, m_os);
    if (rules::RuleMatcher::is_placeholder(cmd)) {
        auto c = CandidateResolution::failed(Method::Rule, "No exact rule matched");
        c.metadata["placeholder"] = cmd;
        return c;
    }
    auto* r = m_parts.rules->find_rule(query);
    return CandidateResolution::resolved(Method::Rule, cmd, 1.0, r ? std::optional<std::string>(r->description) : std::nullopt);
}

ArbitrationDecision Arbitrator::resolve(const std::string& query, std::optional<Method> force) const {
    ArbitrationDecision d;
    static const query::Normalizer default_normalizer;
    const query::Normalizer& norm = m_parts.normalizer ? *m_parts.normalizer : default_normalizer;
    auto processed = norm.normalize(query);
    if (!processed.is_valid) {
        d.status = DecisionStatus::InvalidInput;
        d.error_kind = ErrorKind::InvalidInput;
        d.error = "Invalid or empty request";
        return d;
    }
    auto forced_to = [&](std::initializer_list<Method> ms) {
        if (!force) return false;
        for (auto m : ms) if (*force == m) return true;
        return false;
    };
    auto choose = [&](CandidateResolution c) {
        d.status = DecisionStatus::Resolved;
        d.chosen = std::move(c);
        return d;
    };

    std::optional<CandidateResolution> ml_backup, fuzzy_backup;

    // 1. classifier
    if (m_parts.classifier && !forced_to({Method::Rule, Method::Fuzzy})) {
        auto c = guarded(Method::Ml, [&] { return classify(query); });
        trace("ml", c);
        if (accepted(c, m_cfg.ml_threshold)) return choose(std::move(*c));
        if (c) { ml_backup = c; d.rejected.push_back(*c); }
    }
    // 2. templates (template backup stays out of the fallback pool)
    if (m_parts.templates && m_parts.extractor) {
        auto c = guarded(Method::Template, [&] { return from_template(query); });
        trace("template", c);
        if (accepted(c, m_cfg.template_threshold)) return choose(std::move(*c));
        if (c) d.rejected.push_back(*c);
    }
    // 3. approximate match / diagnosis
    if (m_parts.matcher && !forced_to({Method::Rule, Method::Ml})) {
        auto c = guarded(Method::Fuzzy, [&] { return approximate(query); });
        trace("fuzzy", c);
        if (accepted(c, m_cfg.fuzzy_threshold)) return choose(std::move(*c));
        if (c) { fuzzy_backup = c; d.rejected.push_back(*c); }
    }
    // 4. exact rules
    if (m_parts.rules && !forced_to({Method::Ml, Method::Fuzzy})) {
        auto c = guarded(Method::Rule, [&] { return exact_rule(query); });
        trace("rule", c);
        if (c && c->success && c->usable()) return choose(std::move(*c));
        if (c) d.rejected.push_back(*c);
    }
    // 5. fallback
    const CandidateResolution* best = nullptr;
    for (auto* b : {&ml_backup, &fuzzy_backup}) {
        if (!*b || !(*b)->usable()) continue;
        if (!best || (*b)->confidence > best->confidence) best = &**b;
    }
    if (best) {
        d.status = DecisionStatus::ResolvedFallback;
        d.chosen = *best;
        for (auto it = d.rejected.begin(); it != d.rejected.end(); ++it) {
            if (it->method == best->method && it->command == best->command) { d.rejected.erase(it); break; }
        }
        d.fallback_used = true;
        d.warning = low_confidence_warning(best->confidence);
        return d;
    }
    d.status = DecisionStatus::Unresolved;
    d.error_kind = ErrorKind::NoResolution;
    d.error = kNoResolutionMessage;
    return d;
}

} // namespace nl2cmd::engine
