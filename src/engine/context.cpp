#include <nl2cmd/engine/context.hpp>
#include <nl2cmd/ai/keyword_classifier.hpp>
#include <nl2cmd/ai/llm_classifier.hpp>
#include <nl2cmd/text/strings.hpp>
#include <nl2cmd/util/log.hpp>
#include <set>

namespace nl2cmd::engine {

std::unique_ptr<ai::Classifier> make_classifier(const config::Config& cfg, std::shared_ptr<const data::Dataset> dataset) {
    if (cfg.classifier == "none") return nullptr;
    if (!dataset || dataset->empty()) {
        log::warn("classifier disabled: no dataset");
        return nullptr;
    }
    if (cfg.classifier == "llm") {
        auto client = ai::make_llm(cfg.llm);
        if (!client) {
            log::warn("classifier=llm but no usable llm_provider; classifier disabled");
            return nullptr;
        }
        return std::make_unique<ai::LlmClassifier>(std::move(client), std::move(dataset));
    }
    return std::make_unique<ai::KeywordClassifier>(std::move(dataset));
}

EngineContext::EngineContext(const config::Config& cfg) : m_os(config::resolve_os(cfg)) {
    if (auto ds = data::load_dataset(cfg.dataset_path)) m_dataset = std::make_shared<const data::Dataset>(std::move(*ds));
    if (m_dataset) m_matcher = std::make_unique<match::ApproximateMatcher>(m_dataset);
    m_classifier = make_classifier(cfg, m_dataset);
    ArbitratorConfig arb;
    arb.ml_threshold = cfg.confidence_threshold;
    wire(arb);
}

EngineContext::EngineContext(OsFamily os, std::optional<data::Dataset> dataset,
                             std::unique_ptr<ai::Classifier> classifier, ArbitratorConfig arb)
    : m_os(os), m_classifier(std::move(classifier)) {
    if (dataset) {
        m_dataset = std::make_shared<const data::Dataset>(std::move(*dataset));
        m_matcher = std::make_unique<match::ApproximateMatcher>(m_dataset);
    }
    wire(arb);
}

void EngineContext::wire(ArbitratorConfig arb) {
    Collaborators parts;
    parts.normalizer = &m_normalizer;
    parts.classifier = m_classifier.get();
    parts.extractor = &m_extractor;
    parts.templates = &m_templates;
    parts.matcher = m_matcher.get();
    parts.rules = &m_rules;
    m_arbitrator = std::make_unique<Arbitrator>(m_os, parts, arb);
    m_multi = std::make_unique<MultiCommandProcessor>(*m_arbitrator);
}

std::vector<std::string> EngineContext::status_lines() const {
    std::vector<std::string> out;
    out.push_back(std::string("os family: ") + to_string(m_os));
    out.push_back(m_classifier ? "classifier: enabled (" + m_classifier->name() + ")" : std::string("classifier: disabled"));
    out.push_back("templates: enabled");
    out.push_back(m_matcher ? "approximate matcher: enabled (" + std::to_string(m_matcher->index_size()) + " queries)"
                            : std::string("approximate matcher: disabled (no dataset)"));
    out.push_back("exact rules: enabled (" + std::to_string(m_rules.rules().size()) + " rules)");
    return out;
}

std::vector<std::string> EngineContext::vocabulary() const {
    std::set<std::string> words;
    if (m_matcher) for (auto& w : m_matcher->vocabulary()) words.insert(w);
    for (auto& r : m_rules.rules())
        for (auto& p : r.phrases)
            for (auto& w : text::split_ws(p)) words.insert(w);
    return {words.begin(), words.end()};
}

} // namespace nl2cmd::engine
