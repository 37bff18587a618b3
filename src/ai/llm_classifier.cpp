#include <nl2cmd/ai/llm_classifier.hpp>
#include <nl2cmd/text/strings.hpp>
#include <nl2cmd/util/log.hpp>
#include "llm_http.hpp"
#include <algorithm>
#include <cstdlib>

namespace nl2cmd::ai {

namespace {

// Number after "confidence":, accepting 0-1 or 0-100 scales.
double parse_confidence(const std::string& reply) {
    size_t p = reply.find("\"confidence\"");
    if (p == std::string::npos) return 0.5;
    p = reply.find(':', p);
    if (p == std::string::npos) return 0.5;
    const char* start = reply.c_str() + p + 1;
    char* end = nullptr;
    double v = std::strtod(start, &end);
    if (end == start) return 0.5;
    if (v > 1.0) v /= 100.0;
    return std::clamp(v, 0.0, 1.0);
}

} // namespace

LlmClassifier::LlmClassifier(std::unique_ptr<LLMClient> client, std::shared_ptr<const data::Dataset> dataset)
    : m_client(std::move(client)), m_dataset(std::move(dataset)) {
    if (m_dataset) m_labels = m_dataset->labels();
}

std::string LlmClassifier::build_prompt(const std::string& query) const {
    return "Classify the user's request into exactly one of these intents: " + text::join(m_labels, ", ") +
           ". Reply ONLY with JSON {\"label\":\"<intent>\",\"confidence\":<0..1>} and no other text. Request: " + query;
}

std::optional<Prediction> LlmClassifier::parse_reply(const std::string& reply) const {
    std::string label = text::trim(detail::extract_json_string(reply, "label"));
    double conf = parse_confidence(reply);
    if (label.empty()) {
        // bare label reply
        label = text::trim(reply);
        conf = 0.5;
    }
    label = text::to_lower(label);
    if (std::find(m_labels.begin(), m_labels.end(), label) == m_labels.end()) return std::nullopt;
    Prediction p;
    p.label = label;
    p.confidence_per_label[label] = conf;
    return p;
}

std::optional<Prediction> LlmClassifier::predict(const std::string& query) const {
    if (!m_client || m_labels.empty()) return std::nullopt;
    auto reply = m_client->complete(build_prompt(query));
    if (!reply) return std::nullopt;
    if (!reply->ok()) {
        log::debug("llm classifier unavailable: " + reply->text);
        return std::nullopt;
    }
    auto p = parse_reply(reply->text);
    if (!p) log::debug("llm classifier: unrecognised reply from " + reply->source);
    return p;
}

std::optional<std::string> LlmClassifier::label_to_command(const std::string& label, OsFamily os) const {
    if (!m_dataset) return std::nullopt;
    return m_dataset->command_for_intent(label, os);
}

} // namespace nl2cmd::ai
