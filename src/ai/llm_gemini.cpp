#include <nl2cmd/ai/llm.hpp>
#include "llm_http.hpp"
#include <sstream>

namespace nl2cmd::ai {

std::optional<LLMCompletion> GeminiLLMClient::complete(const std::string& prompt) {
    std::string reason;
    std::string key = detail::resolve_api_key(m_cfg, reason);
    if (key.empty()) return detail::error_completion(reason);
    std::string model = m_cfg.model.empty() ? "gemini-1.5-flash" : m_cfg.model;
    std::string base = m_cfg.endpoint.empty() ? "https://generativelanguage.googleapis.com/v1/models/" : m_cfg.endpoint;
    std::string endpoint = base + model + ":generateContent?key=" + key;
    std::ostringstream body;
    body << "{\"contents\":[{\"parts\":[{\"text\":\"" << detail::escape_json(prompt) << "\"}]}]}";
    auto r = detail::http_post_json(endpoint, {}, body.str(), m_cfg.timeout_seconds);
    if (!r.ok()) return detail::error_completion("(gemini error code=" + std::to_string(r.status) + ")");
    std::string text = detail::extract_json_string(r.body, "text");
    if (text.empty()) return detail::error_completion("(parse-empty)");
    LLMCompletion c; c.text = text; c.source = "gemini";
    c.prompt_tokens = detail::extract_json_int(r.body, "promptTokenCount");
    c.completion_tokens = detail::extract_json_int(r.body, "candidatesTokenCount");
    return c;
}

} // namespace nl2cmd::ai
