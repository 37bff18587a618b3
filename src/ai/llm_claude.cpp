#include <nl2cmd/ai/llm.hpp>
#include "llm_http.hpp"
#include <sstream>

namespace nl2cmd::ai {

std::optional<LLMCompletion> ClaudeLLMClient::complete(const std::string& prompt) {
    std::string reason;
    std::string key = detail::resolve_api_key(m_cfg, reason);
    if (key.empty()) return detail::error_completion(reason);
    std::string endpoint = m_cfg.endpoint.empty() ? "https://api.anthropic.com/v1/messages" : m_cfg.endpoint;
    std::ostringstream body;
    body << "{\"model\":\"" << (m_cfg.model.empty() ? "claude-3-haiku-20240307" : m_cfg.model) << "\",\"max_tokens\":"
         << m_cfg.max_tokens << ",\"messages\":[{\"role\":\"user\",\"content\":[{\"type\":\"text\",\"text\":\""
         << detail::escape_json(prompt) << "\"}]}]}";
    auto r = detail::http_post_json(endpoint, {"x-api-key: " + key, "anthropic-version: 2023-06-01"}, body.str(), m_cfg.timeout_seconds);
    if (!r.ok()) return detail::error_completion("(claude error code=" + std::to_string(r.status) + ")");
    std::string text = detail::extract_json_string(r.body, "text");
    if (text.empty()) return detail::error_completion("(parse-empty)");
    LLMCompletion c; c.text = text; c.source = "claude";
    c.prompt_tokens = detail::extract_json_int(r.body, "input_tokens");
    c.completion_tokens = detail::extract_json_int(r.body, "output_tokens");
    return c;
}

} // namespace nl2cmd::ai
