#include <nl2cmd/ai/llm.hpp>
#include "llm_http.hpp"
#include <sstream>

namespace nl2cmd::ai {

std::optional<LLMCompletion> OpenAILLMClient::complete(const std::string& prompt) {
    std::string reason;
    std::string key = detail::resolve_api_key(m_cfg, reason);
    if (key.empty()) return detail::error_completion(reason);
    std::string endpoint = m_cfg.endpoint.empty() ? "https://api.openai.com/v1/chat/completions" : m_cfg.endpoint;
    std::ostringstream body;
    body << "{\"model\":\"" << (m_cfg.model.empty() ? "gpt-4o-mini" : m_cfg.model) << "\","
         << "\"messages\":[{\"role\":\"user\",\"content\":\"" << detail::escape_json(prompt) << "\"}],"
         << "\"temperature\":" << m_cfg.temperature << ",\"max_tokens\":" << m_cfg.max_tokens << "}";
    auto r = detail::http_post_json(endpoint, {"Authorization: Bearer " + key}, body.str(), m_cfg.timeout_seconds);
    if (!r.ok()) {
        std::string msg = detail::extract_json_string(r.body, "message");
        return detail::error_completion("(openai error code=" + std::to_string(r.status) + (msg.empty() ? "" : " msg=" + msg) + ")");
    }
    // choices[0].message.content
    size_t choices = r.body.find("\"choices\"");
    size_t message = r.body.find("\"message\"", choices == std::string::npos ? 0 : choices);
    std::string content = detail::extract_json_string(r.body, "content", message == std::string::npos ? 0 : message);
    if (content.empty()) return detail::error_completion("(parse-empty)");
    LLMCompletion c; c.text = content; c.source = "openai";
    c.prompt_tokens = detail::extract_json_int(r.body, "prompt_tokens");
    c.completion_tokens = detail::extract_json_int(r.body, "completion_tokens");
    return c;
}

} // namespace nl2cmd::ai
