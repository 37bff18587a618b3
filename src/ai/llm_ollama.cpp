#include <nl2cmd/ai/llm.hpp>
#include "llm_http.hpp"
#include <sstream>

namespace nl2cmd::ai {

std::optional<LLMCompletion> OllamaLLMClient::complete(const std::string& prompt) {
    std::string endpoint = m_cfg.endpoint.empty() ? "http://localhost:11434/api/generate" : m_cfg.endpoint;
    // {"model":"<model>","prompt":"...","stream":false}
    std::ostringstream body;
    body << "{\"model\":\"" << (m_cfg.model.empty() ? "llama3" : m_cfg.model) << "\",\"prompt\":\""
         << detail::escape_json(prompt) << "\",\"stream\":false}";
    auto r = detail::http_post_json(endpoint, {}, body.str(), m_cfg.timeout_seconds);
    if (!r.ok()) return detail::error_completion("(ollama error code=" + std::to_string(r.status) + ")");
    std::string text = detail::extract_json_string(r.body, "response");
    if (text.empty()) return detail::error_completion("(parse-empty)");
    LLMCompletion c; c.text = text; c.source = "ollama";
    c.prompt_tokens = detail::extract_json_int(r.body, "prompt_eval_count");
    c.completion_tokens = detail::extract_json_int(r.body, "eval_count");
    return c;
}

} // namespace nl2cmd::ai
