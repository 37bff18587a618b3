#include <nl2cmd/ai/llm.hpp>
#include <nl2cmd/util/log.hpp>
#include <fstream>
#include <sstream>

namespace nl2cmd::ai {

std::optional<LLMCompletion> StubLLMClient::complete(const std::string&) {
    if (m_cfg.stub_file.empty()) return std::nullopt;
    std::ifstream in(m_cfg.stub_file);
    if (!in) { log::warn("llm stub file not readable: " + m_cfg.stub_file); return std::nullopt; }
    std::ostringstream oss; oss << in.rdbuf();
    std::string data = oss.str();
    if (data.empty()) return std::nullopt;
    LLMCompletion c; c.text = data; c.source = "stub_file";
    return c;
}

std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg) {
    if (!cfg.stub_file.empty() && (cfg.provider == "stub" || cfg.provider == "none")) return std::make_unique<StubLLMClient>(cfg);
    if (cfg.provider == "openai") return std::make_unique<OpenAILLMClient>(cfg);
    if (cfg.provider == "ollama") return std::make_unique<OllamaLLMClient>(cfg);
    if (cfg.provider == "claude") return std::make_unique<ClaudeLLMClient>(cfg);
    if (cfg.provider == "gemini") return std::make_unique<GeminiLLMClient>(cfg);
    if (cfg.provider != "none") log::warn("unknown llm_provider '" + cfg.provider + "'");
    return nullptr;
}

} // namespace nl2cmd::ai
