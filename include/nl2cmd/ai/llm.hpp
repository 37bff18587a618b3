/*
 * LLM completion clients - nl2cmd
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace nl2cmd::ai {

// Settings read from the llm_* keys of ~/.nl2cmdrc.
struct LLMConfig {
    std::string provider = "none";   // openai|ollama|claude|gemini|stub
    std::string model;
    std::string endpoint;            // overrides the provider default URL
    std::string api_key_env;         // checked before api_key
    std::string api_key;
    std::string stub_file;           // canned reply, used offline and in tests
    int max_tokens = 64;             // a label, never a paragraph
    double temperature = 0.0;
    int timeout_seconds = 10;
};

struct LLMCompletion {
    std::string text;                // raw model text, or "(reason)" when source == "error"
    std::string source;              // stub_file|openai|ollama|claude|gemini|error
    int prompt_tokens = -1;
    int completion_tokens = -1;

    bool ok() const { return source != "error" && !text.empty(); }
};

class LLMClient {
public:
    virtual ~LLMClient() = default;
    // nullopt when nothing was attempted (e.g. no stub file); an "error" completion otherwise.
    virtual std::optional<LLMCompletion> complete(const std::string& prompt) = 0;
};

// Clients that only need the configuration they were built with.
class ConfiguredLLMClient : public LLMClient {
public:
    explicit ConfiguredLLMClient(LLMConfig cfg) : m_cfg(std::move(cfg)) {}
    const LLMConfig& config() const { return m_cfg; }
protected:
    LLMConfig m_cfg;
};

struct StubLLMClient : ConfiguredLLMClient {
    using ConfiguredLLMClient::ConfiguredLLMClient;
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
};

// HTTP providers, all over libcurl (llm_http.cpp).
struct OpenAILLMClient : ConfiguredLLMClient {
    using ConfiguredLLMClient::ConfiguredLLMClient;
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
};
struct OllamaLLMClient : ConfiguredLLMClient {
    using ConfiguredLLMClient::ConfiguredLLMClient;
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
};
struct ClaudeLLMClient : ConfiguredLLMClient {
    using ConfiguredLLMClient::ConfiguredLLMClient;
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
};
struct GeminiLLMClient : ConfiguredLLMClient {
    using ConfiguredLLMClient::ConfiguredLLMClient;
    std::optional<LLMCompletion> complete(const std::string& prompt) override;
};

// nullptr for provider "none" (without stub_file) or an unknown provider.
std::unique_ptr<LLMClient> make_llm(const LLMConfig& cfg);

} // namespace nl2cmd::ai
