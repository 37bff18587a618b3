// Shared libcurl / JSON-string helpers for the HTTP LLM clients (private).
#pragma once
#include <nl2cmd/ai/llm.hpp>
#include <string>
#include <vector>

namespace nl2cmd::ai::detail {

struct HttpResult {
    bool transport_ok = false;
    long status = 0;
    std::string body;

    bool ok() const { return transport_ok && status / 100 == 2; }
};

HttpResult http_post_json(const std::string& url, const std::vector<std::string>& headers,
                          const std::string& body, int timeout_seconds);

std::string escape_json(const std::string& in);

// First string value following "key": in `src` (unescaped), empty if absent.
std::string extract_json_string(const std::string& src, const std::string& key, size_t from = 0);

// First integer value following "key":, -1 if absent.
int extract_json_int(const std::string& src, const std::string& key);

// Key from api_key_env (preferred) or api_key; empty with a reason when missing.
std::string resolve_api_key(const LLMConfig& cfg, std::string& reason);

LLMCompletion error_completion(const std::string& reason);

} // namespace nl2cmd::ai::detail
