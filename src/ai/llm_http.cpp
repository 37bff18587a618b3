#include "llm_http.hpp"
#include <curl/curl.h>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace nl2cmd::ai::detail {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResult http_post_json(const std::string& url, const std::vector<std::string>& headers,
                          const std::string& body, int timeout_seconds) {
    HttpResult r;
    CURL* curl = curl_easy_init();
    if (!curl) { r.body = "(curl-init-fail)"; return r; }
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &r.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    struct curl_slist* hdrs = curl_slist_append(nullptr, "Content-Type: application/json");
    for (auto& h : headers) hdrs = curl_slist_append(hdrs, h.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &r.status);
    curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);
    r.transport_ok = res == CURLE_OK;
    if (!r.transport_ok) r.body = std::string("(curl: ") + curl_easy_strerror(res) + ")";
    return r;
}

std::string escape_json(const std::string& in) {
    std::string out; out.reserve(in.size() + 16);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c); out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

std::string extract_json_string(const std::string& src, const std::string& key, size_t from) {
    size_t pos = src.find("\"" + key + "\"", from);
    if (pos == std::string::npos) return {};
    pos = src.find(':', pos);
    if (pos == std::string::npos) return {};
    ++pos;
    while (pos < src.size() && std::isspace((unsigned char)src[pos])) ++pos;
    if (pos >= src.size() || src[pos] != '"') return {};
    std::string out; bool esc = false;
    for (size_t i = pos + 1; i < src.size(); ++i) {
        char c = src[i];
        if (esc) {
            if (c == 'n') out.push_back('\n'); else if (c == 'r') out.push_back('\r'); else if (c == 't') out.push_back('\t'); else out.push_back(c);
            esc = false; continue;
        }
        if (c == '\\') { esc = true; continue; }
        if (c == '"') return out;
        out.push_back(c);
    }
    return {};
}

int extract_json_int(const std::string& src, const std::string& key) {
    size_t p = src.find("\"" + key + "\"");
    if (p == std::string::npos) return -1;
    p = src.find(':', p);
    if (p == std::string::npos) return -1;
    ++p;
    while (p < src.size() && std::isspace((unsigned char)src[p])) ++p;
    size_t e = p;
    while (e < src.size() && std::isdigit((unsigned char)src[e])) ++e;
    if (e == p) return -1;
    errno = 0;
    long v = std::strtol(src.c_str() + p, nullptr, 10);
    if (errno == ERANGE || v > std::numeric_limits<int>::max()) return -1;
    return static_cast<int>(v);
}

std::string resolve_api_key(const LLMConfig& cfg, std::string& reason) {
    if (!cfg.api_key_env.empty()) {
        const char* v = std::getenv(cfg.api_key_env.c_str());
        if (v && *v) return v;
        // key pasted where the variable name belongs
        if (cfg.api_key_env.rfind("sk-", 0) == 0) reason = "(misconfigured-env-key-name)";
        else reason = v ? "(env-empty:" + cfg.api_key_env + ")" : "(env-missing:" + cfg.api_key_env + ")";
    }
    if (!cfg.api_key.empty()) { reason.clear(); return cfg.api_key; }
    if (reason.empty()) reason = "(no-key)";
    return {};
}

LLMCompletion error_completion(const std::string& reason) {
    LLMCompletion c; c.text = reason; c.source = "error"; return c;
}

} // namespace nl2cmd::ai::detail
