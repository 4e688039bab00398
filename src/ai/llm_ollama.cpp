#include <ai-cmdguard/ai/llm.hpp>
#include <ai-cmdguard/util/log.hpp>
#include <curl/curl.h>
#include <sstream>
#include <string>
#include <optional>

namespace cmdguard::ai {

static size_t curl_write_cb_ollama(char* ptr, size_t size, size_t nmemb, void* userdata){
    auto* out = static_cast<std::string*>(userdata); out->append(ptr, size*nmemb); return size*nmemb;
}

std::optional<LLMCompletion> OllamaLLMClient::complete(const std::string& prompt) {
    std::string base = m_cfg.endpoint.empty() ? "http://localhost:11434" : m_cfg.endpoint;
    while (!base.empty() && base.back()=='/') base.pop_back();
    std::string endpoint = base + "/api/generate";
    CURL* curl = curl_easy_init(); if (!curl) return LLMCompletion{"(curl-init-fail)", "error"};
    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb_ollama);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_cfg.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    struct curl_slist* headers=nullptr; headers=curl_slist_append(headers, "Content-Type: application/json"); curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    // Body conforme API generate: {"model":"<model>","prompt":"...","stream":false}
    std::ostringstream body; body << "{\"model\":\"" << json_escape(m_cfg.model.empty()?"mistral":m_cfg.model) << "\",\"prompt\":\"" << json_escape(prompt) << "\",\"stream\":false}";
    std::string b = body.str(); curl_easy_setopt(curl, CURLOPT_POST, 1L); curl_easy_setopt(curl, CURLOPT_POSTFIELDS, b.c_str());
    log::debug("POST " + endpoint + " model=" + m_cfg.model);
    auto res = curl_easy_perform(curl); long code=0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(headers); curl_easy_cleanup(curl);
    if (res != CURLE_OK) return LLMCompletion{std::string("(ollama error: ") + curl_easy_strerror(res) + ")", "error"};
    if (code/100 != 2) return LLMCompletion{"(ollama error code=" + std::to_string(code) + ")", "error"};
    auto text = json_string_field(response, "response");
    if (!text || text->empty()) return LLMCompletion{"(parse-empty)", "error"};
    return LLMCompletion{*text, "ollama"};
}

} // namespace cmdguard::ai
