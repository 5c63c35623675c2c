/**
 * LLMClient.hpp - HTTP client for a llama.cpp server
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace sui::nlu {

struct CompletionRequest {
    std::string prompt;
    int max_tokens = 256;
    float temperature = 0.1f;
    float top_p = 0.9f;
    std::vector<std::string> stop;
};

struct CompletionResponse {
    std::string content;
    int tokens_generated = 0;
    int tokens_prompt = 0;
    bool stopped = false;
    std::string stop_reason;
    std::string error;   // empty on success
};

class LLMClient {
public:
    LLMClient(const std::string& base_url, int timeout_ms);
    ~LLMClient();

    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    bool isHealthy();

    CompletionResponse complete(const CompletionRequest& request);

    const std::string& baseUrl() const { return base_url_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string base_url_;
};

} // namespace sui::nlu
