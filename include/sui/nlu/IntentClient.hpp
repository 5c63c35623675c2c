/**
 * IntentClient.hpp - Intent extraction through a llama.cpp server
 *
 * Prompts the model with the catalog of commands the daemon understands
 * and parses the JSON it answers with.
 */

#pragma once

#include "sui/nlu/Intent.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sui::nlu {

struct IntentClientConfig {
    std::string server_url = "http://localhost:8080";
    int timeout_ms = 30000;
    int max_tokens = 256;
    float min_confidence = 0.3f;   // below this the answer counts as "none"
};

class IntentClient : public IntentExtractor {
public:
    explicit IntentClient(const IntentClientConfig& config = IntentClientConfig{});
    ~IntentClient() override;

    /**
     * @throws std::runtime_error when the server cannot be reached
     */
    std::optional<Intent> extractIntent(const std::string& text) override;

    bool isReady();

    std::vector<std::string> supportedIntents() const;

    /**
     * Parse a model answer. Returns nullopt for "none", unknown JSON or a
     * confidence below min_confidence.
     */
    static std::optional<Intent> parseResponse(const std::string& response,
                                               const std::string& raw_text,
                                               float min_confidence);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sui::nlu
