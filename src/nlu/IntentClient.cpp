/**
 * IntentClient.cpp - Intent detection via the llama.cpp server
 */

#include "sui/nlu/IntentClient.hpp"
#include "sui/nlu/LLMClient.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sui::nlu {

// Command catalog understood by the daemon
static const char* INTENT_CATALOG = R"(
Tu es un assistant qui identifie l'intention d'un utilisateur.
Analyse la phrase et retourne un JSON décrivant la commande demandée.

Commandes disponibles :
- help : obtenir de l'aide (params: topic)
- status : état du système
- version : version du logiciel
- capabilities : ce que l'assistant sait faire
- time : heure actuelle
- date : date du jour
- echo : répéter un message (params: message)
- analyze : analyser un fichier ou un projet (params: target)
- explain : expliquer du code ou un concept (params: subject)
- suggest : proposer une amélioration (params: target)
- query : répondre à une question (params: question)
- quit : arrêter l'assistant
- none : aucune commande, simple conversation

Réponds UNIQUEMENT avec un JSON au format :
{"intent": "nom", "params": {...}, "confidence": 0.0-1.0, "summary": "résumé court en français"}
)";

static const std::vector<std::string> SUPPORTED_INTENTS = {
    "help", "status", "version", "capabilities", "time", "date",
    "echo", "analyze", "explain", "suggest", "query", "quit"
};

struct IntentClient::Impl {
    IntentClientConfig config;
    LLMClient client;
    
    explicit Impl(const IntentClientConfig& c)
        : config(c)
        , client(c.server_url, c.timeout_ms) {
    }
    
    std::string buildPrompt(const std::string& text) const {
        std::stringstream prompt;
        prompt << INTENT_CATALOG << "\n\n";
        prompt << "Phrase de l'utilisateur : " << text << "\n\n";
        prompt << "JSON:";
        return prompt.str();
    }
};

IntentClient::IntentClient(const IntentClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
    std::cout << "[IntentClient] Connecting to " << config.server_url << std::endl;
}

IntentClient::~IntentClient() = default;

bool IntentClient::isReady() {
    return impl_->client.isHealthy();
}

std::optional<Intent> IntentClient::extractIntent(const std::string& text) {
    CompletionRequest request;
    request.prompt = impl_->buildPrompt(text);
    request.max_tokens = impl_->config.max_tokens;
    request.temperature = 0.1f;  // Low temperature for structured output
    request.stop = {"\n\n", "Phrase de l'utilisateur"};
    
    auto response = impl_->client.complete(request);
    if (!response.error.empty()) {
        throw std::runtime_error("intent server: " + response.error);
    }
    
    if (response.content.empty()) {
        std::cerr << "[IntentClient] Empty response from server" << std::endl;
        return std::nullopt;
    }
    
    return parseResponse(response.content, text, impl_->config.min_confidence);
}

std::vector<std::string> IntentClient::supportedIntents() const {
    return SUPPORTED_INTENTS;
}

std::optional<Intent> IntentClient::parseResponse(const std::string& response,
                                                  const std::string& raw_text,
                                                  float min_confidence) {
    // Find JSON in response
    size_t start = response.find('{');
    size_t end = response.rfind('}');
    
    if (start == std::string::npos || end == std::string::npos || end < start) {
        return std::nullopt;
    }
    
    std::string json_str = response.substr(start, end - start + 1);
    
    try {
        json j = json::parse(json_str);
        
        Intent intent;
        intent.raw_text = raw_text;
        intent.type = j.value("intent", "none");
        intent.confidence = j.value("confidence", 0.0f);
        intent.human_summary = j.value("summary", "");
        
        if (j.contains("params") && j["params"].is_object()) {
            for (auto& [key, value] : j["params"].items()) {
                if (value.is_string()) {
                    intent.parameters[key] = value.get<std::string>();
                } else if (!value.is_null()) {
                    intent.parameters[key] = value.dump();
                }
            }
        }
        
        if (intent.type.empty() || intent.type == "none" || intent.confidence < min_confidence) {
            return std::nullopt;
        }
        
        if (intent.human_summary.empty()) {
            intent.human_summary = summarizeIntent(intent);
        }
        return intent;
        
    } catch (const json::exception& e) {
        std::cerr << "[IntentClient] JSON parse error: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace sui::nlu
