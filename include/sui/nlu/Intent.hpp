/**
 * Intent.hpp - Structured interpretation of a user utterance
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace sui::nlu {

struct Intent {
    std::string raw_text;
    std::string type;
    std::map<std::string, std::string> parameters;
    float confidence = 0.0f;
    std::string human_summary;
};

class IntentExtractor {
public:
    virtual ~IntentExtractor() = default;

    /**
     * @return nullopt when no actionable intent was found
     */
    virtual std::optional<Intent> extractIntent(const std::string& text) = 0;
};

/**
 * Spoken summary: "type (value1, value2)", or just the type without parameters.
 */
std::string summarizeIntent(const Intent& intent);

} // namespace sui::nlu
