/**
 * Intent.cpp - Intent helpers
 */

#include "sui/nlu/Intent.hpp"

namespace sui::nlu {

std::string summarizeIntent(const Intent& intent) {
    std::string summary = intent.type;
    if (intent.parameters.empty()) {
        return summary;
    }

    summary += " (";
    bool first = true;
    for (const auto& [key, value] : intent.parameters) {
        if (!first) summary += ", ";
        summary += value;
        first = false;
    }
    summary += ")";
    return summary;
}

} // namespace sui::nlu
