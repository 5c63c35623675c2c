/**
 * GlobalCommands.cpp - Global command vocabulary and quit position policy
 */

#include "sui/session/GlobalCommands.hpp"
#include "sui/session/Text.hpp"
#include "sui/Config.hpp"

#include <map>
#include <set>

namespace sui::session {

namespace {

const std::map<std::string, GlobalCommand> VOCABULARY = {
    {"stop", GlobalCommand::Stop},
    {"arrête", GlobalCommand::Stop},
    {"arrêter", GlobalCommand::Stop},
    {"arrêtez", GlobalCommand::Stop},
    {"arrete", GlobalCommand::Stop},
    {"quitte", GlobalCommand::Stop},
    {"quitter", GlobalCommand::Stop},
    {"quit", GlobalCommand::Stop},
    {"exit", GlobalCommand::Stop},

    {"cancel", GlobalCommand::Cancel},
    {"annule", GlobalCommand::Cancel},
    {"annuler", GlobalCommand::Cancel},

    {"pause", GlobalCommand::Pause},
    {"wait", GlobalCommand::Pause},
    {"attends", GlobalCommand::Pause},

    {"resume", GlobalCommand::Resume},
    {"reprends", GlobalCommand::Resume},
    {"continue", GlobalCommand::Resume},

    {"restart", GlobalCommand::Restart},
    {"recommence", GlobalCommand::Restart},
};

const std::set<std::string> NEGATIVE_REPLIES = {
    "non", "no", "nan", "nope", "jamais", "faux", "incorrect", "aucunement"
};

// "pas" followed by one of these refuses without a "ne" ("pas ça", "pas d'accord")
const std::set<std::string> NEGATED_AFTER_PAS = {
    "ça", "ca", "cela", "du", "question", "maintenant", "vraiment", "exactement",
    "correct", "bon", "bien", "d'accord", "accord", "ok", "okay", "comme"
};

const std::set<std::string> POSITIVE_REPLIES = {
    "oui", "yes", "ouais", "ouep", "ok", "okay", "accord", "d'accord", "exactement",
    "parfait", "confirme", "confirmé", "correct", "absolument", "vas-y", "volontiers",
    "bien", "ça", "yep", "tout-à-fait", "évidemment"
};

} // namespace

const char* toString(GlobalCommand command) {
    switch (command) {
        case GlobalCommand::None:    return "none";
        case GlobalCommand::Stop:    return "stop";
        case GlobalCommand::Cancel:  return "cancel";
        case GlobalCommand::Pause:   return "pause";
        case GlobalCommand::Resume:  return "resume";
        case GlobalCommand::Restart: return "restart";
    }
    return "unknown";
}

const char* toString(CommandPosition position) {
    switch (position) {
        case CommandPosition::None:   return "none";
        case CommandPosition::End:    return "end";
        case CommandPosition::Middle: return "middle";
    }
    return "unknown";
}

const char* toString(Reply reply) {
    switch (reply) {
        case Reply::Yes:     return "yes";
        case Reply::No:      return "no";
        case Reply::Unknown: return "unknown";
    }
    return "unknown";
}

GlobalCommandParser::GlobalCommandParser(const CommandPolicy& policy)
    : policy_(policy) {
    requireValid(validate(policy), "GlobalCommandParser");
}

GlobalCommand GlobalCommandParser::lookup(const std::string& word) {
    std::string base = stripElision(word);

    // "arrête-toi", "attends-moi"
    size_t hyphen = base.find('-');
    if (hyphen != std::string::npos && hyphen > 0) {
        base = base.substr(0, hyphen);
    }

    auto it = VOCABULARY.find(base);
    return it != VOCABULARY.end() ? it->second : GlobalCommand::None;
}

GlobalCommandMatch GlobalCommandParser::parse(const std::string& text) const {
    GlobalCommandMatch match;
    auto words = tokenizeWords(text);
    match.word_count = words.size();

    for (size_t i = 0; i < words.size(); ++i) {
        GlobalCommand command = lookup(words[i]);
        if (command != GlobalCommand::None) {
            match.command = command;
            match.word_index = i;
        }
    }

    if (!match) {
        return match;
    }

    const double threshold = policy_.end_position_ratio * static_cast<double>(match.word_count);
    match.position = static_cast<double>(match.word_index) >= threshold
        ? CommandPosition::End
        : CommandPosition::Middle;
    match.executable = match.position == CommandPosition::End ||
                       match.word_count <= policy_.max_command_words;
    return match;
}

Reply GlobalCommandParser::classifyReply(const std::string& text) {
    const auto words = tokenizeWords(text);
    bool positive = false;
    bool negationOpened = false;  // "ne" or "n'" seen, waiting for "pas"

    for (size_t i = 0; i < words.size(); ++i) {
        const std::string& word = words[i];
        if (NEGATIVE_REPLIES.count(word)) {
            return Reply::No;
        }
        if (word == "ne" || word.rfind("n'", 0) == 0) {
            negationOpened = true;
        }
        if (word == "pas") {
            const bool refusal = i + 1 < words.size() &&
                (NEGATED_AFTER_PAS.count(words[i + 1]) ||
                 NEGATED_AFTER_PAS.count(stripElision(words[i + 1])));
            if (negationOpened || refusal) {
                return Reply::No;
            }
            // "pourquoi pas", "pas mal"
            continue;
        }
        if (POSITIVE_REPLIES.count(word) || POSITIVE_REPLIES.count(stripElision(word))) {
            positive = true;
        }
    }
    return positive ? Reply::Yes : Reply::Unknown;
}

} // namespace sui::session
