/**
 * GlobalCommands.hpp - Session-wide voice commands and reply classification
 *
 * stop / cancel / pause / resume / restart are recognised in every state.
 * Where the command word sits in the sentence decides whether it is an
 * order ("merci, arrête") or just part of a request ("arrête la musique
 * dans le salon").
 */

#pragma once

#include <cstddef>
#include <string>

namespace sui::session {

enum class GlobalCommand {
    None,
    Stop,
    Cancel,
    Pause,
    Resume,
    Restart
};

enum class CommandPosition {
    None,
    End,
    Middle
};

enum class Reply {
    Yes,
    No,
    Unknown
};

const char* toString(GlobalCommand command);
const char* toString(CommandPosition position);
const char* toString(Reply reply);

struct GlobalCommandMatch {
    GlobalCommand command = GlobalCommand::None;
    CommandPosition position = CommandPosition::None;
    size_t word_index = 0;
    size_t word_count = 0;
    bool executable = false;   // act on it immediately

    explicit operator bool() const { return command != GlobalCommand::None; }
};

struct CommandPolicy {
    double end_position_ratio = 0.8;
    size_t max_command_words = 3;
};

class GlobalCommandParser {
public:
    explicit GlobalCommandParser(const CommandPolicy& policy = CommandPolicy{});

    /**
     * The last command word in the utterance decides.
     */
    GlobalCommandMatch parse(const std::string& text) const;

    /**
     * Yes / No / Unknown for a confirmation answer. Negatives win.
     */
    static Reply classifyReply(const std::string& text);

    static GlobalCommand lookup(const std::string& word);

    const CommandPolicy& policy() const { return policy_; }

private:
    CommandPolicy policy_;
};

} // namespace sui::session
