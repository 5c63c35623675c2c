/**
 * CommandExecutor.hpp - Command dispatch collaborator interface
 */

#pragma once

#include "sui/nlu/Intent.hpp"

#include <string>

namespace sui::daemon {

struct CommandResult {
    bool success = false;
    std::string message;
};

class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    /**
     * Execute a confirmed intent. May block; called off the state machine thread.
     */
    virtual CommandResult dispatch(const nlu::Intent& intent) = 0;
};

} // namespace sui::daemon
