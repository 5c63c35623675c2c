/**
 * SessionStats.hpp - Counters reported by the interaction state machine
 */

#pragma once

#include <cstddef>
#include <string>

namespace sui::session {

struct SessionStats {
    size_t segments_processed = 0;
    size_t batches_completed = 0;
    size_t transcriptions_received = 0;
    size_t words_transcribed = 0;
    size_t echoes_suppressed = 0;
    size_t intents_extracted = 0;
    size_t intents_cancelled = 0;
    size_t commands_processed = 0;
    size_t command_failures = 0;
};

/**
 * Spoken French summary, answered locally for "statistiques".
 */
std::string describeStats(const SessionStats& stats);

} // namespace sui::session
