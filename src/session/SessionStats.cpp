/**
 * SessionStats.cpp - Spoken statistics summary
 */

#include "sui/session/SessionStats.hpp"

#include <sstream>

namespace sui::session {

std::string describeStats(const SessionStats& stats) {
    std::ostringstream out;
    out << "Depuis le début de la session, j'ai reçu " << stats.transcriptions_received
        << " transcriptions pour " << stats.words_transcribed << " mots, et traité "
        << stats.commands_processed << " commandes.";
    if (stats.command_failures > 0) {
        out << " " << stats.command_failures << " commandes ont échoué.";
    }
    if (stats.echoes_suppressed > 0) {
        out << " J'ai ignoré " << stats.echoes_suppressed << " échos de ma propre voix.";
    }
    return out.str();
}

} // namespace sui::session
