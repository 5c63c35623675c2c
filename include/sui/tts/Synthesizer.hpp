/**
 * Synthesizer.hpp - Speech synthesis collaborator interface
 */

#pragma once

#include <string>

namespace sui::tts {

struct SynthesisResult {
    bool success = false;
    double audio_duration = 0.0;  // seconds played
    std::string error;
};

class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    /**
     * Speak text and return once playback finished.
     */
    virtual SynthesisResult synthesize(const std::string& text) = 0;
};

} // namespace sui::tts
