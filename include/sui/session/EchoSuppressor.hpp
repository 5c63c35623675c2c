/**
 * EchoSuppressor.hpp - Rejects transcriptions of the assistant's own voice
 *
 * Remembers the last sentence spoken and when playback finished. A
 * transcription arriving shortly after that and sharing most of its
 * words is treated as the microphone hearing the speaker.
 */

#pragma once

#include "sui/core/Time.hpp"

#include <optional>
#include <string>

namespace sui::session {

struct EchoConfig {
    double similarity_threshold = 0.5;   // echo if strictly above
    double window = 1.0;                 // seconds after playback ended
    float post_speech_energy = 0.015f;   // capture energy gate inside the window
};

class EchoSuppressor {
public:
    explicit EchoSuppressor(const EchoConfig& config = EchoConfig{});

    void recordSpoken(const std::string& text, TimePoint finished_at);

    bool isEcho(const std::string& text, TimePoint now) const;

    bool inEchoWindow(TimePoint now) const;

    void clear();

    /**
     * |A ∩ B| / |A ∪ B| over lower-cased word sets; 0 if either is empty.
     */
    static double similarity(const std::string& a, const std::string& b);

    const std::string& lastSpoken() const { return last_spoken_; }
    const EchoConfig& config() const { return config_; }

private:
    EchoConfig config_;
    std::string last_spoken_;
    std::optional<TimePoint> finished_at_;
};

} // namespace sui::session
