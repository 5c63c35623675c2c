/**
 * SegmentClassifier.hpp - Per-frame voice activity classification
 *
 * Turns an AudioFrame into an AudioSegment carrying its RMS energy and a
 * speech/non-speech decision. Uses libfvad when the sample rate allows it
 * and an energy threshold otherwise.
 */

#pragma once

#include "sui/audio/AudioTypes.hpp"

#include <memory>

namespace sui::audio {

struct ClassifierConfig {
    int sample_rate = DEFAULT_SAMPLE_RATE;
    VADMode mode = VADMode::Aggressive;
    int subframe_ms = 10;              // 10, 20 or 30
    float energy_threshold = 0.01f;    // fallback decision
    float min_speech_energy = 0.005f;  // voiced frames below this are rejected
    bool use_vad = true;
};

class SegmentClassifier {
public:
    explicit SegmentClassifier(const ClassifierConfig& config = ClassifierConfig{});
    ~SegmentClassifier();

    SegmentClassifier(const SegmentClassifier&) = delete;
    SegmentClassifier& operator=(const SegmentClassifier&) = delete;

    /**
     * Classify one frame. Takes ownership of the samples. Never throws.
     */
    AudioSegment classify(AudioFrame frame);

    /**
     * True when libfvad accepted the configuration; otherwise only the
     * energy threshold is used.
     */
    bool hasVoiceModel() const;

    const ClassifierConfig& config() const;

    static float computeEnergy(const float* samples, size_t count);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace sui::audio
