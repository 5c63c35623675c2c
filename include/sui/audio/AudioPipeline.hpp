/**
 * AudioPipeline.hpp - WebRTC AEC3 echo canceller (optional, SUI_HAS_AEC3)
 *
 * Render audio (what the speaker plays) is fed as reference; captured
 * frames are cleaned in place before classification.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace sui::audio {

class AudioPipeline {
public:
    /**
     * @param sample_rate 16000, 32000 or 48000
     */
    explicit AudioPipeline(int sample_rate, int num_channels = 1);
    ~AudioPipeline();

    AudioPipeline(const AudioPipeline&) = delete;
    AudioPipeline& operator=(const AudioPipeline&) = delete;

    bool isInitialized() const;

    /**
     * Reference signal sent to the speaker. Thread-safe with processCapture.
     */
    void feedRenderAudio(const float* samples, size_t count);

    /**
     * Cancel echo in whole 10ms blocks; a trailing partial block is left as is.
     */
    void processCapture(std::vector<float>& samples);

    size_t blocksProcessed() const;

    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace sui::audio
