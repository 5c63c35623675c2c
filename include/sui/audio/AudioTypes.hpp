/**
 * AudioTypes.hpp - Frames, segments and the capture interface
 */

#pragma once

#include "sui/core/Time.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace sui::audio {

constexpr int DEFAULT_SAMPLE_RATE = 16000;

/**
 * Raw mono float PCM block as delivered by the capture device.
 */
struct AudioFrame {
    std::vector<float> samples;
    int sample_rate = DEFAULT_SAMPLE_RATE;
    TimePoint timestamp{};
};

/**
 * A classified frame. timestamp is the capture time of the segment's end.
 */
struct AudioSegment {
    std::vector<float> samples;
    int sample_rate = DEFAULT_SAMPLE_RATE;
    TimePoint timestamp{};
    double duration = 0.0;  // seconds
    bool has_speech = false;
    float energy_level = 0.0f;
};

/**
 * VAD aggressiveness, least to most aggressive (libfvad modes 0-3)
 */
enum class VADMode {
    Quality = 0,
    LowBitrate = 1,
    Aggressive = 2,
    VeryAggressive = 3
};

/**
 * Source of captured frames (microphone, file, test fixture).
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /**
     * Block up to timeout for the next frame.
     * @return nullopt if nothing arrived in time
     */
    virtual std::optional<AudioFrame> captureFrame(std::chrono::milliseconds timeout) = 0;
};

} // namespace sui::audio
