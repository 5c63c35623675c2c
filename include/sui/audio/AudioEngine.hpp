/**
 * AudioEngine.hpp - PortAudio capture and playback
 *
 * Capture is exposed as an AudioSource: the input callback fills a ring
 * buffer and captureFrame() hands out fixed-size frames. Playback is a
 * second ring buffer drained by the output callback.
 */

#pragma once

#include "sui/audio/AudioTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sui::audio {

struct AudioConfig {
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = 1;
    int frame_ms = 20;              // capture frame handed to the classifier
    int frames_per_buffer = 160;    // PortAudio buffer size
    int input_device = -1;          // -1 = default
    int output_device = -1;
    double capture_buffer_seconds = 2.0;
    double playback_buffer_seconds = 30.0;

    int frameSamples() const { return sample_rate * frame_ms / 1000; }
};

class AudioEngine : public AudioSource {
public:
    explicit AudioEngine(const AudioConfig& config = AudioConfig{});
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();
    bool start();
    void stop();
    bool isRunning() const;

    std::optional<AudioFrame> captureFrame(std::chrono::milliseconds timeout) override;

    /**
     * Queue samples (at the engine sample rate) for playback.
     * @return number of samples accepted
     */
    size_t queuePlayback(const float* samples, size_t count);
    void clearPlayback();
    bool isPlaying() const;

    /**
     * Samples dropped because the capture buffer was full.
     */
    size_t droppedCaptureSamples() const;

    const AudioConfig& config() const { return config_; }
    std::string lastError() const;

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace sui::audio
