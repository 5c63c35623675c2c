/**
 * CaptureLoop.hpp - Capture thread: source -> classifier -> batcher
 */

#pragma once

#include "sui/audio/AudioTypes.hpp"
#include "sui/audio/MicrophoneGate.hpp"
#include "sui/audio/SegmentClassifier.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace sui::speech {
class SpeechBatcher;
}

namespace sui::audio {

struct CaptureConfig {
    int frame_timeout_ms = 100;
    float post_speech_energy = 0.015f;  // energy gate during the echo window
    bool verbose = false;
};

struct CaptureStats {
    size_t frames_captured = 0;
    size_t frames_drained = 0;
    size_t frames_monitored = 0;
    size_t segments_forwarded = 0;
    size_t segments_rejected = 0;   // batcher queue full
    size_t echo_gated = 0;
    size_t capture_errors = 0;
};

class CaptureLoop {
public:
    // Receives frames while the gate is Monitoring (wake word)
    using FrameMonitor = std::function<void(const AudioFrame&)>;
    // Optional in-place filter applied before classification (echo canceller)
    using FrameFilter = std::function<void(std::vector<float>&)>;

    CaptureLoop(AudioSource& source,
                SegmentClassifier& classifier,
                speech::SpeechBatcher& batcher,
                const MicrophoneGate& gate,
                const CaptureConfig& config = CaptureConfig{});
    ~CaptureLoop();

    CaptureLoop(const CaptureLoop&) = delete;
    CaptureLoop& operator=(const CaptureLoop&) = delete;

    bool start();
    void stop();
    bool isRunning() const;

    // Both must be set before start()
    void setMonitor(FrameMonitor monitor);
    void setFilter(FrameFilter filter);

    /**
     * One loop iteration for a frame already captured.
     * @return true if a segment was handed to the batcher
     */
    bool processFrame(AudioFrame frame);

    CaptureStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace sui::audio
