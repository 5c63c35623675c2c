/**
 * CaptureLoop.cpp - Capture thread feeding the speech batcher
 *
 * Pulls frames from the AudioSource and routes them according to the
 * microphone gate, which is read once per frame.
 */

#include "sui/audio/CaptureLoop.hpp"
#include "sui/speech/SpeechBatcher.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>

namespace sui::audio {

const char* toString(MicState state) {
    switch (state) {
        case MicState::Inactive:             return "Inactive";
        case MicState::Monitoring:           return "Monitoring";
        case MicState::Active:               return "Active";
        case MicState::SuspendedForPlayback: return "SuspendedForPlayback";
    }
    return "Unknown";
}

struct CaptureLoop::Impl {
    AudioSource& source;
    SegmentClassifier& classifier;
    speech::SpeechBatcher& batcher;
    const MicrophoneGate& gate;
    CaptureConfig config;

    FrameMonitor monitor;
    FrameFilter filter;

    std::thread thread;
    std::atomic<bool> running{false};

    mutable std::mutex statsMutex;
    CaptureStats stats;

    Impl(AudioSource& s, SegmentClassifier& c, speech::SpeechBatcher& b,
         const MicrophoneGate& g, const CaptureConfig& cfg)
        : source(s), classifier(c), batcher(b), gate(g), config(cfg) {}

    void loop() {
        const auto timeout = std::chrono::milliseconds(config.frame_timeout_ms);

        while (running) {
            std::optional<AudioFrame> frame;
            try {
                frame = source.captureFrame(timeout);
            } catch (const std::exception& e) {
                {
                    std::lock_guard<std::mutex> lock(statsMutex);
                    stats.capture_errors++;
                }
                std::cerr << "[CaptureLoop] Capture error: " << e.what() << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }

            if (frame) {
                route(std::move(*frame));
            }
        }
    }

    bool route(AudioFrame frame) {
        {
            std::lock_guard<std::mutex> lock(statsMutex);
            stats.frames_captured++;
        }

        switch (gate.state()) {
            case MicState::Inactive:
            case MicState::SuspendedForPlayback: {
                std::lock_guard<std::mutex> lock(statsMutex);
                stats.frames_drained++;
                return false;
            }
            case MicState::Monitoring: {
                if (monitor) {
                    monitor(frame);
                }
                std::lock_guard<std::mutex> lock(statsMutex);
                stats.frames_monitored++;
                return false;
            }
            case MicState::Active:
                break;
        }

        if (filter) {
            filter(frame.samples);
        }

        AudioSegment segment = classifier.classify(std::move(frame));

        // Residual echo right after playback is quieter than a user talking
        if (segment.has_speech && gate.inEchoGuard(segment.timestamp) &&
            segment.energy_level < config.post_speech_energy) {
            segment.has_speech = false;
            std::lock_guard<std::mutex> lock(statsMutex);
            stats.echo_gated++;
        }

        if (config.verbose && segment.has_speech) {
            std::cout << "[CaptureLoop] Speech frame (energy=" << segment.energy_level << ")" << std::endl;
        }

        bool accepted = batcher.addSegment(std::move(segment));
        std::lock_guard<std::mutex> lock(statsMutex);
        if (accepted) {
            stats.segments_forwarded++;
        } else {
            stats.segments_rejected++;
        }
        return accepted;
    }
};

CaptureLoop::CaptureLoop(AudioSource& source,
                         SegmentClassifier& classifier,
                         speech::SpeechBatcher& batcher,
                         const MicrophoneGate& gate,
                         const CaptureConfig& config)
    : pImpl_(std::make_unique<Impl>(source, classifier, batcher, gate, config))
{
}

CaptureLoop::~CaptureLoop() {
    stop();
}

bool CaptureLoop::start() {
    if (pImpl_->running.exchange(true)) {
        return true;
    }
    pImpl_->thread = std::thread(&Impl::loop, pImpl_.get());
    std::cout << "[CaptureLoop] Started" << std::endl;
    return true;
}

void CaptureLoop::stop() {
    if (!pImpl_->running.exchange(false)) {
        return;
    }
    if (pImpl_->thread.joinable()) {
        pImpl_->thread.join();
    }

    auto s = stats();
    std::cout << "[CaptureLoop] Stopped (" << s.frames_captured << " frames, "
              << s.segments_forwarded << " forwarded, " << s.capture_errors << " errors)" << std::endl;
}

bool CaptureLoop::isRunning() const {
    return pImpl_->running;
}

void CaptureLoop::setMonitor(FrameMonitor monitor) {
    pImpl_->monitor = std::move(monitor);
}

void CaptureLoop::setFilter(FrameFilter filter) {
    pImpl_->filter = std::move(filter);
}

bool CaptureLoop::processFrame(AudioFrame frame) {
    return pImpl_->route(std::move(frame));
}

CaptureStats CaptureLoop::stats() const {
    std::lock_guard<std::mutex> lock(pImpl_->statsMutex);
    return pImpl_->stats;
}

} // namespace sui::audio
