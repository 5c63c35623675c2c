/**
 * SegmentClassifier.cpp - Voice Activity Detection via libfvad
 *
 * Each frame is classified on its own: RMS energy plus the WebRTC VAD
 * verdict over 10/20/30ms sub-frames. Falls back to an energy threshold
 * when libfvad cannot handle the sample rate.
 */

#include "sui/audio/SegmentClassifier.hpp"
#include "sui/Config.hpp"

#include <fvad.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <vector>

namespace sui::audio {

struct SegmentClassifier::Impl {
    Fvad* vad = nullptr;
    ClassifierConfig config;
    size_t subframe_samples = 0;
    std::vector<int16_t> frame16;

    ~Impl() {
        if (vad) {
            fvad_free(vad);
        }
    }

    bool runVad(const std::vector<float>& samples) {
        frame16.resize(subframe_samples);

        for (size_t offset = 0; offset + subframe_samples <= samples.size(); offset += subframe_samples) {
            // Convert float to int16 for libfvad
            for (size_t i = 0; i < subframe_samples; ++i) {
                float sample = std::clamp(samples[offset + i], -1.0f, 1.0f);
                frame16[i] = static_cast<int16_t>(sample * 32767.0f);
            }

            int result = fvad_process(vad, frame16.data(), subframe_samples);
            if (result == 1) {
                return true;
            }
            if (result < 0) {
                // Should not happen with a validated sub-frame size
                std::cerr << "[SegmentClassifier] fvad_process rejected frame" << std::endl;
                return false;
            }
        }
        return false;
    }
};

SegmentClassifier::SegmentClassifier(const ClassifierConfig& config)
    : pImpl_(std::make_unique<Impl>())
{
    requireValid(validate(config), "SegmentClassifier");
    pImpl_->config = config;
    pImpl_->subframe_samples = static_cast<size_t>(config.sample_rate * config.subframe_ms / 1000);

    if (!config.use_vad) {
        std::cout << "[SegmentClassifier] Energy detection only (threshold="
                  << config.energy_threshold << ")" << std::endl;
        return;
    }

    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[SegmentClassifier] Failed to create fvad instance, using energy threshold" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, config.sample_rate) < 0) {
        std::cerr << "[SegmentClassifier] Sample rate " << config.sample_rate
                  << "Hz not supported by fvad, using energy threshold" << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, static_cast<int>(config.mode)) < 0) {
        std::cerr << "[SegmentClassifier] Invalid mode" << std::endl;
    }

    std::cout << "[SegmentClassifier] Initialized (sample_rate=" << config.sample_rate
              << "Hz, subframe=" << config.subframe_ms << "ms, mode=" << static_cast<int>(config.mode) << ")"
              << std::endl;
}

SegmentClassifier::~SegmentClassifier() = default;

AudioSegment SegmentClassifier::classify(AudioFrame frame) {
    AudioSegment segment;
    segment.sample_rate = frame.sample_rate > 0 ? frame.sample_rate : pImpl_->config.sample_rate;
    segment.timestamp = frame.timestamp;

    if (frame.samples.empty()) {
        return segment;
    }

    segment.duration = static_cast<double>(frame.samples.size()) / segment.sample_rate;

    const bool finite = std::all_of(frame.samples.begin(), frame.samples.end(),
                                    [](float s) { return std::isfinite(s); });
    if (!finite) {
        std::cerr << "[SegmentClassifier] Non-finite samples, frame treated as silence" << std::endl;
        segment.samples = std::move(frame.samples);
        return segment;
    }

    segment.energy_level = computeEnergy(frame.samples.data(), frame.samples.size());

    bool voiced;
    if (pImpl_->vad && segment.sample_rate == pImpl_->config.sample_rate &&
        frame.samples.size() >= pImpl_->subframe_samples) {
        fvad_reset(pImpl_->vad);
        voiced = pImpl_->runVad(frame.samples);
    } else {
        voiced = segment.energy_level > pImpl_->config.energy_threshold;
    }

    segment.has_speech = voiced && segment.energy_level >= pImpl_->config.min_speech_energy;
    segment.samples = std::move(frame.samples);
    return segment;
}

bool SegmentClassifier::hasVoiceModel() const {
    return pImpl_->vad != nullptr;
}

const ClassifierConfig& SegmentClassifier::config() const {
    return pImpl_->config;
}

float SegmentClassifier::computeEnergy(const float* samples, size_t count) {
    if (!samples || count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    float rms = static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
    return std::isfinite(rms) ? rms : 0.0f;
}

} // namespace sui::audio
