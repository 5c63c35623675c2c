/**
 * AudioPipeline.cpp - WebRTC AEC3 integration for echo cancellation
 * 
 * Removes residual speaker echo from microphone frames before they reach
 * the segment classifier.
 */

#include "sui/audio/AudioPipeline.hpp"

#include "audio_processing/aec3/echo_canceller3.h"
#include "audio_processing/audio_buffer.h"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace sui::audio {

// AEC3 processes in 10ms blocks
constexpr int BLOCK_MS = 10;

// AudioBuffer channels hold floats in int16 range
constexpr float S16_SCALE = 32768.0f;

struct AudioPipeline::Impl {
    std::unique_ptr<webrtc::EchoCanceller3> aec3;
    std::unique_ptr<webrtc::AudioBuffer> render_buffer;
    std::unique_ptr<webrtc::AudioBuffer> capture_buffer;
    
    int sample_rate = 0;
    size_t block_samples = 0;
    
    // Render samples waiting for a full block
    std::vector<float> render_pending;
    
    std::mutex mutex;
    size_t blocks = 0;
    bool initialized = false;
    
    std::unique_ptr<webrtc::AudioBuffer> makeBuffer(int channels) const {
        return std::make_unique<webrtc::AudioBuffer>(
            sample_rate, channels,
            sample_rate, channels,
            sample_rate, channels
        );
    }
};

AudioPipeline::AudioPipeline(int sample_rate, int num_channels)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->block_samples = static_cast<size_t>(sample_rate * BLOCK_MS / 1000);
    
    if (sample_rate != 16000 && sample_rate != 32000 && sample_rate != 48000) {
        std::cerr << "[AudioPipeline] Invalid sample rate: " << sample_rate 
                  << " (must be 16000, 32000, or 48000)" << std::endl;
        return;
    }
    
    webrtc::EchoCanceller3Config config;
    
    try {
        pImpl_->aec3 = std::make_unique<webrtc::EchoCanceller3>(
            config,
            sample_rate,
            num_channels,  // render channels
            num_channels   // capture channels
        );
        pImpl_->render_buffer = pImpl_->makeBuffer(num_channels);
        pImpl_->capture_buffer = pImpl_->makeBuffer(num_channels);
        pImpl_->initialized = true;
        
        std::cout << "[AudioPipeline] AEC3 initialized (sample_rate=" << sample_rate 
                  << "Hz, block=" << pImpl_->block_samples << " samples)" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[AudioPipeline] AEC3 initialization failed: " << e.what() << std::endl;
    }
}

AudioPipeline::~AudioPipeline() = default;

bool AudioPipeline::isInitialized() const {
    return pImpl_->initialized;
}

void AudioPipeline::feedRenderAudio(const float* samples, size_t count) {
    if (!pImpl_->initialized || !samples) return;
    
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    auto& pending = pImpl_->render_pending;
    pending.insert(pending.end(), samples, samples + count);
    
    size_t offset = 0;
    while (pending.size() - offset >= pImpl_->block_samples) {
        float* const* channel = pImpl_->render_buffer->channels_f();
        std::transform(pending.begin() + offset, pending.begin() + offset + pImpl_->block_samples,
                       channel[0], [](float v) { return v * S16_SCALE; });
        pImpl_->aec3->AnalyzeRender(pImpl_->render_buffer.get());
        offset += pImpl_->block_samples;
    }
    pending.erase(pending.begin(), pending.begin() + offset);
}

void AudioPipeline::processCapture(std::vector<float>& samples) {
    if (!pImpl_->initialized) return;
    
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    const size_t block = pImpl_->block_samples;
    
    for (size_t offset = 0; offset + block <= samples.size(); offset += block) {
        float* const* channel = pImpl_->capture_buffer->channels_f();
        std::transform(samples.begin() + offset, samples.begin() + offset + block,
                       channel[0], [](float v) { return v * S16_SCALE; });
        
        pImpl_->aec3->AnalyzeCapture(pImpl_->capture_buffer.get());
        pImpl_->aec3->ProcessCapture(pImpl_->capture_buffer.get(), false);
        
        const float* const* processed = pImpl_->capture_buffer->channels_const_f();
        std::transform(processed[0], processed[0] + block, samples.begin() + offset,
                       [](float v) { return std::clamp(v / S16_SCALE, -1.0f, 1.0f); });
        pImpl_->blocks++;
    }
}

size_t AudioPipeline::blocksProcessed() const {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    return pImpl_->blocks;
}

void AudioPipeline::reset() {
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    pImpl_->render_pending.clear();
    pImpl_->blocks = 0;
    std::cout << "[AudioPipeline] Reset" << std::endl;
}

} // namespace sui::audio
