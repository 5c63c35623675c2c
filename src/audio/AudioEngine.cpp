/**
 * AudioEngine.cpp - PortAudio capture and playback
 * 
 * The input callback writes into a capture ring buffer that captureFrame()
 * slices into fixed-size frames; the output callback drains the playback
 * ring buffer filled by the synthesizer.
 */

#include "sui/audio/AudioEngine.hpp"
#include "sui/audio/RingBuffer.hpp"

#include <portaudio.h>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <cstring>

namespace sui::audio {

// Forward declare Impl for callbacks
struct AudioEngineImpl {
    PaStream* inputStream = nullptr;
    PaStream* outputStream = nullptr;
    
    RingBuffer<float> captureBuffer;
    RingBuffer<float> playbackBuffer;
    
    std::atomic<bool> running{false};
    std::atomic<bool> initialized{false};
    std::atomic<size_t> droppedSamples{0};
    
    // Wakes captureFrame() when the input callback delivered samples
    std::mutex captureMutex;
    std::condition_variable captureReady;
    
    std::string lastError;
    
    AudioConfig config;
    
    explicit AudioEngineImpl(const AudioConfig& c)
        : captureBuffer(static_cast<size_t>(c.sample_rate * c.capture_buffer_seconds))
        , playbackBuffer(static_cast<size_t>(c.sample_rate * c.playback_buffer_seconds))
        , config(c) {}
};

/**
 * PortAudio callback for input stream
 */
static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

/**
 * PortAudio callback for output stream
 */
static int outputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

struct AudioEngine::Impl : public AudioEngineImpl {
    using AudioEngineImpl::AudioEngineImpl;
};

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>(config))
    , config_(config)
{
}

AudioEngine::~AudioEngine() {
    stop();
    
    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) {
        return true;
    }
    
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        return false;
    }
    
    pImpl_->initialized = true;
    
    // Log available devices
    int numDevices = Pa_GetDeviceCount();
    std::cout << "[AudioEngine] Found " << numDevices << " audio devices" << std::endl;
    
    int defaultInput = Pa_GetDefaultInputDevice();
    int defaultOutput = Pa_GetDefaultOutputDevice();
    
    if (defaultInput >= 0) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(defaultInput);
        std::cout << "[AudioEngine] Default input: " << info->name << std::endl;
    }
    
    if (defaultOutput >= 0) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(defaultOutput);
        std::cout << "[AudioEngine] Default output: " << info->name << std::endl;
    }
    
    return true;
}

bool AudioEngine::start() {
    if (pImpl_->running) {
        return true;
    }
    
    if (!pImpl_->initialized && !initialize()) {
        return false;
    }
    
    PaError err;
    
    // Configure input stream
    PaStreamParameters inputParams;
    inputParams.device = (config_.input_device >= 0) 
        ? config_.input_device 
        : Pa_GetDefaultInputDevice();
    
    if (inputParams.device == paNoDevice) {
        pImpl_->lastError = "No input device available";
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        return false;
    }
    
    inputParams.channelCount = config_.channels;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = Pa_GetDeviceInfo(inputParams.device)->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;
    
    // Open input stream
    err = Pa_OpenStream(
        &pImpl_->inputStream,
        &inputParams,
        nullptr,  // No output for this stream
        config_.sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        inputCallback,
        pImpl_.get()
    );
    
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_OpenStream (input) failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        return false;
    }
    
    // Configure output stream
    PaStreamParameters outputParams;
    outputParams.device = (config_.output_device >= 0)
        ? config_.output_device
        : Pa_GetDefaultOutputDevice();
    
    if (outputParams.device == paNoDevice) {
        pImpl_->lastError = "No output device available";
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
        return false;
    }
    
    outputParams.channelCount = config_.channels;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = Pa_GetDeviceInfo(outputParams.device)->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;
    
    // Open output stream
    err = Pa_OpenStream(
        &pImpl_->outputStream,
        nullptr,  // No input for this stream
        &outputParams,
        config_.sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        outputCallback,
        pImpl_.get()
    );
    
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_OpenStream (output) failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
        return false;
    }
    
    // Start streams
    err = Pa_StartStream(pImpl_->inputStream);
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_StartStream (input) failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        Pa_CloseStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->outputStream);
        pImpl_->inputStream = nullptr;
        pImpl_->outputStream = nullptr;
        return false;
    }
    
    err = Pa_StartStream(pImpl_->outputStream);
    if (err != paNoError) {
        pImpl_->lastError = std::string("Pa_StartStream (output) failed: ") + Pa_GetErrorText(err);
        std::cerr << "[AudioEngine] " << pImpl_->lastError << std::endl;
        Pa_StopStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->outputStream);
        pImpl_->inputStream = nullptr;
        pImpl_->outputStream = nullptr;
        return false;
    }
    
    pImpl_->captureBuffer.clear();
    pImpl_->running = true;
    std::cout << "[AudioEngine] Started (sample_rate=" << config_.sample_rate 
              << "Hz, buffer=" << config_.frames_per_buffer << " frames, frame="
              << config_.frame_ms << "ms)" << std::endl;
    
    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running) {
        return;
    }
    
    pImpl_->running = false;
    pImpl_->captureReady.notify_all();
    
    if (pImpl_->inputStream) {
        Pa_StopStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
    }
    
    if (pImpl_->outputStream) {
        Pa_StopStream(pImpl_->outputStream);
        Pa_CloseStream(pImpl_->outputStream);
        pImpl_->outputStream = nullptr;
    }
    
    std::cout << "[AudioEngine] Stopped" << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

std::optional<AudioFrame> AudioEngine::captureFrame(std::chrono::milliseconds timeout) {
    const size_t frameSamples = static_cast<size_t>(config_.frameSamples());
    
    if (!pImpl_->running) {
        std::this_thread::sleep_for(timeout);
        return std::nullopt;
    }
    
    {
        std::unique_lock<std::mutex> lock(pImpl_->captureMutex);
        bool ready = pImpl_->captureReady.wait_for(lock, timeout, [this, frameSamples] {
            return !pImpl_->running || pImpl_->captureBuffer.available() >= frameSamples;
        });
        if (!ready || pImpl_->captureBuffer.available() < frameSamples) {
            return std::nullopt;
        }
    }
    
    AudioFrame frame;
    frame.sample_rate = config_.sample_rate;
    frame.samples.resize(frameSamples);
    size_t read = pImpl_->captureBuffer.pop(frame.samples.data(), frameSamples);
    frame.samples.resize(read);
    frame.timestamp = Clock::now();
    return frame;
}

size_t AudioEngine::queuePlayback(const float* samples, size_t count) {
    size_t written = pImpl_->playbackBuffer.push(samples, count);
    if (written < count) {
        std::cerr << "[AudioEngine] Playback buffer full, dropped " << (count - written) 
                  << " samples" << std::endl;
    }
    return written;
}

void AudioEngine::clearPlayback() {
    pImpl_->playbackBuffer.clear();
}

bool AudioEngine::isPlaying() const {
    return pImpl_->playbackBuffer.available() > 0;
}

size_t AudioEngine::droppedCaptureSamples() const {
    return pImpl_->droppedSamples;
}

std::vector<std::string> AudioEngine::listInputDevices() {
    std::vector<std::string> devices;
    
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return devices;
    }
    
    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back(info->name);
        }
    }
    
    Pa_Terminate();
    return devices;
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    std::vector<std::string> devices;
    
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        return devices;
    }
    
    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxOutputChannels > 0) {
            devices.push_back(info->name);
        }
    }
    
    Pa_Terminate();
    return devices;
}

std::string AudioEngine::lastError() const {
    return pImpl_->lastError;
}

// ============================================================================
// PortAudio Callbacks
// ============================================================================

static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
) {
    auto* impl = static_cast<AudioEngineImpl*>(userData);
    const float* samples = static_cast<const float*>(input);
    if (!samples) {
        return paContinue;
    }
    
    // Keep the first channel only
    size_t written;
    if (impl->config.channels == 1) {
        written = impl->captureBuffer.push(samples, frameCount);
    } else {
        written = 0;
        for (unsigned long i = 0; i < frameCount; ++i) {
            written += impl->captureBuffer.push(&samples[i * impl->config.channels], 1);
        }
    }
    if (written < frameCount) {
        impl->droppedSamples += frameCount - written;
    }
    
    impl->captureReady.notify_one();
    return paContinue;
}

static int outputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
) {
    auto* impl = static_cast<AudioEngineImpl*>(userData);
    float* out = static_cast<float*>(output);
    
    const int channels = impl->config.channels;
    
    if (channels == 1) {
        size_t read = impl->playbackBuffer.pop(out, frameCount);
        
        // Zero-fill if not enough data
        if (read < frameCount) {
            std::memset(out + read, 0, (frameCount - read) * sizeof(float));
        }
        return paContinue;
    }
    
    // Duplicate mono playback to every channel
    for (unsigned long i = 0; i < frameCount; ++i) {
        float sample = 0.0f;
        impl->playbackBuffer.pop(&sample, 1);
        for (int c = 0; c < channels; ++c) {
            out[i * channels + c] = sample;
        }
    }
    
    return paContinue;
}

} // namespace sui::audio
