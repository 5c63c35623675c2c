/**
 * test_audio.cpp - Audio device test
 * Tests AudioEngine initialization, device listing and frame capture.
 * Skipped when no audio device is available.
 */

#include "sui/audio/AudioEngine.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace sui::audio;

int main() {
    std::cout << "=== SUI Audio System Test ===" << std::endl;

    std::cout << "\n--- Input Devices ---" << std::endl;
    auto inputs = AudioEngine::listInputDevices();
    for (size_t i = 0; i < inputs.size(); ++i) {
        std::cout << "  [" << i << "] " << inputs[i] << std::endl;
    }

    std::cout << "\n--- Output Devices ---" << std::endl;
    auto outputs = AudioEngine::listOutputDevices();
    for (size_t i = 0; i < outputs.size(); ++i) {
        std::cout << "  [" << i << "] " << outputs[i] << std::endl;
    }

    if (inputs.empty()) {
        std::cout << "\n[SKIP] No input device" << std::endl;
        return 0;
    }

    std::cout << "\n--- Initializing AudioEngine ---" << std::endl;
    AudioConfig config;
    config.sample_rate = 16000;
    config.frame_ms = 20;

    AudioEngine engine(config);
    if (!engine.initialize()) {
        std::cout << "[SKIP] Failed to initialize: " << engine.lastError() << std::endl;
        return 0;
    }

    std::cout << "\n--- Capturing frames (2 seconds) ---" << std::endl;
    if (!engine.start()) {
        std::cout << "[SKIP] Failed to start: " << engine.lastError() << std::endl;
        return 0;
    }

    size_t totalSamples = 0;
    size_t frames = 0;
    bool sizesOk = true;
    bool orderOk = true;
    sui::TimePoint last{};

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        auto frame = engine.captureFrame(std::chrono::milliseconds(100));
        if (!frame) continue;

        sizesOk = sizesOk && frame->samples.size() == static_cast<size_t>(config.frameSamples());
        orderOk = orderOk && frame->timestamp >= last;
        last = frame->timestamp;
        totalSamples += frame->samples.size();
        ++frames;
    }

    // Short beep through the playback path
    std::vector<float> beep(config.sample_rate / 10);
    for (size_t i = 0; i < beep.size(); ++i) {
        beep[i] = (i / 20) % 2 ? 0.1f : -0.1f;
    }
    size_t accepted = engine.queuePlayback(beep.data(), beep.size());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    engine.clearPlayback();

    engine.stop();

    double durationSec = static_cast<double>(totalSamples) / config.sample_rate;
    std::cout << "\n--- Results ---" << std::endl;
    std::cout << "  Frames captured: " << frames << std::endl;
    std::cout << "  Duration: " << durationSec << " seconds (expected ~2.0)" << std::endl;
    std::cout << "  Dropped samples: " << engine.droppedCaptureSamples() << std::endl;
    std::cout << "  Playback accepted: " << accepted << "/" << beep.size() << std::endl;

    bool success = sizesOk && orderOk && durationSec >= 1.5 && durationSec <= 2.5
                   && accepted == beep.size() && !engine.isRunning();
    std::cout << "\n" << (success ? "[PASS]" : "[FAIL]") << " Audio capture test" << std::endl;

    return success ? 0 : 1;
}
