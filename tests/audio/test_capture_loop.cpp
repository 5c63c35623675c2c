/**
 * test_capture_loop.cpp - Gate routing, echo gating and capture errors
 */

#include "sui/audio/CaptureLoop.hpp"
#include "sui/speech/SpeechBatcher.hpp"
#include "support/Fakes.hpp"

#include <cassert>
#include <iostream>

using namespace sui;
using namespace sui::audio;

namespace {

ClassifierConfig energyOnly() {
    ClassifierConfig config;
    config.use_vad = false;
    config.energy_threshold = 0.005f;
    config.min_speech_energy = 0.005f;
    return config;
}

AudioFrame frameAt(TimePoint at, float amplitude) {
    AudioFrame frame;
    frame.samples = test::tone(320, amplitude);
    frame.timestamp = at;
    return frame;
}

struct Rig {
    test::FakeAudioSource source;
    test::FakeRecognizer recognizer;
    SegmentClassifier classifier{energyOnly()};
    speech::SpeechBatcher batcher{recognizer};
    MicrophoneGate gate;
    CaptureLoop loop{source, classifier, batcher, gate};
};

} // namespace

void test_inactive_drains() {
    Rig rig;
    rig.gate.set(MicState::Inactive);
    assert(!rig.loop.processFrame(frameAt(Clock::now(), 0.3f)));

    rig.gate.set(MicState::SuspendedForPlayback);
    assert(!rig.loop.processFrame(frameAt(Clock::now(), 0.3f)));

    auto stats = rig.loop.stats();
    assert(stats.frames_captured == 2);
    assert(stats.frames_drained == 2);
    assert(stats.segments_forwarded == 0);

    std::cout << "[PASS] test_inactive_drains" << std::endl;
}

void test_monitoring_feeds_monitor_only() {
    Rig rig;
    int monitored = 0;
    rig.loop.setMonitor([&](const AudioFrame& frame) {
        assert(frame.samples.size() == 320);
        ++monitored;
    });

    rig.gate.set(MicState::Monitoring);
    assert(!rig.loop.processFrame(frameAt(Clock::now(), 0.3f)));
    assert(monitored == 1);
    assert(rig.loop.stats().frames_monitored == 1);
    assert(rig.loop.stats().segments_forwarded == 0);

    std::cout << "[PASS] test_monitoring_feeds_monitor_only" << std::endl;
}

void test_active_forwards_through_filter() {
    Rig rig;
    int filtered = 0;
    rig.loop.setFilter([&](std::vector<float>& samples) {
        ++filtered;
        for (auto& s : samples) s *= 0.5f;
    });

    rig.gate.set(MicState::Active);
    assert(rig.loop.processFrame(frameAt(Clock::now(), 0.3f)));
    assert(rig.loop.processFrame(frameAt(Clock::now(), 0.0f)));
    assert(filtered == 2);
    assert(rig.loop.stats().segments_forwarded == 2);

    std::cout << "[PASS] test_active_forwards_through_filter" << std::endl;
}

void test_echo_guard_raises_energy_gate() {
    Rig rig;
    rig.gate.set(MicState::Active);

    TimePoint now = Clock::now();
    rig.gate.setEchoGuardUntil(now + std::chrono::seconds(1));

    // RMS ~0.0106: speech for the classifier, below the post-speech gate
    assert(rig.loop.processFrame(frameAt(now, 0.015f)));
    assert(rig.loop.stats().echo_gated == 1);

    // A user talking over the guard is louder
    assert(rig.loop.processFrame(frameAt(now, 0.3f)));
    assert(rig.loop.stats().echo_gated == 1);

    // Guard expired
    assert(rig.loop.processFrame(frameAt(now + std::chrono::seconds(2), 0.015f)));
    assert(rig.loop.stats().echo_gated == 1);

    std::cout << "[PASS] test_echo_guard_raises_energy_gate" << std::endl;
}

void test_thread_survives_capture_errors() {
    Rig rig;
    rig.gate.set(MicState::Active);
    assert(rig.loop.start());
    assert(rig.loop.isRunning());

    for (int i = 0; i < 3; ++i) {
        rig.source.push(frameAt(Clock::now(), 0.3f));
    }
    rig.source.failNext();
    for (int i = 0; i < 2; ++i) {
        rig.source.push(frameAt(Clock::now(), 0.3f));
    }

    bool done = test::waitFor([&] {
        auto s = rig.loop.stats();
        return s.frames_captured == 5 && s.capture_errors == 1;
    });
    assert(done);

    rig.loop.stop();
    rig.loop.stop();  // idempotent
    assert(!rig.loop.isRunning());

    std::cout << "[PASS] test_thread_survives_capture_errors" << std::endl;
}

int main() {
    std::cout << "=== CaptureLoop Tests ===" << std::endl;

    test_inactive_drains();
    test_monitoring_feeds_monitor_only();
    test_active_forwards_through_filter();
    test_echo_guard_raises_energy_gate();
    test_thread_survives_capture_errors();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
