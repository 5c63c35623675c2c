/**
 * test_speech_batcher.cpp - Pause detection, batching and transcription ordering
 */

#include "sui/Config.hpp"
#include "sui/speech/SpeechBatcher.hpp"
#include "support/Fakes.hpp"

#include <atomic>
#include <cassert>
#include <cmath>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace sui;
using namespace sui::speech;
using namespace std::chrono_literals;

namespace {

constexpr size_t FRAME = 320;  // 20ms at 16kHz

TimePoint at(TimePoint base, double seconds) {
    return addSeconds(base, seconds);
}

BatcherConfig quietConfig() {
    BatcherConfig config;
    config.partial_interval = 1000;  // no partials unless a test wants them
    return config;
}

std::vector<TranscriptionEvent> collectFinals(SpeechBatcher& batcher, size_t expected,
                                              std::chrono::milliseconds timeout = 3000ms) {
    std::vector<TranscriptionEvent> finals;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (finals.size() < expected && std::chrono::steady_clock::now() < deadline) {
        auto event = batcher.nextEvent(50ms);
        if (event && event->is_final) {
            finals.push_back(*event);
        }
    }
    return finals;
}

// Holds recognition calls until released
class Latch {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

} // namespace

void test_forty_frame_scenario() {
    test::FakeRecognizer recognizer;
    BatcherConfig config;
    SpeechBatcher batcher(recognizer, config);
    const TimePoint base = Clock::now();

    // 5 silent frames
    for (int i = 1; i <= 5; ++i) {
        batcher.process(test::silenceSegment(at(base, 0.02 * i)));
    }
    // 20 speech frames from t=0.12
    for (int i = 1; i <= 20; ++i) {
        batcher.process(test::speechSegment(at(base, 0.12 + 0.02 * i), FRAME));
    }
    // 15 silent frames spaced 1.3s apart
    const double speechEnd = 0.12 + 0.02 * 20;
    for (int i = 1; i <= 15; ++i) {
        batcher.process(test::silenceSegment(at(base, speechEnd + 1.3 * i)));
    }

    auto finals = collectFinals(batcher, 2, 1500ms);
    assert(finals.size() == 1);
    assert(finals[0].text == "samples 6400");
    assert(std::abs(secondsBetween(at(base, 0.12), finals[0].batch_started_at)) < 1e-6);
    assert(recognizer.finalCalls() == 1);

    auto stats = batcher.stats();
    assert(stats.segments_processed == 40);
    assert(stats.batches_completed == 1);
    assert(stats.final_transcriptions == 1);

    auto batches = batcher.completedBatches();
    assert(batches.size() == 1);
    assert(batches[0].accumulated_samples.size() == 6400);
    assert(batches[0].state == BatchState::Completed);

    std::cout << "[PASS] test_forty_frame_scenario" << std::endl;
}

void test_short_pause_needs_content() {
    test::FakeRecognizer recognizer;
    SpeechBatcher batcher(recognizer, quietConfig());
    const TimePoint base = Clock::now();

    // 0.6s of speech in 30 segments
    for (int i = 1; i <= 30; ++i) {
        batcher.process(test::speechSegment(at(base, 0.02 * i), FRAME));
    }
    const double end = 0.6;

    batcher.checkPause(at(base, end + 0.9));
    assert(batcher.hasActiveBatch());

    batcher.checkPause(at(base, end + 1.0));
    assert(!batcher.hasActiveBatch());
    assert(batcher.stats().batches_completed == 1);

    std::cout << "[PASS] test_short_pause_needs_content" << std::endl;
}

void test_adaptive_long_pause() {
    test::FakeRecognizer recognizer;
    BatcherConfig config = quietConfig();
    config.short_pause_min_segments = 1000;  // only the long pause applies
    SpeechBatcher batcher(recognizer, config);
    const TimePoint base = Clock::now();

    // 4.5s utterance: threshold 2.0 * min(1.5, 4.5 / 3.0) = 3.0s
    for (int i = 1; i <= 45; ++i) {
        batcher.process(test::speechSegment(at(base, 0.1 * i), 1600));
    }
    const double end = 4.5;

    batcher.checkPause(at(base, end + 2.5));
    assert(batcher.hasActiveBatch());

    batcher.checkPause(at(base, end + 3.0));
    assert(!batcher.hasActiveBatch());

    std::cout << "[PASS] test_adaptive_long_pause" << std::endl;
}

void test_hard_duration_cap() {
    test::FakeRecognizer recognizer;
    BatcherConfig config = quietConfig();
    config.max_batch_duration = 1.0;
    SpeechBatcher batcher(recognizer, config);
    const TimePoint base = Clock::now();

    for (int i = 1; i <= 5; ++i) {
        batcher.process(test::speechSegment(at(base, 0.25 * i), 4000));
    }

    // Finalized at exactly 1.0s, the fifth segment opened a new batch
    auto stats = batcher.stats();
    assert(stats.batches_completed == 1);
    assert(batcher.hasActiveBatch());
    auto batches = batcher.completedBatches();
    assert(batches[0].accumulated_samples.size() == 16000);

    std::cout << "[PASS] test_hard_duration_cap" << std::endl;
}

void test_accumulation_matches_segments() {
    test::FakeRecognizer recognizer;
    SpeechBatcher batcher(recognizer, quietConfig());
    const TimePoint base = Clock::now();

    std::vector<float> expected;
    for (int i = 1; i <= 6; ++i) {
        auto segment = test::speechSegment(at(base, 0.1 * i), 1600, 0.1f * static_cast<float>(i));
        expected.insert(expected.end(), segment.samples.begin(), segment.samples.end());
        batcher.process(std::move(segment));
    }
    assert(batcher.forceFinalize());

    auto batch = batcher.completedBatches().back();
    assert(batch.accumulated_samples == expected);
    assert(batch.segmentCount() == 6);

    size_t total = 0;
    TimePoint last{};
    for (const auto& info : batch.segments) {
        total += info.sample_count;
        assert(info.timestamp >= last);
        last = info.timestamp;
    }
    assert(total == batch.accumulated_samples.size());
    assert(batch.last_activity_time == at(base, 0.6));

    std::cout << "[PASS] test_accumulation_matches_segments" << std::endl;
}

void test_micro_segment_merged() {
    test::FakeRecognizer recognizer;
    SpeechBatcher batcher(recognizer, quietConfig());
    const TimePoint base = Clock::now();

    // 20ms opener is held, then prepended to the next segment
    batcher.process(test::speechSegment(at(base, 0.02), FRAME, 0.9f));
    assert(!batcher.hasActiveBatch());

    batcher.process(test::speechSegment(at(base, 0.12), 1600, 0.2f));
    assert(batcher.hasActiveBatch());
    assert(batcher.forceFinalize());

    auto batch = batcher.completedBatches().back();
    assert(batch.accumulated_samples.size() == FRAME + 1600);
    assert(batch.accumulated_samples.front() == 0.9f);
    assert(batch.accumulated_samples.back() == 0.2f);

    std::cout << "[PASS] test_micro_segment_merged" << std::endl;
}

void test_micro_segment_dropped_after_silence() {
    test::FakeRecognizer recognizer;
    SpeechBatcher batcher(recognizer, quietConfig());
    const TimePoint base = Clock::now();

    batcher.process(test::speechSegment(at(base, 0.02), FRAME, 0.9f));
    batcher.process(test::silenceSegment(at(base, 1.5)));
    batcher.process(test::speechSegment(at(base, 1.6), 1600, 0.2f));
    assert(batcher.forceFinalize());

    auto batch = batcher.completedBatches().back();
    assert(batch.accumulated_samples.size() == 1600);
    assert(batch.accumulated_samples.front() == 0.2f);

    std::cout << "[PASS] test_micro_segment_dropped_after_silence" << std::endl;
}

void test_superseded_partial_not_published() {
    std::mutex mutex;
    std::condition_variable cv;
    bool releaseFirst = false;

    test::FakeRecognizer recognizer([&](const std::vector<float>& samples, bool final_pass)
                                        -> std::optional<stt::TranscriptionResult> {
        if (!final_pass && samples.size() == 4800) {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return releaseFirst; });
        }
        return stt::TranscriptionResult{
            (final_pass ? "final " : "partial ") + std::to_string(samples.size()), 0.8f, final_pass};
    });

    BatcherConfig config;
    config.partial_interval = 3;
    config.worker_count = 2;
    SpeechBatcher batcher(recognizer, config);
    const TimePoint base = Clock::now();

    for (int i = 1; i <= 3; ++i) {
        batcher.process(test::speechSegment(at(base, 0.1 * i), 1600));
    }
    assert(test::waitFor([&] { return recognizer.calls().size() == 1; }));

    // Three more segments supersede the blocked partial
    for (int i = 4; i <= 6; ++i) {
        batcher.process(test::speechSegment(at(base, 0.1 * i), 1600));
    }

    std::optional<TranscriptionEvent> second;
    for (int i = 0; i < 40 && !second; ++i) {
        second = batcher.nextEvent(50ms);
    }
    assert(second);
    assert(!second->is_final);
    assert(second->text == "partial 9600");

    {
        std::lock_guard<std::mutex> lock(mutex);
        releaseFirst = true;
    }
    cv.notify_all();

    assert(test::waitFor([&] { return batcher.stats().partials_dropped >= 1; }));
    assert(!batcher.nextEvent(100ms));

    std::cout << "[PASS] test_superseded_partial_not_published" << std::endl;
}

void test_finals_published_in_order() {
    test::FakeRecognizer recognizer([](const std::vector<float>& samples, bool final_pass)
                                        -> std::optional<stt::TranscriptionResult> {
        if (final_pass && samples.size() == 3200) {
            std::this_thread::sleep_for(200ms);  // first batch finishes last
        }
        return stt::TranscriptionResult{"batch " + std::to_string(samples.size()), 0.9f, final_pass};
    });

    BatcherConfig config = quietConfig();
    config.worker_count = 2;
    SpeechBatcher batcher(recognizer, config);
    const TimePoint base = Clock::now();

    batcher.process(test::speechSegment(at(base, 0.2), 3200));
    assert(batcher.forceFinalize());
    batcher.process(test::speechSegment(at(base, 2.0), 1600));
    assert(batcher.forceFinalize());

    auto finals = collectFinals(batcher, 2);
    assert(finals.size() == 2);
    assert(finals[0].text == "batch 3200");
    assert(finals[1].text == "batch 1600");
    assert(finals[0].batch_id < finals[1].batch_id);

    std::cout << "[PASS] test_finals_published_in_order" << std::endl;
}

void test_recognizer_failure_releases_slot() {
    std::atomic<int> finals{0};
    test::FakeRecognizer recognizer([&](const std::vector<float>& samples, bool final_pass)
                                        -> std::optional<stt::TranscriptionResult> {
        if (final_pass && ++finals == 1) {
            throw std::runtime_error("decoder crashed");
        }
        if (final_pass && finals == 2) {
            return std::nullopt;
        }
        return stt::TranscriptionResult{"ok " + std::to_string(samples.size()), 0.9f, final_pass};
    });

    BatcherConfig config = quietConfig();
    config.worker_count = 1;
    SpeechBatcher batcher(recognizer, config);
    const TimePoint base = Clock::now();

    for (int i = 0; i < 3; ++i) {
        batcher.process(test::speechSegment(at(base, 2.0 * i + 0.1), 1600));
        assert(batcher.forceFinalize());
    }

    auto events = collectFinals(batcher, 1);
    assert(events.size() == 1);
    assert(events[0].text == "ok 1600");

    auto stats = batcher.stats();
    assert(stats.failed_transcriptions == 2);
    assert(stats.final_transcriptions == 1);

    std::cout << "[PASS] test_recognizer_failure_releases_slot" << std::endl;
}

void test_hung_recognition_skipped() {
    Latch latch;
    std::atomic<bool> returned{false};
    test::FakeRecognizer recognizer([&](const std::vector<float>& samples, bool final_pass)
                                        -> std::optional<stt::TranscriptionResult> {
        if (final_pass && samples.size() == 3200) {
            latch.wait();
            returned = true;
            return stt::TranscriptionResult{"too late", 0.9f, true};
        }
        return stt::TranscriptionResult{"batch " + std::to_string(samples.size()), 0.9f, final_pass};
    });

    BatcherConfig config = quietConfig();
    config.worker_count = 2;
    config.recognition_timeout_ms = 300;
    SpeechBatcher batcher(recognizer, config);
    const TimePoint base = Clock::now();

    batcher.process(test::speechSegment(at(base, 0.2), 3200));
    assert(batcher.forceFinalize());
    batcher.process(test::speechSegment(at(base, 2.0), 1600));
    assert(batcher.forceFinalize());

    // The second batch is not held behind the stuck one
    auto finals = collectFinals(batcher, 1, 2000ms);
    assert(finals.size() == 1);
    assert(finals[0].text == "batch 1600");

    auto stats = batcher.stats();
    assert(stats.timed_out_transcriptions == 1);
    assert(stats.failed_transcriptions == 1);
    assert(stats.final_transcriptions == 1);

    latch.release();
    assert(test::waitFor([&] { return returned.load(); }));
    assert(!batcher.nextEvent(200ms));

    stats = batcher.stats();
    assert(stats.final_transcriptions == 1);
    assert(stats.timed_out_transcriptions == 1);

    std::cout << "[PASS] test_hung_recognition_skipped" << std::endl;
}

void test_stop_bounded_with_hung_recognizer() {
    Latch latch;
    std::atomic<bool> returned{false};
    test::FakeRecognizer recognizer([&](const std::vector<float>& samples, bool final_pass)
                                        -> std::optional<stt::TranscriptionResult> {
        if (final_pass) {
            latch.wait();
            returned = true;
        }
        return stt::TranscriptionResult{"samples " + std::to_string(samples.size()), 0.9f, final_pass};
    });

    {
        BatcherConfig config = quietConfig();
        config.shutdown_timeout_ms = 200;
        SpeechBatcher batcher(recognizer, config);
        assert(batcher.start());

        batcher.process(test::speechSegment(at(Clock::now(), 0.1), 1600));
        assert(batcher.forceFinalize());
        assert(test::waitFor([&] { return recognizer.finalCalls() == 1; }));

        const auto begin = std::chrono::steady_clock::now();
        batcher.stop();
        assert(std::chrono::steady_clock::now() - begin < 2s);

        assert(!batcher.nextEvent(50ms));
        assert(batcher.stats().timed_out_transcriptions == 1);
    }

    // The detached call finishes after the batcher is gone
    latch.release();
    assert(test::waitFor([&] { return returned.load(); }));
    std::this_thread::sleep_for(50ms);

    std::cout << "[PASS] test_stop_bounded_with_hung_recognizer" << std::endl;
}

void test_discard_active_batch() {
    test::FakeRecognizer recognizer;
    SpeechBatcher batcher(recognizer, quietConfig());
    const TimePoint base = Clock::now();

    assert(!batcher.discardActiveBatch());
    batcher.process(test::speechSegment(at(base, 0.1), 1600));
    assert(batcher.discardActiveBatch());
    assert(!batcher.hasActiveBatch());
    assert(!batcher.forceFinalize());

    auto stats = batcher.stats();
    assert(stats.batches_discarded == 1);
    assert(stats.batches_completed == 0);
    assert(recognizer.calls().empty());

    std::cout << "[PASS] test_discard_active_batch" << std::endl;
}

void test_input_queue_bound() {
    test::FakeRecognizer recognizer;
    BatcherConfig config = quietConfig();
    config.input_queue_capacity = 2;
    SpeechBatcher batcher(recognizer, config);
    const TimePoint base = Clock::now();

    assert(batcher.addSegment(test::speechSegment(at(base, 0.1), 1600)));
    assert(batcher.addSegment(test::speechSegment(at(base, 0.2), 1600)));
    assert(!batcher.addSegment(test::speechSegment(at(base, 0.3), 1600)));
    assert(batcher.stats().segments_dropped == 1);

    std::cout << "[PASS] test_input_queue_bound" << std::endl;
}

void test_stop_flushes_and_is_idempotent() {
    test::FakeRecognizer recognizer;
    SpeechBatcher batcher(recognizer, quietConfig());
    assert(batcher.start());
    assert(batcher.isRunning());

    const TimePoint base = Clock::now();
    for (int i = 1; i <= 5; ++i) {
        assert(batcher.addSegment(test::speechSegment(at(base, 0.1 * i), 1600)));
    }

    batcher.stop();
    batcher.stop();
    assert(!batcher.isRunning());

    // In-flight batch was finalized and transcribed during stop
    auto event = batcher.nextEvent(100ms);
    assert(event && event->is_final);
    assert(event->text == "samples 8000");

    assert(!batcher.addSegment(test::speechSegment(at(base, 1.0), 1600)));
    assert(!batcher.start());

    std::cout << "[PASS] test_stop_flushes_and_is_idempotent" << std::endl;
}

void test_inverted_thresholds_rejected() {
    test::FakeRecognizer recognizer;
    BatcherConfig config;
    config.short_pause_threshold = 3.0;
    config.long_pause_base_threshold = 2.0;

    bool threw = false;
    try {
        SpeechBatcher batcher(recognizer, config);
    } catch (const ConfigError& e) {
        threw = true;
        assert(std::string(e.what()).find("long_pause_base_threshold") != std::string::npos);
    }
    assert(threw);

    std::cout << "[PASS] test_inverted_thresholds_rejected" << std::endl;
}

int main() {
    std::cout << "=== SpeechBatcher Tests ===" << std::endl;

    test_forty_frame_scenario();
    test_short_pause_needs_content();
    test_adaptive_long_pause();
    test_hard_duration_cap();
    test_accumulation_matches_segments();
    test_micro_segment_merged();
    test_micro_segment_dropped_after_silence();
    test_superseded_partial_not_published();
    test_finals_published_in_order();
    test_recognizer_failure_releases_slot();
    test_hung_recognition_skipped();
    test_stop_bounded_with_hung_recognizer();
    test_discard_active_batch();
    test_input_queue_bound();
    test_stop_flushes_and_is_idempotent();
    test_inverted_thresholds_rejected();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
