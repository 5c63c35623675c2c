/**
 * SpeechBatcher.hpp - Groups classified segments into utterances
 *
 * Consumes AudioSegments from the capture loop, decides when the user has
 * finished a thought (short pause, adaptive long pause or hard duration
 * cap), requests partial transcriptions while a batch grows and a final
 * transcription when it is closed. Results are published as
 * TranscriptionEvents on a bounded channel.
 */

#pragma once

#include "sui/audio/AudioTypes.hpp"
#include "sui/core/BoundedQueue.hpp"
#include "sui/core/Time.hpp"
#include "sui/speech/SpeechBatch.hpp"
#include "sui/stt/Recognizer.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace sui::speech {

struct BatcherConfig {
    int sample_rate = audio::DEFAULT_SAMPLE_RATE;

    // Pause detection
    double short_pause_threshold = 1.0;      // seconds, with enough content
    int short_pause_min_segments = 2;
    double short_pause_min_duration = 0.5;   // seconds of accumulated audio
    double long_pause_base_threshold = 2.0;  // seconds
    double adaptive_reference_duration = 3.0;
    double adaptive_max_factor = 1.5;

    // Batch limits
    double min_segment_duration = 0.05;      // shorter openers are held and merged
    double max_batch_duration = 10.0;

    // Partial transcription
    int partial_interval = 3;                // segments between partial requests
    double partial_window = 2.0;             // seconds of trailing audio

    // Workers and queues
    size_t worker_count = 2;
    size_t task_queue_capacity = 32;
    size_t input_queue_capacity = 256;
    size_t event_queue_capacity = 64;
    int poll_timeout_ms = 300;
    int recognition_timeout_ms = 15000;
    int shutdown_timeout_ms = 3000;
    size_t archive_size = 10;

    bool verbose = false;
};

class SpeechBatcher {
public:
    using EventChannel = core::BoundedQueue<TranscriptionEvent>;

    /**
     * @throws ConfigError if the configuration is invalid
     */
    SpeechBatcher(stt::Recognizer& recognizer,
                  const BatcherConfig& config = BatcherConfig{},
                  NowFunction now = NowFunction{});
    ~SpeechBatcher();

    SpeechBatcher(const SpeechBatcher&) = delete;
    SpeechBatcher& operator=(const SpeechBatcher&) = delete;

    /**
     * Start the processing loop thread.
     */
    bool start();

    /**
     * Drain queued segments, finalize the in-flight batch and wait (bounded)
     * for outstanding recognitions. Idempotent.
     */
    void stop();

    bool isRunning() const;

    /**
     * Non-blocking hand-off from the capture loop.
     * @return false if the input queue is full or the batcher stopped
     */
    bool addSegment(audio::AudioSegment segment);

    /**
     * Synchronous algorithm step for one segment.
     */
    void process(audio::AudioSegment segment);

    /**
     * Pause check when no segment arrived.
     */
    void checkPause(TimePoint now);

    /**
     * Finalize the active batch now.
     * @return true if there was one
     */
    bool forceFinalize();

    /**
     * Drop the active batch without transcription and cancel its partials.
     * @return true if there was one
     */
    bool discardActiveBatch();

    bool hasActiveBatch() const;

    EventChannel& events();
    std::optional<TranscriptionEvent> nextEvent(std::chrono::milliseconds timeout);

    /**
     * Skip final recognitions past recognition_timeout_ms so the finals
     * behind them are published. Runs on every loop iteration, every
     * checkPause() and every nextEvent().
     */
    void expireOverdue();

    /**
     * The most recent finalized batches, oldest first.
     */
    std::vector<SpeechBatch> completedBatches() const;

    BatcherStats stats() const;
    const BatcherConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace sui::speech
