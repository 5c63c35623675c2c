/**
 * SpeechBatch.hpp - Utterance under construction and the events it yields
 */

#pragma once

#include "sui/audio/AudioTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sui::speech {

enum class BatchState {
    Active,     // last segment was speech
    Paused,     // last segment was silence, batch still open
    Completed   // finalized, transcription requested
};

const char* toString(BatchState state);

/**
 * Metadata of one segment appended to a batch. The samples themselves are
 * moved into SpeechBatch::accumulated_samples.
 */
struct SegmentInfo {
    TimePoint timestamp{};
    double duration = 0.0;
    float energy_level = 0.0f;
    size_t sample_count = 0;
};

struct SpeechBatch {
    uint64_t id = 0;
    int sample_rate = audio::DEFAULT_SAMPLE_RATE;
    std::vector<SegmentInfo> segments;
    std::vector<float> accumulated_samples;
    TimePoint start_time{};
    TimePoint last_activity_time{};
    BatchState state = BatchState::Active;

    /**
     * Append a speech segment. Keeps accumulated_samples equal to the
     * concatenation of every segment and last_activity_time non-decreasing.
     */
    void append(audio::AudioSegment segment);

    double duration() const;
    size_t segmentCount() const { return segments.size(); }
};

/**
 * Element of the channel from the batcher to the state machine.
 */
struct TranscriptionEvent {
    std::string text;
    float confidence = 0.0f;
    bool is_final = false;
    uint64_t batch_id = 0;
    TimePoint batch_started_at{};
};

struct BatcherStats {
    size_t segments_processed = 0;
    size_t segments_dropped = 0;      // input queue full
    size_t batches_completed = 0;
    size_t batches_discarded = 0;
    size_t partial_requests = 0;
    size_t partials_dropped = 0;      // superseded, cancelled or rejected
    size_t final_transcriptions = 0;
    size_t failed_transcriptions = 0;
    size_t timed_out_transcriptions = 0;  // skipped after recognition_timeout_ms
    double total_audio_seconds = 0.0;
    double avg_transcription_ms = 0.0;
};

} // namespace sui::speech
