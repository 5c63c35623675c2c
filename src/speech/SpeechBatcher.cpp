/**
 * SpeechBatcher.cpp - Utterance batching with pause detection
 *
 * Segments arrive from the capture loop through a bounded queue and are
 * processed on a single loop thread. Recognition runs on a TaskPool so a
 * slow model never blocks segment intake. Final events are released in
 * finalization order through a small reorder buffer; a recognition past
 * recognition_timeout_ms is skipped there and its late result dropped.
 */

#include "sui/speech/SpeechBatcher.hpp"
#include "sui/speech/TaskPool.hpp"
#include "sui/Config.hpp"
#include "sui/session/Text.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <exception>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace sui::speech {

namespace {

const BatcherConfig& checked(const BatcherConfig& config) {
    requireValid(validate(config), "SpeechBatcher");
    return config;
}

} // namespace

const char* toString(BatchState state) {
    switch (state) {
        case BatchState::Active:    return "Active";
        case BatchState::Paused:    return "Paused";
        case BatchState::Completed: return "Completed";
    }
    return "Unknown";
}

void SpeechBatch::append(audio::AudioSegment segment) {
    SegmentInfo info;
    info.timestamp = segment.timestamp;
    info.sample_count = segment.samples.size();
    info.duration = static_cast<double>(info.sample_count) / sample_rate;
    info.energy_level = segment.energy_level;

    accumulated_samples.insert(accumulated_samples.end(),
                               segment.samples.begin(), segment.samples.end());
    last_activity_time = std::max(last_activity_time, segment.timestamp);
    segments.push_back(info);
}

double SpeechBatch::duration() const {
    return static_cast<double>(accumulated_samples.size()) / sample_rate;
}

/**
 * Recognition results side: everything a transcription task touches. Held
 * by shared_ptr so a recognition still running after shutdown stays valid.
 */
struct ResultSink {
    stt::Recognizer& recognizer;
    const BatcherConfig config;
    SpeechBatcher::EventChannel events;

    struct Outstanding {
        uint64_t batch_id = 0;
        Clock::time_point deadline;
    };

    // Final ordering
    std::mutex publishMutex;
    std::map<uint64_t, std::optional<TranscriptionEvent>> pendingFinals;
    std::map<uint64_t, Outstanding> outstanding;  // submitted, no result yet
    uint64_t nextPublishSeq = 0;

    std::mutex statsMutex;
    BatcherStats stats;
    size_t timedTranscriptions = 0;

    ResultSink(stt::Recognizer& r, const BatcherConfig& c)
        : recognizer(r)
        , config(c)
        , events(c.event_queue_capacity) {}

    void expect(uint64_t seq, uint64_t batchId) {
        std::lock_guard<std::mutex> lock(publishMutex);
        outstanding[seq] = {batchId, Clock::now() + std::chrono::milliseconds(config.recognition_timeout_ms)};
    }

    void runPartial(uint64_t id, TimePoint startedAt, const std::vector<float>& samples,
                    const CancellationToken& token) {
        if (token.isCancelled()) {
            std::lock_guard<std::mutex> statsLock(statsMutex);
            stats.partials_dropped++;
            return;
        }

        std::optional<stt::TranscriptionResult> result;
        try {
            result = recognizer.recognize(samples, false);
        } catch (const std::exception& e) {
            std::cerr << "[SpeechBatcher] Partial transcription failed: " << e.what() << std::endl;
            return;
        }
        if (!result) {
            return;
        }
        std::string text = session::trim(result->text);
        if (text.empty()) {
            return;
        }

        std::lock_guard<std::mutex> lock(publishMutex);
        bool published = false;
        if (!token.isCancelled()) {
            TranscriptionEvent event;
            event.text = std::move(text);
            event.confidence = result->confidence;
            event.is_final = false;
            event.batch_id = id;
            event.batch_started_at = startedAt;
            published = events.tryPush(std::move(event));
        }
        if (!published) {
            std::lock_guard<std::mutex> statsLock(statsMutex);
            stats.partials_dropped++;
        }
    }

    void runFinal(uint64_t seq, uint64_t id, TimePoint startedAt, const std::vector<float>& samples,
                  const CancellationToken& token) {
        if (token.isCancelled()) {
            std::cerr << "[SpeechBatcher] Final transcription of batch #" << id
                      << " cancelled" << std::endl;
            if (publishFinal(seq, std::nullopt)) {
                std::lock_guard<std::mutex> statsLock(statsMutex);
                stats.failed_transcriptions++;
            }
            return;
        }

        const auto begin = Clock::now();
        std::optional<stt::TranscriptionResult> result;
        try {
            result = recognizer.recognize(samples, true);
        } catch (const std::exception& e) {
            std::cerr << "[SpeechBatcher] Transcription of batch #" << id
                      << " failed: " << e.what() << std::endl;
        }
        const double elapsedMs = secondsBetween(begin, Clock::now()) * 1000.0;

        const bool overdue = elapsedMs > config.recognition_timeout_ms;
        if (result && overdue) {
            std::cerr << "[SpeechBatcher] Transcription of batch #" << id << " took "
                      << static_cast<int>(elapsedMs) << "ms, discarding result" << std::endl;
            result.reset();
        }

        std::optional<TranscriptionEvent> event;
        if (result) {
            std::string text = session::trim(result->text);
            if (!text.empty()) {
                TranscriptionEvent ev;
                ev.text = std::move(text);
                ev.confidence = result->confidence;
                ev.is_final = true;
                ev.batch_id = id;
                ev.batch_started_at = startedAt;
                event = std::move(ev);
            } else if (config.verbose) {
                std::cout << "[SpeechBatcher] Batch #" << id << ": nothing recognized" << std::endl;
            }
        }

        const bool accepted = publishFinal(seq, std::move(event));

        std::lock_guard<std::mutex> statsLock(statsMutex);
        timedTranscriptions++;
        stats.avg_transcription_ms +=
            (elapsedMs - stats.avg_transcription_ms) / static_cast<double>(timedTranscriptions);
        if (!accepted) {
            return;  // already skipped and counted as timed out
        }
        if (overdue) {
            stats.timed_out_transcriptions++;
        }
        if (result) {
            stats.final_transcriptions++;
        } else {
            stats.failed_transcriptions++;
        }
    }

    /**
     * Store the result of final number seq and release every final that is
     * now in order.
     * @return false if seq was already skipped after its deadline
     */
    bool publishFinal(uint64_t seq, std::optional<TranscriptionEvent> event) {
        std::lock_guard<std::mutex> lock(publishMutex);
        if (seq < nextPublishSeq) {
            std::cerr << "[SpeechBatcher] Late transcription"
                      << (event ? " of batch #" + std::to_string(event->batch_id) : std::string())
                      << " dropped" << std::endl;
            return false;
        }
        outstanding.erase(seq);
        pendingFinals.emplace(seq, std::move(event));
        flushLocked();
        return true;
    }

    void flushLocked() {
        for (auto it = pendingFinals.find(nextPublishSeq); it != pendingFinals.end();
             it = pendingFinals.find(nextPublishSeq)) {
            if (it->second) {
                if (config.verbose) {
                    std::cout << "[SpeechBatcher] Final #" << it->second->batch_id << ": \""
                              << it->second->text << "\"" << std::endl;
                }
                if (!events.push(std::move(*it->second), std::chrono::milliseconds(1000))) {
                    std::cerr << "[SpeechBatcher] Event channel full, final transcription dropped"
                              << std::endl;
                }
            }
            pendingFinals.erase(it);
            ++nextPublishSeq;
        }
    }

    /**
     * Skip the head of the reorder buffer while its recognition is past the
     * deadline, so later finals are not held back. With force, skip every
     * recognition still outstanding.
     */
    void expireOverdue(bool force) {
        std::lock_guard<std::mutex> lock(publishMutex);
        const auto current = Clock::now();
        size_t expired = 0;

        for (auto it = outstanding.find(nextPublishSeq); it != outstanding.end();
             it = outstanding.find(nextPublishSeq)) {
            if (!force && current < it->second.deadline) {
                break;
            }
            std::cerr << "[SpeechBatcher] Transcription of batch #" << it->second.batch_id
                      << (force ? " still running at shutdown" : " timed out")
                      << ", skipping it" << std::endl;
            outstanding.erase(it);
            pendingFinals.emplace(nextPublishSeq, std::nullopt);
            flushLocked();
            ++expired;
        }

        if (expired > 0) {
            std::lock_guard<std::mutex> statsLock(statsMutex);
            stats.timed_out_transcriptions += expired;
            stats.failed_transcriptions += expired;
        }
    }
};

struct SpeechBatcher::Impl {
    BatcherConfig config;
    NowFunction now;
    std::shared_ptr<ResultSink> sink;

    core::BoundedQueue<audio::AudioSegment> input;

    std::thread loopThread;
    std::atomic<bool> running{false};
    std::atomic<bool> stopped{false};

    // Active batch
    mutable std::mutex batchMutex;
    std::optional<SpeechBatch> active;
    std::optional<audio::AudioSegment> held;  // micro-segment waiting for a batch
    std::optional<CancellationToken> partialToken;
    uint64_t nextBatchId = 1;
    uint64_t nextFinalSeq = 0;
    std::deque<SpeechBatch> archive;

    TaskPool pool;

    Impl(stt::Recognizer& r, const BatcherConfig& c, NowFunction n)
        : config(c)
        , now(n ? std::move(n) : NowFunction(&Clock::now))
        , sink(std::make_shared<ResultSink>(r, c))
        , input(c.input_queue_capacity)
        , pool(c.worker_count, c.task_queue_capacity) {}

    template <typename F>
    void count(F&& update) {
        std::lock_guard<std::mutex> lock(sink->statsMutex);
        update(sink->stats);
    }

    double adaptiveThreshold(double duration) const {
        double factor = 1.0;
        if (duration > config.adaptive_reference_duration) {
            factor = std::min(config.adaptive_max_factor,
                              duration / config.adaptive_reference_duration);
        }
        return config.long_pause_base_threshold * factor;
    }

    void processSegment(audio::AudioSegment segment) {
        std::lock_guard<std::mutex> lock(batchMutex);
        count([](BatcherStats& s) { s.segments_processed++; });

        if (!segment.has_speech || segment.samples.empty()) {
            handleSilenceLocked(segment.timestamp);
            return;
        }

        if (held) {
            // Keep the first phoneme: prepend the held opener
            held->samples.insert(held->samples.end(), segment.samples.begin(), segment.samples.end());
            segment.samples = std::move(held->samples);
            segment.energy_level = std::max(segment.energy_level, held->energy_level);
            held.reset();
        }
        segment.duration = static_cast<double>(segment.samples.size()) / config.sample_rate;

        if (!active) {
            if (segment.duration < config.min_segment_duration) {
                if (config.verbose) {
                    std::cout << "[SpeechBatcher] Holding micro-segment ("
                              << segment.duration * 1000.0 << "ms)" << std::endl;
                }
                held = std::move(segment);
                return;
            }
            openBatchLocked(segment);
        }

        active->state = BatchState::Active;
        active->append(std::move(segment));

        if (active->duration() >= config.max_batch_duration) {
            finalizeLocked("max duration");
            return;
        }

        if (config.partial_interval > 0 &&
            active->segmentCount() % static_cast<size_t>(config.partial_interval) == 0) {
            queuePartialLocked();
        }
    }

    void openBatchLocked(const audio::AudioSegment& first) {
        SpeechBatch batch;
        batch.id = nextBatchId++;
        batch.sample_rate = config.sample_rate;
        batch.start_time = addSeconds(first.timestamp, -first.duration);
        batch.last_activity_time = batch.start_time;
        active = std::move(batch);

        if (config.verbose) {
            std::cout << "[SpeechBatcher] Batch #" << active->id << " started" << std::endl;
        }
    }

    void handleSilenceLocked(TimePoint at) {
        if (held && secondsBetween(held->timestamp, at) > config.short_pause_threshold) {
            held.reset();
        }
        if (!active) {
            return;
        }

        active->state = BatchState::Paused;
        const double pause = std::max(0.0, secondsBetween(active->last_activity_time, at));
        const double duration = active->duration();
        const bool enoughContent =
            active->segmentCount() >= static_cast<size_t>(config.short_pause_min_segments) &&
            duration >= config.short_pause_min_duration;

        if (enoughContent && pause >= config.short_pause_threshold) {
            finalizeLocked("short pause");
        } else if (pause >= adaptiveThreshold(duration)) {
            finalizeLocked("long pause");
        }
    }

    void cancelPartialLocked() {
        if (partialToken) {
            partialToken->cancel();
            partialToken.reset();
        }
    }

    void finalizeLocked(const char* reason) {
        SpeechBatch batch = std::move(*active);
        active.reset();
        batch.state = BatchState::Completed;
        cancelPartialLocked();

        const uint64_t seq = nextFinalSeq++;
        const uint64_t id = batch.id;
        const TimePoint startedAt = batch.start_time;
        const double duration = batch.duration();
        auto samples = std::make_shared<const std::vector<float>>(batch.accumulated_samples);

        count([duration](BatcherStats& s) {
            s.batches_completed++;
            s.total_audio_seconds += duration;
        });

        std::cout << "[SpeechBatcher] Batch #" << id << " finalized (" << reason << ", "
                  << duration << "s, "
                  << batch.segmentCount() << " segments)" << std::endl;

        archive.push_back(std::move(batch));
        while (archive.size() > config.archive_size) {
            archive.pop_front();
        }

        sink->expect(seq, id);
        std::shared_ptr<ResultSink> target = sink;
        bool queued = pool.submit([target, seq, id, startedAt, samples](const CancellationToken& token) {
            target->runFinal(seq, id, startedAt, *samples, token);
        });
        if (!queued) {
            std::cerr << "[SpeechBatcher] Worker queue full, transcribing batch #" << id
                      << " inline" << std::endl;
            sink->runFinal(seq, id, startedAt, *samples, CancellationToken{});
        }
    }

    void queuePartialLocked() {
        cancelPartialLocked();

        CancellationToken token;
        partialToken = token;

        const auto& all = active->accumulated_samples;
        const size_t window = static_cast<size_t>(config.partial_window * config.sample_rate);
        const size_t offset = all.size() > window ? all.size() - window : 0;
        auto tail = std::make_shared<const std::vector<float>>(all.begin() + offset, all.end());
        const uint64_t id = active->id;
        const TimePoint startedAt = active->start_time;

        count([](BatcherStats& s) { s.partial_requests++; });

        std::shared_ptr<ResultSink> target = sink;
        bool queued = pool.submit([target, id, startedAt, tail](const CancellationToken& t) {
            target->runPartial(id, startedAt, *tail, t);
        }, token);
        if (!queued) {
            count([](BatcherStats& s) { s.partials_dropped++; });
        }
    }

    void loop() {
        const auto pollTimeout = std::chrono::milliseconds(config.poll_timeout_ms);
        const double pollSeconds = config.poll_timeout_ms / 1000.0;
        TimePoint lastCheck = now();

        while (running) {
            auto segment = input.pop(pollTimeout);
            if (segment) {
                processSegment(std::move(*segment));
            }

            TimePoint current = now();
            if (!segment || secondsBetween(lastCheck, current) >= pollSeconds) {
                std::lock_guard<std::mutex> lock(batchMutex);
                handleSilenceLocked(current);
                lastCheck = current;
            }
            sink->expireOverdue(false);
        }
    }
};

SpeechBatcher::SpeechBatcher(stt::Recognizer& recognizer, const BatcherConfig& config, NowFunction now)
    : pImpl_(std::make_unique<Impl>(recognizer, checked(config), std::move(now)))
{
}

SpeechBatcher::~SpeechBatcher() {
    stop();
}

bool SpeechBatcher::start() {
    if (pImpl_->stopped) {
        std::cerr << "[SpeechBatcher] Cannot restart a stopped batcher" << std::endl;
        return false;
    }
    if (pImpl_->running.exchange(true)) {
        return true;
    }

    pImpl_->loopThread = std::thread(&Impl::loop, pImpl_.get());
    std::cout << "[SpeechBatcher] Started (short pause " << pImpl_->config.short_pause_threshold
              << "s, long pause " << pImpl_->config.long_pause_base_threshold
              << "s, max batch " << pImpl_->config.max_batch_duration << "s)" << std::endl;
    return true;
}

void SpeechBatcher::stop() {
    if (pImpl_->stopped.exchange(true)) {
        return;
    }

    pImpl_->running = false;
    pImpl_->input.close();
    if (pImpl_->loopThread.joinable()) {
        pImpl_->loopThread.join();
    }

    for (auto& segment : pImpl_->input.drain()) {
        pImpl_->processSegment(std::move(segment));
    }

    {
        std::lock_guard<std::mutex> lock(pImpl_->batchMutex);
        pImpl_->held.reset();
        if (pImpl_->active) {
            pImpl_->finalizeLocked("shutdown");
        }
    }

    if (!pImpl_->pool.shutdown(std::chrono::milliseconds(pImpl_->config.shutdown_timeout_ms))) {
        std::cerr << "[SpeechBatcher] Outstanding transcriptions did not finish in time" << std::endl;
    }
    // Release finals queued behind a recognition that is still running
    pImpl_->sink->expireOverdue(true);

    auto s = stats();
    std::cout << "[SpeechBatcher] Stopped (" << s.batches_completed << " batches, "
              << s.final_transcriptions << " transcriptions)" << std::endl;
}

bool SpeechBatcher::isRunning() const {
    return pImpl_->running;
}

bool SpeechBatcher::addSegment(audio::AudioSegment segment) {
    if (pImpl_->stopped) {
        return false;
    }
    if (!pImpl_->input.tryPush(std::move(segment))) {
        pImpl_->count([](BatcherStats& s) { s.segments_dropped++; });
        std::cerr << "[SpeechBatcher] Input queue full, segment dropped" << std::endl;
        return false;
    }
    return true;
}

void SpeechBatcher::process(audio::AudioSegment segment) {
    if (pImpl_->stopped) {
        return;
    }
    pImpl_->processSegment(std::move(segment));
}

void SpeechBatcher::checkPause(TimePoint now) {
    {
        std::lock_guard<std::mutex> lock(pImpl_->batchMutex);
        pImpl_->handleSilenceLocked(now);
    }
    pImpl_->sink->expireOverdue(false);
}

bool SpeechBatcher::forceFinalize() {
    std::lock_guard<std::mutex> lock(pImpl_->batchMutex);
    pImpl_->held.reset();
    if (!pImpl_->active) {
        return false;
    }
    pImpl_->finalizeLocked("forced");
    return true;
}

bool SpeechBatcher::discardActiveBatch() {
    std::lock_guard<std::mutex> lock(pImpl_->batchMutex);
    pImpl_->held.reset();
    if (!pImpl_->active) {
        return false;
    }

    pImpl_->cancelPartialLocked();
    const uint64_t id = pImpl_->active->id;
    pImpl_->active.reset();
    pImpl_->count([](BatcherStats& s) { s.batches_discarded++; });
    if (pImpl_->config.verbose) {
        std::cout << "[SpeechBatcher] Batch #" << id << " discarded" << std::endl;
    }
    return true;
}

bool SpeechBatcher::hasActiveBatch() const {
    std::lock_guard<std::mutex> lock(pImpl_->batchMutex);
    return pImpl_->active.has_value();
}

SpeechBatcher::EventChannel& SpeechBatcher::events() {
    return pImpl_->sink->events;
}

std::optional<TranscriptionEvent> SpeechBatcher::nextEvent(std::chrono::milliseconds timeout) {
    pImpl_->sink->expireOverdue(false);
    return pImpl_->sink->events.pop(timeout);
}

void SpeechBatcher::expireOverdue() {
    pImpl_->sink->expireOverdue(false);
}

std::vector<SpeechBatch> SpeechBatcher::completedBatches() const {
    std::lock_guard<std::mutex> lock(pImpl_->batchMutex);
    return std::vector<SpeechBatch>(pImpl_->archive.begin(), pImpl_->archive.end());
}

BatcherStats SpeechBatcher::stats() const {
    std::lock_guard<std::mutex> lock(pImpl_->sink->statsMutex);
    return pImpl_->sink->stats;
}

const BatcherConfig& SpeechBatcher::config() const {
    return pImpl_->config;
}

} // namespace sui::speech
