/**
 * TTSEngine.hpp - XTTS v2 client with local playback
 *
 * Talks to a persistent XTTS HTTP server (model and speaker embedding
 * stay cached there) and plays the returned audio through AudioEngine.
 */

#pragma once

#include "sui/tts/Synthesizer.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sui::audio {
class AudioEngine;
}

namespace sui::tts {

struct TTSConfig {
    std::string server_url = "http://localhost:5050";
    std::string language = "fr";
    std::string speaker_wav;      // reference voice, server default if empty
    int timeout_sec = 30;
};

class TTSEngine : public Synthesizer {
public:
    // Receives every block handed to the speaker (echo canceller reference)
    using RenderSink = std::function<void(const float*, size_t)>;

    /**
     * @param output Playback device; nullptr synthesizes without playing
     */
    TTSEngine(const TTSConfig& config, audio::AudioEngine* output);
    ~TTSEngine() override;

    TTSEngine(const TTSEngine&) = delete;
    TTSEngine& operator=(const TTSEngine&) = delete;

    /**
     * Synthesize sentence by sentence, queue for playback and wait until
     * the speaker drained.
     */
    SynthesisResult synthesize(const std::string& text) override;

    /**
     * Fetch audio for text, resampled to the playback rate.
     * @return empty on failure
     */
    std::vector<float> synthesizeAudio(const std::string& text);

    void setRenderSink(RenderSink sink);

    /**
     * Interrupt the current synthesize() call and flush playback.
     */
    void stop();

    bool isServerAvailable();
    int getSampleRate() const;

    static std::vector<std::string> splitSentences(const std::string& text);

    /**
     * Decode a RIFF/WAVE body (16-bit PCM or 32-bit float, first channel).
     * @return empty on malformed input
     */
    static std::vector<float> decodeWav(const std::string& bytes, int& sample_rate);

    static std::vector<float> resample(const std::vector<float>& input, int from_rate, int to_rate);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sui::tts
