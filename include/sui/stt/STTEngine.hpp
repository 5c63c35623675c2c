/**
 * STTEngine.hpp - Speech-to-Text using whisper.cpp
 *
 * Model is loaded once and stays resident. Decoder states are kept per call
 * kind (partial, final) and reused; concurrent calls never share a state, so
 * a partial and a final can decode side by side.
 */

#pragma once

#include "sui/stt/Recognizer.hpp"

#include <memory>
#include <string>

namespace sui::stt {

struct STTConfig {
    std::string model_path = "models/ggml-small.bin";
    std::string language = "fr";
    int n_threads = 4;
    int beam_size = 5;   // final pass; partials decode greedily
    bool use_gpu = true;
};

class STTEngine : public Recognizer {
public:
    explicit STTEngine(const STTConfig& config = STTConfig{});
    ~STTEngine() override;

    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    std::optional<TranscriptionResult> recognize(const std::vector<float>& samples,
                                                 bool request_alignment) override;

    bool isReady() const;
    std::string getModelInfo() const;

    /**
     * Decoder states currently idle and ready for reuse.
     */
    size_t cachedStates() const;

    /**
     * whisper.cpp expects 16kHz mono
     */
    static constexpr int getSampleRate() { return 16000; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sui::stt
