/**
 * test_stt.cpp - STTEngine tests
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

#include "sui/stt/STTEngine.hpp"

namespace {

sui::stt::STTConfig modelConfig() {
    sui::stt::STTConfig config;
    config.model_path = "models/ggml-small.bin";
    config.language = "fr";
    config.n_threads = 4;
    return config;
}

} // namespace

void test_sample_rate() {
    std::cout << "--- Test: Sample Rate ---" << std::endl;

    static_assert(sui::stt::STTEngine::getSampleRate() == 16000, "whisper runs at 16kHz");
    std::cout << "[PASS] Sample rate is 16kHz" << std::endl;
}

void test_missing_model() {
    std::cout << "\n--- Test: Missing Model ---" << std::endl;

    sui::stt::STTConfig config;
    config.model_path = "models/does-not-exist.bin";
    sui::stt::STTEngine engine(config);

    assert(!engine.isReady());
    assert(!engine.recognize(std::vector<float>(1600, 0.0f), true));
    std::cout << "[PASS] Missing model reports failure" << std::endl;
}

void test_initialization() {
    std::cout << "\n--- Test: STTEngine Initialization ---" << std::endl;

    sui::stt::STTEngine engine(modelConfig());

    if (engine.isReady()) {
        std::cout << "  Info: " << engine.getModelInfo() << std::endl;
        std::cout << "[PASS] Model loaded successfully" << std::endl;
    } else {
        std::cout << "[SKIP] Model not available at models/ggml-small.bin" << std::endl;
    }
}

void test_transcription_with_silence() {
    std::cout << "\n--- Test: Transcription with Silence ---" << std::endl;

    sui::stt::STTEngine engine(modelConfig());
    if (!engine.isReady()) {
        std::cout << "[SKIP] Model not available" << std::endl;
        return;
    }

    auto empty = engine.recognize({}, false);
    assert(empty && empty->text.empty());

    // 1 second of silence (16kHz)
    std::vector<float> silence(16000, 0.0f);
    auto result = engine.recognize(silence, true);

    assert(result);
    assert(result->is_final);
    std::cout << "  Result: \"" << result->text << "\"" << std::endl;
    std::cout << "[PASS] Transcription of silence works" << std::endl;
}

void test_concurrent_partial_and_final() {
    std::cout << "\n--- Test: Concurrent Partial and Final ---" << std::endl;

    sui::stt::STTEngine engine(modelConfig());
    if (!engine.isReady()) {
        std::cout << "[SKIP] Model not available" << std::endl;
        return;
    }

    // 2 seconds of 440Hz tone
    const int sample_rate = 16000;
    std::vector<float> tone(sample_rate * 2);
    for (size_t i = 0; i < tone.size(); ++i) {
        tone[i] = 0.3f * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 440.0 * i / sample_rate));
    }

    std::optional<sui::stt::TranscriptionResult> partial;
    std::thread worker([&] { partial = engine.recognize(tone, false); });
    auto final_result = engine.recognize(tone, true);
    worker.join();

    assert(partial && !partial->is_final);
    assert(final_result && final_result->is_final);
    assert(final_result->confidence >= 0.0f && final_result->confidence <= 1.0f);
    std::cout << "  Partial: \"" << partial->text << "\"" << std::endl;
    std::cout << "  Final:   \"" << final_result->text << "\"" << std::endl;
    std::cout << "[PASS] Two decoder states run side by side" << std::endl;
}

void test_decoder_states_reused() {
    std::cout << "\n--- Test: Decoder State Reuse ---" << std::endl;

    sui::stt::STTEngine engine(modelConfig());
    if (!engine.isReady()) {
        std::cout << "[SKIP] Model not available" << std::endl;
        return;
    }
    assert(engine.cachedStates() == 0);

    std::vector<float> silence(8000, 0.0f);
    for (int i = 0; i < 3; ++i) {
        assert(engine.recognize(silence, false));
    }
    // Sequential partials share one state
    assert(engine.cachedStates() == 1);

    assert(engine.recognize(silence, true));
    assert(engine.cachedStates() == 2);
    std::cout << "[PASS] One decoder state per call kind" << std::endl;
}

int main() {
    std::cout << "=== STTEngine Tests ===" << std::endl;

    test_sample_rate();
    test_missing_model();
    test_initialization();
    test_transcription_with_silence();
    test_concurrent_partial_and_final();
    test_decoder_states_reused();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
