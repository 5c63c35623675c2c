/**
 * STTEngine.cpp - Speech-to-Text Engine using whisper.cpp
 * 
 * Uses whisper.cpp for local, offline speech recognition.
 * Model is preloaded at startup and stays resident in RAM.
 */

#include "sui/stt/STTEngine.hpp"

#include <cmath>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "whisper.h"

namespace sui::stt {

namespace {

struct StateDeleter {
    void operator()(whisper_state* state) const { whisper_free_state(state); }
};

using StatePtr = std::unique_ptr<whisper_state, StateDeleter>;

// whisper emits markers like "[BLANK_AUDIO]" or "(music)" on non-speech input
bool isNonSpeechMarker(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\n");
    if (begin == std::string::npos) return true;
    size_t end = text.find_last_not_of(" \t\n");
    char open = text[begin];
    char close = text[end];
    return (open == '[' && close == ']') || (open == '(' && close == ')');
}

} // namespace

struct STTEngine::Impl {
    STTConfig config;
    whisper_context* ctx = nullptr;

    // Idle decoder states per call kind, reused across calls
    mutable std::mutex statesMutex;
    std::vector<StatePtr> idleStates[2];
    
    explicit Impl(const STTConfig& c) : config(c) {
        // Initialize whisper context from model file
        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config.use_gpu;
        ctx = whisper_init_from_file_with_params(config.model_path.c_str(), cparams);
        
        if (!ctx) {
            std::cerr << "[STTEngine] Failed to load model: " << config.model_path << std::endl;
            return;
        }
        
        std::cout << "[STTEngine] Model loaded: " << config.model_path << std::endl;
        std::cout << "[STTEngine] Language: " << config.language << ", Threads: " << config.n_threads << std::endl;
    }
    
    ~Impl() {
        for (auto& states : idleStates) {
            states.clear();
        }
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }
    
    StatePtr acquireState(bool final_pass) {
        {
            std::lock_guard<std::mutex> lock(statesMutex);
            auto& states = idleStates[final_pass ? 1 : 0];
            if (!states.empty()) {
                StatePtr state = std::move(states.back());
                states.pop_back();
                return state;
            }
        }
        // Another call of the same kind is running
        return StatePtr(whisper_init_state(ctx));
    }

    void releaseState(bool final_pass, StatePtr state) {
        std::lock_guard<std::mutex> lock(statesMutex);
        idleStates[final_pass ? 1 : 0].push_back(std::move(state));
    }

    whisper_full_params makeParams(bool final_pass) const {
        whisper_full_params params = final_pass
            ? whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH)
            : whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        
        params.language = config.language.c_str();
        params.n_threads = config.n_threads;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        params.translate = false;
        params.no_context = true;
        params.suppress_blank = true;
        
        if (final_pass) {
            params.beam_search.beam_size = config.beam_size;
            params.token_timestamps = true;  // word alignment
            params.single_segment = false;
        } else {
            params.single_segment = true;
            params.no_timestamps = true;
        }
        return params;
    }
};

STTEngine::STTEngine(const STTConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

STTEngine::~STTEngine() = default;

std::optional<TranscriptionResult> STTEngine::recognize(const std::vector<float>& samples,
                                                        bool request_alignment) {
    if (!impl_->ctx) {
        return std::nullopt;
    }
    if (samples.empty()) {
        return TranscriptionResult{"", 0.0f, request_alignment};
    }
    
    StatePtr state = impl_->acquireState(request_alignment);
    if (!state) {
        std::cerr << "[STTEngine] Failed to allocate decoder state" << std::endl;
        return std::nullopt;
    }
    
    whisper_full_params params = impl_->makeParams(request_alignment);
    int result = whisper_full_with_state(impl_->ctx, state.get(), params,
                                         samples.data(), static_cast<int>(samples.size()));
    if (result != 0) {
        std::cerr << "[STTEngine] Transcription failed: " << result << std::endl;
        impl_->releaseState(request_alignment, std::move(state));
        return std::nullopt;
    }
    
    std::string text;
    double probability_sum = 0.0;
    int token_count = 0;
    const int n_segments = whisper_full_n_segments_from_state(state.get());
    
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text_from_state(state.get(), i);
        if (!segment_text || isNonSpeechMarker(segment_text)) {
            continue;
        }
        text += segment_text;
        
        const int n_tokens = whisper_full_n_tokens_from_state(state.get(), i);
        for (int t = 0; t < n_tokens; ++t) {
            float p = whisper_full_get_token_p_from_state(state.get(), i, t);
            if (std::isfinite(p)) {
                probability_sum += p;
                ++token_count;
            }
        }
    }
    
    impl_->releaseState(request_alignment, std::move(state));

    TranscriptionResult out;
    out.text = text;
    out.confidence = token_count > 0 ? static_cast<float>(probability_sum / token_count) : 0.0f;
    out.is_final = request_alignment;
    return out;
}

bool STTEngine::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

size_t STTEngine::cachedStates() const {
    std::lock_guard<std::mutex> lock(impl_->statesMutex);
    return impl_->idleStates[0].size() + impl_->idleStates[1].size();
}

std::string STTEngine::getModelInfo() const {
    if (!isReady()) {
        return "Model not loaded";
    }
    return "whisper (" + impl_->config.model_path + ")";
}

} // namespace sui::stt
