/**
 * TTSEngine.cpp - XTTS v2 client using the HTTP server
 * 
 * Connects to a persistent XTTS server for fast inference; the server
 * keeps model and speaker embedding cached. Sentences are fetched one by
 * one so the first one plays while the next is being synthesized.
 */

#include "sui/tts/TTSEngine.hpp"
#include "sui/audio/AudioEngine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <mutex>
#include <regex>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sui::tts {

namespace {

template <typename T>
T readLE(const std::string& bytes, size_t offset) {
    T value;
    std::memcpy(&value, bytes.data() + offset, sizeof(T));
    return value;
}

} // anonymous namespace

struct TTSEngine::Impl {
    TTSConfig config;
    audio::AudioEngine* output;
    std::unique_ptr<httplib::Client> client;
    RenderSink renderSink;
    
    std::atomic<bool> should_stop{false};
    std::atomic<int> server_sample_rate{24000};
    bool server_available = false;
    std::mutex request_mutex;
    
    Impl(const TTSConfig& c, audio::AudioEngine* out) : config(c), output(out) {
        client = std::make_unique<httplib::Client>(config.server_url);
        client->set_connection_timeout(2, 0);
        client->set_read_timeout(config.timeout_sec, 0);
        client->set_write_timeout(config.timeout_sec, 0);
    }
    
    int playbackRate() const {
        return output ? output->config().sample_rate : server_sample_rate.load();
    }
    
    bool checkServer() {
        auto res = client->Get("/health");
        server_available = res && res->status == 200;
        if (server_available) {
            std::cout << "[TTSEngine] Connected to XTTS server at " << config.server_url << std::endl;
        } else {
            std::cerr << "[TTSEngine] XTTS server not reachable at " << config.server_url << std::endl;
        }
        return server_available;
    }
    
    std::vector<float> fetch(const std::string& text) {
        json body = {
            {"text", text},
            {"language", config.language}
        };
        if (!config.speaker_wav.empty()) {
            body["speaker_wav"] = config.speaker_wav;
        }
        
        std::lock_guard<std::mutex> lock(request_mutex);
        auto res = client->Post("/synthesize", body.dump(), "application/json");
        
        if (!res) {
            std::cerr << "[TTSEngine] Request failed: " << httplib::to_string(res.error()) << std::endl;
            server_available = false;
            return {};
        }
        if (res->status != 200) {
            std::cerr << "[TTSEngine] Server returned " << res->status << std::endl;
            return {};
        }
        
        int rate = 0;
        auto audio = decodeWav(res->body, rate);
        if (audio.empty()) {
            return audio;
        }
        server_sample_rate = rate;
        return resample(audio, rate, playbackRate());
    }
    
    // Push into the playback ring buffer, waiting for room
    bool play(const std::vector<float>& audio) {
        size_t offset = 0;
        while (offset < audio.size()) {
            if (should_stop) return false;
            
            size_t chunk = std::min<size_t>(audio.size() - offset, 4096);
            size_t written = output->queuePlayback(audio.data() + offset, chunk);
            if (written > 0 && renderSink) {
                renderSink(audio.data() + offset, written);
            }
            offset += written;
            if (written < chunk) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
        return true;
    }
    
    void waitForPlayback(double seconds) {
        auto deadline = std::chrono::steady_clock::now()
            + std::chrono::milliseconds(static_cast<int>(seconds * 1000.0) + 2000);
        while (output->isPlaying() && !should_stop &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
};

TTSEngine::TTSEngine(const TTSConfig& config, audio::AudioEngine* output)
    : impl_(std::make_unique<Impl>(config, output)) {
    std::cout << "[TTSEngine] XTTS client for " << config.server_url 
              << " (language=" << config.language << ")" << std::endl;
}

TTSEngine::~TTSEngine() = default;

SynthesisResult TTSEngine::synthesize(const std::string& text) {
    SynthesisResult result;
    impl_->should_stop = false;
    
    if (text.empty()) {
        result.success = true;
        return result;
    }
    
    if (!impl_->server_available && !impl_->checkServer()) {
        result.error = "XTTS server not available";
        return result;
    }
    
    size_t total_samples = 0;
    for (const auto& sentence : splitSentences(text)) {
        if (impl_->should_stop) break;
        
        auto audio = impl_->fetch(sentence);
        if (audio.empty()) {
            result.error = "synthesis failed for: " + sentence;
            continue;
        }
        
        total_samples += audio.size();
        if (impl_->output && !impl_->play(audio)) {
            break;
        }
    }
    
    result.audio_duration = static_cast<double>(total_samples) / impl_->playbackRate();
    if (impl_->output) {
        impl_->waitForPlayback(result.audio_duration);
    }
    
    if (impl_->should_stop) {
        result.error = "interrupted";
    }
    result.success = total_samples > 0 && result.error.empty();
    return result;
}

std::vector<float> TTSEngine::synthesizeAudio(const std::string& text) {
    if (text.empty()) return {};
    if (!impl_->server_available && !impl_->checkServer()) return {};
    return impl_->fetch(text);
}

void TTSEngine::setRenderSink(RenderSink sink) {
    impl_->renderSink = std::move(sink);
}

void TTSEngine::stop() {
    impl_->should_stop = true;
    if (impl_->output) {
        impl_->output->clearPlayback();
    }
}

bool TTSEngine::isServerAvailable() {
    return impl_->checkServer();
}

int TTSEngine::getSampleRate() const {
    return impl_->playbackRate();
}

std::vector<std::string> TTSEngine::splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    std::regex sentence_regex(R"([^.!?]+[.!?]+\s*)");
    
    auto begin = std::sregex_iterator(text.begin(), text.end(), sentence_regex);
    auto end = std::sregex_iterator();
    size_t consumed = 0;
    
    for (auto it = begin; it != end; ++it) {
        std::string sentence = it->str();
        consumed = static_cast<size_t>(it->position() + it->length());
        if (sentence.find_first_not_of(" \t\n") != std::string::npos) {
            sentences.push_back(sentence);
        }
    }
    
    // Trailing text without final punctuation
    if (consumed < text.size()) {
        std::string rest = text.substr(consumed);
        if (rest.find_first_not_of(" \t\n") != std::string::npos) {
            sentences.push_back(rest);
        }
    }
    
    return sentences;
}

std::vector<float> TTSEngine::decodeWav(const std::string& bytes, int& sample_rate) {
    std::vector<float> audio;
    
    // Parse WAV - find data chunk (header may be >44 bytes)
    if (bytes.size() < 44) return audio;
    
    if (bytes.compare(0, 4, "RIFF") != 0 || bytes.compare(8, 4, "WAVE") != 0) {
        std::cerr << "[TTSEngine] Invalid WAV: no RIFF header" << std::endl;
        return audio;
    }
    
    uint16_t audio_format = 0;
    uint16_t num_channels = 1;
    uint16_t bits_per_sample = 0;
    size_t data_offset = 0;
    size_t data_size = 0;
    
    // Walk the chunk list
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        std::string id = bytes.substr(pos, 4);
        uint32_t size = readLE<uint32_t>(bytes, pos + 4);
        size_t body = pos + 8;
        
        if (id == "fmt " && body + 16 <= bytes.size()) {
            audio_format = readLE<uint16_t>(bytes, body);
            num_channels = readLE<uint16_t>(bytes, body + 2);
            sample_rate = static_cast<int>(readLE<uint32_t>(bytes, body + 4));
            bits_per_sample = readLE<uint16_t>(bytes, body + 14);
        } else if (id == "data") {
            data_offset = body;
            data_size = std::min<size_t>(size, bytes.size() - body);
            break;
        }
        pos = body + size + (size & 1);
    }
    
    if (data_offset == 0 || num_channels == 0 || sample_rate <= 0) {
        std::cerr << "[TTSEngine] Invalid WAV: no data chunk" << std::endl;
        return audio;
    }
    
    // Handle different bit depths, first channel only
    if (bits_per_sample == 16 && audio_format == 1) {
        const size_t stride = 2u * num_channels;
        const size_t frames = data_size / stride;
        audio.reserve(frames);
        for (size_t i = 0; i < frames; ++i) {
            int16_t s = readLE<int16_t>(bytes, data_offset + i * stride);
            audio.push_back(static_cast<float>(s) / 32768.0f);
        }
    } else if (bits_per_sample == 32 && audio_format == 3) {
        // 32-bit float (IEEE)
        const size_t stride = 4u * num_channels;
        const size_t frames = data_size / stride;
        audio.reserve(frames);
        for (size_t i = 0; i < frames; ++i) {
            audio.push_back(readLE<float>(bytes, data_offset + i * stride));
        }
    } else {
        std::cerr << "[TTSEngine] Unsupported WAV format: " << bits_per_sample << " bits" << std::endl;
    }
    
    return audio;
}

std::vector<float> TTSEngine::resample(const std::vector<float>& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) {
        return input;
    }
    
    // Linear interpolation
    const double ratio = static_cast<double>(from_rate) / to_rate;
    const size_t out_size = static_cast<size_t>(static_cast<double>(input.size()) / ratio);
    std::vector<float> output(out_size);
    
    for (size_t i = 0; i < out_size; ++i) {
        double src = static_cast<double>(i) * ratio;
        size_t idx = static_cast<size_t>(src);
        double frac = src - static_cast<double>(idx);
        float a = input[std::min(idx, input.size() - 1)];
        float b = input[std::min(idx + 1, input.size() - 1)];
        output[i] = static_cast<float>(a + (b - a) * frac);
    }
    return output;
}

} // namespace sui::tts
