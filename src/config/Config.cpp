/**
 * Config.cpp - Configuration validation and JSON loading (nlohmann/json)
 */

#include "sui/Config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sui {

namespace {

class Errors {
public:
    explicit Errors(std::string prefix) : prefix_(std::move(prefix)) {}

    void check(bool ok, const std::string& message) {
        if (!ok) list_.push_back(prefix_ + message);
    }

    void append(const std::vector<std::string>& other, const std::string& section) {
        for (const auto& message : other) {
            list_.push_back(section + "." + message);
        }
    }

    std::vector<std::string> take() { return std::move(list_); }

private:
    std::string prefix_;
    std::vector<std::string> list_;
};

// JSON reading

const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + name + "' must be an object");
    }
    return &*it;
}

template <typename T>
void read(const json* sec, const char* name, const char* key, T& out) {
    if (!sec) return;
    auto it = sec->find(key);
    if (it == sec->end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string(name) + "." + key + ": " + e.what());
    }
}

void read(const json* sec, const char* name, const char* key, size_t& out) {
    if (!sec) return;
    auto it = sec->find(key);
    if (it == sec->end() || it->is_null()) return;
    if (!it->is_number_integer() || it->get<long long>() < 0) {
        throw ConfigError(std::string(name) + "." + key + ": expected a non-negative integer");
    }
    out = it->get<size_t>();
}

audio::VADMode parseMode(const json& value) {
    if (value.is_number_integer()) {
        int mode = value.get<int>();
        if (mode < 0 || mode > 3) {
            throw ConfigError("classifier.mode: expected 0-3, got " + std::to_string(mode));
        }
        return static_cast<audio::VADMode>(mode);
    }
    if (value.is_string()) {
        const auto name = value.get<std::string>();
        if (name == "quality") return audio::VADMode::Quality;
        if (name == "low_bitrate") return audio::VADMode::LowBitrate;
        if (name == "aggressive") return audio::VADMode::Aggressive;
        if (name == "very_aggressive") return audio::VADMode::VeryAggressive;
        throw ConfigError("classifier.mode: unknown mode '" + name + "'");
    }
    throw ConfigError("classifier.mode: expected a string or an integer");
}

void readAudio(const json& root, audio::AudioConfig& c) {
    const json* s = section(root, "audio");
    read(s, "audio", "sample_rate", c.sample_rate);
    read(s, "audio", "channels", c.channels);
    read(s, "audio", "frame_ms", c.frame_ms);
    read(s, "audio", "frames_per_buffer", c.frames_per_buffer);
    read(s, "audio", "input_device", c.input_device);
    read(s, "audio", "output_device", c.output_device);
    read(s, "audio", "capture_buffer_seconds", c.capture_buffer_seconds);
    read(s, "audio", "playback_buffer_seconds", c.playback_buffer_seconds);
}

void readClassifier(const json& root, audio::ClassifierConfig& c) {
    const json* s = section(root, "classifier");
    if (!s) return;
    if (auto it = s->find("mode"); it != s->end() && !it->is_null()) {
        c.mode = parseMode(*it);
    }
    read(s, "classifier", "subframe_ms", c.subframe_ms);
    read(s, "classifier", "energy_threshold", c.energy_threshold);
    read(s, "classifier", "min_speech_energy", c.min_speech_energy);
    read(s, "classifier", "use_vad", c.use_vad);
}

void readCapture(const json& root, audio::CaptureConfig& c) {
    const json* s = section(root, "capture");
    read(s, "capture", "frame_timeout_ms", c.frame_timeout_ms);
}

void readBatcher(const json& root, speech::BatcherConfig& c) {
    const json* s = section(root, "batcher");
    read(s, "batcher", "short_pause_threshold", c.short_pause_threshold);
    read(s, "batcher", "short_pause_min_segments", c.short_pause_min_segments);
    read(s, "batcher", "short_pause_min_duration", c.short_pause_min_duration);
    read(s, "batcher", "long_pause_base_threshold", c.long_pause_base_threshold);
    read(s, "batcher", "adaptive_reference_duration", c.adaptive_reference_duration);
    read(s, "batcher", "adaptive_max_factor", c.adaptive_max_factor);
    read(s, "batcher", "min_segment_duration", c.min_segment_duration);
    read(s, "batcher", "max_batch_duration", c.max_batch_duration);
    read(s, "batcher", "partial_interval", c.partial_interval);
    read(s, "batcher", "partial_window", c.partial_window);
    read(s, "batcher", "worker_count", c.worker_count);
    read(s, "batcher", "task_queue_capacity", c.task_queue_capacity);
    read(s, "batcher", "input_queue_capacity", c.input_queue_capacity);
    read(s, "batcher", "event_queue_capacity", c.event_queue_capacity);
    read(s, "batcher", "poll_timeout_ms", c.poll_timeout_ms);
    read(s, "batcher", "recognition_timeout_ms", c.recognition_timeout_ms);
    read(s, "batcher", "shutdown_timeout_ms", c.shutdown_timeout_ms);
    read(s, "batcher", "archive_size", c.archive_size);
}

void readEcho(const json& root, session::EchoConfig& c) {
    const json* s = section(root, "echo");
    read(s, "echo", "similarity_threshold", c.similarity_threshold);
    read(s, "echo", "window", c.window);
    read(s, "echo", "post_speech_energy", c.post_speech_energy);
}

void readSession(const json& root, SessionConfig& c) {
    const json* s = section(root, "session");
    read(s, "session", "tick_interval_ms", c.tick_interval_ms);
    read(s, "session", "auto_listen", c.auto_listen);
    read(s, "session", "max_listening_duration", c.max_listening_duration);
    read(s, "session", "high_confidence_threshold", c.high_confidence_threshold);
    read(s, "session", "confirmation_timeout", c.confirmation_timeout);
    read(s, "session", "recognition_timeout", c.recognition_timeout);
    read(s, "session", "shutdown_timeout_ms", c.shutdown_timeout_ms);
    read(s, "session", "greeting", c.greeting);

    const json* commands = section(root, "commands");
    read(commands, "commands", "end_position_ratio", c.commands.end_position_ratio);
    read(commands, "commands", "max_command_words", c.commands.max_command_words);
}

void readEndpoints(const json& root, EndpointConfig& c) {
    const json* stt = section(root, "stt");
    read(stt, "stt", "model_path", c.stt.model_path);
    read(stt, "stt", "language", c.stt.language);
    read(stt, "stt", "n_threads", c.stt.n_threads);
    read(stt, "stt", "beam_size", c.stt.beam_size);
    read(stt, "stt", "use_gpu", c.stt.use_gpu);

    const json* tts = section(root, "tts");
    read(tts, "tts", "server_url", c.tts.server_url);
    read(tts, "tts", "language", c.tts.language);
    read(tts, "tts", "speaker_wav", c.tts.speaker_wav);
    read(tts, "tts", "timeout_sec", c.tts.timeout_sec);

    const json* intent = section(root, "intent");
    read(intent, "intent", "server_url", c.intent.server_url);
    read(intent, "intent", "timeout_ms", c.intent.timeout_ms);
    read(intent, "intent", "max_tokens", c.intent.max_tokens);
    read(intent, "intent", "min_confidence", c.intent.min_confidence);

    const json* daemon = section(root, "daemon");
    read(daemon, "daemon", "server_url", c.daemon.server_url);
    read(daemon, "daemon", "command_path", c.daemon.command_path);
    read(daemon, "daemon", "session_id", c.daemon.session_id);
    read(daemon, "daemon", "timeout_ms", c.daemon.timeout_ms);
}

void readWakeWord(const json& root, wakeword::WakeWordConfig& c) {
    const json* s = section(root, "wake_word");
    read(s, "wake_word", "enabled", c.enabled);
    read(s, "wake_word", "access_key", c.access_key);
    read(s, "wake_word", "model_path", c.model_path);
    read(s, "wake_word", "keyword_paths", c.keyword_paths);
    read(s, "wake_word", "sensitivities", c.sensitivities);
}

} // namespace

std::vector<std::string> validate(const audio::AudioConfig& c) {
    Errors e("");
    e.check(c.sample_rate > 0, "sample_rate must be positive");
    e.check(c.channels >= 1, "channels must be at least 1");
    e.check(c.frame_ms > 0, "frame_ms must be positive");
    e.check(c.frames_per_buffer > 0, "frames_per_buffer must be positive");
    e.check(c.capture_buffer_seconds > 0.0, "capture_buffer_seconds must be positive");
    e.check(c.playback_buffer_seconds > 0.0, "playback_buffer_seconds must be positive");
    return e.take();
}

std::vector<std::string> validate(const audio::ClassifierConfig& c) {
    Errors e("");
    e.check(c.sample_rate > 0, "sample_rate must be positive");
    e.check(c.subframe_ms == 10 || c.subframe_ms == 20 || c.subframe_ms == 30,
            "subframe_ms must be 10, 20 or 30");
    e.check(c.energy_threshold >= 0.0f, "energy_threshold must not be negative");
    e.check(c.min_speech_energy >= 0.0f, "min_speech_energy must not be negative");
    return e.take();
}

std::vector<std::string> validate(const audio::CaptureConfig& c) {
    Errors e("");
    e.check(c.frame_timeout_ms > 0, "frame_timeout_ms must be positive");
    e.check(c.post_speech_energy >= 0.0f, "post_speech_energy must not be negative");
    return e.take();
}

std::vector<std::string> validate(const speech::BatcherConfig& c) {
    Errors e("");
    e.check(c.sample_rate > 0, "sample_rate must be positive");
    e.check(c.short_pause_threshold > 0.0, "short_pause_threshold must be positive");
    e.check(c.long_pause_base_threshold > c.short_pause_threshold,
            "long_pause_base_threshold must exceed short_pause_threshold");
    e.check(c.short_pause_min_segments >= 1, "short_pause_min_segments must be at least 1");
    e.check(c.short_pause_min_duration >= 0.0, "short_pause_min_duration must not be negative");
    e.check(c.adaptive_reference_duration > 0.0, "adaptive_reference_duration must be positive");
    e.check(c.adaptive_max_factor >= 1.0, "adaptive_max_factor must be at least 1");
    e.check(c.min_segment_duration >= 0.0, "min_segment_duration must not be negative");
    e.check(c.max_batch_duration > c.min_segment_duration,
            "max_batch_duration must exceed min_segment_duration");
    e.check(c.partial_interval >= 1, "partial_interval must be at least 1");
    e.check(c.partial_window > 0.0, "partial_window must be positive");
    e.check(c.worker_count >= 1, "worker_count must be at least 1");
    e.check(c.task_queue_capacity >= 1, "task_queue_capacity must be at least 1");
    e.check(c.input_queue_capacity >= 1, "input_queue_capacity must be at least 1");
    e.check(c.event_queue_capacity >= 1, "event_queue_capacity must be at least 1");
    e.check(c.poll_timeout_ms > 0, "poll_timeout_ms must be positive");
    e.check(c.recognition_timeout_ms > 0, "recognition_timeout_ms must be positive");
    e.check(c.shutdown_timeout_ms >= 0, "shutdown_timeout_ms must not be negative");
    return e.take();
}

std::vector<std::string> validate(const session::EchoConfig& c) {
    Errors e("");
    e.check(c.similarity_threshold >= 0.0 && c.similarity_threshold <= 1.0,
            "similarity_threshold must be within [0, 1]");
    e.check(c.window >= 0.0, "window must not be negative");
    e.check(c.post_speech_energy >= 0.0f, "post_speech_energy must not be negative");
    return e.take();
}

std::vector<std::string> validate(const session::CommandPolicy& p) {
    Errors e("");
    e.check(p.end_position_ratio > 0.0 && p.end_position_ratio <= 1.0,
            "end_position_ratio must be within (0, 1]");
    return e.take();
}

std::vector<std::string> validate(const SessionConfig& c) {
    Errors e("");
    e.check(c.tick_interval_ms > 0, "tick_interval_ms must be positive");
    e.check(c.max_listening_duration > 0.0, "max_listening_duration must be positive");
    e.check(c.high_confidence_threshold >= 0.0 && c.high_confidence_threshold <= 1.0,
            "high_confidence_threshold must be within [0, 1]");
    e.check(c.confirmation_timeout > 0.0, "confirmation_timeout must be positive");
    e.check(c.recognition_timeout > 0.0, "recognition_timeout must be positive");
    e.check(c.shutdown_timeout_ms >= 0, "shutdown_timeout_ms must not be negative");
    e.append(validate(c.commands), "commands");
    return e.take();
}

std::vector<std::string> validate(const Config& c) {
    Errors e("");
    e.append(validate(c.audio), "audio");
    e.append(validate(c.classifier), "classifier");
    e.append(validate(c.capture), "capture");
    e.append(validate(c.batcher), "batcher");
    e.append(validate(c.echo), "echo");
    e.append(validate(c.session), "session");

    // whisper only accepts 16 kHz input
    e.check(c.audio.sample_rate == stt::STTEngine::getSampleRate(),
            "audio.sample_rate must be " + std::to_string(stt::STTEngine::getSampleRate()));
    e.check(c.classifier.sample_rate == c.audio.sample_rate,
            "classifier.sample_rate must match audio.sample_rate");
    e.check(c.batcher.sample_rate == c.audio.sample_rate,
            "batcher.sample_rate must match audio.sample_rate");

    e.check(!c.endpoints.stt.model_path.empty(), "stt.model_path must not be empty");
    e.check(!c.endpoints.tts.server_url.empty(), "tts.server_url must not be empty");
    e.check(!c.endpoints.intent.server_url.empty(), "intent.server_url must not be empty");
    e.check(!c.endpoints.daemon.server_url.empty(), "daemon.server_url must not be empty");

    if (c.wake_word.enabled) {
        e.check(!c.wake_word.keyword_paths.empty(), "wake_word.keyword_paths must not be empty");
        e.check(c.wake_word.sensitivities.size() <= c.wake_word.keyword_paths.size(),
                "wake_word.sensitivities has more entries than keyword_paths");
    }
    return e.take();
}

void requireValid(const std::vector<std::string>& errors, const std::string& component) {
    if (errors.empty()) return;

    std::ostringstream out;
    out << component << ": invalid configuration";
    for (const auto& message : errors) {
        out << "\n  - " << message;
    }
    throw ConfigError(out.str());
}

void propagateShared(Config& config) {
    config.classifier.sample_rate = config.audio.sample_rate;
    config.batcher.sample_rate = config.audio.sample_rate;
    config.capture.post_speech_energy = config.echo.post_speech_energy;
    config.session.use_wake_word = config.wake_word.enabled;
    config.capture.verbose = config.verbose;
    config.batcher.verbose = config.verbose;
    config.session.verbose = config.verbose;
}

Config parseConfig(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("malformed JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    Config config;
    read(&root, "config", "verbose", config.verbose);
    read(&root, "config", "use_aec", config.use_aec);
    readAudio(root, config.audio);
    readClassifier(root, config.classifier);
    readCapture(root, config.capture);
    readBatcher(root, config.batcher);
    readEcho(root, config.echo);
    readSession(root, config.session);
    readEndpoints(root, config.endpoints);
    readWakeWord(root, config.wake_word);

    propagateShared(config);
    return config;
}

Config loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Config config = parseConfig(buffer.str());
    std::cout << "[Config] Loaded " << path << std::endl;
    return config;
}

} // namespace sui
