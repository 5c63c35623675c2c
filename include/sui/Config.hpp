/**
 * Config.hpp - Aggregated configuration, validation and JSON loading
 */

#pragma once

#include "sui/InteractionStateMachine.hpp"
#include "sui/audio/AudioEngine.hpp"
#include "sui/audio/CaptureLoop.hpp"
#include "sui/audio/SegmentClassifier.hpp"
#include "sui/daemon/DaemonClient.hpp"
#include "sui/nlu/IntentClient.hpp"
#include "sui/session/EchoSuppressor.hpp"
#include "sui/session/GlobalCommands.hpp"
#include "sui/speech/SpeechBatcher.hpp"
#include "sui/stt/STTEngine.hpp"
#include "sui/tts/TTSEngine.hpp"
#include "sui/wakeword/WakeWordDetector.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace sui {

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * Model paths and server URLs of the external collaborators.
 */
struct EndpointConfig {
    stt::STTConfig stt;
    tts::TTSConfig tts;
    nlu::IntentClientConfig intent;
    daemon::DaemonConfig daemon;
};

struct Config {
    audio::AudioConfig audio;
    audio::ClassifierConfig classifier;
    audio::CaptureConfig capture;
    speech::BatcherConfig batcher;
    session::EchoConfig echo;
    SessionConfig session;
    EndpointConfig endpoints;
    wakeword::WakeWordConfig wake_word;
    bool use_aec = true;    // ignored without SUI_HAS_AEC3
    bool verbose = false;
};

// Each returns one message per violated constraint; empty means valid
std::vector<std::string> validate(const audio::AudioConfig& config);
std::vector<std::string> validate(const audio::ClassifierConfig& config);
std::vector<std::string> validate(const audio::CaptureConfig& config);
std::vector<std::string> validate(const speech::BatcherConfig& config);
std::vector<std::string> validate(const session::EchoConfig& config);
std::vector<std::string> validate(const session::CommandPolicy& policy);
std::vector<std::string> validate(const SessionConfig& config);
std::vector<std::string> validate(const Config& config);

/**
 * @throws ConfigError listing every message when errors is not empty
 */
void requireValid(const std::vector<std::string>& errors, const std::string& component);

/**
 * Defaults overridden by an optional JSON file, one object per section
 * ("audio", "classifier", "batcher", ...). Unknown keys are ignored.
 * Shared values (sample rate, verbose, post-speech energy) are propagated
 * to every section that carries them.
 * @throws ConfigError on unreadable files, bad JSON or wrong value types
 */
Config loadConfig(const std::string& path);

/**
 * Same as loadConfig for an in-memory document.
 */
Config parseConfig(const std::string& json_text);

/**
 * Copy shared values into every section that carries them.
 */
void propagateShared(Config& config);

} // namespace sui
