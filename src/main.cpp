/**
 * sui - Speech User Interface
 *
 * Real-time voice front-end: microphone -> VAD -> utterance batching ->
 * whisper -> intent confirmation -> command daemon, answering through XTTS.
 *
 * Usage: sui [config.json]
 */

#include "sui/Config.hpp"
#include "sui/InteractionStateMachine.hpp"
#include "sui/audio/AudioEngine.hpp"
#include "sui/audio/CaptureLoop.hpp"
#include "sui/audio/SegmentClassifier.hpp"
#include "sui/daemon/DaemonClient.hpp"
#include "sui/nlu/IntentClient.hpp"
#include "sui/speech/SpeechBatcher.hpp"
#include "sui/stt/STTEngine.hpp"
#include "sui/tts/TTSEngine.hpp"

#ifdef SUI_HAS_PORCUPINE
#include "sui/wakeword/WakeWordDetector.hpp"
#endif

#ifdef SUI_HAS_AEC3
#include "sui/audio/AudioPipeline.hpp"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};
std::atomic<bool> g_input_done{false};

void signalHandler(int) {
    g_running = false;
}

#ifdef SUI_HAS_PORCUPINE
std::string readAccessKey(const std::string& configured) {
    if (!configured.empty()) return configured;

    std::string key;
    std::ifstream key_file(".porcupine_key");
    if (key_file.good()) {
        std::getline(key_file, key);
        while (!key.empty() && (key.back() == '\n' || key.back() == '\r' || key.back() == ' ')) {
            key.pop_back();
        }
    }
    return key;
}
#endif

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║          SUI - Speech User Interface          ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    sui::Config config;
    try {
        if (argc > 1) {
            config = sui::loadConfig(argv[1]);
        } else {
            sui::propagateShared(config);
        }
        sui::requireValid(sui::validate(config), "sui");
    } catch (const sui::ConfigError& e) {
        std::cerr << "[SUI] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[SUI] Initializing..." << std::endl;

    sui::audio::AudioEngine audio(config.audio);
    if (!audio.initialize()) {
        std::cerr << "[SUI] AudioEngine init failed: " << audio.lastError() << std::endl;
        return 1;
    }

    sui::stt::STTEngine stt(config.endpoints.stt);
    if (!stt.isReady()) {
        std::cerr << "[SUI] STTEngine init failed (model: " << config.endpoints.stt.model_path << ")" << std::endl;
        return 1;
    }

    sui::tts::TTSEngine tts(config.endpoints.tts, &audio);
    if (!tts.isServerAvailable()) {
        std::cerr << "[SUI] Warning: XTTS server unreachable, replies will be silent" << std::endl;
    }

    sui::nlu::IntentClient intents(config.endpoints.intent);
    if (!intents.isReady()) {
        std::cerr << "[SUI] Warning: intent server unreachable at "
                  << config.endpoints.intent.server_url << std::endl;
    }

    sui::daemon::DaemonClient daemon(config.endpoints.daemon);
    if (!daemon.isHealthy()) {
        std::cerr << "[SUI] Warning: command daemon unreachable at "
                  << config.endpoints.daemon.server_url << std::endl;
    }

    try {
        sui::audio::SegmentClassifier classifier(config.classifier);
        sui::speech::SpeechBatcher batcher(stt, config.batcher);

#ifdef SUI_HAS_PORCUPINE
        std::unique_ptr<sui::wakeword::WakeWordDetector> wakeword;
        if (config.wake_word.enabled) {
            auto wake_config = config.wake_word;
            wake_config.access_key = readAccessKey(wake_config.access_key);
            wakeword = std::make_unique<sui::wakeword::WakeWordDetector>(wake_config);
            if (!wakeword->isReady()) {
                std::cerr << "[SUI] WakeWordDetector failed, falling back to continuous listening" << std::endl;
                wakeword.reset();
                config.session.use_wake_word = false;
            }
        }
#else
        if (config.wake_word.enabled) {
            std::cerr << "[SUI] Built without Porcupine, wake word disabled" << std::endl;
            config.session.use_wake_word = false;
        }
#endif

        sui::InteractionStateMachine session(batcher, tts, intents, daemon,
                                             config.session, config.echo);
        sui::audio::CaptureLoop capture(audio, classifier, batcher, session.microphone(), config.capture);
        session.attachCapture(&capture);

#ifdef SUI_HAS_PORCUPINE
        if (wakeword) {
            wakeword->setCallback([&session](int) { session.trigger(); });
            capture.setMonitor([&wakeword](const sui::audio::AudioFrame& frame) {
                wakeword->processFloat(frame.samples.data(), frame.samples.size());
            });
        }
#endif

#ifdef SUI_HAS_AEC3
        std::unique_ptr<sui::audio::AudioPipeline> aec;
        if (config.use_aec) {
            aec = std::make_unique<sui::audio::AudioPipeline>(config.audio.sample_rate);
            if (aec->isInitialized()) {
                tts.setRenderSink([&aec](const float* samples, size_t count) {
                    aec->feedRenderAudio(samples, count);
                });
                capture.setFilter([&aec](std::vector<float>& samples) {
                    aec->processCapture(samples);
                });
                std::cout << "[SUI] AEC3 echo cancellation enabled" << std::endl;
            } else {
                aec.reset();
            }
        }
#endif

        sui::StateMachineCallbacks callbacks;
        callbacks.onPartialTranscript = [](const std::string& text) {
            std::cout << "[SUI] ... " << text << std::endl;
        };
        callbacks.onError = [](const std::string& message) {
            std::cerr << "[SUI] Error: " << message << std::endl;
        };
        session.setCallbacks(std::move(callbacks));

        if (!audio.start()) {
            std::cerr << "[SUI] Audio start failed: " << audio.lastError() << std::endl;
            return 1;
        }
        if (!session.start()) {
            audio.stop();
            return 1;
        }

        // Triggered mode: Enter activates listening
        std::thread input_thread;
        if (!config.session.auto_listen && !config.session.use_wake_word) {
            std::cout << "[SUI] Press Enter to talk" << std::endl;
            input_thread = std::thread([&session]() {
                std::string line;
                while (std::getline(std::cin, line) && g_running) {
                    session.trigger();
                }
                g_input_done = true;
            });
        }

        while (g_running && !session.isTerminated()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        g_running = false;
        std::cout << "\n[SUI] Shutting down..." << std::endl;
        tts.stop();
        session.stop();
        audio.stop();

        const auto stats = session.stats();
        std::cout << "[SUI] " << stats.transcriptions_received << " transcriptions, "
                  << stats.commands_processed << " commands, "
                  << stats.echoes_suppressed << " echoes suppressed" << std::endl;

        if (input_thread.joinable()) {
            if (g_input_done) {
                input_thread.join();
            } else {
                // Blocked in getline until stdin closes
                input_thread.detach();
            }
        }
    } catch (const sui::ConfigError& e) {
        std::cerr << "[SUI] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[SUI] Goodbye!" << std::endl;
    return 0;
}
