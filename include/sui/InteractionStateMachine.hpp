/**
 * InteractionStateMachine.hpp - Voice session controller
 *
 * Idle -> Listening -> Processing -> IntentValidation -> AwaitResponse -> Idle
 *
 * Consumes transcription events from the SpeechBatcher, owns the
 * microphone gate and the echo suppressor, and sequences intent
 * extraction, confirmation and command dispatch. Global voice commands
 * (stop, cancel, pause, resume, restart) are honoured in every state.
 */

#pragma once

#include "sui/audio/MicrophoneGate.hpp"
#include "sui/core/Time.hpp"
#include "sui/nlu/Intent.hpp"
#include "sui/session/EchoSuppressor.hpp"
#include "sui/session/GlobalCommands.hpp"
#include "sui/session/SessionStats.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sui {

namespace audio { class CaptureLoop; }
namespace speech { class SpeechBatcher; }
namespace tts { class Synthesizer; }
namespace daemon { class CommandExecutor; struct CommandResult; }

enum class InteractionState {
    Idle,
    Listening,
    Processing,
    IntentValidation,
    AwaitResponse
};

const char* toString(InteractionState state);

struct SessionConfig {
    int tick_interval_ms = 50;
    bool auto_listen = true;              // continuous mode, no trigger needed
    bool use_wake_word = false;           // Idle keeps the gate in Monitoring
    double max_listening_duration = 30.0; // seconds
    double high_confidence_threshold = 0.85;
    double confirmation_timeout = 10.0;   // seconds without a yes/no
    double recognition_timeout = 15.0;    // wait for a forced finalization
    int shutdown_timeout_ms = 3000;
    std::string greeting = "Interface vocale prête. Vous pouvez commencer à parler.";
    session::CommandPolicy commands;
    bool verbose = false;
};

struct StateMachineCallbacks {
    std::function<void(InteractionState)> onStateChange;
    std::function<void(const std::string&)> onPartialTranscript;
    std::function<void(const std::string&)> onUserUtterance;
    std::function<void(const std::string&)> onAssistantSpeech;
    std::function<void(const nlu::Intent&)> onIntent;
    std::function<void(const std::string&)> onError;
};

class InteractionStateMachine {
public:
    /**
     * @throws ConfigError if a configuration is invalid
     */
    InteractionStateMachine(speech::SpeechBatcher& batcher,
                            tts::Synthesizer& synthesizer,
                            nlu::IntentExtractor& intents,
                            daemon::CommandExecutor& executor,
                            const SessionConfig& config = SessionConfig{},
                            const session::EchoConfig& echo = session::EchoConfig{},
                            NowFunction now = NowFunction{});
    ~InteractionStateMachine();

    InteractionStateMachine(const InteractionStateMachine&) = delete;
    InteractionStateMachine& operator=(const InteractionStateMachine&) = delete;

    /**
     * Capture loop started and stopped with the session. Optional.
     */
    void attachCapture(audio::CaptureLoop* capture);

    /**
     * Start batcher, capture and the session thread.
     */
    bool start();

    /**
     * Stop capture, then the batcher, then the session thread. Idempotent;
     * the session ends terminated.
     */
    void stop();

    /**
     * Blocking session loop: greeting, then tick() every tick_interval_ms.
     */
    void run();

    /**
     * One loop iteration. Never blocks on the event channel.
     */
    void tick();

    /**
     * Manual activation from Idle.
     */
    void trigger();

    /**
     * Speak with the microphone suspended and remember the text for echo checks.
     * While the session thread runs, a call from another thread is queued
     * and spoken on its next tick.
     */
    void say(const std::string& text);

    InteractionState state() const;
    bool isRunning() const;
    bool isTerminated() const;
    bool isPaused() const;

    std::optional<nlu::Intent> currentIntent() const;
    session::SessionStats stats() const;

    const audio::MicrophoneGate& microphone() const;

    /**
     * Must be called before start() or run(); ignored while running.
     */
    void setCallbacks(StateMachineCallbacks callbacks);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sui
