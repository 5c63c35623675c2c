/**
 * InteractionStateMachine.cpp - Voice session controller
 *
 * Listening -> Processing -> IntentValidation -> AwaitResponse, driven one
 * tick at a time from the batcher's event channel. Dispatch runs on an
 * async task so stop/cancel stay responsive while a command executes.
 */

#include "sui/InteractionStateMachine.hpp"
#include "sui/Config.hpp"
#include "sui/audio/CaptureLoop.hpp"
#include "sui/daemon/CommandExecutor.hpp"
#include "sui/session/Text.hpp"
#include "sui/speech/SpeechBatcher.hpp"
#include "sui/tts/Synthesizer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace sui {

namespace {

const char* const MSG_GOODBYE = "D'accord, j'arrête.";
const char* const MSG_COMMAND_CANCELLED = "Commande annulée.";
const char* const MSG_PAUSED = "En pause, dis 'reprends' pour continuer.";
const char* const MSG_RESUMED = "Je reprends.";
const char* const MSG_RESTART = "Redémarrage de l'interface vocale.";
const char* const MSG_NOTHING_UNDERSTOOD = "Désolé, je n'ai pas compris ce que tu as dit.";
const char* const MSG_NO_INTENT = "Désolé, je n'ai pas compris ton intention.";
const char* const MSG_REQUEST_CANCELLED = "D'accord, j'annule la demande.";
const char* const MSG_REPEAT = "Je n'ai pas bien compris, peux-tu répéter ?";
const char* const MSG_ERROR = "Désolé, une erreur s'est produite lors du traitement.";
const char* const MSG_DISPATCHING = "Je traite votre demande : ";
const char* const QUIT_SUMMARY = "arrêter l'interface vocale";

// Batches starting this long before the epoch still belong to it (frame latency)
constexpr double EPOCH_TOLERANCE = 0.1;

std::string confirmationPrompt(const std::string& summary) {
    return "Tu veux faire ceci : " + summary + ", c'est bien ça ?";
}

std::string completionMessage(const std::string& type, const std::string& message) {
    std::string prefix;
    if (type == "help") {
        prefix = "J'ai récupéré les informations d'aide. Voici ce que j'ai trouvé :";
    } else if (type == "status") {
        prefix = "J'ai vérifié le statut du système. Voici les informations :";
    } else if (type == "time") {
        prefix = "J'ai consulté l'horloge système. Il est actuellement :";
    } else if (type == "date") {
        prefix = "J'ai vérifié la date. Nous sommes le :";
    } else if (type == "version") {
        prefix = "J'ai consulté les informations de version. Voici les détails :";
    } else if (type == "capabilities") {
        prefix = "J'ai listé mes capacités. Voici ce que je peux faire :";
    } else if (type == "echo") {
        prefix = "J'ai bien reçu votre message et je le répète :";
    } else if (type == "quit") {
        prefix = "J'ai initié la procédure d'arrêt. Le système va s'arrêter maintenant.";
    } else if (type == "analyze") {
        prefix = "J'ai terminé l'analyse. Voici les résultats :";
    } else if (type == "analysis") {
        prefix = "L'analyse est terminée. Voici ce que j'ai découvert :";
    } else {
        prefix = "J'ai traité votre demande. Voici le résultat :";
    }

    const std::string body = session::trim(message);
    if (body.empty()) {
        return prefix + " La commande a été exécutée avec succès.";
    }
    return prefix + " " + body;
}

bool isStatisticsRequest(const std::string& utterance) {
    const auto words = session::wordSet(utterance);
    return words.count("statistiques") > 0 || words.count("stats") > 0 ||
           words.count("statistics") > 0;
}

const SessionConfig& checked(const SessionConfig& config) {
    requireValid(validate(config), "InteractionStateMachine");
    return config;
}

} // namespace

const char* toString(InteractionState state) {
    switch (state) {
        case InteractionState::Idle:             return "Idle";
        case InteractionState::Listening:        return "Listening";
        case InteractionState::Processing:       return "Processing";
        case InteractionState::IntentValidation: return "IntentValidation";
        case InteractionState::AwaitResponse:    return "AwaitResponse";
    }
    return "Unknown";
}

struct InteractionStateMachine::Impl {
    // Collaborators
    speech::SpeechBatcher& batcher;
    tts::Synthesizer& synthesizer;
    nlu::IntentExtractor& intents;
    daemon::CommandExecutor& executor;
    audio::CaptureLoop* capture = nullptr;

    SessionConfig config;
    NowFunction now;
    session::EchoSuppressor echo;
    session::GlobalCommandParser commands;
    audio::MicrophoneGate gate;

    // Lifecycle
    std::atomic<bool> running{false};
    std::atomic<bool> looping{false};
    std::atomic<bool> stopped{false};
    std::atomic<bool> terminated{false};
    std::atomic<bool> paused{false};
    std::atomic<bool> triggered{false};
    std::atomic<InteractionState> state{InteractionState::Idle};
    std::thread worker;

    // Loop-thread state
    InteractionState pausedFrom = InteractionState::Idle;
    TimePoint epoch{};
    TimePoint listenStarted{};
    std::optional<TimePoint> speechStarted;
    bool forcePending = false;
    TimePoint forceRequested{};
    TimePoint validationStarted{};
    std::vector<std::string> fragments;

    // Dispatch
    std::future<daemon::CommandResult> pending;
    std::string pendingType;
    std::vector<std::future<daemon::CommandResult>> abandoned;

    // Observed from other threads
    mutable std::mutex mutex;
    std::optional<nlu::Intent> currentIntent;
    session::SessionStats counters;
    StateMachineCallbacks callbacks;  // written only before start()
    std::thread::id loopThread;
    std::vector<std::string> announcements;  // say() from outside the loop thread

    Impl(speech::SpeechBatcher& b, tts::Synthesizer& s, nlu::IntentExtractor& i,
         daemon::CommandExecutor& e, const SessionConfig& c, const session::EchoConfig& ec,
         NowFunction n)
        : batcher(b)
        , synthesizer(s)
        , intents(i)
        , executor(e)
        , config(checked(c))
        , now(n ? std::move(n) : NowFunction(&Clock::now))
        , echo(ec)
        , commands(c.commands) {}

    void setState(InteractionState next) {
        InteractionState previous = state.exchange(next);
        if (previous == next) return;
        std::cout << "[StateMachine] " << toString(previous) << " -> " << toString(next) << std::endl;
        if (callbacks.onStateChange) {
            callbacks.onStateChange(next);
        }
    }

    void reportError(const std::string& message) {
        std::cerr << "[StateMachine] " << message << std::endl;
        if (callbacks.onError) {
            callbacks.onError(message);
        }
    }

    void setIntent(std::optional<nlu::Intent> intent) {
        std::lock_guard<std::mutex> lock(mutex);
        currentIntent = std::move(intent);
    }

    bool hasIntent() const {
        std::lock_guard<std::mutex> lock(mutex);
        return currentIntent.has_value();
    }

    template <typename F>
    void count(F&& update) {
        std::lock_guard<std::mutex> lock(mutex);
        update(counters);
    }

    // --- Speaking ---

    void say(const std::string& text) {
        if (text.empty()) return;

        std::cout << "[StateMachine] Assistant: " << text << std::endl;
        if (callbacks.onAssistantSpeech) {
            callbacks.onAssistantSpeech(text);
        }

        const audio::MicState previous = gate.exchange(audio::MicState::SuspendedForPlayback);
        batcher.discardActiveBatch();

        tts::SynthesisResult result;
        try {
            result = synthesizer.synthesize(text);
        } catch (const std::exception& e) {
            result.success = false;
            result.error = e.what();
        }
        if (!result.success) {
            reportError("Synthesis failed: " + result.error);
        }

        const TimePoint finished = now();
        echo.recordSpoken(text, finished);
        gate.setEchoGuardUntil(addSeconds(finished, echo.config().window));
        gate.set(previous);
        epoch = finished;
    }

    // --- Transitions ---

    void enterIdle() {
        fragments.clear();
        forcePending = false;
        speechStarted.reset();
        gate.set(config.use_wake_word ? audio::MicState::Monitoring : audio::MicState::Inactive);
        setState(InteractionState::Idle);
    }

    void startListening() {
        triggered = false;
        fragments.clear();
        forcePending = false;
        speechStarted.reset();
        epoch = now();
        listenStarted = epoch;
        gate.set(audio::MicState::Active);
        setState(InteractionState::Listening);
    }

    void terminate() {
        say(MSG_GOODBYE);
        abandonDispatch();
        setIntent(std::nullopt);
        fragments.clear();
        paused = false;
        terminated = true;
        running = false;
        gate.set(audio::MicState::Inactive);
        setState(InteractionState::Idle);
        std::cout << "[StateMachine] Session terminated" << std::endl;
    }

    void abandonDispatch() {
        if (pending.valid()) {
            abandoned.push_back(std::move(pending));
        }
        pendingType.clear();
    }

    void reapAbandoned() {
        for (auto it = abandoned.begin(); it != abandoned.end();) {
            if (it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                ++it;
                continue;
            }
            try {
                auto result = it->get();
                std::cout << "[StateMachine] Discarded result of a cancelled command ("
                          << (result.success ? "success" : "failure") << ")" << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[StateMachine] Cancelled command failed: " << e.what() << std::endl;
            }
            it = abandoned.erase(it);
        }
    }

    void drainDispatch() {
        abandonDispatch();
        const auto deadline = std::chrono::steady_clock::now()
            + std::chrono::milliseconds(config.shutdown_timeout_ms);
        for (auto& future : abandoned) {
            if (future.wait_until(deadline) != std::future_status::ready) {
                std::cerr << "[StateMachine] Command still running at shutdown" << std::endl;
            }
        }
        reapAbandoned();
    }

    // --- Events ---

    bool isStale(const speech::TranscriptionEvent& event) const {
        return addSeconds(event.batch_started_at, EPOCH_TOLERANCE) < epoch;
    }

    /**
     * Common handling of a final transcription. Returns the cleaned text,
     * or nullopt when the event was consumed (echo or global command).
     */
    std::optional<std::string> acceptFinal(const speech::TranscriptionEvent& event) {
        std::string text = session::trim(event.text);
        const size_t words = session::tokenizeWords(text).size();
        count([words](session::SessionStats& s) {
            s.transcriptions_received++;
            s.words_transcribed += words;
        });

        // Measured from when the user started speaking, not from when the
        // recognition finished
        const TimePoint heardAt = std::max(event.batch_started_at, epoch);
        if (echo.isEcho(text, heardAt)) {
            std::cout << "[StateMachine] Ignoring echo: \"" << text << "\"" << std::endl;
            count([](session::SessionStats& s) { s.echoes_suppressed++; });
            return std::nullopt;
        }

        if (handleGlobalCommand(text)) {
            return std::nullopt;
        }
        return text;
    }

    bool handleGlobalCommand(const std::string& text) {
        const auto match = commands.parse(text);
        if (!match || !match.executable) {
            return false;
        }

        std::cout << "[StateMachine] Global command: " << session::toString(match.command)
                  << " (" << session::toString(match.position) << ")" << std::endl;

        switch (match.command) {
            case session::GlobalCommand::Stop:
                terminate();
                return true;

            case session::GlobalCommand::Cancel:
                if (hasIntent() || pending.valid()) {
                    count([](session::SessionStats& s) { s.intents_cancelled++; });
                }
                abandonDispatch();
                setIntent(std::nullopt);
                paused = false;
                say(MSG_COMMAND_CANCELLED);
                enterIdle();
                return true;

            case session::GlobalCommand::Pause:
                if (!paused) {
                    pausedFrom = state.load();
                    paused = true;
                    gate.set(audio::MicState::Active);
                    say(MSG_PAUSED);
                }
                return true;

            case session::GlobalCommand::Resume:
                if (!paused) {
                    return false;
                }
                paused = false;
                say(MSG_RESUMED);
                resumeFrom(pausedFrom);
                return true;

            case session::GlobalCommand::Restart:
                abandonDispatch();
                setIntent(std::nullopt);
                paused = false;
                echo.clear();
                say(MSG_RESTART);
                enterIdle();
                return true;

            case session::GlobalCommand::None:
                break;
        }
        return false;
    }

    void resumeFrom(InteractionState previous) {
        switch (previous) {
            case InteractionState::Listening:
            case InteractionState::Processing:
                startListening();
                break;
            case InteractionState::IntentValidation:
                validationStarted = now();
                gate.set(audio::MicState::Active);
                setState(InteractionState::IntentValidation);
                break;
            case InteractionState::AwaitResponse:
                gate.set(audio::MicState::Active);
                setState(InteractionState::AwaitResponse);
                break;
            case InteractionState::Idle:
                enterIdle();
                break;
        }
    }

    // --- States ---

    void handleIdle() {
        // Only global commands are honoured before listening starts
        while (auto event = batcher.events().tryPop()) {
            if (!event->is_final || isStale(*event)) {
                if (config.verbose) {
                    std::cout << "[StateMachine] Idle, dropping \"" << event->text << "\"" << std::endl;
                }
                continue;
            }
            auto text = acceptFinal(*event);
            if (terminated || paused || state != InteractionState::Idle) {
                return;
            }
            if (text && config.verbose) {
                std::cout << "[StateMachine] Idle, ignoring \"" << *text << "\"" << std::endl;
            }
        }

        const bool manual = triggered.exchange(false);
        if (manual || (config.auto_listen && !config.use_wake_word)) {
            startListening();
        }
    }

    void handleListening() {
        while (state == InteractionState::Listening && !terminated && !paused) {
            auto event = batcher.events().tryPop();
            if (!event) break;
            if (isStale(*event)) {
                if (config.verbose) {
                    std::cout << "[StateMachine] Stale event from batch #" << event->batch_id << std::endl;
                }
                continue;
            }

            if (!event->is_final) {
                if (!speechStarted) speechStarted = now();
                if (callbacks.onPartialTranscript) {
                    callbacks.onPartialTranscript(event->text);
                }
                continue;
            }

            forcePending = false;
            auto text = acceptFinal(*event);
            if (!text) continue;

            std::cout << "[StateMachine] User: " << *text << std::endl;
            if (callbacks.onUserUtterance) {
                callbacks.onUserUtterance(*text);
            }
            fragments.push_back(*text);
            processUtterance();
            return;
        }

        if (state != InteractionState::Listening || terminated || paused) {
            return;
        }

        const TimePoint current = now();
        const bool speaking = batcher.hasActiveBatch();
        if (speaking && !speechStarted) {
            speechStarted = current;
        } else if (!speaking && !forcePending && config.auto_listen) {
            speechStarted.reset();
        }

        // Continuous mode measures from the first speech, triggered mode from activation
        std::optional<TimePoint> reference = config.auto_listen
            ? speechStarted : std::optional<TimePoint>(listenStarted);

        if (!forcePending && reference &&
            secondsBetween(*reference, current) >= config.max_listening_duration) {
            std::cout << "[StateMachine] Maximum listening duration reached" << std::endl;
            if (batcher.forceFinalize()) {
                forcePending = true;
                forceRequested = current;
            } else {
                processUtterance();
            }
            return;
        }

        if (forcePending && secondsBetween(forceRequested, current) >= config.recognition_timeout) {
            std::cerr << "[StateMachine] No transcription after forced finalization" << std::endl;
            forcePending = false;
            processUtterance();
        }
    }

    void processUtterance() {
        gate.set(audio::MicState::Inactive);
        setState(InteractionState::Processing);

        const std::string utterance = session::joinFragments(fragments);
        fragments.clear();
        forcePending = false;

        if (utterance.empty()) {
            say(MSG_NOTHING_UNDERSTOOD);
            enterIdle();
            return;
        }

        if (isStatisticsRequest(utterance)) {
            say(session::describeStats(snapshot()));
            enterIdle();
            return;
        }

        // A stop word inside a longer request is confirmed before quitting
        const auto match = commands.parse(utterance);
        if (match.command == session::GlobalCommand::Stop && !match.executable) {
            nlu::Intent quit;
            quit.raw_text = utterance;
            quit.type = "quit";
            quit.confidence = 1.0f;
            quit.human_summary = QUIT_SUMMARY;
            count([](session::SessionStats& s) { s.intents_extracted++; });
            if (callbacks.onIntent) {
                callbacks.onIntent(quit);
            }
            askConfirmation(std::move(quit));
            return;
        }

        std::optional<nlu::Intent> intent;
        try {
            intent = intents.extractIntent(utterance);
        } catch (const std::exception& e) {
            reportError(std::string("Intent extraction failed: ") + e.what());
            say(MSG_ERROR);
            enterIdle();
            return;
        }

        if (!intent) {
            say(MSG_NO_INTENT);
            enterIdle();
            return;
        }

        if (intent->raw_text.empty()) intent->raw_text = utterance;
        if (intent->human_summary.empty()) intent->human_summary = nlu::summarizeIntent(*intent);
        count([](session::SessionStats& s) { s.intents_extracted++; });

        std::cout << "[StateMachine] Intent: " << intent->type
                  << " (confidence " << intent->confidence << ")" << std::endl;
        if (callbacks.onIntent) {
            callbacks.onIntent(*intent);
        }

        if (intent->type != "quit" && intent->confidence >= config.high_confidence_threshold) {
            dispatch(std::move(*intent));
        } else {
            askConfirmation(std::move(*intent));
        }
    }

    void askConfirmation(nlu::Intent intent) {
        const std::string prompt = confirmationPrompt(intent.human_summary);
        setIntent(std::move(intent));
        say(prompt);
        validationStarted = now();
        gate.set(audio::MicState::Active);
        setState(InteractionState::IntentValidation);
    }

    void handleValidation() {
        while (state == InteractionState::IntentValidation && !terminated && !paused) {
            auto event = batcher.events().tryPop();
            if (!event) break;
            if (!event->is_final || isStale(*event)) continue;

            auto text = acceptFinal(*event);
            if (!text) continue;

            std::cout << "[StateMachine] User: " << *text << std::endl;
            if (callbacks.onUserUtterance) {
                callbacks.onUserUtterance(*text);
            }

            switch (session::GlobalCommandParser::classifyReply(*text)) {
                case session::Reply::Yes: {
                    std::optional<nlu::Intent> intent;
                    {
                        std::lock_guard<std::mutex> lock(mutex);
                        intent = currentIntent;
                    }
                    if (!intent) {
                        enterIdle();
                    } else if (intent->type == "quit") {
                        terminate();
                    } else {
                        dispatch(std::move(*intent));
                    }
                    return;
                }
                case session::Reply::No:
                    setIntent(std::nullopt);
                    count([](session::SessionStats& s) { s.intents_cancelled++; });
                    say(MSG_REQUEST_CANCELLED);
                    enterIdle();
                    return;
                case session::Reply::Unknown:
                    setIntent(std::nullopt);
                    say(MSG_REPEAT);
                    startListening();
                    return;
            }
        }

        if (state != InteractionState::IntentValidation || terminated || paused) {
            return;
        }

        if (secondsBetween(validationStarted, now()) >= config.confirmation_timeout) {
            std::cout << "[StateMachine] Confirmation timed out" << std::endl;
            setIntent(std::nullopt);
            count([](session::SessionStats& s) { s.intents_cancelled++; });
            say(MSG_REQUEST_CANCELLED);
            enterIdle();
        }
    }

    void dispatch(nlu::Intent intent) {
        setIntent(intent);
        say(MSG_DISPATCHING + intent.human_summary);

        pendingType = intent.type;
        try {
            daemon::CommandExecutor& target = executor;
            pending = std::async(std::launch::async, [&target, intent]() {
                return target.dispatch(intent);
            });
        } catch (const std::system_error& e) {
            reportError(std::string("Cannot start dispatch: ") + e.what());
            count([](session::SessionStats& s) { s.command_failures++; });
            setIntent(std::nullopt);
            say(MSG_ERROR);
            enterIdle();
            return;
        }

        // Stay open for stop / cancel while the command runs
        gate.set(audio::MicState::Active);
        setState(InteractionState::AwaitResponse);
    }

    void handleAwait() {
        while (state == InteractionState::AwaitResponse && !terminated && !paused) {
            auto event = batcher.events().tryPop();
            if (!event) break;
            if (!event->is_final || isStale(*event)) continue;

            auto text = acceptFinal(*event);
            if (text && config.verbose) {
                std::cout << "[StateMachine] Busy, ignoring \"" << *text << "\"" << std::endl;
            }
        }

        if (state != InteractionState::AwaitResponse || terminated || paused) {
            return;
        }
        if (!pending.valid()) {
            enterIdle();
            return;
        }
        if (pending.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return;
        }

        daemon::CommandResult result;
        try {
            result = pending.get();
        } catch (const std::exception& e) {
            result.success = false;
            result.message = e.what();
        }

        const std::string type = pendingType;
        pendingType.clear();
        setIntent(std::nullopt);

        if (result.success) {
            count([](session::SessionStats& s) { s.commands_processed++; });
            say(completionMessage(type, result.message));
        } else {
            count([](session::SessionStats& s) { s.command_failures++; });
            reportError("Command failed: " + result.message);
            say(MSG_ERROR);
        }
        enterIdle();
    }

    void handlePaused() {
        while (paused && !terminated) {
            auto event = batcher.events().tryPop();
            if (!event) break;
            if (!event->is_final || isStale(*event)) continue;

            auto text = acceptFinal(*event);
            if (text && config.verbose) {
                std::cout << "[StateMachine] Paused, ignoring \"" << *text << "\"" << std::endl;
            }
        }
    }

    /**
     * Queue text for the loop thread when called from another thread.
     * @return false if the caller should speak it directly
     */
    bool queueAnnouncement(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        if (loopThread == std::thread::id{} || loopThread == std::this_thread::get_id()) {
            return false;
        }
        announcements.push_back(text);
        return true;
    }

    void speakAnnouncements() {
        std::vector<std::string> queued;
        {
            std::lock_guard<std::mutex> lock(mutex);
            queued.swap(announcements);
        }
        for (const auto& text : queued) {
            say(text);
        }
    }

    void tick() {
        if (terminated) return;
        reapAbandoned();
        speakAnnouncements();

        if (paused) {
            handlePaused();
            return;
        }

        switch (state.load()) {
            case InteractionState::Idle:
                handleIdle();
                break;
            case InteractionState::Listening:
                handleListening();
                break;
            case InteractionState::Processing:
                processUtterance();
                break;
            case InteractionState::IntentValidation:
                handleValidation();
                break;
            case InteractionState::AwaitResponse:
                handleAwait();
                break;
        }
    }

    session::SessionStats snapshot() const {
        session::SessionStats result;
        {
            std::lock_guard<std::mutex> lock(mutex);
            result = counters;
        }
        const auto batcherStats = batcher.stats();
        result.segments_processed = batcherStats.segments_processed;
        result.batches_completed = batcherStats.batches_completed;
        return result;
    }

    bool startComponents() {
        if (!batcher.start()) {
            std::cerr << "[StateMachine] SpeechBatcher failed to start" << std::endl;
            return false;
        }
        if (capture && !capture->isRunning() && !capture->start()) {
            std::cerr << "[StateMachine] CaptureLoop failed to start" << std::endl;
            return false;
        }
        return true;
    }

    void loop() {
        looping = true;
        {
            std::lock_guard<std::mutex> lock(mutex);
            loopThread = std::this_thread::get_id();
        }
        std::cout << "[StateMachine] Running ("
                  << (config.use_wake_word ? "wake word" : config.auto_listen ? "continuous" : "triggered")
                  << " mode)" << std::endl;

        say(config.greeting);
        enterIdle();

        const auto interval = std::chrono::milliseconds(config.tick_interval_ms);
        while (running && !terminated) {
            tick();
            std::this_thread::sleep_for(interval);
        }

        std::lock_guard<std::mutex> lock(mutex);
        loopThread = std::thread::id{};
        if (!announcements.empty()) {
            std::cerr << "[StateMachine] Session ended, " << announcements.size()
                      << " announcements not spoken" << std::endl;
            announcements.clear();
        }
        looping = false;
    }
};

InteractionStateMachine::InteractionStateMachine(speech::SpeechBatcher& batcher,
                                                 tts::Synthesizer& synthesizer,
                                                 nlu::IntentExtractor& intents,
                                                 daemon::CommandExecutor& executor,
                                                 const SessionConfig& config,
                                                 const session::EchoConfig& echo,
                                                 NowFunction now)
    : impl_(std::make_unique<Impl>(batcher, synthesizer, intents, executor, config, echo, std::move(now))) {
}

InteractionStateMachine::~InteractionStateMachine() {
    stop();
}

void InteractionStateMachine::attachCapture(audio::CaptureLoop* capture) {
    impl_->capture = capture;
}

bool InteractionStateMachine::start() {
    if (impl_->terminated || impl_->stopped) {
        std::cerr << "[StateMachine] Session already terminated" << std::endl;
        return false;
    }
    if (impl_->running.exchange(true)) {
        return true;
    }
    if (!impl_->startComponents()) {
        impl_->running = false;
        return false;
    }

    impl_->worker = std::thread(&Impl::loop, impl_.get());
    return true;
}

void InteractionStateMachine::stop() {
    if (impl_->stopped.exchange(true)) {
        return;
    }

    impl_->running = false;
    impl_->terminated = true;
    impl_->gate.set(audio::MicState::Inactive);

    if (impl_->capture) {
        impl_->capture->stop();
    }
    impl_->batcher.stop();

    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
    if (!impl_->looping) {
        impl_->drainDispatch();
    }
    std::cout << "[StateMachine] Stopped" << std::endl;
}

void InteractionStateMachine::run() {
    if (impl_->terminated || impl_->stopped || impl_->running.exchange(true)) {
        return;
    }
    if (!impl_->startComponents()) {
        impl_->running = false;
        return;
    }
    impl_->loop();
    impl_->drainDispatch();
}

void InteractionStateMachine::tick() {
    impl_->tick();
}

void InteractionStateMachine::trigger() {
    impl_->triggered = true;
}

void InteractionStateMachine::say(const std::string& text) {
    if (impl_->queueAnnouncement(text)) {
        return;
    }
    impl_->say(text);
}

InteractionState InteractionStateMachine::state() const {
    return impl_->state.load();
}

bool InteractionStateMachine::isRunning() const {
    return impl_->running;
}

bool InteractionStateMachine::isTerminated() const {
    return impl_->terminated;
}

bool InteractionStateMachine::isPaused() const {
    return impl_->paused;
}

std::optional<nlu::Intent> InteractionStateMachine::currentIntent() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->currentIntent;
}

session::SessionStats InteractionStateMachine::stats() const {
    return impl_->snapshot();
}

const audio::MicrophoneGate& InteractionStateMachine::microphone() const {
    return impl_->gate;
}

void InteractionStateMachine::setCallbacks(StateMachineCallbacks callbacks) {
    if (impl_->running) {
        std::cerr << "[StateMachine] Callbacks must be set before start()" << std::endl;
        return;
    }
    impl_->callbacks = std::move(callbacks);
}

} // namespace sui
