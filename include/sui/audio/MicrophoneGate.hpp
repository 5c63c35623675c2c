/**
 * MicrophoneGate.hpp - Microphone activation flag
 *
 * Written only by the interaction state machine, read once per frame by the
 * capture loop.
 */

#pragma once

#include "sui/core/Time.hpp"

#include <atomic>

namespace sui::audio {

enum class MicState {
    Inactive,              // frames are drained
    Monitoring,            // frames go to the wake-word detector only
    Active,                // frames are classified and batched
    SuspendedForPlayback   // assistant is speaking
};

const char* toString(MicState state);

class MicrophoneGate {
public:
    MicState state() const { return state_.load(std::memory_order_acquire); }
    void set(MicState state) { state_.store(state, std::memory_order_release); }
    MicState exchange(MicState state) { return state_.exchange(state, std::memory_order_acq_rel); }
    bool isActive() const { return state() == MicState::Active; }

    /**
     * Raise the capture energy gate until the given time (post-speech echo window).
     */
    void setEchoGuardUntil(TimePoint until) {
        echoGuardUntil_.store(until.time_since_epoch().count(), std::memory_order_release);
    }

    bool inEchoGuard(TimePoint now) const {
        return now.time_since_epoch().count() <= echoGuardUntil_.load(std::memory_order_acquire);
    }

private:
    std::atomic<MicState> state_{MicState::Inactive};
    std::atomic<Clock::rep> echoGuardUntil_{Clock::duration::min().count()};
};

} // namespace sui::audio
