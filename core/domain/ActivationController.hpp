#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace evhistory::domain {

enum class ActivationState {
    Dormant,
    Recording
};

enum class ActivationEvent {
    Enable,                 ///< Administrative setActive(true)
    Disable,                ///< Administrative setActive(false)
    ListenerAdded,
    LastListenerRemoved
};

// Flat on/off flag: whichever writer ran last decides, there is no forced mode.
class ActivationController {
public:
    explicit ActivationController(bool verbose = false);

    void processEvent(ActivationEvent event);

    void setActive(bool active);
    bool isActive() const { return state_.load() == ActivationState::Recording; }
    ActivationState getCurrentState() const { return state_.load(); }

private:
    void transitionTo(ActivationState newState, ActivationEvent cause);

    std::atomic<ActivationState> state_{ActivationState::Dormant};
    std::mutex transitionMutex_;
    bool verbose_;
};

std::string stateToString(ActivationState state);
std::string activationEventToString(ActivationEvent event);

} // namespace evhistory::domain
