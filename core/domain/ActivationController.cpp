#include "ActivationController.hpp"
#include <iostream>

namespace evhistory::domain {

ActivationController::ActivationController(bool verbose) : verbose_(verbose) {
}

void ActivationController::processEvent(ActivationEvent event) {
    std::lock_guard<std::mutex> lock(transitionMutex_);

    ActivationState newState = state_.load();

    switch (event) {
        case ActivationEvent::Enable:
        case ActivationEvent::ListenerAdded:
            newState = ActivationState::Recording;
            break;

        case ActivationEvent::Disable:
        case ActivationEvent::LastListenerRemoved:
            newState = ActivationState::Dormant;
            break;
    }

    transitionTo(newState, event);
}

void ActivationController::setActive(bool active) {
    processEvent(active ? ActivationEvent::Enable : ActivationEvent::Disable);
}

void ActivationController::transitionTo(ActivationState newState, ActivationEvent cause) {
    ActivationState oldState = state_.exchange(newState);

    if (verbose_ && oldState != newState) {
        std::cout << "[Activation] State transition: " << stateToString(oldState)
                  << " -> " << stateToString(newState)
                  << " (" << activationEventToString(cause) << ")" << std::endl;
    }
}

std::string stateToString(ActivationState state) {
    switch (state) {
        case ActivationState::Dormant: return "Dormant";
        case ActivationState::Recording: return "Recording";
        default: return "Unknown";
    }
}

std::string activationEventToString(ActivationEvent event) {
    switch (event) {
        case ActivationEvent::Enable: return "enable";
        case ActivationEvent::Disable: return "disable";
        case ActivationEvent::ListenerAdded: return "listener added";
        case ActivationEvent::LastListenerRemoved: return "last listener removed";
        default: return "unknown";
    }
}

} // namespace evhistory::domain
