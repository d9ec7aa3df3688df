#include "SimulatedClock.hpp"

namespace evhistory::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point startTime)
    : simulatedTime_(startTime) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = simulatedTime_;
    simulatedTime_ += autoAdvance_;
    return current;
}

std::string SimulatedClock::iso8601() const {
    return formatIso8601(now());
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
}

void SimulatedClock::setCurrentTime(std::chrono::system_clock::time_point time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
}

void SimulatedClock::setAutoAdvance(std::chrono::milliseconds step) {
    std::lock_guard<std::mutex> lock(mutex_);
    autoAdvance_ = step;
}

} // namespace evhistory::sim
