#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>
#include <string>

namespace evhistory::sim {

// Manually driven clock; time only moves through advance() or setCurrentTime().
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point startTime =
                                std::chrono::system_clock::time_point{});
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::system_clock::time_point now() const override;
    std::string iso8601() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(std::chrono::system_clock::time_point time);

    // Advance by this step after every read; zero keeps time frozen
    void setAutoAdvance(std::chrono::milliseconds step);

private:
    mutable std::mutex mutex_;
    mutable std::chrono::system_clock::time_point simulatedTime_;
    std::chrono::milliseconds autoAdvance_{0};
};

} // namespace evhistory::sim
