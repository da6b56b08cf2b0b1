#include "simulation_clock.h"

SimulationClock::SimulationClock(int tick_period_ms) : tick_period_ms_(tick_period_ms) {}

void SimulationClock::Start() {
    if (!running_) {
        scheduled_ = false;
    }
    running_ = true;
}

void SimulationClock::Reset() {
    running_ = false;
    elapsed_ = 0;
    speed_multiplier_ = 1;
    scheduled_ = false;
    next_due_ms_ = 0;
    skipped_ticks_ = 0;
}

void SimulationClock::SetSpeedMultiplier(int speed_multiplier) {
    switch (speed_multiplier) {
        case 1:
        case 2:
        case 4:
            speed_multiplier_ = speed_multiplier;
            break;
        default:
            speed_multiplier_ = 1;
    }
}

void SimulationClock::ToggleSpeedMultiplier() {
    SetSpeedMultiplier(speed_multiplier_ == 4 ? 1 : speed_multiplier_ * 2);
}

bool SimulationClock::ConsumeDueTick(uint64_t now_ms) {
    if (!running_) {
        return false;
    }
    const auto period = static_cast<uint64_t>(tick_period_ms_);
    if (!scheduled_) {
        // First tick is due one period after the clock was started
        next_due_ms_ = now_ms + period;
        scheduled_ = true;
        return false;
    }
    if (now_ms < next_due_ms_) {
        return false;
    }
    uint64_t missed = (now_ms - next_due_ms_) / period;
    skipped_ticks_ += static_cast<long>(missed);
    next_due_ms_ += (missed + 1) * period;
    return true;
}
