//
// simulation_clock.h - Simulated time, run state and tick scheduling
//
// The wall clock period of a tick is fixed. The speed multiplier scales the
// per tick physics and the elapsed time increment, never the tick rate.
//

#ifndef SMOKEFLOW_SIMULATION_CLOCK_H
#define SMOKEFLOW_SIMULATION_CLOCK_H

#include <cstdint>

class SimulationClock {

public:
    explicit SimulationClock(int tick_period_ms);

    void Start();
    void Stop() { running_ = false; }
    void Reset();
    // Adds the speed multiplier to the elapsed time
    void Advance() { elapsed_ += speed_multiplier_; }

    // Accepts 1, 2 or 4, anything else selects 1
    void SetSpeedMultiplier(int speed_multiplier);
    // 1 -> 2 -> 4 -> 1
    void ToggleSpeedMultiplier();

    // True if a tick is due at now_ms. Missed periods are dropped, so at most
    // one tick is reported per call and ticks never pile up.
    bool ConsumeDueTick(uint64_t now_ms);

    [[nodiscard]] bool IsRunning() const { return running_; }
    [[nodiscard]] long GetElapsed() const { return elapsed_; }
    [[nodiscard]] int GetSpeedMultiplier() const { return speed_multiplier_; }
    [[nodiscard]] int GetTickPeriodMs() const { return tick_period_ms_; }
    [[nodiscard]] long GetSkippedTicks() const { return skipped_ticks_; }

private:
    int tick_period_ms_;
    bool running_ = false;
    long elapsed_ = 0;
    int speed_multiplier_ = 1;

    bool scheduled_ = false;
    uint64_t next_due_ms_ = 0;
    long skipped_ticks_ = 0;
};


#endif //SMOKEFLOW_SIMULATION_CLOCK_H
