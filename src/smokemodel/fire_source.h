//
// fire_source.h - Point emitter whose intensity grows with simulated time
//

#ifndef SMOKEFLOW_FIRE_SOURCE_H
#define SMOKEFLOW_FIRE_SOURCE_H

#include <algorithm>
#include <cmath>
#include "model_parameters.h"

class FireSource {

public:
    explicit FireSource(const SmokeModelParameters& parameters);

    void Grow(int speed_multiplier);
    void SetPosition(double x) { x_ = x; }
    void Reset();

    [[nodiscard]] double GetPosition() const { return x_; }
    // Raw intensity, grows without limit while the simulation runs
    [[nodiscard]] double GetIntensity() const { return intensity_; }
    // Intensity as seen by flame rendering
    [[nodiscard]] double GetEffectiveIntensity() const;
    // Intensity as seen by the particle spawn rate
    [[nodiscard]] double GetSpawnIntensity() const;
    [[nodiscard]] int GetFlameCount() const;

private:
    const SmokeModelParameters& parameters_;
    double x_ = 0.0;
    double intensity_;
};


#endif //SMOKEFLOW_FIRE_SOURCE_H
