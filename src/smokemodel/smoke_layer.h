//
// smoke_layer.h - Ceiling smoke thickness field
//
// One sample per horizontal surface unit. Expired particles deposit into it,
// every tick it drifts, diffuses horizontally (blocked by the wall while the
// door is closed), drains near active vents and thins out. Samples never go
// below zero.
//

#ifndef SMOKEFLOW_SMOKE_LAYER_H
#define SMOKEFLOW_SMOKE_LAYER_H

#include <vector>
#include "model_parameters.h"
#include "obstruction.h"
#include "utils.h"

class SmokeLayer {

public:
    SmokeLayer(const SmokeModelParameters& parameters, const Obstruction& obstruction);

    // Length becomes ceil(surface_width), all samples start at zero
    void Resize(double surface_width);
    void Clear();

    void DepositAt(int column, double amount);
    void Step(bool door_open, const VentState& vents, double simulated_time, int speed_multiplier);

    [[nodiscard]] int GetLength() const { return static_cast<int>(layer_.size()); }
    [[nodiscard]] bool IsEmpty() const { return layer_.empty(); }
    [[nodiscard]] const std::vector<double>& GetSamples() const { return layer_; }
    [[nodiscard]] double GetSample(int column) const { return layer_[column]; }
    [[nodiscard]] double GetMax() const { return MaxOfRange(layer_, 0, GetLength()); }
    [[nodiscard]] double GetTotalMass() const { return SumOfRange(layer_, 0, GetLength()); }
    [[nodiscard]] double GetMaxInZone(Zone zone) const;
    [[nodiscard]] double GetMassInZone(Zone zone) const;
    // Mass of the columns an active vent on this side would drain
    [[nodiscard]] double GetMassInVentBand(VentSide side) const;
    [[nodiscard]] double GetEffectiveDiffusionRate(int speed_multiplier) const;

private:
    [[nodiscard]] double Diffusion(int x, bool door_open, double rate) const;
    [[nodiscard]] bool IsInVentBand(int x, VentSide side) const;

    const SmokeModelParameters& parameters_;
    const Obstruction& obstruction_;
    std::vector<double> layer_;
    // Frozen copy of the previous field, reused across steps
    std::vector<double> snapshot_;
    bool clamp_reported_ = false;
};


#endif //SMOKEFLOW_SMOKE_LAYER_H
