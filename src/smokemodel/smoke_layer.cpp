#include "smoke_layer.h"

#include <algorithm>
#include <cmath>
#include <iostream>

SmokeLayer::SmokeLayer(const SmokeModelParameters& parameters, const Obstruction& obstruction)
    : parameters_(parameters), obstruction_(obstruction) {}

void SmokeLayer::Resize(double surface_width) {
    auto length = static_cast<size_t>(std::ceil(std::max(surface_width, 0.0)));
    layer_.assign(length, 0.0);
    snapshot_.assign(length, 0.0);
}

void SmokeLayer::Clear() {
    std::fill(layer_.begin(), layer_.end(), 0.0);
    std::fill(snapshot_.begin(), snapshot_.end(), 0.0);
}

void SmokeLayer::DepositAt(int column, double amount) {
    if (column < 0 || column >= GetLength()) {
        return;
    }
    layer_[column] += amount;
}

double SmokeLayer::GetEffectiveDiffusionRate(int speed_multiplier) const {
    double rate = parameters_.GetDiffusionRate(speed_multiplier);
    if (parameters_.HasDiffusionLimit()) {
        rate = std::min(rate, parameters_.diffusion_stability_limit_);
    }
    return rate;
}

bool SmokeLayer::IsInVentBand(int x, VentSide side) const {
    if (side == VentSide::Left) {
        return x < parameters_.vent_layer_range_;
    }
    return x > GetLength() - parameters_.vent_layer_range_;
}

double SmokeLayer::Diffusion(int x, bool door_open, double rate) const {
    const auto& L = snapshot_;
    if (door_open || !obstruction_.IsInDiffusionBand(x)) {
        if (!door_open && x == obstruction_.GetLeftBoundaryColumn()) {
            return (L[x - 1] - L[x]) * rate;
        }
        if (!door_open && x == obstruction_.GetRightBoundaryColumn()) {
            return (L[x + 1] - L[x]) * rate;
        }
        return (L[x - 1] + L[x + 1] - 2 * L[x]) * rate;
    }
    // Inside the wall with the door closed
    return 0.0;
}

void SmokeLayer::Step(bool door_open, const VentState& vents, double simulated_time, int speed_multiplier) {
    if (layer_.empty()) {
        return;
    }
    snapshot_ = layer_;

    const double rate = GetEffectiveDiffusionRate(speed_multiplier);
    if (!clamp_reported_ && rate < parameters_.GetDiffusionRate(speed_multiplier)) {
        std::cout << "[SmokeModel] WARNING: diffusion rate " << parameters_.GetDiffusionRate(speed_multiplier)
                  << " clamped to " << rate << " for stability." << std::endl;
        clamp_reported_ = true;
    }
    const double drain = parameters_.vent_layer_drain_ * speed_multiplier;
    const double decay = parameters_.decay_rate_ * speed_multiplier;
    const int length = GetLength();

#pragma omp parallel for
    for (int x = 0; x < length; ++x) {
        double value = snapshot_[x];

        // Ambient air movement
        value += std::sin(simulated_time * parameters_.drift_time_frequency_ + x * parameters_.drift_space_frequency_)
                 * parameters_.drift_amplitude_;

        if (x > 0 && x < length - 1) {
            value += Diffusion(x, door_open, rate);
        }

        if (vents.left && IsInVentBand(x, VentSide::Left)) {
            value -= drain;
        }
        if (vents.right && IsInVentBand(x, VentSide::Right)) {
            value -= drain;
        }

        value -= decay;
        layer_[x] = std::max(value, 0.0);
    }
}

double SmokeLayer::GetMaxInZone(Zone zone) const {
    if (zone == Zone::Left) {
        return MaxOfRange(layer_, 0, obstruction_.GetFirstBandColumn());
    }
    return MaxOfRange(layer_, obstruction_.GetLastBandColumn() + 1, GetLength());
}

double SmokeLayer::GetMassInZone(Zone zone) const {
    if (zone == Zone::Left) {
        return SumOfRange(layer_, 0, obstruction_.GetFirstBandColumn());
    }
    return SumOfRange(layer_, obstruction_.GetLastBandColumn() + 1, GetLength());
}

double SmokeLayer::GetMassInVentBand(VentSide side) const {
    auto range = static_cast<int>(std::ceil(parameters_.vent_layer_range_));
    if (side == VentSide::Left) {
        return SumOfRange(layer_, 0, range);
    }
    // Right band is x > length - range
    int begin = static_cast<int>(std::floor(GetLength() - parameters_.vent_layer_range_)) + 1;
    return SumOfRange(layer_, begin, GetLength());
}
