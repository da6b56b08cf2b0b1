#include "fire_source.h"

FireSource::FireSource(const SmokeModelParameters& parameters)
    : parameters_(parameters), intensity_(parameters.GetFireInitialIntensity()) {}

void FireSource::Grow(int speed_multiplier) {
    intensity_ += parameters_.GetFireGrowthRate() * speed_multiplier;
}

void FireSource::Reset() {
    intensity_ = parameters_.GetFireInitialIntensity();
}

double FireSource::GetEffectiveIntensity() const {
    return std::min(intensity_, parameters_.GetFireMaxEffectiveIntensity());
}

double FireSource::GetSpawnIntensity() const {
    return std::min(intensity_, parameters_.GetFireSpawnIntensityCap());
}

int FireSource::GetFlameCount() const {
    return static_cast<int>(std::floor(parameters_.fire_flames_per_intensity_ * GetEffectiveIntensity()));
}
