#include "smoke_simulation.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

SmokeSimulation::SmokeSimulation() : SmokeSimulation(SmokeModelParameters()) {}

SmokeSimulation::SmokeSimulation(SmokeModelParameters parameters)
    : parameters_(std::move(parameters)),
      clock_(parameters_.GetTickPeriodMs()),
      obstruction_(parameters_),
      fire_(parameters_),
      layer_(parameters_, obstruction_),
      particles_(parameters_) {}

void SmokeSimulation::Configure(double surface_width, double surface_height) {
    surface_width_ = std::clamp(surface_width, 0.0, kMaxSurfaceExtent);
    surface_height_ = std::clamp(surface_height, 0.0, kMaxSurfaceExtent);
    obstruction_.Configure(surface_width_, surface_height_);
    layer_.Resize(surface_width_);
    fire_.SetPosition(surface_width_ * parameters_.fire_default_position_);
    std::cout << "[SmokeModel] Configured surface " << surface_width_ << " x " << surface_height_
              << " (" << layer_.GetLength() << " layer columns, wall at " << obstruction_.GetWallX() << ")" << std::endl;
}

bool SmokeSimulation::Tick() {
    if (!clock_.IsRunning()) {
        return false;
    }
    const int speed = clock_.GetSpeedMultiplier();

    clock_.Advance();
    fire_.Grow(speed);
    particles_.Spawn(intensity_level_, fire_.GetIntensity(), fire_.GetPosition(), surface_height_, speed);
    particles_.Advance(surface_width_, obstruction_, vents_, speed, layer_);
    layer_.Step(obstruction_.IsDoorOpen(), vents_, static_cast<double>(clock_.GetElapsed()), speed);
    return true;
}

bool SmokeSimulation::Update(uint64_t now_ms) {
    if (clock_.ConsumeDueTick(now_ms)) {
        return Tick();
    }
    return false;
}

void SmokeSimulation::SetIntensityLevel(int level) {
    intensity_level_ = std::clamp(level, 1, 3);
}

void SmokeSimulation::SetDoorOpen(bool open) {
    if (open != obstruction_.IsDoorOpen()) {
        std::cout << "[SmokeModel] Door " << (open ? "opened" : "closed") << " at t=" << clock_.GetElapsed() << std::endl;
    }
    obstruction_.SetDoorOpen(open);
}

void SmokeSimulation::SetVent(VentSide side, bool on) {
    if (on != vents_.IsOn(side)) {
        std::cout << "[SmokeModel] " << VentSideToString(side) << " vent " << (on ? "on" : "off")
                  << " at t=" << clock_.GetElapsed() << std::endl;
    }
    vents_.Set(side, on);
}

void SmokeSimulation::Start() {
    if (!clock_.IsRunning()) {
        std::cout << "[SmokeModel] Simulation started at t=" << clock_.GetElapsed() << std::endl;
    }
    clock_.Start();
}

void SmokeSimulation::Stop() {
    if (clock_.IsRunning()) {
        std::cout << "[SmokeModel] Simulation stopped at t=" << clock_.GetElapsed() << std::endl;
    }
    clock_.Stop();
}

void SmokeSimulation::Reset() {
    clock_.Reset();
    particles_.Clear();
    layer_.Clear();
    fire_.Reset();
    obstruction_.Reset();
    vents_ = VentState();
    crouching_ = false;
    std::cout << "[SmokeModel] Simulation reset" << std::endl;
}

int SmokeSimulation::GetSmokeLayerDepthCm() const {
    const double depth_cm = std::floor(parameters_.ConvertUnitsToCm(layer_.GetMax()));
    // An unclamped diffusion step can blow the layer up beyond int range
    if (!std::isfinite(depth_cm) || depth_cm >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(std::max(depth_cm, 0.0));
}

int SmokeSimulation::GetBreathingHeightCm() const {
    return crouching_ ? parameters_.crouching_height_cm_ : parameters_.standing_height_cm_;
}
