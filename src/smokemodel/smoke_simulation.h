//
// smoke_simulation.h - Owner of the complete smoke model state
//
// Sequences one tick: clock -> fire growth -> spawn -> particle advance ->
// layer step. Rendering and UI only read through the const accessors, input
// setters are plain writes picked up by the next tick.
//

#ifndef SMOKEFLOW_SMOKE_SIMULATION_H
#define SMOKEFLOW_SMOKE_SIMULATION_H

#include <cstdint>
#include <iostream>
#include <vector>
#include "model_parameters.h"
#include "fire_source.h"
#include "obstruction.h"
#include "simulation_clock.h"
#include "smoke_layer.h"
#include "particles/particle_system.h"
#include "utils.h"

class SmokeSimulation {

public:
    // Largest accepted surface width or height, in surface units
    static constexpr double kMaxSurfaceExtent = 8192.0;

    SmokeSimulation();
    explicit SmokeSimulation(SmokeModelParameters parameters);

    // Components keep references into this object
    SmokeSimulation(const SmokeSimulation&) = delete;
    SmokeSimulation& operator=(const SmokeSimulation&) = delete;

    void Configure(double surface_width, double surface_height);
    // Runs one tick if the simulation is running, returns whether it did
    bool Tick();
    // Runs Tick() if the fixed period has passed at now_ms
    bool Update(uint64_t now_ms);

    // Inputs
    void SetFireOrigin(double x) { fire_.SetPosition(x); }
    void SetIntensityLevel(int level);
    void SetDoorOpen(bool open);
    void SetVent(VentSide side, bool on);
    void SetSpeedMultiplier(int speed_multiplier) { clock_.SetSpeedMultiplier(speed_multiplier); }
    void ToggleSpeedMultiplier() { clock_.ToggleSpeedMultiplier(); }
    void SetCrouch(bool crouching) { crouching_ = crouching; }

    // Lifecycle
    void Start();
    void Stop();
    void Reset();

    // State
    [[nodiscard]] long GetElapsedTime() const { return clock_.GetElapsed(); }
    [[nodiscard]] bool IsRunning() const { return clock_.IsRunning(); }
    [[nodiscard]] int GetSpeedMultiplier() const { return clock_.GetSpeedMultiplier(); }
    [[nodiscard]] int GetIntensityLevel() const { return intensity_level_; }
    [[nodiscard]] bool IsDoorOpen() const { return obstruction_.IsDoorOpen(); }
    [[nodiscard]] bool IsVentOn(VentSide side) const { return vents_.IsOn(side); }
    [[nodiscard]] bool IsCrouching() const { return crouching_; }
    [[nodiscard]] double GetSurfaceWidth() const { return surface_width_; }
    [[nodiscard]] double GetSurfaceHeight() const { return surface_height_; }

    // Components
    [[nodiscard]] const FireSource& GetFire() const { return fire_; }
    [[nodiscard]] const Obstruction& GetObstruction() const { return obstruction_; }
    [[nodiscard]] const SmokeLayer& GetLayer() const { return layer_; }
    [[nodiscard]] const ParticleSystem& GetParticleSystem() const { return particles_; }
    [[nodiscard]] const SimulationClock& GetClock() const { return clock_; }
    [[nodiscard]] const SmokeModelParameters& GetParameters() const { return parameters_; }
    SmokeModelParameters& GetParameters() { return parameters_; }

    // Snapshots
    [[nodiscard]] std::vector<SmokeParticle> GetParticleSnapshot() const { return particles_.GetParticles(); }
    [[nodiscard]] std::vector<double> GetFieldSnapshot() const { return layer_.GetSamples(); }
    [[nodiscard]] int GetParticleCount() const { return particles_.GetCount(); }

    // Readout
    [[nodiscard]] double GetMaxLayerThickness() const { return layer_.GetMax(); }
    [[nodiscard]] double GetMaxLayerThickness(Zone zone) const { return layer_.GetMaxInZone(zone); }
    [[nodiscard]] int GetSmokeLayerDepthCm() const;
    [[nodiscard]] int GetBreathingHeightCm() const;
    [[nodiscard]] bool IsBreathingZoneCompromised() const { return GetSmokeLayerDepthCm() > GetBreathingHeightCm(); }
    [[nodiscard]] Zone GetFireZone() const { return obstruction_.GetZone(fire_.GetPosition()); }
    [[nodiscard]] double GetWallX() const { return obstruction_.GetWallX(); }
    [[nodiscard]] double GetDoorTop() const { return obstruction_.GetDoorTop(); }

private:
    // Must stay the first member, every component below references it
    SmokeModelParameters parameters_;
    SimulationClock clock_;
    Obstruction obstruction_;
    FireSource fire_;
    SmokeLayer layer_;
    ParticleSystem particles_;
    VentState vents_;

    int intensity_level_ = 1;
    bool crouching_ = false;
    double surface_width_ = 0.0;
    double surface_height_ = 0.0;
};


#endif //SMOKEFLOW_SMOKE_SIMULATION_H
