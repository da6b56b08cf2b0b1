//
// particle_system.h - Owner of the live smoke particles
//

#ifndef SMOKEFLOW_PARTICLE_SYSTEM_H
#define SMOKEFLOW_PARTICLE_SYSTEM_H

#include <cmath>
#include <random>
#include <vector>
#include "smoke_particle.h"
#include "smokemodel/model_parameters.h"
#include "smokemodel/obstruction.h"
#include "smokemodel/smoke_layer.h"
#include "smokemodel/utils.h"

class ParticleSystem {

public:
    explicit ParticleSystem(SmokeModelParameters& parameters);

    // Number of particles Spawn() creates for these inputs
    [[nodiscard]] int GetBatchSize(int intensity_level, double fire_intensity, int speed_multiplier) const;
    void Add(const SmokeParticle& particle) { particles_.push_back(particle); }
    void Spawn(int intensity_level, double fire_intensity, double origin_x, double surface_height, int speed_multiplier);
    // Moves every particle one tick. Particles reaching the ceiling band are
    // deposited into the layer, faded or escaped particles are dropped.
    void Advance(double surface_width, const Obstruction& obstruction, const VentState& vents,
                 int speed_multiplier, SmokeLayer& layer);
    void Clear() { particles_.clear(); deposit_count_ = 0; }

    [[nodiscard]] const std::vector<SmokeParticle>& GetParticles() const { return particles_; }
    [[nodiscard]] int GetCount() const { return static_cast<int>(particles_.size()); }
    // Number of particles converted into layer deposits since the last Clear()
    [[nodiscard]] long GetDepositCount() const { return deposit_count_; }

private:
    void ApplyTurbulence(SmokeParticle& particle);
    void ApplyWallCollision(SmokeParticle& particle, const Obstruction& obstruction, double from_x) const;
    void ApplyVentSuction(SmokeParticle& particle, double surface_width, const VentState& vents) const;

    SmokeModelParameters& parameters_;
    std::vector<SmokeParticle> particles_;
    std::vector<SmokeParticle> survivors_;
    long deposit_count_ = 0;
};


#endif //SMOKEFLOW_PARTICLE_SYSTEM_H
