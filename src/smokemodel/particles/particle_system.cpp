#include "particle_system.h"

#include <algorithm>

ParticleSystem::ParticleSystem(SmokeModelParameters& parameters) : parameters_(parameters) {}

int ParticleSystem::GetBatchSize(int intensity_level, double fire_intensity, int speed_multiplier) const {
    double spawn_intensity = std::min(fire_intensity, parameters_.GetFireSpawnIntensityCap());
    return static_cast<int>(std::floor(parameters_.spawn_factor_ * intensity_level * spawn_intensity * speed_multiplier));
}

void ParticleSystem::Spawn(int intensity_level, double fire_intensity, double origin_x, double surface_height,
                           int speed_multiplier) {
    int batch = GetBatchSize(intensity_level, fire_intensity, speed_multiplier);
    if (batch <= 0) {
        return;
    }

    std::uniform_real_distribution<> dist_unit(0.0, 1.0);
    particles_.reserve(particles_.size() + batch);
    for (int i = 0; i < batch; ++i) {
        double x = origin_x + (dist_unit(parameters_.gen_) - 0.5) * 2 * parameters_.spawn_jitter_;
        double y = surface_height - parameters_.floor_offset_;
        double vx = (dist_unit(parameters_.gen_) - 0.5) * 2 * parameters_.initial_horizontal_speed_;
        double vy = -dist_unit(parameters_.gen_) * parameters_.rise_speed_random_
                    - intensity_level * parameters_.rise_speed_per_level_;
        double radius = parameters_.min_radius_ + dist_unit(parameters_.gen_) * parameters_.radius_range_;
        Add(SmokeParticle(x, y, vx, vy, radius, parameters_.initial_opacity_));
    }
}

void ParticleSystem::ApplyTurbulence(SmokeParticle& particle) {
    std::uniform_real_distribution<> dist_jitter(-0.5 * parameters_.turbulence_, 0.5 * parameters_.turbulence_);
    double dvx = dist_jitter(parameters_.gen_);
    double dvy = dist_jitter(parameters_.gen_);
    particle.Accelerate(dvx, dvy);
}

void ParticleSystem::ApplyWallCollision(SmokeParticle& particle, const Obstruction& obstruction, double from_x) const {
    if (obstruction.BlocksParticle(particle.GetX(), particle.GetY())) {
        particle.ReflectHorizontal(parameters_.reflection_damping_, obstruction.ClampOutside(from_x));
    }
}

void ParticleSystem::ApplyVentSuction(SmokeParticle& particle, double surface_width, const VentState& vents) const {
    const double x = particle.GetX();
    const double y = particle.GetY();
    const double gain = parameters_.vent_suction_gain_;
    const double pull_y = (parameters_.vent_suction_target_y_ - y) * gain;

    if (vents.right && x > surface_width - parameters_.vent_particle_range_) {
        particle.Accelerate((surface_width - x) * gain, pull_y);
        particle.Fade(parameters_.vent_particle_fade_);
    }
    if (vents.left && x < parameters_.vent_particle_range_) {
        particle.Accelerate((0.0 - x) * gain, pull_y);
        particle.Fade(parameters_.vent_particle_fade_);
    }
}

void ParticleSystem::Advance(double surface_width, const Obstruction& obstruction, const VentState& vents,
                             int speed_multiplier, SmokeLayer& layer) {
    survivors_.clear();
    survivors_.reserve(particles_.size());

    for (auto& particle : particles_) {
        ApplyTurbulence(particle);
        ApplyWallCollision(particle, obstruction, particle.GetX());
        ApplyVentSuction(particle, surface_width, vents);

        double from_x = particle.GetX();
        particle.Integrate(speed_multiplier);
        // A step must not end inside a blocking part of the wall either
        ApplyWallCollision(particle, obstruction, from_x);

        if (particle.GetY() < parameters_.ceiling_band_) {
            layer.DepositAt(static_cast<int>(std::floor(particle.GetX())), parameters_.deposit_amount_);
            deposit_count_++;
            continue;
        }

        particle.Fade(parameters_.fade_rate_ * speed_multiplier);
        if (particle.GetY() < 0.0 || !particle.IsVisible() || particle.GetX() < 0.0 || particle.GetX() > surface_width) {
            continue;
        }
        survivors_.push_back(particle);
    }
    particles_.swap(survivors_);
}
