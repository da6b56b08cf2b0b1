#include "obstruction.h"

Obstruction::Obstruction(const SmokeModelParameters& parameters) : parameters_(parameters) {}

void Obstruction::Configure(double surface_width, double surface_height) {
    wall_x_ = surface_width * parameters_.wall_position_;
    door_top_ = surface_height - parameters_.floor_offset_ - parameters_.door_height_;

    // Band is the open interval (wall_x - half_width, wall_x + half_width)
    const double half_width = parameters_.diffusion_half_width_;
    first_band_column_ = static_cast<int>(std::floor(wall_x_ - half_width)) + 1;
    last_band_column_ = static_cast<int>(std::ceil(wall_x_ + half_width)) - 1;
}

bool Obstruction::IsInCollisionBand(double x) const {
    return x > wall_x_ - parameters_.collision_half_width_ && x < wall_x_ + parameters_.collision_half_width_;
}

bool Obstruction::BlocksParticle(double x, double y) const {
    if (!IsInCollisionBand(x)) {
        return false;
    }
    return IsAboveDoor(y) || !door_open_;
}

double Obstruction::ClampOutside(double x) const {
    return x < wall_x_ ? wall_x_ - parameters_.collision_clearance_ : wall_x_ + parameters_.collision_clearance_;
}

bool Obstruction::IsInDiffusionBand(int column) const {
    return column >= first_band_column_ && column <= last_band_column_;
}
