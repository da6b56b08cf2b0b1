//
// obstruction.h - Interior wall with a door opening at the floor
//
// The wall spans from the ceiling to the floor at a fixed fraction of the
// surface width. The lowest door_height units are the door opening; only its
// open/closed flag changes at runtime.
//

#ifndef SMOKEFLOW_OBSTRUCTION_H
#define SMOKEFLOW_OBSTRUCTION_H

#include <cmath>
#include "model_parameters.h"
#include "utils.h"

class Obstruction {

public:
    explicit Obstruction(const SmokeModelParameters& parameters);

    void Configure(double surface_width, double surface_height);

    void SetDoorOpen(bool open) { door_open_ = open; }
    [[nodiscard]] bool IsDoorOpen() const { return door_open_; }

    [[nodiscard]] double GetWallX() const { return wall_x_; }
    // Height (y) of the top edge of the door opening
    [[nodiscard]] double GetDoorTop() const { return door_top_; }
    [[nodiscard]] Zone GetZone(double x) const { return x < wall_x_ ? Zone::Left : Zone::Right; }

    // Particle collision
    [[nodiscard]] bool IsInCollisionBand(double x) const;
    [[nodiscard]] bool IsAboveDoor(double y) const { return y < door_top_; }
    [[nodiscard]] bool BlocksParticle(double x, double y) const;
    // Position just outside the collision band on the side x approached from
    [[nodiscard]] double ClampOutside(double x) const;

    // Layer diffusion
    [[nodiscard]] bool IsInDiffusionBand(int column) const;
    [[nodiscard]] int GetFirstBandColumn() const { return first_band_column_; }
    [[nodiscard]] int GetLastBandColumn() const { return last_band_column_; }
    // Columns adjacent to the band, they exchange only outwards while the door is closed
    [[nodiscard]] int GetLeftBoundaryColumn() const { return first_band_column_ - 1; }
    [[nodiscard]] int GetRightBoundaryColumn() const { return last_band_column_ + 1; }

    void Reset() { door_open_ = false; }

private:
    const SmokeModelParameters& parameters_;
    bool door_open_ = false;
    double wall_x_ = 0.0;
    double door_top_ = 0.0;
    int first_band_column_ = 0;
    int last_band_column_ = -1;
};


#endif //SMOKEFLOW_OBSTRUCTION_H
