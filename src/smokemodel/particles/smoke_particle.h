//
// smoke_particle.h - A single buoyant smoke puff
//

#ifndef SMOKEFLOW_SMOKE_PARTICLE_H
#define SMOKEFLOW_SMOKE_PARTICLE_H

class SmokeParticle {

public:
    SmokeParticle(double x, double y, double vx, double vy, double radius, double opacity);

    void Accelerate(double dvx, double dvy);
    // Reverse and damp the horizontal velocity, then place the particle at x
    void ReflectHorizontal(double damping, double x);
    void Integrate(double speed_multiplier);
    void Fade(double amount) { opacity_ -= amount; }

    void GetPosition(double& x1, double& x2) const { x1 = X_[0]; x2 = X_[1]; }
    void GetVelocity(double& u1, double& u2) const { u1 = U_[0]; u2 = U_[1]; }
    [[nodiscard]] double GetX() const { return X_[0]; }
    [[nodiscard]] double GetY() const { return X_[1]; }
    [[nodiscard]] double GetRadius() const { return radius_; }
    [[nodiscard]] double GetOpacity() const { return opacity_; }
    [[nodiscard]] bool IsVisible() const { return opacity_ > 0.0; }

private:
    double X_[2]{};      // Position
    double U_[2]{};      // Velocity
    double radius_{};
    double opacity_{};
};


#endif //SMOKEFLOW_SMOKE_PARTICLE_H
