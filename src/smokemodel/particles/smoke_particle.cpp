#include "smoke_particle.h"

SmokeParticle::SmokeParticle(double x, double y, double vx, double vy, double radius, double opacity)
    : radius_(radius), opacity_(opacity) {
    X_[0] = x;
    X_[1] = y;
    U_[0] = vx;
    U_[1] = vy;
}

void SmokeParticle::Accelerate(double dvx, double dvy) {
    U_[0] += dvx;
    U_[1] += dvy;
}

void SmokeParticle::ReflectHorizontal(double damping, double x) {
    U_[0] *= -damping;
    X_[0] = x;
}

void SmokeParticle::Integrate(double speed_multiplier) {
    for (int i = 0; i < 2; ++i) {
        X_[i] += U_[i] * speed_multiplier;
    }
}
