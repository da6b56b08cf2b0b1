#include "smokemodel_renderer.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace {
    const SDL_Color kRoomColor{255, 255, 255, 255};
    const SDL_Color kOutlineColor{51, 65, 85, 255};
    const SDL_Color kFloorColor{203, 213, 225, 255};
    const SDL_Color kWallColor{71, 85, 105, 255};
    const SDL_Color kDoorClosedColor{146, 64, 14, 255};
    const SDL_Color kDoorOpenColor{34, 197, 94, 255};
    const SDL_Color kStairColor{226, 232, 240, 255};
    const SDL_Color kStairStepColor{148, 163, 184, 255};
    const SDL_Color kVentOffColor{148, 163, 184, 255};
    const SDL_Color kVentOnColor{59, 130, 246, 255};
    const SDL_Color kEscapeLineColor{22, 163, 74, 255};
    const SDL_Color kOccupantColor{30, 64, 175, 255};
    const SDL_Color kOccupantDangerColor{249, 115, 22, 255};
    const SDL_Color kDangerColor{220, 38, 38, 40};
}

SmokeModelRenderer::SmokeModelRenderer(SDL_Renderer* renderer, const SmokeModelParameters& parameters)
    : parameters_(parameters), camera_(SmokeModelCamera()), renderer_(renderer) {
    SetScreenResolution();
}

void SmokeModelRenderer::SetScreenResolution() {
    if (SDL_GetRendererOutputSize(renderer_, &width_, &height_) != 0) {
        SDL_Log("Unable to query renderer output size: %s", SDL_GetError());
    }
    camera_.SetViewport(width_, height_);
}

std::pair<double, double> SmokeModelRenderer::ScreenToSurfacePosition(int x, int y) const {
    return camera_.ScreenToSurfacePosition(x, y);
}

void SmokeModelRenderer::Render(const SmokeSimulation& simulation) {
    const double width = simulation.GetSurfaceWidth();
    const double height = simulation.GetSurfaceHeight();

    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    SDL_SetRenderDrawColor(renderer_,
                           parameters_.background_color_[0], parameters_.background_color_[1],
                           parameters_.background_color_[2], parameters_.background_color_[3]);
    SDL_RenderClear(renderer_);
    if (width <= 0.0 || height <= 0.0) {
        return;
    }
    camera_.Update(width_, height_, width, height);

    DrawRoom(width, height);
    DrawStairs(width, height);
    DrawWallAndDoor(simulation);
    DrawVents(simulation);
    DrawEscapeLine(simulation);
    DrawOccupant(simulation);
    if (parameters_.render_particles_) {
        DrawParticles(simulation);
    }
    DrawSmokeLayer(simulation);
    if (parameters_.render_flames_) {
        DrawFire(simulation);
    }
    if (simulation.IsBreathingZoneCompromised()) {
        DrawDangerOverlay(width, height);
    }
}

void SmokeModelRenderer::FillSurfaceRect(double x, double y, double w, double h, SDL_Color color) {
    auto [sx, sy] = camera_.SurfaceToScreenPosition(x, y);
    SDL_Rect rect{sx, sy, std::max(camera_.ToScreenLength(w), 1), std::max(camera_.ToScreenLength(h), 1)};
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderFillRect(renderer_, &rect);
}

void SmokeModelRenderer::DrawSurfaceRect(double x, double y, double w, double h, SDL_Color color) {
    auto [sx, sy] = camera_.SurfaceToScreenPosition(x, y);
    SDL_Rect rect{sx, sy, std::max(camera_.ToScreenLength(w), 1), std::max(camera_.ToScreenLength(h), 1)};
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderDrawRect(renderer_, &rect);
}

void SmokeModelRenderer::DrawSurfaceLine(double x1, double y1, double x2, double y2, SDL_Color color) {
    auto [sx1, sy1] = camera_.SurfaceToScreenPosition(x1, y1);
    auto [sx2, sy2] = camera_.SurfaceToScreenPosition(x2, y2);
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    SDL_RenderDrawLine(renderer_, sx1, sy1, sx2, sy2);
}

void SmokeModelRenderer::DrawCircle(int x, int y, int radius, SDL_Color color) {
    SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
    // One horizontal span per row
    for (int dy = -radius; dy <= radius; dy++) {
        int dx = static_cast<int>(std::sqrt(static_cast<double>(radius * radius - dy * dy)));
        SDL_RenderDrawLine(renderer_, x - dx, y + dy, x + dx, y + dy);
    }
}

void SmokeModelRenderer::DrawRoom(double width, double height) {
    FillSurfaceRect(0.0, 0.0, width, height, kRoomColor);
    const double floor_y = height - parameters_.floor_offset_;
    FillSurfaceRect(0.0, floor_y, width, parameters_.floor_offset_, kFloorColor);
    DrawSurfaceRect(0.0, 0.0, width, height, kOutlineColor);
}

void SmokeModelRenderer::DrawStairs(double width, double height) {
    const double floor_y = height - parameters_.floor_offset_;
    const double left = width - kStairWidth;
    FillSurfaceRect(left, 0.0, kStairWidth, floor_y, kStairColor);

    const int steps = 8;
    const double step_height = floor_y / steps;
    for (int i = 1; i < steps; ++i) {
        double y = floor_y - i * step_height;
        double x = left + kStairWidth * i / steps;
        DrawSurfaceLine(x, y, width, y, kStairStepColor);
    }
}

void SmokeModelRenderer::DrawWallAndDoor(const SmokeSimulation& simulation) {
    const auto& obstruction = simulation.GetObstruction();
    const double half = parameters_.wall_thickness_ / 2;
    const double wall_left = obstruction.GetWallX() - half;
    const double door_top = obstruction.GetDoorTop();

    FillSurfaceRect(wall_left, 0.0, parameters_.wall_thickness_, door_top, kWallColor);
    if (obstruction.IsDoorOpen()) {
        DrawSurfaceRect(wall_left, door_top, parameters_.wall_thickness_, parameters_.door_height_, kDoorOpenColor);
    } else {
        FillSurfaceRect(wall_left, door_top, parameters_.wall_thickness_, parameters_.door_height_, kDoorClosedColor);
    }
}

void SmokeModelRenderer::DrawVents(const SmokeSimulation& simulation) {
    const int radius = std::max(camera_.ToScreenLength(kVentRadius), 2);
    auto [lx, ly] = camera_.SurfaceToScreenPosition(kVentInset, kVentInset);
    DrawCircle(lx, ly, radius, simulation.IsVentOn(VentSide::Left) ? kVentOnColor : kVentOffColor);
    auto [rx, ry] = camera_.SurfaceToScreenPosition(simulation.GetSurfaceWidth() - kVentInset, kVentInset);
    DrawCircle(rx, ry, radius, simulation.IsVentOn(VentSide::Right) ? kVentOnColor : kVentOffColor);
}

void SmokeModelRenderer::DrawSmokeLayer(const SmokeSimulation& simulation) {
    const auto& samples = simulation.GetLayer().GetSamples();
    if (samples.empty()) {
        return;
    }
    const double t = static_cast<double>(simulation.GetElapsedTime());
    const double length = static_cast<double>(samples.size());

    auto [left, top] = camera_.SurfaceToScreenPosition(0.0, 0.0);
    auto [right, bottom] = camera_.SurfaceToScreenPosition(std::min(length, simulation.GetSurfaceWidth()), 0.0);
    for (int sx = left; sx < right; ++sx) {
        auto [x, y] = camera_.ScreenToSurfacePosition(sx, top);
        int column = std::clamp(static_cast<int>(std::floor(x)), 0, static_cast<int>(samples.size()) - 1);
        double thickness = samples[column];
        if (!std::isfinite(thickness)) {
            thickness = simulation.GetSurfaceHeight();
        }
        thickness = std::clamp(thickness, 0.0, simulation.GetSurfaceHeight());
        double depth = parameters_.ceiling_band_ + thickness;
        if (parameters_.render_ripple_) {
            depth += std::sin(t * kRippleTimeFrequency + column * kRippleSpaceFrequency) * kRippleAmplitude;
        }
        auto alpha = static_cast<Uint8>(std::min(90.0 + thickness * 2.5, 220.0));
        auto [ex, ey] = camera_.SurfaceToScreenPosition(x, std::max(depth, 0.0));
        SDL_SetRenderDrawColor(renderer_, 100, 100, 110, alpha);
        SDL_RenderDrawLine(renderer_, sx, top, sx, ey);
    }
}

void SmokeModelRenderer::DrawParticles(const SmokeSimulation& simulation) {
    for (const auto& particle : simulation.GetParticleSystem().GetParticles()) {
        double x, y;
        particle.GetPosition(x, y);
        auto [posx, posy] = camera_.SurfaceToScreenPosition(x, y);
        int radius = std::max(camera_.ToScreenLength(particle.GetRadius()), 1);
        auto alpha = static_cast<Uint8>(255.0 * std::clamp(particle.GetOpacity(), 0.0, 1.0));
        DrawCircle(posx, posy, radius, SDL_Color{120, 120, 130, alpha});
    }
}

void SmokeModelRenderer::DrawFire(const SmokeSimulation& simulation) {
    const auto& fire = simulation.GetFire();
    const int flames = fire.GetFlameCount();
    if (flames <= 0) {
        return;
    }
    const double base_y = simulation.GetSurfaceHeight() - parameters_.floor_offset_;
    const double spread = fire.GetEffectiveIntensity() * 3.0;
    std::uniform_real_distribution<> dist_unit(0.0, 1.0);

    std::vector<SDL_Vertex> vertices;
    vertices.reserve(static_cast<size_t>(flames) * 3);
    for (int i = 0; i < flames; ++i) {
        double x = fire.GetPosition() + (dist_unit(flicker_gen_) - 0.5) * 2 * spread;
        double flame_height = kFlameHeight * (0.5 + dist_unit(flicker_gen_));
        Uint8 green = static_cast<Uint8>(80 + dist_unit(flicker_gen_) * 150);
        SDL_Color color{255, green, 0, 200};

        auto [lx, ly] = camera_.SurfaceToScreenPosition(x - kFlameBaseWidth / 2, base_y);
        auto [rx, ry] = camera_.SurfaceToScreenPosition(x + kFlameBaseWidth / 2, base_y);
        auto [tx, ty] = camera_.SurfaceToScreenPosition(x, base_y - flame_height);
        vertices.push_back({SDL_FPoint{static_cast<float>(lx), static_cast<float>(ly)}, color, SDL_FPoint{0, 0}});
        vertices.push_back({SDL_FPoint{static_cast<float>(rx), static_cast<float>(ry)}, color, SDL_FPoint{0, 0}});
        vertices.push_back({SDL_FPoint{static_cast<float>(tx), static_cast<float>(ty)}, SDL_Color{255, 240, 120, 160}, SDL_FPoint{0, 0}});
    }
    if (SDL_RenderGeometry(renderer_, nullptr, vertices.data(), static_cast<int>(vertices.size()), nullptr, 0) != 0) {
        SDL_Log("Unable to draw flames: %s", SDL_GetError());
    }
}

void SmokeModelRenderer::DrawEscapeLine(const SmokeSimulation& simulation) {
    // Where the lower edge of the smoke reaches the occupant's breathing height
    const double y = parameters_.ceiling_band_ + parameters_.ConvertCmToUnits(simulation.GetBreathingHeightCm());
    const double width = simulation.GetSurfaceWidth();
    const double dash = 8.0;
    for (double x = 0.0; x < width; x += 2 * dash) {
        DrawSurfaceLine(x, y, std::min(x + dash, width), y, kEscapeLineColor);
    }
}

void SmokeModelRenderer::DrawOccupant(const SmokeSimulation& simulation) {
    const SDL_Color color = simulation.IsBreathingZoneCompromised() ? kOccupantDangerColor : kOccupantColor;
    const double wall_x = simulation.GetWallX();
    const double x = wall_x + (simulation.GetSurfaceWidth() - kStairWidth - wall_x) / 2;
    const double floor_y = simulation.GetSurfaceHeight() - parameters_.floor_offset_;
    const double body = simulation.IsCrouching() ? 30.0 : 55.0;
    const double legs = simulation.IsCrouching() ? 15.0 : 35.0;
    const double head_radius = 8.0;

    double hip_y = floor_y - legs;
    double shoulder_y = hip_y - body;
    DrawSurfaceLine(x, hip_y, x - 10, floor_y, color);
    DrawSurfaceLine(x, hip_y, x + 10, floor_y, color);
    DrawSurfaceLine(x, hip_y, x, shoulder_y, color);
    DrawSurfaceLine(x, shoulder_y + 10, x - 14, shoulder_y + 30, color);
    DrawSurfaceLine(x, shoulder_y + 10, x + 14, shoulder_y + 30, color);
    auto [hx, hy] = camera_.SurfaceToScreenPosition(x, shoulder_y - head_radius);
    DrawCircle(hx, hy, std::max(camera_.ToScreenLength(head_radius), 2), color);
}

void SmokeModelRenderer::DrawDangerOverlay(double width, double height) {
    FillSurfaceRect(0.0, 0.0, width, height, kDangerColor);
}
