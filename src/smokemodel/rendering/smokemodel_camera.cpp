#include "smokemodel_camera.h"

void SmokeModelCamera::Zoom(double factor) {
    if (factor <= 0.0) {
        return;
    }
    zoom_ = std::clamp(zoom_ * factor, kMinZoom, kMaxZoom);
}

std::pair<double, double> SmokeModelCamera::ScreenToSurfacePosition(int screenX, int screenY) const {
    double surfaceX = (screenX - offset_x_) / scale_;
    double surfaceY = (screenY - offset_y_) / scale_;

    return std::make_pair(surfaceX, surfaceY);
}

std::pair<int, int> SmokeModelCamera::SurfaceToScreenPosition(double surfaceX, double surfaceY) const {
    int screenX = static_cast<int>(std::lround(surfaceX * scale_ + offset_x_));
    int screenY = static_cast<int>(std::lround(surfaceY * scale_ + offset_y_));

    return std::make_pair(screenX, screenY);
}

bool SmokeModelCamera::IsInsideSurface(int screenX, int screenY) const {
    auto [x, y] = ScreenToSurfacePosition(screenX, screenY);
    return x >= 0.0 && x <= surface_width_ && y >= 0.0 && y <= surface_height_;
}

void SmokeModelCamera::Update(int width, int height, double surface_width, double surface_height) {
    SetViewport(width, height);
    SetScale(surface_width, surface_height);
    SetOffset(surface_width, surface_height);
}

void SmokeModelCamera::SetScale(double surface_width, double surface_height) {
    surface_width_ = surface_width;
    surface_height_ = surface_height;
    if (surface_width <= 0.0 || surface_height <= 0.0) {
        scale_ = 1.0;
        return;
    }
    double available_width = std::max(GetViewportWidth() - 2 * margin_, 1.0);
    double available_height = std::max(GetViewportHeight() - 2 * margin_, 1.0);
    double scale = std::min(available_width / surface_width, available_height / surface_height) * zoom_;
    scale_ = scale <= 0.05 ? 0.05 : scale;
}

void SmokeModelCamera::SetOffset(double surface_width, double surface_height) {
    offset_x_ = (GetViewportWidth() - surface_width * scale_) / 2;
    offset_y_ = (GetViewportHeight() - surface_height * scale_) / 2;
}

void SmokeModelCamera::SetViewport(int screen_width, int screen_height) {
    viewport_width_ = screen_width;
    viewport_height_ = screen_height;
}
