//
// smokemodel_camera.h - Fits the simulation surface into the window
//

#ifndef SMOKEFLOW_SMOKEMODEL_CAMERA_H
#define SMOKEFLOW_SMOKEMODEL_CAMERA_H

#include <utility>
#include <algorithm>
#include <cmath>

class SmokeModelCamera {
public:
    SmokeModelCamera() : zoom_(1.0), margin_(24.0) {};
    void Zoom(double factor);
    [[nodiscard]] double GetZoom() const { return zoom_; }
    void SetViewport(int screen_width, int screen_height);
    [[nodiscard]] double GetViewportWidth() const { return viewport_width_; }
    [[nodiscard]] double GetViewportHeight() const { return viewport_height_; }
    [[nodiscard]] double GetScale() const { return scale_; }
    [[nodiscard]] double GetOffsetX() const { return offset_x_; }
    [[nodiscard]] double GetOffsetY() const { return offset_y_; }
    void Update(int width, int height, double surface_width, double surface_height);

    // Length in surface units to pixels
    [[nodiscard]] int ToScreenLength(double length) const { return static_cast<int>(std::lround(length * scale_)); }
    [[nodiscard]] std::pair<double, double> ScreenToSurfacePosition(int screenX, int screenY) const;
    [[nodiscard]] std::pair<int, int> SurfaceToScreenPosition(double surfaceX, double surfaceY) const;
    [[nodiscard]] bool IsInsideSurface(int screenX, int screenY) const;
private:
    void SetScale(double surface_width, double surface_height);
    void SetOffset(double surface_width, double surface_height);

    double zoom_;
    double margin_;
    double scale_{1.0};
    double offset_x_{};
    double offset_y_{};
    double viewport_width_{};
    double viewport_height_{};
    double surface_width_{};
    double surface_height_{};

    static constexpr double kMinZoom = 0.25;
    static constexpr double kMaxZoom = 4.0;
};


#endif //SMOKEFLOW_SMOKEMODEL_CAMERA_H
