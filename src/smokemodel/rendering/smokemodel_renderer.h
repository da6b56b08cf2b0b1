//
// smokemodel_renderer.h - SDL2 drawing of the room and the smoke state
//
// Read only consumer of SmokeSimulation. Everything is drawn in surface
// coordinates and mapped to the window by SmokeModelCamera.
//

#ifndef SMOKEFLOW_SMOKEMODEL_RENDERER_H
#define SMOKEFLOW_SMOKEMODEL_RENDERER_H

#include <SDL.h>
#include <memory>
#include <random>
#include <utility>
#include "smokemodel_camera.h"
#include "smokemodel/model_parameters.h"
#include "smokemodel/smoke_simulation.h"

class SmokeModelRenderer {
public:
    SmokeModelRenderer(SDL_Renderer* renderer, const SmokeModelParameters& parameters);

    static std::shared_ptr<SmokeModelRenderer> Create(SDL_Renderer* renderer, const SmokeModelParameters& parameters) {
        return std::make_shared<SmokeModelRenderer>(renderer, parameters);
    }

    void Render(const SmokeSimulation& simulation);
    void SetScreenResolution();
    void ResizeEvent() { SetScreenResolution(); }
    SDL_Renderer* GetRenderer() { return renderer_; }

    // Converter Functions
    [[nodiscard]] std::pair<double, double> ScreenToSurfacePosition(int x, int y) const;
    [[nodiscard]] bool IsInsideSurface(int x, int y) const { return camera_.IsInsideSurface(x, y); }

    // Camera functions
    void ApplyZoom(double z) { camera_.Zoom(z); }

private:
    void DrawRoom(double width, double height);
    void DrawStairs(double width, double height);
    void DrawSmokeLayer(const SmokeSimulation& simulation);
    void DrawParticles(const SmokeSimulation& simulation);
    void DrawFire(const SmokeSimulation& simulation);
    void DrawWallAndDoor(const SmokeSimulation& simulation);
    void DrawVents(const SmokeSimulation& simulation);
    void DrawEscapeLine(const SmokeSimulation& simulation);
    void DrawOccupant(const SmokeSimulation& simulation);
    void DrawDangerOverlay(double width, double height);

    void DrawCircle(int x, int y, int radius, SDL_Color color);
    void FillSurfaceRect(double x, double y, double w, double h, SDL_Color color);
    void DrawSurfaceRect(double x, double y, double w, double h, SDL_Color color);
    void DrawSurfaceLine(double x1, double y1, double x2, double y2, SDL_Color color);

    const SmokeModelParameters& parameters_;
    SmokeModelCamera camera_;
    SDL_Renderer* renderer_;
    int width_{};
    int height_{};

    // Flame flicker only, never touches the simulation random source
    std::mt19937 flicker_gen_{std::random_device{}()};

    static constexpr double kStairWidth = 80.0;
    static constexpr double kVentRadius = 15.0;
    static constexpr double kVentInset = 30.0;
    static constexpr double kFlameBaseWidth = 8.0;
    static constexpr double kFlameHeight = 24.0;
    static constexpr double kRippleAmplitude = 2.0;
    static constexpr double kRippleTimeFrequency = 0.2;
    static constexpr double kRippleSpaceFrequency = 0.1;
};


#endif //SMOKEFLOW_SMOKEMODEL_RENDERER_H
