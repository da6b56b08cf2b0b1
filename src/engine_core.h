//
// engine_core.h - Window, ImGui context and main loop around a model
//

#ifndef SMOKEFLOW_ENGINE_CORE_H
#define SMOKEFLOW_ENGINE_CORE_H

#include <cstdlib>
#include <iostream>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_sdlrenderer2.h"
#include <cstdio>
#include <memory>
#include <SDL.h>
#include "model_interface.h"
#include "smokemodel/smokemodel.h"
#include "utils.h"

#if !SDL_VERSION_ATLEAST(2,0,18)
#error This backend requires SDL 2.0.18+ because of SDL_RenderGeometry() function
#endif

class EngineCore {

public:
    EngineCore()= default;
    ~EngineCore();

    bool Init(int mode, const std::string& config_path, const HeadlessScenario& scenario = {});
    void Clean();

    void Update();
    void Render();
    void HandleEvents();

    [[nodiscard]] inline bool IsRunning() const { return is_running_; }

private:

    bool is_running_{};

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_WindowFlags window_flags_{};

    ImGuiIO* io_ = nullptr;
    bool imgui_backends_ready_ = false;

    // Model
    std::shared_ptr<IModel> model_ = nullptr;

    // Simulation State
    bool render_simulation_ = true;

    // For Init of the Window
    int width_ = 1280;
    int height_ = 720;

    // GUI Stuff
    bool SDLInit();
    bool ImGuiInit();

    // Flags
    Mode mode_ = Mode::GUI;
};


#endif //SMOKEFLOW_ENGINE_CORE_H
