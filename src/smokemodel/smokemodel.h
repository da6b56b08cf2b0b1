//
// smokemodel.h - IModel implementation driving the smoke simulation
//
// GUI mode ticks the simulation on the fixed wall clock period and renders
// after every frame. NoGUI mode runs a scripted scenario back to back and
// prints a summary.
//

#ifndef SMOKEFLOW_SMOKEMODEL_H
#define SMOKEFLOW_SMOKEMODEL_H

#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include "model_interface.h"
#include "src/utils.h"
#include "model_parameters.h"
#include "smoke_simulation.h"
#include "rendering/smokemodel_renderer.h"
#include "rendering/imgui/UIManager.h"

// Inputs of a headless run
struct HeadlessScenario {
    int ticks = 200;
    int intensity_level = 1;
    int speed_multiplier = 1;
    double fire_x = -1.0;       // < 0 keeps the default fire position
    int door_open_at = -1;      // tick at which the door opens, < 0 keeps it closed
    bool left_vent = false;
    bool right_vent = false;
    bool crouch = false;
    int report_every = 50;      // progress line every n ticks, 0 disables it
    std::optional<int> seed;    // overrides settings.seed
};

class SmokeModel : public IModel {
public:
    SmokeModel(Mode mode, const std::string& config_path, HeadlessScenario scenario = {});

    static std::shared_ptr<SmokeModel> Create(Mode mode, const std::string& config_path,
                                              HeadlessScenario scenario = {}) {
        return std::make_shared<SmokeModel>(mode, config_path, std::move(scenario));
    }

    ~SmokeModel() override;

    void Update() override;
    void Render() override;
    bool GetEarlyClosing() override;
    void HandleEvents(SDL_Event event, ImGuiIO* io) override;
    void SetRenderer(SDL_Renderer* renderer) override;
    void ImGuiRendering(bool &render_simulation, float framerate) override;

    [[nodiscard]] const SmokeSimulation& GetSimulation() const { return *simulation_; }

private:
    static SmokeModelParameters LoadParameters(const std::string& config_path, const HeadlessScenario& scenario);

    void UpdateInteractive();
    void UpdateHeadless();
    void PrintHeadlessProgress() const;
    void PrintHeadlessSummary() const;

    void HandleKey(SDL_Keycode key);
    void LogEvent(const std::string& message);
    [[nodiscard]] uint64_t GetWallClockMs() const;

    void setupCallbacks();
    void setupImGui();

    std::unique_ptr<SmokeSimulation> simulation_;
    std::shared_ptr<SmokeModelRenderer> model_renderer_;
    std::unique_ptr<ui::UIManager> ui_manager_;
    // Shared by the UI windows and the keyboard shortcuts
    ui::UICallbacks callbacks_;

    // Flags
    Mode mode_;
    HeadlessScenario scenario_;
    int headless_ticks_ = 0;
    bool finished_ = false;

    //Measurement
    Timer timer_;
    std::chrono::steady_clock::time_point wall_clock_start_;
};


#endif //SMOKEFLOW_SMOKEMODEL_H
