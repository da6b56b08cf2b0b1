//
// ControlPanelWindow.h - Scenario controls
//
// Intensity level, start/stop, speed, reset, door, vents, crouch and the
// room size. Every change goes through UICallbacks, the window itself only
// reads the simulation.
//

#ifndef SMOKEFLOW_CONTROLPANELWINDOW_H
#define SMOKEFLOW_CONTROLPANELWINDOW_H

#include "IWindow.h"
#include "../UITypes.h"
#include "../UICallbacks.h"
#include "smokemodel/smoke_simulation.h"
#include <algorithm>
#include <string>

namespace ui {

class ControlPanelWindow : public IWindow {
public:
    explicit ControlPanelWindow(const SmokeModelParameters& parameters)
        : roomWidth_(parameters.surface_width_)
        , roomHeight_(parameters.surface_height_) {}

    void Render() override {
        if (!visible_ || simulation_ == nullptr) return;

        ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
        ImGui::Begin("Control Panel", &visible_, window_flags::kPanel);

        RenderIntensity();
        ImGui::Spacing();
        RenderLifecycleButtons();
        ImGui::Separator();
        RenderScenarioToggles();
        ImGui::Separator();
        RenderRoomSize();

        ImGui::End();
    }

    bool IsVisible() const override { return visible_; }
    void SetVisible(bool visible) override { visible_ = visible; }
    const char* GetName() const override { return "Control Panel"; }

    void SetSimulation(const SmokeSimulation* simulation) { simulation_ = simulation; }
    void SetCallbacks(const UICallbacks* callbacks) { callbacks_ = callbacks; }

private:
    void RenderIntensity() {
        static const char* levels[] = {"Low", "Medium", "High"};
        int current = simulation_->GetIntensityLevel() - 1;
        ImGui::SetNextItemWidth(160.0f);
        if (ImGui::Combo("Fire intensity", &current, levels, IM_ARRAYSIZE(levels))) {
            callbacks_->scenario.setIntensityLevel(current + 1);
        }
    }

    void RenderLifecycleButtons() {
        const bool running = simulation_->IsRunning();
        if (running) {
            ImGui::PushStyleColor(ImGuiCol_Button, colors::kButtonActive);
            ImGui::PushStyleColor(ImGuiCol_ButtonHovered, colors::kButtonActiveHovered);
            ImGui::PushStyleColor(ImGuiCol_ButtonActive, colors::kButtonActivePressed);
        }
        if (ImGui::Button(running ? "Stop" : "Start", ImVec2(70, 0))) {
            if (running) callbacks_->simulation.stop();
            else callbacks_->simulation.start();
        }
        if (running) {
            ImGui::PopStyleColor(3);
        }
        if (ImGui::IsItemHovered())
            ImGui::SetTooltip("Space: %s the simulation.", running ? "stop" : "start");
        ImGui::SameLine();

        std::string speed_label = "Speed " + std::to_string(simulation_->GetSpeedMultiplier()) + "x";
        if (ImGui::Button(speed_label.c_str(), ImVec2(80, 0))) {
            callbacks_->simulation.toggleSpeed();
        }
        if (ImGui::IsItemHovered())
            ImGui::SetTooltip("S: cycle 1x, 2x, 4x.");
        ImGui::SameLine();

        if (ImGui::Button("Reset", ImVec2(70, 0))) {
            callbacks_->simulation.reset();
        }
        if (ImGui::IsItemHovered())
            ImGui::SetTooltip("R: clear all smoke and start over.");
    }

    void RenderScenarioToggles() {
        bool door_open = simulation_->IsDoorOpen();
        if (ImGui::Checkbox("Door open (D)", &door_open)) {
            callbacks_->scenario.setDoorOpen(door_open);
        }
        bool left_vent = simulation_->IsVentOn(VentSide::Left);
        if (ImGui::Checkbox("Left vent (Q)", &left_vent)) {
            callbacks_->scenario.setVent(VentSide::Left, left_vent);
        }
        ImGui::SameLine();
        bool right_vent = simulation_->IsVentOn(VentSide::Right);
        if (ImGui::Checkbox("Right vent (E)", &right_vent)) {
            callbacks_->scenario.setVent(VentSide::Right, right_vent);
        }
        bool crouching = simulation_->IsCrouching();
        if (ImGui::Checkbox("Crouch (C)", &crouching)) {
            callbacks_->scenario.setCrouch(crouching);
        }
        ImGui::TextColored(colors::kHint, "Click inside the room to move the fire.");
    }

    void RenderRoomSize() {
        if (ImGui::TreeNode("Room size")) {
            ImGui::SetNextItemWidth(120.0f);
            ImGui::InputInt("Width", &roomWidth_, 10, 100);
            ImGui::SetNextItemWidth(120.0f);
            ImGui::InputInt("Height", &roomHeight_, 10, 100);
            const int max_extent = static_cast<int>(SmokeSimulation::kMaxSurfaceExtent);
            roomWidth_ = std::clamp(roomWidth_, 100, max_extent);
            roomHeight_ = std::clamp(roomHeight_, 200, max_extent);
            if (ImGui::Button("Apply")) {
                callbacks_->simulation.configure(roomWidth_, roomHeight_);
            }
            ImGui::TreePop();
        }
    }

    const SmokeSimulation* simulation_ = nullptr;
    const UICallbacks* callbacks_ = nullptr;
    bool visible_ = true;
    int roomWidth_;
    int roomHeight_;
};

} // namespace ui

#endif // SMOKEFLOW_CONTROLPANELWINDOW_H
