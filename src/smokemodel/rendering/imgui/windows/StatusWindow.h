//
// StatusWindow.h - Live readout of the smoke situation
//

#ifndef SMOKEFLOW_STATUSWINDOW_H
#define SMOKEFLOW_STATUSWINDOW_H

#include "IWindow.h"
#include "../UITypes.h"
#include "../components/StatusIndicator.h"
#include "smokemodel/smoke_simulation.h"
#include "smokemodel/utils.h"

namespace ui {

class StatusWindow : public IWindow {
public:
    StatusWindow() = default;

    void Render() override {
        if (!visible_ || simulation_ == nullptr) return;

        ImGui::SetNextWindowPos(ImVec2(10, 260), ImGuiCond_FirstUseEver);
        ImGui::Begin("Status", &visible_, window_flags::kPanel);

        const int depth = simulation_->GetSmokeLayerDepthCm();
        const int breathing = simulation_->GetBreathingHeightCm();
        const StatusState depth_state = StatusIndicator::GetDepthState(depth, breathing);

        StatusIndicator::DrawBadge(simulation_->IsRunning() ? "Running" : "Stopped",
                                   StatusIndicator::GetRunState(simulation_->IsRunning()));
        if (depth_state == StatusState::Error) {
            ImGui::SameLine();
            StatusIndicator::DrawBadge("DANGER: smoke below breathing height", StatusState::Error);
        } else if (depth_state == StatusState::Warning) {
            ImGui::SameLine();
            StatusIndicator::DrawBadge("Smoke close to breathing height", StatusState::Warning);
        }

        ImGui::Text("Simulated time: %s", formatTime(static_cast<int>(simulation_->GetElapsedTime())).c_str());
        ImGui::TextColored(depth_state == StatusState::Error ? colors::kDanger : colors::kSafe,
                           "Smoke layer depth: %d cm", depth);
        ImGui::Text("Breathing height: %d cm (%s)", breathing,
                    simulation_->IsCrouching() ? "crouching" : "standing");
        StatusIndicator::DrawDepthGauge(depth, breathing);
        ImGui::Text("Particles: %d", simulation_->GetParticleCount());
        ImGui::Text("Fire intensity: %.2f", simulation_->GetFire().GetIntensity());
        ImGui::Text("Layer max left / right: %.1f / %.1f",
                    simulation_->GetMaxLayerThickness(Zone::Left), simulation_->GetMaxLayerThickness(Zone::Right));

        ImGui::Separator();
        StatusIndicator::DrawWithLabel("Door", simulation_->IsDoorOpen());
        ImGui::SameLine();
        StatusIndicator::DrawWithLabel("Left vent", simulation_->IsVentOn(VentSide::Left));
        ImGui::SameLine();
        StatusIndicator::DrawWithLabel("Right vent", simulation_->IsVentOn(VentSide::Right));

        ImGui::Spacing();
        ImGui::TextColored(colors::kHint, "Dropped ticks: %ld", simulation_->GetClock().GetSkippedTicks());
        ImGui::Text("Application average %.3f ms/frame (%.1f FPS)", 1000.0f / framerate_, framerate_);

        ImGui::End();
    }

    bool IsVisible() const override { return visible_; }
    void SetVisible(bool visible) override { visible_ = visible; }
    const char* GetName() const override { return "Status"; }

    void SetSimulation(const SmokeSimulation* simulation) { simulation_ = simulation; }
    void SetFramerate(float framerate) { framerate_ = framerate; }

private:
    const SmokeSimulation* simulation_ = nullptr;
    bool visible_ = true;
    float framerate_ = 60.0f;
};

} // namespace ui

#endif // SMOKEFLOW_STATUSWINDOW_H
