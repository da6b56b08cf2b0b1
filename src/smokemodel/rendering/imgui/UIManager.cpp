//
// UIManager.cpp - Central UI orchestrator implementation
//

#include "UIManager.h"
#include <iostream>
#include <utility>

namespace ui {

UIManager::UIManager(const SmokeModelParameters& parameters)
    : controlPanel_(std::make_unique<ControlPanelWindow>(parameters))
    , status_(std::make_unique<StatusWindow>())
    , log_(std::make_unique<LogWindow>()) {}

bool UIManager::Init(UICallbacks callbacks) {
    if (!callbacks.IsValid()) {
        std::cerr << "[UI] ERROR: Incomplete UI callbacks, control panel disabled." << std::endl;
        controlPanel_->SetVisible(false);
        return false;
    }
    callbacks_ = std::move(callbacks);
    controlPanel_->SetCallbacks(&callbacks_);
    return true;
}

void UIManager::Render(const SmokeSimulation& simulation, bool& renderSimulation, float framerate) {
    RenderMenuBar(renderSimulation);

    if (showDemoWindow_) {
        ImGui::ShowDemoWindow(&showDemoWindow_);
    }

    controlPanel_->SetSimulation(&simulation);
    controlPanel_->Render();

    status_->SetSimulation(&simulation);
    status_->SetFramerate(framerate);
    status_->Render();

    log_->Render();
}

void UIManager::RenderMenuBar(bool& renderSimulation) {
    if (ImGui::BeginMainMenuBar()) {
        if (ImGui::BeginMenu("View")) {
            bool controls = controlPanel_->IsVisible();
            if (ImGui::MenuItem("Control Panel", nullptr, &controls))
                controlPanel_->SetVisible(controls);
            bool status = status_->IsVisible();
            if (ImGui::MenuItem("Status", nullptr, &status))
                status_->SetVisible(status);
            bool log = log_->IsVisible();
            if (ImGui::MenuItem("Event Log", nullptr, &log))
                log_->SetVisible(log);
            ImGui::Separator();
            ImGui::MenuItem("Render Simulation", nullptr, &renderSimulation);
            ImGui::MenuItem("ImGui Demo", nullptr, &showDemoWindow_);
            ImGui::EndMenu();
        }
        ImGui::EndMainMenuBar();
    }
}

void UIManager::Log(const std::string& message) {
    log_->GetConsole().AddLine(message);
}

} // namespace ui
