//
// UIManager.h - Central UI orchestrator
//
// Owns the ImGui windows of the smoke model and wires them to the
// callbacks provided by SmokeModel.
//

#ifndef SMOKEFLOW_UIMANAGER_H
#define SMOKEFLOW_UIMANAGER_H

#include "UITypes.h"
#include "UICallbacks.h"
#include "windows/ControlPanelWindow.h"
#include "windows/StatusWindow.h"
#include "windows/LogWindow.h"
#include "smokemodel/model_parameters.h"
#include "smokemodel/smoke_simulation.h"

#include <memory>
#include <string>

namespace ui {

class UIManager {
public:
    explicit UIManager(const SmokeModelParameters& parameters);

    // Callbacks must be complete, the windows call them without checking
    bool Init(UICallbacks callbacks);

    // Called every frame between ImGui::NewFrame() and ImGui::Render()
    void Render(const SmokeSimulation& simulation, bool& renderSimulation, float framerate);

    // Adds a line to the event log window
    void Log(const std::string& message);

private:
    void RenderMenuBar(bool& renderSimulation);

    UICallbacks callbacks_;
    bool showDemoWindow_ = false;

    std::unique_ptr<ControlPanelWindow> controlPanel_;
    std::unique_ptr<StatusWindow> status_;
    std::unique_ptr<LogWindow> log_;
};

} // namespace ui

#endif // SMOKEFLOW_UIMANAGER_H
