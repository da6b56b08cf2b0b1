//
// UICallbacks.h - Grouped callback function types for ImGui UI
//

#ifndef SMOKEFLOW_UICALLBACKS_H
#define SMOKEFLOW_UICALLBACKS_H

#include <functional>
#include "smokemodel/utils.h"

namespace ui {

// Lifecycle of the simulation
struct SimulationCallbacks {
    std::function<void()> start;
    std::function<void()> stop;
    std::function<void()> reset;
    std::function<void()> toggleSpeed;
    std::function<void(double, double)> configure;
};

// Scenario inputs
struct ScenarioCallbacks {
    std::function<void(int)> setIntensityLevel;
    std::function<void(bool)> setDoorOpen;
    std::function<void(VentSide, bool)> setVent;
    std::function<void(bool)> setCrouch;
};

struct UICallbacks {
    SimulationCallbacks simulation;
    ScenarioCallbacks scenario;

    bool IsValid() const {
        return simulation.start && simulation.stop && simulation.reset &&
               simulation.toggleSpeed && simulation.configure &&
               scenario.setIntensityLevel && scenario.setDoorOpen &&
               scenario.setVent && scenario.setCrouch;
    }
};

} // namespace ui

#endif // SMOKEFLOW_UICALLBACKS_H
