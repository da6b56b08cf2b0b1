//
// LogWindow.h - Event log of the session
//

#ifndef SMOKEFLOW_LOGWINDOW_H
#define SMOKEFLOW_LOGWINDOW_H

#include "IWindow.h"
#include "../components/LogConsoleWidget.h"

namespace ui {

class LogWindow : public IWindow {
public:
    void Render() override {
        if (!visible_) return;

        ImGui::SetNextWindowSize(ImVec2(420, 260), ImGuiCond_FirstUseEver);
        ImGui::Begin("Event Log", &visible_);
        console_.Draw("##event_log");
        ImGui::End();
    }

    bool IsVisible() const override { return visible_; }
    void SetVisible(bool visible) override { visible_ = visible; }
    const char* GetName() const override { return "Event Log"; }

    LogConsoleWidget& GetConsole() { return console_; }

private:
    LogConsoleWidget console_;
    bool visible_ = true;
};

} // namespace ui

#endif // SMOKEFLOW_LOGWINDOW_H
