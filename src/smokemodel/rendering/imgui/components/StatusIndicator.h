//
// StatusIndicator.h - Status dots, badges and the smoke depth gauge
//

#ifndef SMOKEFLOW_STATUSINDICATOR_H
#define SMOKEFLOW_STATUSINDICATOR_H

#include <algorithm>
#include <cstdio>
#include "imgui.h"
#include "../UITypes.h"

namespace ui {

class StatusIndicator {
public:
    // Fraction of the breathing height from which the layer counts as a warning
    static constexpr float kWarningFraction = 0.75f;

    static void DrawDot(StatusState state, float radius = 5.0f) {
        ImVec4 color = colors::GetStatusColor(state);
        ImVec2 pos = ImGui::GetCursorScreenPos();
        ImDrawList* drawList = ImGui::GetWindowDrawList();

        // Center the dot vertically with text
        float textHeight = ImGui::GetTextLineHeight();
        pos.y += textHeight * 0.5f;
        pos.x += radius;

        drawList->AddCircleFilled(pos, radius, ImGui::ColorConvertFloat4ToU32(color));
        drawList->AddCircle(pos, radius, IM_COL32(0, 0, 0, 100), 0, 1.0f);

        ImGui::Dummy(ImVec2(radius * 2.0f + 4.0f, textHeight));
    }

    static void DrawWithLabel(const char* label, bool on) {
        DrawDot(on ? StatusState::Active : StatusState::Inactive);
        ImGui::SameLine();
        ImGui::Text("%s", label);
    }

    // Pill-shaped badge with text
    static void DrawBadge(const char* text, StatusState state) {
        ImVec4 bgColor = colors::GetStatusColor(state);

        ImGui::PushStyleColor(ImGuiCol_Button, bgColor);
        ImGui::PushStyleColor(ImGuiCol_ButtonHovered, bgColor);
        ImGui::PushStyleColor(ImGuiCol_ButtonActive, bgColor);
        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4(1.0f, 1.0f, 1.0f, 1.0f));
        ImGui::PushStyleVar(ImGuiStyleVar_FrameRounding, 10.0f);
        ImGui::PushStyleVar(ImGuiStyleVar_FramePadding, ImVec2(8.0f, 2.0f));

        ImGui::SmallButton(text);

        ImGui::PopStyleVar(2);
        ImGui::PopStyleColor(4);
    }

    // Layer depth against the breathing height, filled in the depth state color
    static void DrawDepthGauge(int depth_cm, int breathing_cm, float width = 220.0f) {
        const StatusState state = GetDepthState(depth_cm, breathing_cm);
        const float fraction = breathing_cm > 0
                ? std::clamp(static_cast<float>(depth_cm) / static_cast<float>(breathing_cm), 0.0f, 1.0f)
                : 1.0f;

        char overlay[48];
        std::snprintf(overlay, sizeof(overlay), "%d / %d cm", depth_cm, breathing_cm);
        ImGui::PushStyleColor(ImGuiCol_PlotHistogram,
                              state == StatusState::Active ? colors::kSmokeGauge : colors::GetStatusColor(state));
        ImGui::ProgressBar(fraction, ImVec2(width, 0.0f), overlay);
        ImGui::PopStyleColor();
    }

    static StatusState GetRunState(bool running) {
        return running ? StatusState::Active : StatusState::Idle;
    }

    static StatusState GetDepthState(int depth_cm, int breathing_cm) {
        if (depth_cm > breathing_cm) return StatusState::Error;
        if (static_cast<float>(depth_cm) >= kWarningFraction * static_cast<float>(breathing_cm)) return StatusState::Warning;
        return StatusState::Active;
    }
};

} // namespace ui

#endif // SMOKEFLOW_STATUSINDICATOR_H
