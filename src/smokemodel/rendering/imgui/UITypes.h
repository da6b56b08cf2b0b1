//
// UITypes.h - Shared colors, states and window flags of the smoke UI
//

#ifndef SMOKEFLOW_UITYPES_H
#define SMOKEFLOW_UITYPES_H

#include "imgui.h"
#include <cstdint>
#include <string>

namespace ui {

enum class StatusState {
    Active,     // running, door open, vent on
    Idle,       // stopped
    Warning,    // layer approaching the breathing height
    Error,      // breathing zone compromised
    Inactive
};

namespace colors {
    // Log line colors (ImU32 format for LogConsole)
    constexpr ImU32 kLogError = IM_COL32(255, 80, 80, 255);
    constexpr ImU32 kLogWarning = IM_COL32(255, 180, 0, 255);
    constexpr ImU32 kLogInfo = IM_COL32(100, 230, 100, 255);

    // Readout colors
    constexpr ImVec4 kDanger = {1.0f, 0.314f, 0.314f, 1.0f};
    constexpr ImVec4 kSafe = {0.392f, 0.902f, 0.392f, 1.0f};

    // Button colors (active state - blue theme)
    constexpr ImVec4 kButtonActive = {0.35f, 0.6f, 0.85f, 1.0f};
    constexpr ImVec4 kButtonActiveHovered = {0.45f, 0.7f, 0.95f, 1.0f};
    constexpr ImVec4 kButtonActivePressed = {0.25f, 0.5f, 0.75f, 1.0f};

    // Tooltip hint color (grey)
    constexpr ImVec4 kHint = {0.5f, 0.5f, 0.5f, 1.0f};

    constexpr ImVec4 kStatusActive = {0.2f, 0.8f, 0.3f, 1.0f};
    constexpr ImVec4 kStatusIdle = {0.55f, 0.6f, 0.7f, 1.0f};
    constexpr ImVec4 kStatusWarning = {1.0f, 0.65f, 0.0f, 1.0f};
    constexpr ImVec4 kStatusError = {1.0f, 0.3f, 0.3f, 1.0f};
    constexpr ImVec4 kStatusInactive = {0.5f, 0.5f, 0.5f, 1.0f};

    // Smoke gauge fill
    constexpr ImVec4 kSmokeGauge = {0.45f, 0.45f, 0.5f, 1.0f};

    inline ImVec4 GetStatusColor(StatusState state) {
        switch (state) {
            case StatusState::Active: return kStatusActive;
            case StatusState::Idle: return kStatusIdle;
            case StatusState::Warning: return kStatusWarning;
            case StatusState::Error: return kStatusError;
            case StatusState::Inactive: default: return kStatusInactive;
        }
    }
}

// Helper function to get color from log line content
inline ImU32 ColorFromLogLine(const std::string& line) {
    if (line.find("ERROR") != std::string::npos) return colors::kLogError;
    if (line.find("WARNING") != std::string::npos) return colors::kLogWarning;
    return colors::kLogInfo;
}

namespace window_flags {
    constexpr ImGuiWindowFlags kPanel =
        ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoCollapse;
}

} // namespace ui

#endif // SMOKEFLOW_UITYPES_H
