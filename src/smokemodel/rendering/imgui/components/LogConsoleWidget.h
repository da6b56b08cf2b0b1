//
// LogConsoleWidget.h - Event log viewer component for ImGui
//
// Scrolling list of timestamped event lines with a text filter,
// auto-scroll and color-coded levels.
//

#ifndef SMOKEFLOW_LOGCONSOLEWIDGET_H
#define SMOKEFLOW_LOGCONSOLEWIDGET_H

#include "imgui.h"
#include "../UITypes.h"
#include <deque>
#include <string>
#include <utility>

namespace ui {

class LogConsoleWidget {
public:
    void Clear() {
        lines_.clear();
    }

    // Add a line with automatic color detection based on content
    void AddLine(const std::string& line) {
        AddLine(line, ColorFromLogLine(line));
    }

    void AddLine(const std::string& line, ImU32 color) {
        lines_.emplace_back(line, color);
        while (static_cast<int>(lines_.size()) > maxLines_) {
            lines_.pop_front();
        }
        if (autoScroll_)
            scrollToBottom_ = true;
    }

    void Draw(const char* id, float rows = 12.0f) {
        filter_.Draw("Filter", ImGui::GetFontSize() * 12.0f);
        ImGui::SameLine();
        ImGui::Checkbox("Auto Scroll", &autoScroll_);
        ImGui::SameLine();
        if (ImGui::SmallButton("Clear")) {
            Clear();
        }

        ImGui::BeginChild(id,
                          ImVec2(0, ImGui::GetTextLineHeightWithSpacing() * rows),
                          true,
                          ImGuiWindowFlags_HorizontalScrollbar);

        if (lines_.empty()) {
            ImGui::TextDisabled("[No events yet]");
        }
        for (const auto& [text, color] : lines_) {
            if (filter_.IsActive() && !filter_.PassFilter(text.c_str())) {
                continue;
            }
            RenderLogLine(text, color);
        }

        if (autoScroll_ && scrollToBottom_)
            ImGui::SetScrollHereY(1.0f);
        scrollToBottom_ = false;

        ImGui::EndChild();
    }

private:
    static void RenderLogLine(const std::string& text, ImU32 color) {
        // Background highlight for errors/warnings
        if (color == colors::kLogError || color == colors::kLogWarning) {
            ImVec2 pos = ImGui::GetCursorScreenPos();
            ImVec2 size = ImVec2(ImGui::GetContentRegionAvail().x, ImGui::GetTextLineHeightWithSpacing());
            ImU32 bgColor = (color == colors::kLogError) ?
                IM_COL32(255, 80, 80, 30) : IM_COL32(255, 180, 0, 25);
            ImGui::GetWindowDrawList()->AddRectFilled(pos, ImVec2(pos.x + size.x, pos.y + size.y), bgColor);
        }
        ImGui::PushStyleColor(ImGuiCol_Text, color);
        ImGui::TextUnformatted(text.c_str());
        ImGui::PopStyleColor();
    }

    std::deque<std::pair<std::string, ImU32>> lines_;
    ImGuiTextFilter filter_;
    bool autoScroll_ = true;
    bool scrollToBottom_ = false;
    int maxLines_ = 2000;
};

} // namespace ui

#endif // SMOKEFLOW_LOGCONSOLEWIDGET_H
