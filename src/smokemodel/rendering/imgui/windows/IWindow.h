//
// IWindow.h - Base interface for ImGui windows
//

#ifndef SMOKEFLOW_IWINDOW_H
#define SMOKEFLOW_IWINDOW_H

namespace ui {

class IWindow {
public:
    virtual ~IWindow() = default;

    // Render the window contents (called every frame)
    virtual void Render() = 0;

    virtual bool IsVisible() const = 0;
    virtual void SetVisible(bool visible) = 0;

    // Get window name/title (for debugging/logging)
    virtual const char* GetName() const = 0;
};

} // namespace ui

#endif // SMOKEFLOW_IWINDOW_H
