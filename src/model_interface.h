//
// model_interface.h - What EngineCore needs from a model
//

#ifndef SMOKEFLOW_MODEL_INTERFACE_H
#define SMOKEFLOW_MODEL_INTERFACE_H

#include "imgui.h"
#include <SDL.h>

class IModel {
public:
    virtual ~IModel() = default;

    virtual void Update() = 0;
    virtual void Render() = 0;
    virtual bool GetEarlyClosing() = 0;
    virtual void HandleEvents(SDL_Event event, ImGuiIO* io) = 0;
    virtual void SetRenderer(SDL_Renderer* renderer) = 0;
    virtual void ImGuiRendering(bool &render_simulation, float framerate) = 0;
};



#endif //SMOKEFLOW_MODEL_INTERFACE_H
