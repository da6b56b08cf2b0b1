#include "smokemodel.h"

#include <iomanip>
#include <sstream>
#include <utility>

SmokeModel::SmokeModel(Mode mode, const std::string& config_path, HeadlessScenario scenario)
    : mode_(mode), scenario_(std::move(scenario)) {
    wall_clock_start_ = std::chrono::steady_clock::now();
    simulation_ = std::make_unique<SmokeSimulation>(LoadParameters(config_path, scenario_));

    const auto& parameters = simulation_->GetParameters();
    simulation_->Configure(parameters.surface_width_, parameters.surface_height_);

    this->setupCallbacks();
    if (mode_ == Mode::GUI) {
        this->setupImGui();
        if (parameters.start_running_) {
            simulation_->Start();
        }
    } else {
        simulation_->SetIntensityLevel(scenario_.intensity_level);
        simulation_->SetSpeedMultiplier(scenario_.speed_multiplier);
        if (scenario_.fire_x >= 0.0) {
            simulation_->SetFireOrigin(scenario_.fire_x);
        }
        simulation_->SetVent(VentSide::Left, scenario_.left_vent);
        simulation_->SetVent(VentSide::Right, scenario_.right_vent);
        simulation_->SetCrouch(scenario_.crouch);
        simulation_->Start();
        std::cout << "[SmokeModel] Headless run: " << scenario_.ticks << " ticks, level "
                  << simulation_->GetIntensityLevel() << ", speed " << simulation_->GetSpeedMultiplier()
                  << "x, fire at " << simulation_->GetFire().GetPosition() << std::endl;
    }
    std::cout << "[SmokeModel] Created SmokeModel" << std::endl;
}

SmokeModel::~SmokeModel() {
    ui_manager_.reset();
    model_renderer_.reset();
    simulation_.reset();
    std::cout << "[SmokeModel] SmokeModel destroyed" << std::endl;
}

SmokeModelParameters SmokeModel::LoadParameters(const std::string& config_path, const HeadlessScenario& scenario) {
    SmokeModelParameters parameters;
    if (config_path.empty()) {
        std::cout << "[Config] WARNING: No config file given, using built-in defaults." << std::endl;
    } else {
        parameters.Init(config_path);
    }
    if (scenario.seed.has_value()) {
        parameters.SetSeed(*scenario.seed);
    }
    return parameters;
}

void SmokeModel::setupCallbacks() {
    callbacks_.simulation.start = [this]() {
        simulation_->Start();
        LogEvent("Simulation started");
    };
    callbacks_.simulation.stop = [this]() {
        simulation_->Stop();
        LogEvent("Simulation stopped");
    };
    callbacks_.simulation.reset = [this]() {
        simulation_->Reset();
        LogEvent("Simulation reset");
    };
    callbacks_.simulation.toggleSpeed = [this]() {
        simulation_->ToggleSpeedMultiplier();
        LogEvent("Speed " + std::to_string(simulation_->GetSpeedMultiplier()) + "x");
    };
    callbacks_.simulation.configure = [this](double width, double height) {
        simulation_->Configure(width, height);
        LogEvent("Room resized to " + std::to_string(static_cast<int>(width)) + " x " +
                 std::to_string(static_cast<int>(height)));
    };
    callbacks_.scenario.setIntensityLevel = [this](int level) {
        simulation_->SetIntensityLevel(level);
        LogEvent("Fire intensity level " + std::to_string(simulation_->GetIntensityLevel()));
    };
    callbacks_.scenario.setDoorOpen = [this](bool open) {
        simulation_->SetDoorOpen(open);
        LogEvent(open ? "Door opened" : "Door closed");
    };
    callbacks_.scenario.setVent = [this](VentSide side, bool on) {
        simulation_->SetVent(side, on);
        LogEvent(VentSideToString(side) + " vent " + (on ? "on" : "off"));
    };
    callbacks_.scenario.setCrouch = [this](bool crouching) {
        simulation_->SetCrouch(crouching);
        LogEvent(crouching ? "Occupant crouches" : "Occupant stands up");
    };
}

void SmokeModel::setupImGui() {
    ui_manager_ = std::make_unique<ui::UIManager>(simulation_->GetParameters());
    if (!ui_manager_->Init(callbacks_)) {
        std::cerr << "[SmokeModel] ERROR: UI initialisation failed." << std::endl;
    }
}

void SmokeModel::LogEvent(const std::string& message) {
    if (ui_manager_ == nullptr) {
        return;
    }
    std::ostringstream line;
    line << "[t=" << std::setw(5) << simulation_->GetElapsedTime() << "] " << message;
    if (simulation_->IsBreathingZoneCompromised()) {
        line << " (WARNING: breathing zone compromised)";
    }
    ui_manager_->Log(line.str());
}

uint64_t SmokeModel::GetWallClockMs() const {
    auto elapsed = std::chrono::steady_clock::now() - wall_clock_start_;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void SmokeModel::Update() {
    if (mode_ == Mode::GUI) {
        UpdateInteractive();
    } else {
        UpdateHeadless();
    }
}

void SmokeModel::UpdateInteractive() {
    const bool was_compromised = simulation_->IsBreathingZoneCompromised();
    if (simulation_->Update(GetWallClockMs())) {
        if (!was_compromised && simulation_->IsBreathingZoneCompromised()) {
            LogEvent("Smoke layer reached the breathing zone");
        }
    }
}

void SmokeModel::UpdateHeadless() {
    if (finished_) {
        return;
    }
    if (headless_ticks_ >= scenario_.ticks) {
        PrintHeadlessSummary();
        finished_ = true;
        return;
    }
    if (headless_ticks_ == scenario_.door_open_at) {
        simulation_->SetDoorOpen(true);
    }

    timer_.Start();
    const bool ticked = simulation_->Tick();
    timer_.Stop();
    if (!ticked) {
        std::cerr << "[SmokeModel] ERROR: Simulation is not running, stopping the headless run." << std::endl;
        finished_ = true;
        return;
    }
    timer_.AppendDuration(timer_.GetDurationInMilliseconds());
    headless_ticks_++;

    if (scenario_.report_every > 0 && headless_ticks_ % scenario_.report_every == 0) {
        PrintHeadlessProgress();
    }
}

void SmokeModel::PrintHeadlessProgress() const {
    std::cout << "[SmokeModel] tick " << std::setw(5) << headless_ticks_
              << " | t=" << simulation_->GetElapsedTime()
              << " | particles " << std::setw(5) << simulation_->GetParticleCount()
              << " | layer max L/R " << std::fixed << std::setprecision(2)
              << simulation_->GetMaxLayerThickness(Zone::Left) << " / "
              << simulation_->GetMaxLayerThickness(Zone::Right)
              << " | depth " << simulation_->GetSmokeLayerDepthCm() << " cm"
              << std::defaultfloat << std::endl;
}

void SmokeModel::PrintHeadlessSummary() const {
    const auto& layer = simulation_->GetLayer();
    std::cout << "Simulation ended." << std::endl;
    std::cout << "Simulated time: " << formatTime(static_cast<int>(simulation_->GetElapsedTime()))
              << " (" << simulation_->GetElapsedTime() << " units)" << std::endl;
    std::cout << "Particles: " << simulation_->GetParticleCount()
              << ", deposited: " << simulation_->GetParticleSystem().GetDepositCount() << std::endl;
    std::cout << "Fire intensity: " << simulation_->GetFire().GetIntensity() << std::endl;
    std::cout << "Layer max left / right: " << layer.GetMaxInZone(Zone::Left) << " / "
              << layer.GetMaxInZone(Zone::Right) << ", total mass: " << layer.GetTotalMass() << std::endl;
    std::cout << "Smoke layer depth: " << simulation_->GetSmokeLayerDepthCm() << " cm, breathing height: "
              << simulation_->GetBreathingHeightCm() << " cm"
              << (simulation_->IsBreathingZoneCompromised() ? " -> DANGER" : " -> safe") << std::endl;
    std::cout << "Tick duration(ms) over " << timer_.GetDurationCount() << " ticks, average: "
              << timer_.GetAverageDuration() << ", max: " << timer_.GetMaxDuration() << std::endl;
}

void SmokeModel::SetRenderer(SDL_Renderer* renderer) {
    model_renderer_ = SmokeModelRenderer::Create(renderer, simulation_->GetParameters());
}

void SmokeModel::Render() {
    if (model_renderer_ != nullptr) {
        model_renderer_->Render(*simulation_);
    }
}

void SmokeModel::ImGuiRendering(bool &render_simulation, float framerate) {
    if (ui_manager_ != nullptr) {
        ui_manager_->Render(*simulation_, render_simulation, framerate);
    }
}

bool SmokeModel::GetEarlyClosing() {
    return !finished_;
}

void SmokeModel::HandleEvents(SDL_Event event, ImGuiIO* io) {
    // Left click places the fire
    if (event.type == SDL_MOUSEBUTTONDOWN && model_renderer_ && !io->WantCaptureMouse &&
        event.button.button == SDL_BUTTON_LEFT) {
        int x = event.button.x;
        int y = event.button.y;
        if (model_renderer_->IsInsideSurface(x, y)) {
            auto surface_pos = model_renderer_->ScreenToSurfacePosition(x, y);
            simulation_->SetFireOrigin(surface_pos.first);
            LogEvent("Fire moved to x=" + std::to_string(static_cast<int>(surface_pos.first)));
        }
    }
    // Mouse wheel - zoom
    else if (event.type == SDL_MOUSEWHEEL && model_renderer_ && !io->WantCaptureMouse) {
        if (event.wheel.y > 0)
            model_renderer_->ApplyZoom(1.1);
        else if (event.wheel.y < 0)
            model_renderer_->ApplyZoom(0.9);
    }
    // Window resize
    else if (event.type == SDL_WINDOWEVENT && model_renderer_) {
        if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
            model_renderer_->ResizeEvent();
        }
    }
    else if (event.type == SDL_KEYDOWN && !io->WantCaptureKeyboard && event.key.repeat == 0) {
        HandleKey(event.key.keysym.sym);
    }
}

void SmokeModel::HandleKey(SDL_Keycode key) {
    switch (key) {
        case SDLK_SPACE:
            if (simulation_->IsRunning()) callbacks_.simulation.stop();
            else callbacks_.simulation.start();
            break;
        case SDLK_r:
            callbacks_.simulation.reset();
            break;
        case SDLK_s:
            callbacks_.simulation.toggleSpeed();
            break;
        case SDLK_d:
            callbacks_.scenario.setDoorOpen(!simulation_->IsDoorOpen());
            break;
        case SDLK_q:
            callbacks_.scenario.setVent(VentSide::Left, !simulation_->IsVentOn(VentSide::Left));
            break;
        case SDLK_e:
            callbacks_.scenario.setVent(VentSide::Right, !simulation_->IsVentOn(VentSide::Right));
            break;
        case SDLK_c:
            callbacks_.scenario.setCrouch(!simulation_->IsCrouching());
            break;
        case SDLK_1:
        case SDLK_2:
        case SDLK_3:
            callbacks_.scenario.setIntensityLevel(static_cast<int>(key - SDLK_0));
            break;
        default:
            break;
    }
}
