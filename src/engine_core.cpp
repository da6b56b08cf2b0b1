#include "engine_core.h"

bool EngineCore::Init(int mode, const std::string& config_path, const HeadlessScenario& scenario){
    mode_ = static_cast<Mode>(mode);
    switch (mode_) {
        case Mode::GUI:
            std::cout << "[Engine] Mode: GUI" << std::endl;
            break;
        case Mode::NoGUI:
            std::cout << "[Engine] Mode: NoGUI" << std::endl;
            break;
        default:
            std::cerr << "[Engine] Invalid mode: " << mode_ << std::endl;
            return false;
    }

    bool init = true;
    if (mode_ == Mode::GUI) {
        init = this->SDLInit() && this->ImGuiInit();
        if (!init) {
            return is_running_ = false;
        }
        model_ = SmokeModel::Create(mode_, config_path, scenario);
        model_->SetRenderer(renderer_);
    } else {
        std::cout << "[Engine] Loading SmokeModel without GUI" << std::endl;
        model_ = SmokeModel::Create(mode_, config_path, scenario);
        std::cout << "[Engine] SmokeModel loaded" << std::endl;
    }
    return is_running_ = init;
}

EngineCore::~EngineCore() = default;

void EngineCore::Clean() {
    model_.reset();
    // Cleanup GUI stuff
    if (mode_ == Mode::GUI) {
        if (imgui_backends_ready_) {
            ImGui_ImplSDLRenderer2_Shutdown();
            ImGui_ImplSDL2_Shutdown();
        }
        if (io_ != nullptr) {
            ImGui::DestroyContext();
        }
        if (renderer_ != nullptr) {
            SDL_DestroyRenderer(renderer_);
        }
        if (window_ != nullptr) {
            SDL_DestroyWindow(window_);
        }
        SDL_Quit();
    }
    std::cout << "[Engine] Cleaned up successfully." << std::endl;
}

void EngineCore::Update() {
    if (model_ == nullptr) {
        return;
    }
    model_->Update();
    if (mode_ == Mode::NoGUI) {
        is_running_ = model_->GetEarlyClosing();
    }
}

void EngineCore::Render() {
    if (mode_ == Mode::GUI) {
        // Start the Dear ImGui frame
        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        if(model_ != nullptr) {
            model_->ImGuiRendering(render_simulation_, io_->Framerate);
        }

        // Rendering
        ImGui::Render();
        SDL_RenderSetScale(renderer_, io_->DisplayFramebufferScale.x, io_->DisplayFramebufferScale.y);
        if (model_ != nullptr && render_simulation_) {
            model_->Render();
        }
        else {
            SDL_Color color = {41, 49, 51, 255};
            SDL_SetRenderDrawColor(renderer_, color.r, color.g, color.b, color.a);
            SDL_RenderClear(renderer_);
        }
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData());
        SDL_RenderPresent(renderer_);
    }
}

void EngineCore::HandleEvents() {
    // ImGui sees every event first, the model skips what ImGui wants to capture
    if (mode_ == Mode::GUI) {
        SDL_Event event;
        while (SDL_PollEvent(&event))
        {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (model_ != nullptr) {
                model_->HandleEvents(event, io_);
            }
            if (event.type == SDL_QUIT) {
                is_running_ = false;
            }
            if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE && event.window.windowID == SDL_GetWindowID(window_)) {
                is_running_ = false;
            }
        }
    }
}

bool EngineCore::SDLInit() {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
    {
        SDL_Log("Failed to initialize SDL: %s\n", SDL_GetError());
        return false;
    }

    // From 2.0.18: Enable native IME.
#ifdef SDL_HINT_IME_SHOW_UI
    SDL_SetHint(SDL_HINT_IME_SHOW_UI, "1");
#endif

    window_flags_ = (SDL_WindowFlags)(SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    window_ = SDL_CreateWindow("SmokeFlow", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, width_, height_, window_flags_);
    if (window_ == nullptr)
    {
        SDL_Log("Error creating SDL_Window: %s\n", SDL_GetError());
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (renderer_ == nullptr)
    {
        SDL_Log("Error creating SDL_Renderer: %s\n", SDL_GetError());
        return false;
    }

    SDL_GetRendererOutputSize(renderer_, &width_, &height_);
    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    return true;
}

bool EngineCore::ImGuiInit() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    io_ = &ImGui::GetIO();
    io_->ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;     // Enable Keyboard Controls

    ImGui::StyleColorsDark();
    ImGuiStyle& style = ImGui::GetStyle();
    style.FrameBorderSize = 1.0f;
    style.FrameRounding = 6.0f;
    style.WindowRounding = 4.0f;

    // Setup Platform/Renderer backends
    if (!ImGui_ImplSDL2_InitForSDLRenderer(window_, renderer_)){
        SDL_Log("Error initializing ImGui_ImplSDL2_InitForSDLRenderer: %s\n", SDL_GetError());
        return false;
    }
    if (!ImGui_ImplSDLRenderer2_Init(renderer_)){
        SDL_Log("Error initializing ImGui_ImplSDLRenderer2_Init: %s\n", SDL_GetError());
        ImGui_ImplSDL2_Shutdown();
        return false;
    }
    imgui_backends_ready_ = true;
    return true;
}
