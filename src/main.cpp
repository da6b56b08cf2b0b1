// SmokeFlow: interactive smoke spread simulation.
//
// GUI mode opens an SDL2 window with Dear ImGui controls. --nogui runs a
// scripted scenario without a window and prints a summary.

#include "engine_core.h"
#include "project_paths.h"

#include <stdexcept>
#include <string>

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config PATH        YAML configuration (default: config_path in project_paths.json)\n"
              << "  --nogui              run headless\n"
              << "  --ticks N            headless: number of ticks (default 200)\n"
              << "  --level L            headless: fire intensity level 1..3\n"
              << "  --speed S            headless: speed multiplier 1, 2 or 4\n"
              << "  --fire-x X           headless: fire position in surface units\n"
              << "  --door-open-at T     headless: open the door at tick T\n"
              << "  --left-vent          headless: left vent on\n"
              << "  --right-vent         headless: right vent on\n"
              << "  --crouch             headless: occupant crouches\n"
              << "  --report-every N     headless: progress line every N ticks, 0 disables\n"
              << "  --seed N             random seed, -1 seeds from the device\n"
              << "  --help               show this message" << std::endl;
}

std::string NextValue(int& i, int argc, char** argv) {
    if (i + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

}

int main(int argc, char** argv)
{
    Mode mode = Mode::GUI;
    std::string config_path;
    HeadlessScenario scenario;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                PrintUsage(argv[0]);
                return 0;
            } else if (arg == "--nogui") {
                mode = Mode::NoGUI;
            } else if (arg == "--config") {
                config_path = NextValue(i, argc, argv);
            } else if (arg == "--ticks") {
                scenario.ticks = std::stoi(NextValue(i, argc, argv));
            } else if (arg == "--level") {
                scenario.intensity_level = std::stoi(NextValue(i, argc, argv));
            } else if (arg == "--speed") {
                scenario.speed_multiplier = std::stoi(NextValue(i, argc, argv));
            } else if (arg == "--fire-x") {
                scenario.fire_x = std::stod(NextValue(i, argc, argv));
            } else if (arg == "--door-open-at") {
                scenario.door_open_at = std::stoi(NextValue(i, argc, argv));
            } else if (arg == "--left-vent") {
                scenario.left_vent = true;
            } else if (arg == "--right-vent") {
                scenario.right_vent = true;
            } else if (arg == "--crouch") {
                scenario.crouch = true;
            } else if (arg == "--report-every") {
                scenario.report_every = std::stoi(NextValue(i, argc, argv));
            } else if (arg == "--seed") {
                scenario.seed = std::stoi(NextValue(i, argc, argv));
            } else {
                throw std::invalid_argument("Unknown option " + arg);
            }
        }
        if (scenario.ticks <= 0) {
            throw std::invalid_argument("--ticks must be positive");
        }
        if (config_path.empty()) {
            config_path = get_project_path("config_path", {".yaml", ".yml"}).string();
        }

        auto engine = std::make_unique<EngineCore>();
        if (!engine->Init(static_cast<int>(mode), config_path, scenario)) {
            std::cerr << "[Engine] ERROR: Initialisation failed." << std::endl;
            engine->Clean();
            return 1;
        }

        while(engine->IsRunning()) {
            engine->HandleEvents();
            engine->Update();
            engine->Render();
        }

        engine->Clean();
        engine.reset();
    } catch (const YAML::Exception& e) {
        std::cerr << "[Config] ERROR: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Engine] ERROR: " << e.what() << std::endl;
        PrintUsage(argv[0]);
        return 1;
    }
    return 0;
}
