//
// model_parameters.h - Tunable constants of the smoke model
//
// Every constant carries its reference value as default, so a default
// constructed object is a complete configuration. Init() overrides the
// values from a YAML file.
//

#ifndef SMOKEFLOW_MODEL_PARAMETERS_H
#define SMOKEFLOW_MODEL_PARAMETERS_H

#include <array>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

class SmokeModelParameters {

public:
    SmokeModelParameters() = default;

    void Init(const std::string& yaml_path) {
        YAML::Node config = YAML::LoadFile(yaml_path);
        Init(config);
        std::cout << "[Config] Imported all Config Parameters from " << yaml_path << std::endl;
    }

    void Init(const YAML::Node& config) {
        // Settings
        auto settings = config["settings"];
        seed_ = settings["seed"].as<int>();
        start_running_ = settings["start_running"].as<bool>();

        auto simulation = config["simulation"];
        // Timing
        tick_period_ms_ = simulation["time"]["tick_period_ms"].as<int>();

        // Fire
        auto fire = simulation["fire"];
        fire_initial_intensity_ = fire["initial_intensity"].as<double>();
        fire_growth_rate_ = fire["growth_rate"].as<double>();
        fire_max_effective_intensity_ = fire["max_effective_intensity"].as<double>();
        fire_spawn_intensity_cap_ = fire["spawn_intensity_cap"].as<double>();
        fire_flames_per_intensity_ = fire["flames_per_intensity"].as<int>();
        fire_default_position_ = fire["default_position"].as<double>();

        // Particles
        auto particles = simulation["particles"];
        spawn_factor_ = particles["spawn_factor"].as<double>();
        spawn_jitter_ = particles["spawn_jitter"].as<double>();
        floor_offset_ = particles["floor_offset"].as<double>();
        initial_horizontal_speed_ = particles["initial_horizontal_speed"].as<double>();
        rise_speed_random_ = particles["rise_speed_random"].as<double>();
        rise_speed_per_level_ = particles["rise_speed_per_level"].as<double>();
        min_radius_ = particles["min_radius"].as<double>();
        radius_range_ = particles["radius_range"].as<double>();
        initial_opacity_ = particles["initial_opacity"].as<double>();
        turbulence_ = particles["turbulence"].as<double>();
        fade_rate_ = particles["fade_rate"].as<double>();
        ceiling_band_ = particles["ceiling_band"].as<double>();
        deposit_amount_ = particles["deposit_amount"].as<double>();

        // Smoke layer
        auto layer = simulation["layer"];
        diffusion_rate_ = layer["diffusion_rate"].as<double>();
        diffusion_stability_limit_ = layer["diffusion_stability_limit"].as<double>();
        drift_amplitude_ = layer["drift_amplitude"].as<double>();
        drift_time_frequency_ = layer["drift_time_frequency"].as<double>();
        drift_space_frequency_ = layer["drift_space_frequency"].as<double>();
        decay_rate_ = layer["decay_rate"].as<double>();

        // Wall and door
        auto obstruction = simulation["obstruction"];
        wall_position_ = obstruction["wall_position"].as<double>();
        collision_half_width_ = obstruction["collision_half_width"].as<double>();
        collision_clearance_ = obstruction["collision_clearance"].as<double>();
        reflection_damping_ = obstruction["reflection_damping"].as<double>();
        door_height_ = obstruction["door_height"].as<double>();
        diffusion_half_width_ = obstruction["diffusion_half_width"].as<double>();

        // Vents
        auto vents = simulation["vents"];
        vent_particle_range_ = vents["particle_range"].as<double>();
        vent_suction_gain_ = vents["suction_gain"].as<double>();
        vent_suction_target_y_ = vents["suction_target_y"].as<double>();
        vent_particle_fade_ = vents["particle_fade"].as<double>();
        vent_layer_range_ = vents["layer_range"].as<double>();
        vent_layer_drain_ = vents["layer_drain"].as<double>();

        // Occupant
        auto occupant = simulation["occupant"];
        units_per_cm_ = occupant["units_per_cm"].as<double>();
        standing_height_cm_ = occupant["standing_height_cm"].as<int>();
        crouching_height_cm_ = occupant["crouching_height_cm"].as<int>();

        // Rendering
        auto rendering = config["rendering"];
        surface_width_ = rendering["surface_width"].as<int>();
        surface_height_ = rendering["surface_height"].as<int>();
        render_particles_ = rendering["render_particles"].as<bool>();
        render_flames_ = rendering["render_flames"].as<bool>();
        render_ripple_ = rendering["render_ripple"].as<bool>();
        background_color_ = {rendering["background_color"][0].as<int>(),
                             rendering["background_color"][1].as<int>(),
                             rendering["background_color"][2].as<int>(),
                             rendering["background_color"][3].as<int>()};

        Validate();
        SeedGenerator();
    }

    // Throws std::invalid_argument for values the model cannot run with
    void Validate() const {
        if (tick_period_ms_ <= 0)
            throw std::invalid_argument("simulation.time.tick_period_ms must be positive");
        if (fire_initial_intensity_ < 0.0 || fire_growth_rate_ < 0.0)
            throw std::invalid_argument("simulation.fire intensity and growth rate must not be negative");
        if (fire_max_effective_intensity_ <= 0.0 || fire_spawn_intensity_cap_ <= 0.0)
            throw std::invalid_argument("simulation.fire intensity caps must be positive");
        if (fire_default_position_ < 0.0 || fire_default_position_ > 1.0)
            throw std::invalid_argument("simulation.fire.default_position must lie in [0, 1]");
        if (initial_opacity_ <= 0.0 || initial_opacity_ > 1.0)
            throw std::invalid_argument("simulation.particles.initial_opacity must lie in (0, 1]");
        if (min_radius_ <= 0.0 || radius_range_ < 0.0)
            throw std::invalid_argument("simulation.particles radius band is invalid");
        if (diffusion_rate_ < 0.0 || decay_rate_ < 0.0)
            throw std::invalid_argument("simulation.layer rates must not be negative");
        if (wall_position_ <= 0.0 || wall_position_ >= 1.0)
            throw std::invalid_argument("simulation.obstruction.wall_position must lie in (0, 1)");
        if (collision_clearance_ <= collision_half_width_)
            throw std::invalid_argument("simulation.obstruction.collision_clearance must exceed collision_half_width");
        if (door_height_ < 0.0 || diffusion_half_width_ < 0.0)
            throw std::invalid_argument("simulation.obstruction door height and diffusion band must not be negative");
        if (vent_particle_range_ < 0.0 || vent_layer_range_ < 0.0 || vent_layer_drain_ < 0.0)
            throw std::invalid_argument("simulation.vents ranges and drain must not be negative");
        if (units_per_cm_ <= 0.0)
            throw std::invalid_argument("simulation.occupant.units_per_cm must be positive");
        if (surface_width_ <= 0 || surface_height_ <= 0)
            throw std::invalid_argument("rendering surface size must be positive");
    }

    void SeedGenerator() {
        if (seed_ == -1) {
            gen_.seed(std::random_device{}());
        } else {
            gen_.seed(static_cast<std::mt19937::result_type>(seed_));
        }
    }
    void SetSeed(int seed) { seed_ = seed; SeedGenerator(); }

    //Settings
    int seed_ = -1;
    bool start_running_ = false;

    //
    // Simulation parameters
    //

    // Timing: wall clock period of one tick, independent of the speed multiplier
    int tick_period_ms_ = 50;
    [[nodiscard]] int GetTickPeriodMs() const {return tick_period_ms_;}

    // Fire source
    double fire_initial_intensity_ = 1.0;
    double fire_growth_rate_ = 0.01; // per tick and speed unit
    double fire_max_effective_intensity_ = 10.0; // clamp for flame count
    double fire_spawn_intensity_cap_ = 5.0; // clamp for the spawn rate
    int fire_flames_per_intensity_ = 15;
    double fire_default_position_ = 0.15; // fraction of the surface width
    [[nodiscard]] double GetFireInitialIntensity() const {return fire_initial_intensity_;}
    [[nodiscard]] double GetFireGrowthRate() const {return fire_growth_rate_;}
    [[nodiscard]] double GetFireMaxEffectiveIntensity() const {return fire_max_effective_intensity_;}
    [[nodiscard]] double GetFireSpawnIntensityCap() const {return fire_spawn_intensity_cap_;}

    // Smoke particles (surface units, y grows towards the floor)
    double spawn_factor_ = 2.0;
    double spawn_jitter_ = 10.0; // horizontal spawn offset is uniform in [-jitter, jitter]
    double floor_offset_ = 40.0; // spawn height above the floor
    double initial_horizontal_speed_ = 1.0;
    double rise_speed_random_ = 2.0;
    double rise_speed_per_level_ = 1.2; // buoyancy added per intensity level
    double min_radius_ = 5.0;
    double radius_range_ = 8.0;
    double initial_opacity_ = 0.7;
    double turbulence_ = 0.05; // full width of the zero mean velocity jitter
    double fade_rate_ = 0.003;
    double ceiling_band_ = 20.0;
    double deposit_amount_ = 2.5;

    // Ceiling smoke layer
    double diffusion_rate_ = 0.3; // per speed unit
    double diffusion_stability_limit_ = 0.5; // <= 0 disables the clamp
    double drift_amplitude_ = 0.1;
    double drift_time_frequency_ = 0.1;
    double drift_space_frequency_ = 0.05;
    double decay_rate_ = 0.02;
    [[nodiscard]] double GetDiffusionRate(int speed_multiplier) const {return diffusion_rate_ * speed_multiplier;}
    [[nodiscard]] bool HasDiffusionLimit() const {return diffusion_stability_limit_ > 0.0;}

    // Wall with door
    double wall_position_ = 0.5; // fraction of the surface width
    double collision_half_width_ = 8.0;
    double collision_clearance_ = 9.0;
    double reflection_damping_ = 0.5;
    double door_height_ = 90.0;
    double diffusion_half_width_ = 5.0;
    double wall_thickness_ = 10.0; // drawing only

    // Vents
    double vent_particle_range_ = 80.0;
    double vent_suction_gain_ = 0.01;
    double vent_suction_target_y_ = 50.0;
    double vent_particle_fade_ = 0.04;
    double vent_layer_range_ = 150.0;
    double vent_layer_drain_ = 1.5;

    // Occupant and unit conversion (1 cm = 0.2 surface units)
    double units_per_cm_ = 0.2;
    int standing_height_cm_ = 180;
    int crouching_height_cm_ = 100;
    [[nodiscard]] double ConvertUnitsToCm(double units) const {return units / units_per_cm_;}
    [[nodiscard]] double ConvertCmToUnits(double cm) const {return cm * units_per_cm_;}

    //
    // Render parameters
    //
    int surface_width_ = 960;
    int surface_height_ = 420;
    bool render_particles_ = true;
    bool render_flames_ = true;
    bool render_ripple_ = true;
    std::array<int, 4> background_color_{248, 250, 252, 255};

    // Random Generator
    std::mt19937 gen_{std::random_device{}()};
};


#endif //SMOKEFLOW_MODEL_PARAMETERS_H
