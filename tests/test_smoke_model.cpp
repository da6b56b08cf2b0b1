#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "smokemodel/model_parameters.h"
#include "smokemodel/obstruction.h"
#include "smokemodel/simulation_clock.h"
#include "smokemodel/smoke_layer.h"
#include "smokemodel/smoke_simulation.h"
#include "smokemodel/particles/particle_system.h"
#include "project_paths.h"
#include "src/utils.h"

namespace {

// Always-on requirement, independent of NDEBUG
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline bool nearlyEqual(double a, double b, double tol) { return std::abs(a - b) <= tol; }

static SmokeModelParameters makeParameters(int seed) {
    SmokeModelParameters parameters;
    parameters.SetSeed(seed);
    return parameters;
}

static double sumOf(const std::vector<double>& samples) {
    double sum = 0.0;
    for (double v : samples) sum += v;
    return sum;
}

static void requireNonNegativeField(const SmokeSimulation& sim, const char* where) {
    for (double v : sim.GetFieldSnapshot()) {
        REQUIRE(v >= 0.0, "negative layer sample " << v << " (" << where << ")");
    }
}

static void requireLengthMatchesWidth(const SmokeSimulation& sim, const char* where) {
    const auto expected = static_cast<size_t>(std::ceil(sim.GetSurfaceWidth()));
    REQUIRE(sim.GetFieldSnapshot().size() == expected,
            "layer length " << sim.GetFieldSnapshot().size() << " != " << expected << " (" << where << ")");
}

static void runTicks(SmokeSimulation& sim, int ticks) {
    for (int i = 0; i < ticks; ++i) {
        REQUIRE(sim.Tick(), "tick refused while running");
    }
}

// =======================
// Parameters
// =======================

static void runConfigLoad() {
    SmokeModelParameters parameters;
    parameters.Init(std::string(SMOKEFLOW_SOURCE_DIR) + "/config/config.yaml");
    REQUIRE(parameters.GetTickPeriodMs() == 50, "tick period");
    REQUIRE(parameters.surface_width_ == 960 && parameters.surface_height_ == 420, "surface size");
    REQUIRE(nearlyEqual(parameters.ConvertUnitsToCm(1.0), 5.0, 1e-12), "1 unit must be 5 cm");
    REQUIRE(nearlyEqual(parameters.vent_layer_drain_, 1.5, 1e-12), "vent drain");
    REQUIRE(parameters.HasDiffusionLimit(), "default config clamps diffusion");
    std::cout << "[PASS] config.yaml loads with reference constants\n";
}

static void runProjectPathsExist() {
    const std::filesystem::path root(SMOKEFLOW_SOURCE_DIR);
    // JSON is read as a YAML flow mapping
    const YAML::Node paths = YAML::LoadFile((root / "project_paths.json").string());
    REQUIRE(paths.IsMap(), "project_paths.json is an object");
    REQUIRE(paths["config_path"], "config_path entry");
    for (const auto& entry : paths) {
        const std::string key = entry.first.as<std::string>();
        const std::filesystem::path target = root / entry.second.as<std::string>();
        REQUIRE(std::filesystem::exists(target), "project path '" << key << "' is missing: " << target);
    }
    std::cout << "[PASS] every entry of project_paths.json exists\n";
}

static void runConfigRejectsInvalidValues() {
    const std::string path = std::string(SMOKEFLOW_SOURCE_DIR) + "/config/config.yaml";

    {
        YAML::Node config = YAML::LoadFile(path);
        config["simulation"]["time"]["tick_period_ms"] = 0;
        SmokeModelParameters parameters;
        bool thrown = false;
        try {
            parameters.Init(config);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        REQUIRE(thrown, "zero tick period must be rejected");
    }
    {
        YAML::Node config = YAML::LoadFile(path);
        config["simulation"]["obstruction"]["wall_position"] = 1.5;
        SmokeModelParameters parameters;
        bool thrown = false;
        try {
            parameters.Init(config);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        REQUIRE(thrown, "wall outside the surface must be rejected");
    }
    {
        YAML::Node config = YAML::LoadFile(path);
        config["simulation"].remove("fire");
        SmokeModelParameters parameters;
        bool thrown = false;
        try {
            parameters.Init(config);
        } catch (const YAML::Exception&) {
            thrown = true;
        }
        REQUIRE(thrown, "missing fire section must be rejected");
    }
    std::cout << "[PASS] invalid configurations throw\n";
}

// =======================
// Components
// =======================

static void runFireGrowthAndClamps() {
    SmokeModelParameters parameters = makeParameters(1);
    FireSource fire(parameters);
    REQUIRE(nearlyEqual(fire.GetIntensity(), 1.0, 1e-12), "initial intensity");
    for (int i = 0; i < 100; ++i) fire.Grow(2);
    REQUIRE(nearlyEqual(fire.GetIntensity(), 3.0, 1e-9), "growth scales with speed");

    for (int i = 0; i < 1000; ++i) fire.Grow(4);
    REQUIRE(fire.GetIntensity() > 10.0, "raw intensity is not capped");
    REQUIRE(nearlyEqual(fire.GetEffectiveIntensity(), 10.0, 1e-12), "flame intensity clamp");
    REQUIRE(nearlyEqual(fire.GetSpawnIntensity(), 5.0, 1e-12), "spawn intensity clamp");
    REQUIRE(fire.GetFlameCount() == 150, "flame count at the clamp");

    fire.SetPosition(123.0);
    REQUIRE(nearlyEqual(fire.GetPosition(), 123.0, 1e-12), "position");
    fire.Reset();
    REQUIRE(nearlyEqual(fire.GetIntensity(), 1.0, 1e-12), "reset intensity");
    REQUIRE(nearlyEqual(fire.GetPosition(), 123.0, 1e-12), "reset keeps the position");
    std::cout << "[PASS] fire growth and point-of-use clamps\n";
}

static void runSpawnBatchSize() {
    SmokeModelParameters parameters = makeParameters(1);
    ParticleSystem particles(parameters);
    REQUIRE(particles.GetBatchSize(1, 1.0, 1) == 2, "level 1 at unit intensity");
    REQUIRE(particles.GetBatchSize(2, 0.4, 1) == 1, "floor of 1.6");
    REQUIRE(particles.GetBatchSize(3, 7.0, 4) == 120, "intensity capped at 5");
    REQUIRE(particles.GetBatchSize(1, 0.0, 1) == 0, "no fire, no smoke");

    particles.Spawn(1, 1.0, 100.0, 400.0, 1);
    REQUIRE(particles.GetCount() == 2, "spawned batch");
    for (const auto& p : particles.GetParticles()) {
        REQUIRE(p.GetX() >= 90.0 && p.GetX() <= 110.0, "spawn jitter");
        REQUIRE(nearlyEqual(p.GetY(), 360.0, 1e-12), "spawn height");
        REQUIRE(p.GetRadius() >= 5.0 && p.GetRadius() <= 13.0, "radius band");
        double u1, u2;
        p.GetVelocity(u1, u2);
        REQUIRE(u2 < 0.0, "particles rise");
    }
    std::cout << "[PASS] spawn batch size and initial state\n";
}

static void runClockScheduling() {
    SimulationClock clock(50);
    REQUIRE(!clock.ConsumeDueTick(0), "stopped clock has no ticks");
    clock.Start();
    REQUIRE(!clock.ConsumeDueTick(1000), "first call schedules");
    REQUIRE(!clock.ConsumeDueTick(1049), "before the period");
    REQUIRE(clock.ConsumeDueTick(1050), "one period later");
    REQUIRE(clock.ConsumeDueTick(1260), "late call still ticks once");
    REQUIRE(clock.GetSkippedTicks() == 3, "missed periods are dropped");
    REQUIRE(!clock.ConsumeDueTick(1270), "no burst after a stall");
    REQUIRE(clock.ConsumeDueTick(1300), "schedule resynchronised");
    clock.Stop();
    REQUIRE(!clock.ConsumeDueTick(5000), "stopped again");
    std::cout << "[PASS] fixed period scheduling skips missed ticks\n";
}

static void runSpeedMultiplier() {
    SimulationClock clock(50);
    REQUIRE(clock.GetSpeedMultiplier() == 1, "default speed");
    clock.ToggleSpeedMultiplier();
    REQUIRE(clock.GetSpeedMultiplier() == 2, "1 -> 2");
    clock.ToggleSpeedMultiplier();
    REQUIRE(clock.GetSpeedMultiplier() == 4, "2 -> 4");
    clock.ToggleSpeedMultiplier();
    REQUIRE(clock.GetSpeedMultiplier() == 1, "4 -> 1");
    clock.SetSpeedMultiplier(3);
    REQUIRE(clock.GetSpeedMultiplier() == 1, "unsupported multiplier falls back to 1");

    SmokeSimulation sim(makeParameters(3));
    sim.Configure(400, 400);
    sim.SetSpeedMultiplier(4);
    sim.Start();
    runTicks(sim, 10);
    REQUIRE(sim.GetElapsedTime() == 40, "elapsed time advances by the multiplier");
    std::cout << "[PASS] speed multiplier scales elapsed time\n";
}

static void runLayerDepositBounds() {
    SmokeModelParameters parameters = makeParameters(1);
    Obstruction obstruction(parameters);
    obstruction.Configure(100, 100);
    SmokeLayer layer(parameters, obstruction);
    layer.Resize(100);
    layer.DepositAt(-1, 2.5);
    layer.DepositAt(100, 2.5);
    REQUIRE(layer.GetTotalMass() == 0.0, "out of range deposits are dropped");
    layer.DepositAt(99, 2.5);
    REQUIRE(layer.GetSample(99) == 2.5, "last column accepts deposits");

    SmokeLayer empty(parameters, obstruction);
    empty.Step(false, VentState(), 1.0, 1);
    REQUIRE(empty.IsEmpty(), "stepping an empty field is a no-op");
    std::cout << "[PASS] deposits outside the field are ignored\n";
}

static void runLayerClosedWallConservesMass() {
    SmokeModelParameters parameters = makeParameters(1);
    parameters.drift_amplitude_ = 0.0;
    parameters.decay_rate_ = 0.0;
    Obstruction obstruction(parameters);
    obstruction.Configure(100, 100);
    SmokeLayer layer(parameters, obstruction);
    layer.Resize(100);

    REQUIRE(obstruction.GetFirstBandColumn() == 46 && obstruction.GetLastBandColumn() == 54, "wall band columns");
    layer.DepositAt(44, 10.0);
    layer.DepositAt(56, 10.0);

    // 25 steps keep the support away from both edges of the field
    for (int i = 0; i < 25; ++i) {
        layer.Step(false, VentState(), static_cast<double>(i + 1), 1);
        for (int x = 46; x <= 54; ++x) {
            REQUIRE(layer.GetSample(x) == 0.0, "band column " << x << " received smoke");
        }
    }
    REQUIRE(nearlyEqual(layer.GetMassInZone(Zone::Left), 10.0, 1e-9), "left mass " << layer.GetMassInZone(Zone::Left));
    REQUIRE(nearlyEqual(layer.GetMassInZone(Zone::Right), 10.0, 1e-9), "right mass " << layer.GetMassInZone(Zone::Right));

    for (int i = 0; i < 25; ++i) {
        layer.Step(true, VentState(), static_cast<double>(i + 26), 1);
    }
    double band_mass = 0.0;
    for (int x = 46; x <= 54; ++x) band_mass += layer.GetSample(x);
    REQUIRE(band_mass > 0.0, "open door lets the layer through");
    std::cout << "[PASS] closed wall blocks layer diffusion without losing mass\n";
}

static void runLayerVentDrain() {
    SmokeModelParameters parameters = makeParameters(1);
    parameters.drift_amplitude_ = 0.0;
    parameters.decay_rate_ = 0.0;
    Obstruction obstruction(parameters);
    obstruction.Configure(400, 400);
    SmokeLayer layer(parameters, obstruction);
    layer.Resize(400);
    for (int x = 0; x < 400; ++x) layer.DepositAt(x, 5.0);

    VentState vents;
    vents.Set(VentSide::Left, true);
    layer.Step(false, vents, 1.0, 1);
    REQUIRE(nearlyEqual(layer.GetSample(0), 3.5, 1e-12), "left vent drains its band");
    REQUIRE(nearlyEqual(layer.GetSample(149), 3.5, 1e-12), "left band edge");
    REQUIRE(nearlyEqual(layer.GetSample(150), 5.0, 1e-12), "outside the left band");
    REQUIRE(nearlyEqual(layer.GetSample(399), 5.0, 1e-12), "right vent is off");

    vents.Set(VentSide::Right, true);
    layer.Step(false, vents, 2.0, 2);
    REQUIRE(nearlyEqual(layer.GetSample(0), 0.5, 1e-12), "drain scales with speed");
    REQUIRE(nearlyEqual(layer.GetSample(250), 5.0, 1e-12), "column n - range is outside the right band");
    REQUIRE(nearlyEqual(layer.GetSample(251), 2.0, 1e-12), "right band");

    for (int i = 0; i < 5; ++i) layer.Step(false, vents, 3.0 + i, 1);
    REQUIRE(layer.GetSample(0) == 0.0 && layer.GetSample(399) == 0.0, "drained columns clamp at zero");
    std::cout << "[PASS] vents drain their bands and the field stays non-negative\n";
}

static void runDiffusionStabilityClamp() {
    SmokeModelParameters parameters = makeParameters(1);
    Obstruction obstruction(parameters);
    SmokeLayer layer(parameters, obstruction);
    REQUIRE(nearlyEqual(layer.GetEffectiveDiffusionRate(1), 0.3, 1e-12), "rate at speed 1");
    REQUIRE(nearlyEqual(layer.GetEffectiveDiffusionRate(4), 0.5, 1e-12), "rate clamped at speed 4");
    parameters.diffusion_stability_limit_ = 0.0;
    REQUIRE(nearlyEqual(layer.GetEffectiveDiffusionRate(4), 1.2, 1e-12), "clamp disabled");
    std::cout << "[PASS] diffusion rate stability clamp\n";
}

// Single particle, no turbulence, 400x400 room: wall at 200, door top at 270
struct ParticleRig {
    SmokeModelParameters parameters = makeParameters(1);
    Obstruction obstruction{parameters};
    SmokeLayer layer{parameters, obstruction};
    ParticleSystem particles{parameters};

    ParticleRig() {
        parameters.turbulence_ = 0.0;
        obstruction.Configure(400, 400);
        layer.Resize(400);
    }

    void AdvanceOnce(const VentState& vents) { particles.Advance(400, obstruction, vents, 1, layer); }

    const SmokeParticle& Only() {
        REQUIRE(particles.GetCount() == 1, "expected one particle, got " << particles.GetCount());
        return particles.GetParticles().front();
    }
};

static void runAdvanceVentSuction() {
    VentState right;
    right.right = true;
    ParticleRig rig;
    rig.particles.Add(SmokeParticle(350, 200, 0, 0, 5, 0.7));
    rig.AdvanceOnce(right);
    double vx, vy;
    rig.Only().GetVelocity(vx, vy);
    REQUIRE(nearlyEqual(vx, 0.5, 1e-12), "pulled toward the right wall, vx=" << vx);
    REQUIRE(nearlyEqual(vy, -1.5, 1e-12), "pulled toward the ceiling, vy=" << vy);
    REQUIRE(nearlyEqual(rig.Only().GetX(), 350.5, 1e-12), "x after the pull");
    REQUIRE(nearlyEqual(rig.Only().GetY(), 198.5, 1e-12), "y after the pull");
    REQUIRE(nearlyEqual(rig.Only().GetOpacity(), 0.657, 1e-12), "vent fade plus regular fade");

    VentState left;
    left.left = true;
    ParticleRig left_rig;
    left_rig.particles.Add(SmokeParticle(30, 200, 0, 0, 5, 0.7));
    left_rig.AdvanceOnce(left);
    left_rig.Only().GetVelocity(vx, vy);
    REQUIRE(nearlyEqual(vx, -0.3, 1e-12), "pulled toward the left wall, vx=" << vx);
    REQUIRE(nearlyEqual(left_rig.Only().GetX(), 29.7, 1e-12), "x after the left pull");
    REQUIRE(nearlyEqual(left_rig.Only().GetOpacity(), 0.657, 1e-12), "left vent fade");

    // Out of range of the open vent: only the regular fade applies
    ParticleRig far_rig;
    far_rig.particles.Add(SmokeParticle(30, 200, 0, 0, 5, 0.7));
    far_rig.AdvanceOnce(right);
    far_rig.Only().GetVelocity(vx, vy);
    REQUIRE(vx == 0.0 && vy == 0.0, "no pull outside the vent range");
    REQUIRE(nearlyEqual(far_rig.Only().GetX(), 30.0, 1e-12), "x unchanged");
    REQUIRE(nearlyEqual(far_rig.Only().GetOpacity(), 0.697, 1e-12), "regular fade only");
    std::cout << "[PASS] vent suction on a single particle\n";
}

static void runAdvanceWallReflection() {
    const VentState closed;
    double vx, vy;

    ParticleRig from_left;
    from_left.particles.Add(SmokeParticle(185, 200, 10, 0, 5, 0.7));
    from_left.AdvanceOnce(closed);
    from_left.Only().GetVelocity(vx, vy);
    REQUIRE(nearlyEqual(from_left.Only().GetX(), 191.0, 1e-12), "placed at wall - clearance, x=" << from_left.Only().GetX());
    REQUIRE(nearlyEqual(vx, -5.0, 1e-12), "reflected and damped, vx=" << vx);

    ParticleRig from_right;
    from_right.particles.Add(SmokeParticle(215, 200, -10, 0, 5, 0.7));
    from_right.AdvanceOnce(closed);
    from_right.Only().GetVelocity(vx, vy);
    REQUIRE(nearlyEqual(from_right.Only().GetX(), 209.0, 1e-12), "placed at wall + clearance, x=" << from_right.Only().GetX());
    REQUIRE(nearlyEqual(vx, 5.0, 1e-12), "reflected and damped, vx=" << vx);

    // Below the door top the open door lets the particle through
    ParticleRig through_door;
    through_door.obstruction.SetDoorOpen(true);
    through_door.particles.Add(SmokeParticle(185, 300, 10, 0, 5, 0.7));
    through_door.AdvanceOnce(closed);
    through_door.Only().GetVelocity(vx, vy);
    REQUIRE(nearlyEqual(through_door.Only().GetX(), 195.0, 1e-12), "passes the open door");
    REQUIRE(nearlyEqual(vx, 10.0, 1e-12), "velocity kept in the doorway");

    // Above the door top the wall still blocks
    ParticleRig above_door;
    above_door.obstruction.SetDoorOpen(true);
    above_door.particles.Add(SmokeParticle(185, 200, 10, 0, 5, 0.7));
    above_door.AdvanceOnce(closed);
    REQUIRE(nearlyEqual(above_door.Only().GetX(), 191.0, 1e-12), "wall above the door reflects");
    std::cout << "[PASS] wall reflection on a single particle\n";
}

static void runAdvanceCeilingDeposit() {
    ParticleRig rig;
    rig.particles.Add(SmokeParticle(123.7, 21, 0, -2, 5, 0.7));
    rig.AdvanceOnce(VentState{});
    REQUIRE(rig.particles.GetCount() == 0, "deposited particle is removed");
    REQUIRE(rig.particles.GetDepositCount() == 1, "one deposit");
    REQUIRE(rig.layer.GetSample(123) == 2.5, "deposit lands at floor(x), got " << rig.layer.GetSample(123));
    REQUIRE(rig.layer.GetTotalMass() == 2.5, "nothing else deposited");
    std::cout << "[PASS] ceiling deposit on a single particle\n";
}

static void runAdvanceCulling() {
    ParticleRig rig;
    rig.particles.Add(SmokeParticle(1, 200, -2, 0, 5, 0.7));    // leaves through the left edge
    rig.particles.Add(SmokeParticle(399, 200, 2, 0, 5, 0.7));   // leaves through the right edge
    rig.particles.Add(SmokeParticle(100, 200, 0, 0, 5, 0.002)); // fades out
    rig.particles.Add(SmokeParticle(100, 200, 0, 0, 5, 0.7));   // survives
    rig.AdvanceOnce(VentState{});
    REQUIRE(rig.particles.GetCount() == 1, "only the interior particle survives, got " << rig.particles.GetCount());
    REQUIRE(nearlyEqual(rig.Only().GetOpacity(), 0.697, 1e-12), "survivor is the opaque one");
    REQUIRE(rig.particles.GetDepositCount() == 0, "culling does not deposit");
    REQUIRE(rig.layer.GetTotalMass() == 0.0, "layer untouched");
    std::cout << "[PASS] particles leaving the surface or fading out are dropped\n";
}

static void runTimerAggregates() {
    Timer timer;
    REQUIRE(timer.GetAverageDuration() == 0.0, "empty average");
    REQUIRE(timer.GetMaxDuration() == 0.0, "empty max");
    timer.AppendDuration(2.0);
    timer.AppendDuration(6.0);
    timer.AppendDuration(1.0);
    REQUIRE(timer.GetDurationCount() == 3, "three samples");
    REQUIRE(nearlyEqual(timer.GetAverageDuration(), 3.0, 1e-12), "average");
    REQUIRE(timer.GetMaxDuration() == 6.0, "max");
    std::cout << "[PASS] timer keeps running tick statistics\n";
}

static void runExtensionNormalization() {
    REQUIRE(normalized_extension("config/Config.YAML") == ".yaml", "upper case extension");
    REQUIRE(normalized_extension("config/config.yml") == ".yml", "lower case kept");
    REQUIRE(normalized_extension("config/config").empty(), "no extension");
    const std::string high_bytes = std::string("config.") + static_cast<char>(0xC3) + static_cast<char>(0x89);
    const std::string extension = normalized_extension(high_bytes);
    REQUIRE(extension.size() == 3 && extension[0] == '.', "bytes outside ASCII kept, got " << extension.size());
    std::cout << "[PASS] file extension normalization\n";
}

// =======================
// Simulation properties
// =======================

static void runFieldInvariants() {
    SmokeSimulation sim(makeParameters(11));
    sim.Configure(400.5, 300);
    requireLengthMatchesWidth(sim, "configured");
    REQUIRE(sim.GetFieldSnapshot().size() == 401, "ceil of a fractional width");

    sim.SetIntensityLevel(3);
    sim.SetVent(VentSide::Left, true);
    sim.SetVent(VentSide::Right, true);
    sim.SetFireOrigin(60);
    sim.Start();
    for (int i = 0; i < 300; ++i) {
        if (i == 100) sim.SetSpeedMultiplier(4);
        if (i == 150) sim.SetDoorOpen(true);
        REQUIRE(sim.Tick(), "tick");
        requireNonNegativeField(sim, "running");
        requireLengthMatchesWidth(sim, "running");
    }

    sim.Configure(200, 300);
    requireLengthMatchesWidth(sim, "resized");
    REQUIRE(sumOf(sim.GetFieldSnapshot()) == 0.0, "resize starts from an empty layer");
    runTicks(sim, 20);
    requireNonNegativeField(sim, "after resize");

    SmokeSimulation unconfigured(makeParameters(11));
    unconfigured.Start();
    REQUIRE(unconfigured.Tick(), "unconfigured tick");
    REQUIRE(unconfigured.GetFieldSnapshot().empty(), "no field before configure");
    std::cout << "[PASS] layer stays non-negative and sized to the surface\n";
}

static void runResetIdempotence() {
    SmokeSimulation sim(makeParameters(5));
    sim.Configure(400, 400);
    sim.SetIntensityLevel(2);
    sim.SetDoorOpen(true);
    sim.SetVent(VentSide::Right, true);
    sim.SetCrouch(true);
    sim.SetSpeedMultiplier(2);
    sim.Start();
    runTicks(sim, 150);
    REQUIRE(sim.GetParticleCount() > 0, "run produced particles");

    auto requireBaseline = [&](const char* where) {
        REQUIRE(sim.GetElapsedTime() == 0, "elapsed (" << where << ")");
        REQUIRE(sim.GetParticleCount() == 0, "particles (" << where << ")");
        REQUIRE(sumOf(sim.GetFieldSnapshot()) == 0.0, "field (" << where << ")");
        REQUIRE(sim.GetFieldSnapshot().size() == 400, "field length (" << where << ")");
        REQUIRE(nearlyEqual(sim.GetFire().GetIntensity(), 1.0, 1e-12), "fire intensity (" << where << ")");
        REQUIRE(!sim.IsDoorOpen(), "door (" << where << ")");
        REQUIRE(!sim.IsVentOn(VentSide::Left) && !sim.IsVentOn(VentSide::Right), "vents (" << where << ")");
        REQUIRE(!sim.IsCrouching(), "crouch (" << where << ")");
        REQUIRE(sim.GetSpeedMultiplier() == 1, "speed (" << where << ")");
        REQUIRE(!sim.IsRunning(), "running (" << where << ")");
    };

    sim.Reset();
    requireBaseline("first reset");
    sim.Reset();
    requireBaseline("second reset");
    REQUIRE(sim.GetIntensityLevel() == 2, "reset keeps the selected intensity level");
    REQUIRE(!sim.Tick(), "stopped simulation does not tick");
    requireBaseline("tick after reset");
    std::cout << "[PASS] reset is idempotent\n";
}

static void runResetMidRun() {
    for (int variant = 0; variant < 4; ++variant) {
        SmokeSimulation sim(makeParameters(100 + variant));
        sim.Configure(400, 400);
        sim.SetIntensityLevel(1 + variant % 3);
        sim.SetSpeedMultiplier(variant == 3 ? 4 : 1);
        sim.SetDoorOpen(variant % 2 == 1);
        sim.Start();
        runTicks(sim, 40 + 37 * variant);
        sim.Reset();
        REQUIRE(sim.GetElapsedTime() == 0, "elapsed after mid-run reset (variant " << variant << ")");
        REQUIRE(sim.GetParticleCount() == 0, "particles after mid-run reset (variant " << variant << ")");
        sim.Start();
        REQUIRE(sim.Tick(), "restart after reset");
        REQUIRE(sim.GetElapsedTime() == 1, "restart begins at time zero");
    }
    std::cout << "[PASS] reset mid-run returns to time zero\n";
}

static void runMassGrowsWhileDepositsDominate() {
    SmokeModelParameters parameters = makeParameters(21);
    parameters.drift_amplitude_ = 0.0;
    SmokeSimulation sim(parameters);
    sim.Configure(400, 400);
    sim.SetFireOrigin(50);
    sim.SetIntensityLevel(3);
    sim.Start();

    const auto& p = sim.GetParameters();
    const double length = static_cast<double>(sim.GetFieldSnapshot().size());
    int checked = 0;
    for (int i = 0; i < 400; ++i) {
        const double mass_before = sim.GetLayer().GetTotalMass();
        const double max_before = sim.GetMaxLayerThickness();
        const long deposits_before = sim.GetParticleSystem().GetDepositCount();
        REQUIRE(sim.Tick(), "tick");
        const long deposits = sim.GetParticleSystem().GetDepositCount() - deposits_before;

        // Upper bound of what decay and the field edges can remove in one
        // step, plus slack for deposits that land just outside the field
        const double removable = p.decay_rate_ * length + 2 * p.diffusion_rate_ * max_before + 2 * p.deposit_amount_;
        if (deposits * p.deposit_amount_ > removable) {
            checked++;
            REQUIRE(sim.GetLayer().GetTotalMass() >= mass_before,
                    "mass decreased at tick " << i + 1 << " with " << deposits << " deposits");
        }
    }
    REQUIRE(checked > 0, "no tick with deposits outweighing decay");
    std::cout << "[PASS] layer mass grows while deposits outweigh decay (" << checked << " ticks)\n";
}

static void runClosedDoorKeepsParticlesOutOfWall() {
    SmokeSimulation sim(makeParameters(31));
    sim.Configure(400, 400);
    sim.SetFireOrigin(185);
    sim.SetIntensityLevel(3);
    sim.Start();
    const Obstruction& wall = sim.GetObstruction();
    for (int i = 0; i < 300; ++i) {
        if (i == 150) sim.SetDoorOpen(true);
        REQUIRE(sim.Tick(), "tick");
        for (const auto& particle : sim.GetParticleSnapshot()) {
            if (!sim.IsDoorOpen()) {
                REQUIRE(!wall.IsInCollisionBand(particle.GetX()),
                        "particle inside the closed wall at x=" << particle.GetX());
            } else {
                REQUIRE(!(wall.IsInCollisionBand(particle.GetX()) && wall.IsAboveDoor(particle.GetY())),
                        "particle inside the wall above the door at y=" << particle.GetY());
            }
        }
    }
    std::cout << "[PASS] wall reflects particles outside the door opening\n";
}

static void runVentReducesBandMass() {
    auto bandMassAfter = [](bool vent_on, int ticks) {
        SmokeSimulation sim(makeParameters(41));
        sim.Configure(400, 400);
        sim.SetFireOrigin(50);
        sim.SetVent(VentSide::Left, vent_on);
        sim.Start();
        runTicks(sim, ticks);
        return sim.GetLayer().GetMassInVentBand(VentSide::Left);
    };
    for (int ticks : {100, 300}) {
        const double without_vent = bandMassAfter(false, ticks);
        const double with_vent = bandMassAfter(true, ticks);
        REQUIRE(with_vent < without_vent,
                "vent band mass " << with_vent << " not below " << without_vent << " after " << ticks << " ticks");
    }
    std::cout << "[PASS] active vent lowers the layer in its band\n";
}

static void runFireSideScenario() {
    SmokeSimulation sim(makeParameters(51));
    sim.Configure(400, 400);
    sim.SetFireOrigin(50);
    sim.Start();
    runTicks(sim, 200);

    REQUIRE(sim.GetFireZone() == Zone::Left, "fire is left of the wall");
    const double left = sim.GetMaxLayerThickness(Zone::Left);
    const double right = sim.GetMaxLayerThickness(Zone::Right);
    REQUIRE(left > right, "fire side max " << left << " not above " << right);

    // Count is bounded by the largest batch times the longest particle life
    const auto& p = sim.GetParameters();
    const double max_batch = p.spawn_factor_ * 3 * p.GetFireSpawnIntensityCap() * 4;
    const double max_life = std::ceil(p.initial_opacity_ / p.fade_rate_) + 1;
    REQUIRE(sim.GetParticleCount() > 0, "particles alive");
    REQUIRE(sim.GetParticleCount() <= max_batch * max_life, "particle count unbounded");

    for (const auto& particle : sim.GetParticleSnapshot()) {
        REQUIRE(particle.GetX() >= 0.0 && particle.GetX() <= 400.0, "particle left the surface");
        REQUIRE(particle.GetY() >= 0.0, "particle above the ceiling");
        REQUIRE(particle.IsVisible(), "invisible particle kept");
    }

    // Spawn rate saturates once the fire reaches its spawn cap
    runTicks(sim, 500);
    const int count_700 = sim.GetParticleCount();
    runTicks(sim, 100);
    const int count_800 = sim.GetParticleCount();
    REQUIRE(std::abs(count_800 - count_700) <= 0.15 * count_700,
            "particle count not settling: " << count_700 << " -> " << count_800);
    std::cout << "[PASS] fire side accumulates the thicker layer, particle count settles\n";
}

static void runOpenDoorLetsSmokeCross() {
    auto rightMaxAfter = [](bool open_door) {
        SmokeModelParameters parameters = makeParameters(61);
        parameters.drift_amplitude_ = 0.0;
        SmokeSimulation sim(parameters);
        sim.Configure(400, 400);
        sim.SetFireOrigin(170);
        sim.Start();
        runTicks(sim, 200);
        REQUIRE(sim.GetMaxLayerThickness(Zone::Right) == 0.0, "smoke crossed the closed wall");
        sim.SetDoorOpen(open_door);
        runTicks(sim, 300);
        return sim.GetMaxLayerThickness(Zone::Right);
    };
    const double closed = rightMaxAfter(false);
    const double opened = rightMaxAfter(true);
    REQUIRE(closed == 0.0, "closed door leaked " << closed);
    REQUIRE(opened > closed, "opening the door did not raise the far side layer");
    std::cout << "[PASS] opening the door lets smoke reach the far side\n";
}

static void runBreathingZone() {
    SmokeSimulation sim(makeParameters(71));
    sim.Configure(400, 400);
    REQUIRE(sim.GetSmokeLayerDepthCm() == 0, "empty layer has no depth");
    REQUIRE(!sim.IsBreathingZoneCompromised(), "empty layer is safe");
    REQUIRE(sim.GetBreathingHeightCm() == 180, "standing height");
    sim.SetCrouch(true);
    REQUIRE(sim.GetBreathingHeightCm() == 100, "crouching height");

    sim.SetFireOrigin(100);
    sim.Start();
    runTicks(sim, 300);
    const double max = sim.GetMaxLayerThickness();
    REQUIRE(sim.GetSmokeLayerDepthCm() == static_cast<int>(std::floor(max / 0.2)), "depth in cm");

    SmokeModelParameters parameters = makeParameters(71);
    parameters.units_per_cm_ = 0.001;
    SmokeSimulation dense(parameters);
    dense.Configure(400, 400);
    dense.SetFireOrigin(100);
    dense.Start();
    runTicks(dense, 300);
    REQUIRE(dense.GetMaxLayerThickness() > 0.2, "layer formed");
    REQUIRE(dense.IsBreathingZoneCompromised(), "deep layer compromises standing height");
    dense.SetCrouch(true);
    REQUIRE(dense.GetBreathingHeightCm() == 100, "crouch lowers the breathing height");
    std::cout << "[PASS] layer depth readout and breathing zone\n";
}

static void runUnclampedDiffusionDepthSaturates() {
    SmokeModelParameters parameters = makeParameters(73);
    parameters.diffusion_stability_limit_ = 0.0;
    SmokeSimulation sim(parameters);
    sim.Configure(400, 400);
    sim.SetIntensityLevel(3);
    sim.SetSpeedMultiplier(4);
    sim.SetFireOrigin(100);
    sim.Start();
    for (int i = 0; i < 60; ++i) {
        REQUIRE(sim.Tick(), "tick");
        REQUIRE(sim.GetSmokeLayerDepthCm() >= 0, "negative depth " << sim.GetSmokeLayerDepthCm() << " at tick " << i);
    }
    REQUIRE(sim.GetMaxLayerThickness() > 1e9, "unclamped diffusion blew up the layer");
    REQUIRE(sim.GetSmokeLayerDepthCm() == std::numeric_limits<int>::max(), "depth saturates");
    REQUIRE(sim.IsBreathingZoneCompromised(), "blown up layer compromises the breathing zone");
    std::cout << "[PASS] depth readout saturates on an unstable layer\n";
}

static void runSurfaceExtentClamp() {
    SmokeSimulation sim(makeParameters(93));
    sim.Configure(1e12, 400);
    REQUIRE(sim.GetSurfaceWidth() == SmokeSimulation::kMaxSurfaceExtent, "width clamped");
    REQUIRE(sim.GetFieldSnapshot().size() == static_cast<size_t>(SmokeSimulation::kMaxSurfaceExtent), "field clamped");
    sim.Configure(400, 1e12);
    REQUIRE(sim.GetSurfaceHeight() == SmokeSimulation::kMaxSurfaceExtent, "height clamped");
    requireLengthMatchesWidth(sim, "after clamping");
    std::cout << "[PASS] surface extent is clamped\n";
}

static void runWallClockDrive() {
    SmokeSimulation sim(makeParameters(81));
    sim.Configure(400, 400);
    REQUIRE(!sim.Update(0), "not started");
    sim.Start();
    REQUIRE(!sim.Update(0), "first update schedules");
    REQUIRE(!sim.Update(30), "period not reached");
    REQUIRE(sim.Update(50), "tick after one period");
    REQUIRE(sim.GetElapsedTime() == 1, "one tick ran");
    REQUIRE(sim.Update(1000), "tick after a stall");
    REQUIRE(sim.GetElapsedTime() == 2, "stall runs a single tick");
    sim.Stop();
    REQUIRE(!sim.Update(2000), "stopped");
    REQUIRE(sim.GetElapsedTime() == 2, "stop freezes time");
    std::cout << "[PASS] wall clock drive runs at most one tick per call\n";
}

static void runSetterClamps() {
    SmokeSimulation sim(makeParameters(91));
    sim.Configure(400, 400);
    REQUIRE(nearlyEqual(sim.GetFire().GetPosition(), 60.0, 1e-9), "default fire position");
    sim.SetIntensityLevel(0);
    REQUIRE(sim.GetIntensityLevel() == 1, "level clamped to 1");
    sim.SetIntensityLevel(7);
    REQUIRE(sim.GetIntensityLevel() == 3, "level clamped to 3");
    sim.SetIntensityLevel(1);
    sim.Start();
    REQUIRE(sim.Tick(), "tick");
    REQUIRE(sim.GetParticleCount() == 2, "first batch at level 1");
    std::cout << "[PASS] setters clamp their inputs\n";
}

}  // namespace

int main() {
    // =======================
    // Parameters
    // =======================
    runConfigLoad();
    runProjectPathsExist();
    runConfigRejectsInvalidValues();

    // =======================
    // Components
    // =======================
    runFireGrowthAndClamps();
    runSpawnBatchSize();
    runClockScheduling();
    runSpeedMultiplier();
    runLayerDepositBounds();
    runLayerClosedWallConservesMass();
    runLayerVentDrain();
    runDiffusionStabilityClamp();
    runAdvanceVentSuction();
    runAdvanceWallReflection();
    runAdvanceCeilingDeposit();
    runAdvanceCulling();
    runTimerAggregates();
    runExtensionNormalization();

    // =======================
    // Simulation properties
    // =======================
    runFieldInvariants();
    runResetIdempotence();
    runResetMidRun();
    runMassGrowsWhileDepositsDominate();
    runClosedDoorKeepsParticlesOutOfWall();
    runVentReducesBandMass();
    runFireSideScenario();
    runOpenDoorLetsSmokeCross();
    runBreathingZone();
    runUnclampedDiffusionDepthSaturates();
    runSurfaceExtentClamp();
    runWallClockDrive();
    runSetterClamps();

    return 0;
}
