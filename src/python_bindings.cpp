#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "smokemodel/model_parameters.h"
#include "smokemodel/smoke_simulation.h"

namespace py = pybind11;

PYBIND11_MODULE(smokeflow, m) {
    m.doc() = "Smoke generation, ceiling stratification and venting model";

    py::enum_<VentSide>(m, "VentSide")
            .value("Left", VentSide::Left)
            .value("Right", VentSide::Right);

    py::enum_<Zone>(m, "Zone")
            .value("Left", Zone::Left)
            .value("Right", Zone::Right);

    py::class_<SmokeModelParameters>(m, "SmokeModelParameters")
            .def(py::init<>())
            .def("Init", static_cast<void (SmokeModelParameters::*)(const std::string&)>(&SmokeModelParameters::Init),
                 py::arg("yaml_path"))
            .def("Validate", &SmokeModelParameters::Validate)
            .def("SetSeed", &SmokeModelParameters::SetSeed, py::arg("seed"))
            .def_readwrite("tick_period_ms", &SmokeModelParameters::tick_period_ms_)
            .def_readwrite("spawn_factor", &SmokeModelParameters::spawn_factor_)
            .def_readwrite("diffusion_rate", &SmokeModelParameters::diffusion_rate_)
            .def_readwrite("diffusion_stability_limit", &SmokeModelParameters::diffusion_stability_limit_)
            .def_readwrite("decay_rate", &SmokeModelParameters::decay_rate_)
            .def_readwrite("deposit_amount", &SmokeModelParameters::deposit_amount_)
            .def_readwrite("wall_position", &SmokeModelParameters::wall_position_)
            .def_readwrite("door_height", &SmokeModelParameters::door_height_)
            .def_readwrite("vent_layer_drain", &SmokeModelParameters::vent_layer_drain_)
            .def_readwrite("units_per_cm", &SmokeModelParameters::units_per_cm_)
            .def_readwrite("surface_width", &SmokeModelParameters::surface_width_)
            .def_readwrite("surface_height", &SmokeModelParameters::surface_height_);

    py::class_<SmokeParticle>(m, "SmokeParticle")
            .def_property_readonly("x", &SmokeParticle::GetX)
            .def_property_readonly("y", &SmokeParticle::GetY)
            .def_property_readonly("radius", &SmokeParticle::GetRadius)
            .def_property_readonly("opacity", &SmokeParticle::GetOpacity)
            .def_property_readonly("velocity", [](const SmokeParticle& particle) {
                double u1, u2;
                particle.GetVelocity(u1, u2);
                return std::make_pair(u1, u2);
            });

    py::class_<SmokeSimulation>(m, "SmokeSimulation")
            .def(py::init<>())
            .def(py::init<SmokeModelParameters>(), py::arg("parameters"))
            .def("Configure", &SmokeSimulation::Configure, py::arg("surface_width"), py::arg("surface_height"))
            .def("Tick", &SmokeSimulation::Tick)
            .def("Run", [](SmokeSimulation& simulation, int ticks) {
                int executed = 0;
                for (int i = 0; i < ticks; ++i) {
                    executed += simulation.Tick() ? 1 : 0;
                }
                return executed;
            }, py::arg("ticks"))
            .def("SetFireOrigin", &SmokeSimulation::SetFireOrigin, py::arg("x"))
            .def("SetIntensityLevel", &SmokeSimulation::SetIntensityLevel, py::arg("level"))
            .def("SetDoorOpen", &SmokeSimulation::SetDoorOpen, py::arg("open"))
            .def("SetVent", &SmokeSimulation::SetVent, py::arg("side"), py::arg("on"))
            .def("SetSpeedMultiplier", &SmokeSimulation::SetSpeedMultiplier, py::arg("speed_multiplier"))
            .def("ToggleSpeedMultiplier", &SmokeSimulation::ToggleSpeedMultiplier)
            .def("SetCrouch", &SmokeSimulation::SetCrouch, py::arg("crouching"))
            .def("Start", &SmokeSimulation::Start)
            .def("Stop", &SmokeSimulation::Stop)
            .def("Reset", &SmokeSimulation::Reset)
            .def("GetElapsedTime", &SmokeSimulation::GetElapsedTime)
            .def("IsRunning", &SmokeSimulation::IsRunning)
            .def("GetSpeedMultiplier", &SmokeSimulation::GetSpeedMultiplier)
            .def("GetIntensityLevel", &SmokeSimulation::GetIntensityLevel)
            .def("IsDoorOpen", &SmokeSimulation::IsDoorOpen)
            .def("IsVentOn", &SmokeSimulation::IsVentOn, py::arg("side"))
            .def("IsCrouching", &SmokeSimulation::IsCrouching)
            .def("GetFireIntensity", [](const SmokeSimulation& simulation) { return simulation.GetFire().GetIntensity(); })
            .def("GetFirePosition", [](const SmokeSimulation& simulation) { return simulation.GetFire().GetPosition(); })
            .def("GetFlameCount", [](const SmokeSimulation& simulation) { return simulation.GetFire().GetFlameCount(); })
            .def("GetParticleCount", &SmokeSimulation::GetParticleCount)
            .def("GetParticleSnapshot", &SmokeSimulation::GetParticleSnapshot)
            .def("GetFieldSnapshot", &SmokeSimulation::GetFieldSnapshot)
            .def("GetMaxLayerThickness", static_cast<double (SmokeSimulation::*)() const>(&SmokeSimulation::GetMaxLayerThickness))
            .def("GetMaxLayerThicknessInZone", static_cast<double (SmokeSimulation::*)(Zone) const>(&SmokeSimulation::GetMaxLayerThickness),
                 py::arg("zone"))
            .def("GetTotalLayerMass", [](const SmokeSimulation& simulation) { return simulation.GetLayer().GetTotalMass(); })
            .def("GetSmokeLayerDepthCm", &SmokeSimulation::GetSmokeLayerDepthCm)
            .def("GetBreathingHeightCm", &SmokeSimulation::GetBreathingHeightCm)
            .def("IsBreathingZoneCompromised", &SmokeSimulation::IsBreathingZoneCompromised)
            .def("GetWallX", &SmokeSimulation::GetWallX)
            .def("GetDoorTop", &SmokeSimulation::GetDoorTop);
}
