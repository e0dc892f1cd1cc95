#pragma once

#include "control/controller_factory.hpp"
#include "physics/building_envelope.hpp"
#include "simulation/simulator.hpp"

#include <memory>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace building_sim {

// Forecast and schedule for one run
struct SimulationSpec {
  double initial_inside_temp = 0.0; // C
  std::vector<double> outside_temps; // C, one per hour
  std::vector<double> setpoints;     // C, one per hour
};

// Complete scenario configuration
struct ScenarioConfig {
  std::string config_file_path; // Absolute path of the loaded file
  sim_physics::EnvelopeParams building;
  sim_control::ControllerSpec controller;
  sim_engine::HeatPumpSpec heat_pump;
  SimulationSpec simulation;
};

// Load scenario configuration from YAML file
// Throws ConfigurationError if file cannot be read, parsed, or validated.
// Series lengths are checked by the simulator, not here.
ScenarioConfig load_scenario(const std::string &path);

// Parse an already loaded YAML document (same rules as load_scenario)
ScenarioConfig parse_scenario(const YAML::Node &yaml);

// Parse the 'building' section
// Throws ConfigurationError on missing or unknown keys and bad values
sim_physics::EnvelopeParams parse_building(const YAML::Node &node);

// Simulator for a loaded scenario, stepping at controller.dt_h
sim_engine::Simulator make_simulator(const ScenarioConfig &config);

// Fresh controller for one run of a loaded scenario, limited to the heat
// pump's output range
std::unique_ptr<sim_control::Controller>
make_controller(const ScenarioConfig &config);

} // namespace building_sim
