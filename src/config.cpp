#include "config.hpp"

#include "errors.hpp"

#include <cmath>
#include <filesystem>
#include <set>

namespace building_sim {

namespace fs = std::filesystem;

namespace {

// Reject keys we do not understand (prevents silently ignored config)
void check_keys(const YAML::Node &node, const std::string &section,
                const std::set<std::string> &allowed) {
  for (const auto &kv : node) {
    std::string key = kv.first.as<std::string>();
    if (allowed.find(key) == allowed.end()) {
      throw ConfigurationError("[CONFIG] Unknown key '" + section + "." + key +
                               "'");
    }
  }
}

YAML::Node require_map(const YAML::Node &parent, const std::string &key,
                       const std::string &path) {
  if (!parent[key]) {
    throw ConfigurationError("[CONFIG] Missing required '" + path + "' section");
  }
  if (!parent[key].IsMap()) {
    throw ConfigurationError("[CONFIG] '" + path + "' section must be a map");
  }
  return parent[key];
}

template <typename T>
T read_value(const YAML::Node &node, const std::string &path) {
  if (!node.IsScalar()) {
    throw ConfigurationError("[CONFIG] " + path + ": expected a scalar");
  }
  try {
    return node.as<T>();
  } catch (const YAML::Exception &e) {
    throw ConfigurationError("[CONFIG] " + path + ": " + e.what());
  }
}

template <typename T>
T read_required(const YAML::Node &parent, const std::string &key,
                const std::string &section) {
  if (!parent[key]) {
    throw ConfigurationError("[CONFIG] Missing required '" + section + "." +
                             key + "'");
  }
  return read_value<T>(parent[key], section + "." + key);
}

template <typename T>
void read_optional(const YAML::Node &parent, const std::string &key,
                   const std::string &section, T &target) {
  if (parent[key]) {
    target = read_value<T>(parent[key], section + "." + key);
  }
}

std::vector<double> read_series(const YAML::Node &node,
                                const std::string &path) {
  if (!node.IsSequence()) {
    throw ConfigurationError("[CONFIG] '" + path + "' must be a sequence");
  }
  std::vector<double> series;
  series.reserve(node.size());
  for (std::size_t i = 0; i < node.size(); ++i) {
    series.push_back(
        read_value<double>(node[i], path + "[" + std::to_string(i) + "]"));
  }
  return series;
}

void parse_u_values(const YAML::Node &node, sim_physics::UValues &u) {
  if (!node.IsMap()) {
    throw ConfigurationError("[CONFIG] 'building.u_values' must be a map");
  }
  check_keys(node, "building.u_values",
             {"wall", "floor", "roof", "window", "door"});
  read_optional(node, "wall", "building.u_values", u.wall);
  read_optional(node, "floor", "building.u_values", u.floor);
  read_optional(node, "roof", "building.u_values", u.roof);
  read_optional(node, "window", "building.u_values", u.window);
  read_optional(node, "door", "building.u_values", u.door);
}

void parse_materials(const YAML::Node &node,
                     sim_physics::EnvelopeParams &params) {
  if (!node.IsMap()) {
    throw ConfigurationError("[CONFIG] 'building.materials' must be a map");
  }
  check_keys(node, "building.materials", {"wall", "floor", "roof"});

  try {
    if (node["wall"]) {
      params.wall_material = sim_physics::parse_wall_material(
          read_value<std::string>(node["wall"], "building.materials.wall"));
    }
    if (node["floor"]) {
      params.floor_material = sim_physics::parse_floor_material(
          read_value<std::string>(node["floor"], "building.materials.floor"));
    }
    if (node["roof"]) {
      params.roof_material = sim_physics::parse_roof_material(
          read_value<std::string>(node["roof"], "building.materials.roof"));
    }
  } catch (const ConfigurationError &e) {
    throw ConfigurationError("[CONFIG] building.materials: " +
                             std::string(e.what()));
  }
}

// "[BuildingEnvelope] roof_pitch: ..." -> "[CONFIG] building.roof_pitch: ..."
std::string building_key_error(const std::string &envelope_msg) {
  static const std::string kPrefix = "[BuildingEnvelope] ";
  if (envelope_msg.compare(0, kPrefix.size(), kPrefix) == 0) {
    const std::string rest = envelope_msg.substr(kPrefix.size());
    const auto colon = rest.find(':');
    if (colon != std::string::npos && colon > 0 &&
        rest.find(' ') > colon) {
      return "[CONFIG] building." + rest;
    }
  }
  return "[CONFIG] building: " + envelope_msg;
}

sim_control::ControllerSpec parse_controller(const YAML::Node &node) {
  sim_control::ControllerSpec spec;
  if (!node) {
    return spec;
  }
  if (!node.IsMap()) {
    throw ConfigurationError("[CONFIG] 'controller' section must be a map");
  }
  check_keys(node, "controller", {"type", "kp", "ki", "kd", "dt_h"});

  if (node["type"]) {
    try {
      spec.type = sim_control::parse_controller_type(
          read_value<std::string>(node["type"], "controller.type"));
    } catch (const ConfigurationError &e) {
      throw ConfigurationError("[CONFIG] controller.type: " +
                               std::string(e.what()));
    }
  }

  read_optional(node, "kp", "controller", spec.gains.kp);
  read_optional(node, "ki", "controller", spec.gains.ki);
  read_optional(node, "kd", "controller", spec.gains.kd);
  read_optional(node, "dt_h", "controller", spec.dt_h);

  // dt_h is the simulation step for every controller type
  if (spec.type == sim_control::ControllerType::OnOff &&
      (node["kp"] || node["ki"] || node["kd"])) {
    throw ConfigurationError("[CONFIG] controller.type=on_off cannot have PID "
                             "gains (prevents silently ignored config)");
  }
  if (!std::isfinite(spec.dt_h) || spec.dt_h <= 0.0) {
    throw ConfigurationError("[CONFIG] controller.dt_h: must be > 0.0");
  }
  return spec;
}

sim_engine::HeatPumpSpec parse_heat_pump(const YAML::Node &node) {
  check_keys(node, "heat_pump", {"cop", "min_heat_kw", "max_heat_kw"});

  sim_engine::HeatPumpSpec spec;
  spec.cop = read_required<double>(node, "cop", "heat_pump");
  spec.min_heat_kw = read_required<double>(node, "min_heat_kw", "heat_pump");
  spec.max_heat_kw = read_required<double>(node, "max_heat_kw", "heat_pump");

  if (spec.cop <= 0.0) {
    throw ConfigurationError("[CONFIG] heat_pump.cop: must be > 0.0");
  }
  if (spec.min_heat_kw > spec.max_heat_kw) {
    throw ConfigurationError(
        "[CONFIG] heat_pump.min_heat_kw: must be <= heat_pump.max_heat_kw");
  }
  return spec;
}

SimulationSpec parse_simulation(const YAML::Node &node) {
  check_keys(node, "simulation",
             {"initial_inside_temp", "outside_temps", "setpoints", "setpoint"});

  SimulationSpec spec;
  spec.initial_inside_temp =
      read_required<double>(node, "initial_inside_temp", "simulation");

  if (!node["outside_temps"]) {
    throw ConfigurationError(
        "[CONFIG] Missing required 'simulation.outside_temps'");
  }
  spec.outside_temps =
      read_series(node["outside_temps"], "simulation.outside_temps");

  if (node["setpoints"] && node["setpoint"]) {
    throw ConfigurationError("[CONFIG] simulation.setpoints and "
                             "simulation.setpoint are mutually exclusive");
  }
  if (node["setpoints"]) {
    spec.setpoints = read_series(node["setpoints"], "simulation.setpoints");
  } else if (node["setpoint"]) {
    // Constant schedule over the whole horizon
    double setpoint = read_value<double>(node["setpoint"], "simulation.setpoint");
    spec.setpoints.assign(sim_engine::kHorizonHours, setpoint);
  } else {
    throw ConfigurationError(
        "[CONFIG] Missing required 'simulation.setpoints' or "
        "'simulation.setpoint'");
  }
  return spec;
}

} // namespace

sim_physics::EnvelopeParams parse_building(const YAML::Node &node) {
  if (!node.IsMap()) {
    throw ConfigurationError("[CONFIG] 'building' section must be a map");
  }
  check_keys(node, "building",
             {"length", "width", "wall_height", "roof_type", "roof_pitch",
              "glazing_ratio", "num_windows", "num_doors", "u_values",
              "ventilation_rate", "air_leakage_rate", "materials"});

  sim_physics::EnvelopeParams params;
  params.length = read_required<double>(node, "length", "building");
  params.width = read_required<double>(node, "width", "building");
  params.wall_height = read_required<double>(node, "wall_height", "building");

  try {
    params.roof_type = sim_physics::parse_roof_type(
        read_required<std::string>(node, "roof_type", "building"));
  } catch (const ConfigurationError &e) {
    throw ConfigurationError("[CONFIG] building.roof_type: " +
                             std::string(e.what()));
  }
  read_optional(node, "roof_pitch", "building", params.roof_pitch);

  params.glazing_ratio =
      read_required<double>(node, "glazing_ratio", "building");
  params.num_windows = read_required<int>(node, "num_windows", "building");
  params.num_doors = read_required<int>(node, "num_doors", "building");

  if (node["u_values"]) {
    parse_u_values(node["u_values"], params.u_values);
  }
  read_optional(node, "ventilation_rate", "building", params.ventilation_rate);
  read_optional(node, "air_leakage_rate", "building", params.air_leakage_rate);
  if (node["materials"]) {
    parse_materials(node["materials"], params);
  }

  // Geometry validation lives with the envelope; its messages name the
  // offending parameter, which maps onto the building.* key path
  try {
    sim_physics::BuildingEnvelope envelope(params);
  } catch (const ConfigurationError &e) {
    throw ConfigurationError(building_key_error(e.what()));
  }

  return params;
}

ScenarioConfig parse_scenario(const YAML::Node &yaml) {
  if (!yaml.IsMap()) {
    throw ConfigurationError("[CONFIG] Scenario document must be a map");
  }
  check_keys(yaml, "scenario",
             {"building", "controller", "heat_pump", "simulation"});

  ScenarioConfig config;
  config.building = parse_building(require_map(yaml, "building", "building"));
  config.controller = parse_controller(yaml["controller"]);
  config.heat_pump =
      parse_heat_pump(require_map(yaml, "heat_pump", "heat_pump"));
  config.simulation =
      parse_simulation(require_map(yaml, "simulation", "simulation"));

  // Startup validation: gains, dt and limits must yield a usable controller
  try {
    sim_control::create_controller(config.controller,
                                   config.heat_pump.min_heat_kw,
                                   config.heat_pump.max_heat_kw);
  } catch (const ConfigurationError &e) {
    throw ConfigurationError("[CONFIG] controller: " +
                             std::string(e.what()));
  }

  return config;
}

sim_engine::Simulator make_simulator(const ScenarioConfig &config) {
  return sim_engine::Simulator(sim_physics::BuildingEnvelope(config.building),
                               config.heat_pump, config.controller.dt_h);
}

std::unique_ptr<sim_control::Controller>
make_controller(const ScenarioConfig &config) {
  return sim_control::create_controller(config.controller,
                                        config.heat_pump.min_heat_kw,
                                        config.heat_pump.max_heat_kw);
}

ScenarioConfig load_scenario(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigurationError("[CONFIG] Failed to load scenario file '" + path +
                             "': " + e.what());
  }

  ScenarioConfig config = parse_scenario(yaml);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

} // namespace building_sim
