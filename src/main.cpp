#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hpp"
#include "control/controller.hpp"
#include "errors.hpp"
#include "physics/heat_loss_model.hpp"
#include "physics/materials.hpp"
#include "simulation/simulator.hpp"

static void log_err(const std::string &msg) {
  std::cerr << "building-sim: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: building-sim --config <path/to/scenario.yaml> [--summary] "
          "[--breakdown <dT>]... | --list-materials");
}

static void print_tags(const char *category,
                       const std::vector<std::string> &tags) {
  std::cout << category << ":";
  for (const auto &tag : tags) {
    std::cout << " " << tag;
  }
  std::cout << "\n";
}

static void print_breakdown(const sim_physics::HeatLossBreakdown &b) {
  std::cout << std::fixed << std::setprecision(3);
  std::cout << "Heat loss breakdown (dT = " << b.delta_t << " K) in kWh/h:\n";

  std::cout << "Transmission Losses:\n"
            << "  wall: " << b.transmission.wall_w / 1000.0 << "\n"
            << "  roof: " << b.transmission.roof_w / 1000.0 << "\n"
            << "  door: " << b.transmission.door_w / 1000.0 << "\n"
            << "  floor: " << b.transmission.floor_w / 1000.0 << "\n"
            << "  Total: " << b.transmission.total_kwh_h << "\n";

  std::cout << "Ventilation Losses:\n"
            << "  Ventilation: " << b.ventilation.ventilation_w / 3600000.0
            << "\n"
            << "  Infiltration: " << b.ventilation.infiltration_w / 3600000.0
            << "\n"
            << "  Total: " << b.ventilation.total_kwh_h << "\n";

  std::cout << "Thermal Bridge Losses:\n";
  for (const auto &[category, watts] : b.thermal_bridges.breakdown_w) {
    std::cout << "  " << sim_physics::to_string(category) << ": "
              << watts / 1000.0 << "\n";
  }
  std::cout << "  Total: " << b.thermal_bridges.total_kwh_h << "\n";
  std::cout << "Total: " << b.total_kwh_h << " kWh/h\n\n";
}

static void print_trace(const building_sim::SimulationSpec &sim,
                        const sim_engine::SimulationTrace &trace) {
  std::cout << std::fixed << std::setprecision(3);
  std::cout << std::setw(4) << "hour" << std::setw(10) << "outside"
            << std::setw(10) << "setpoint" << std::setw(10) << "inside"
            << std::setw(12) << "heat_kW" << std::setw(12) << "loss_kWh/h"
            << std::setw(12) << "elec_kWh" << "\n";

  for (std::size_t h = 0; h < trace.hours(); ++h) {
    std::cout << std::setw(4) << h << std::setw(10) << sim.outside_temps[h]
              << std::setw(10) << sim.setpoints[h] << std::setw(10)
              << trace.inside_temps[h] << std::setw(12)
              << trace.heating_power[h] << std::setw(12) << trace.heat_loss[h]
              << std::setw(12) << trace.electrical_energy[h] << "\n";
  }
  std::cout << std::setw(4) << trace.hours() << std::setw(30)
            << trace.inside_temps.back() << "\n";
}

int main(int argc, char **argv) {
  // Parse command-line arguments
  std::optional<std::string> config_path;
  std::vector<double> breakdown_delta_ts;
  bool show_summary = false;
  bool list_materials = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--breakdown" && i + 1 < argc) {
      try {
        breakdown_delta_ts.push_back(std::stod(argv[++i]));
      } catch (const std::exception &) {
        log_err("invalid --breakdown value");
        return 1;
      }
    } else if (arg == "--summary") {
      show_summary = true;
    } else if (arg == "--list-materials") {
      list_materials = true;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return 1;
    }
  }

  if (list_materials) {
    print_tags("wall", sim_physics::wall_material_tags());
    print_tags("floor", sim_physics::floor_material_tags());
    print_tags("roof", sim_physics::roof_material_tags());
    return 0;
  }

  // Require configuration file
  if (!config_path) {
    log_err("FATAL: --config argument is required");
    print_usage();
    return 1;
  }

  try {
    log_err("loading scenario from: " + *config_path);
    building_sim::ScenarioConfig config =
        building_sim::load_scenario(*config_path);

    sim_physics::BuildingEnvelope building(config.building);
    sim_engine::Simulator simulator = building_sim::make_simulator(config);

    log_err("effective thermal mass: " +
            std::to_string(
                simulator.thermal_mass_model().effective_thermal_mass()) +
            " kWh/K");

    if (show_summary) {
      std::cout << building.summary() << "\n\n";
    }
    for (double delta_t : breakdown_delta_ts) {
      print_breakdown(simulator.heat_loss_model().breakdown(delta_t));
    }

    // Fresh controller per run
    std::unique_ptr<sim_control::Controller> controller =
        building_sim::make_controller(config);

    sim_engine::SimulationTrace trace = simulator.simulate_heating(
        config.simulation.outside_temps, config.simulation.setpoints,
        config.simulation.initial_inside_temp, *controller);

    print_trace(config.simulation, trace);
  } catch (const building_sim::ConfigurationError &e) {
    log_err("FATAL: " + std::string(e.what()));
    return 1;
  } catch (const building_sim::ValidationError &e) {
    log_err("FATAL: " + std::string(e.what()));
    return 2;
  } catch (const YAML::Exception &e) {
    log_err("FATAL: malformed scenario: " + std::string(e.what()));
    return 1;
  }

  return 0;
}
