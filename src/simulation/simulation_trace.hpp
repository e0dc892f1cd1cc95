#pragma once

#include <cstddef>
#include <vector>

namespace sim_engine {

// Outcome of one heating step
struct StepResult {
  double electrical_energy_kwh = 0.0;
  double new_temperature = 0.0; // C
  double heating_power_kw = 0.0;
  double heat_loss_kwh_h = 0.0;
};

// Hourly trajectory of one run
// inside_temps has one more sample than the per-hour series: the initial
// temperature followed by the temperature at the end of every hour.
struct SimulationTrace {
  std::vector<double> inside_temps;
  std::vector<double> electrical_energy; // kWh
  std::vector<double> heating_power;     // kW
  std::vector<double> heat_loss;         // kWh/h

  std::size_t hours() const { return heating_power.size(); }
};

} // namespace sim_engine
