#include "simulation/simulator.hpp"

#include "control/controller.hpp"
#include "errors.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace sim_engine {

using building_sim::ConfigurationError;
using building_sim::ValidationError;

namespace {

void validate_series(const std::vector<double> &series, const char *name,
                     std::size_t expected) {
  if (series.size() != expected) {
    throw ValidationError("[Simulator] " + std::string(name) + " must have " +
                          std::to_string(expected) + " values (got " +
                          std::to_string(series.size()) + ")");
  }
  for (std::size_t i = 0; i < series.size(); ++i) {
    if (!std::isfinite(series[i])) {
      throw ValidationError("[Simulator] " + std::string(name) + "[" +
                            std::to_string(i) + "] is not a finite number");
    }
  }
}

} // namespace

Simulator::Simulator(const sim_physics::BuildingEnvelope &building,
                     const HeatPumpSpec &heat_pump, double dt_h,
                     std::size_t horizon_hours)
    : heat_loss_(building), thermal_mass_(building), heat_pump_(heat_pump),
      dt_h_(dt_h), horizon_hours_(horizon_hours) {
  if (!std::isfinite(heat_pump_.cop) || heat_pump_.cop <= 0.0) {
    throw ConfigurationError("[Simulator] heat pump COP must be > 0.0");
  }
  if (!std::isfinite(heat_pump_.min_heat_kw) ||
      !std::isfinite(heat_pump_.max_heat_kw) ||
      heat_pump_.min_heat_kw > heat_pump_.max_heat_kw) {
    throw ConfigurationError(
        "[Simulator] heat pump min_heat_kw must be <= max_heat_kw");
  }
  if (!std::isfinite(dt_h_) || dt_h_ <= 0.0) {
    throw ConfigurationError("[Simulator] dt_h must be > 0.0");
  }
  if (horizon_hours_ == 0) {
    throw ConfigurationError("[Simulator] horizon must be at least one hour");
  }
}

void Simulator::check_controller(
    const sim_control::Controller &controller) const {
  if (controller.min_output() != heat_pump_.min_heat_kw ||
      controller.max_output() != heat_pump_.max_heat_kw) {
    throw ConfigurationError(
        "[Simulator] " + controller.kind() + " controller limits [" +
        std::to_string(controller.min_output()) + ", " +
        std::to_string(controller.max_output()) +
        "] kW do not match heat pump limits [" +
        std::to_string(heat_pump_.min_heat_kw) + ", " +
        std::to_string(heat_pump_.max_heat_kw) + "] kW");
  }
}

StepResult Simulator::step(double setpoint, double inside_temp,
                           double outside_temp,
                           sim_control::Controller &controller) const {
  check_controller(controller);

  const double delta_t = inside_temp - outside_temp;

  StepResult result;
  result.heat_loss_kwh_h = heat_loss_.total_heat_loss(delta_t);
  result.heating_power_kw = controller.step(setpoint, inside_temp);

  // A negative loss (outdoor warmer than indoor) enters as a passive gain
  const double q_net = result.heating_power_kw - result.heat_loss_kwh_h;
  const double temp_change =
      (q_net * dt_h_) / thermal_mass_.effective_thermal_mass();

  result.new_temperature = inside_temp + temp_change;
  result.electrical_energy_kwh = result.heating_power_kw / heat_pump_.cop;
  return result;
}

SimulationTrace
Simulator::simulate_heating(const std::vector<double> &outside_temps,
                            const std::vector<double> &setpoints,
                            double initial_inside_temp,
                            sim_control::Controller &controller) const {
  check_controller(controller);
  validate_series(outside_temps, "outside_temps", horizon_hours_);
  validate_series(setpoints, "setpoints", horizon_hours_);
  if (!std::isfinite(initial_inside_temp)) {
    throw ValidationError(
        "[Simulator] initial inside temperature is not a finite number");
  }

  std::cerr << "[Simulator] Starting run (hours=" << horizon_hours_
            << ", dt=" << dt_h_ << " h, initial=" << initial_inside_temp
            << " C, controller=" << controller.kind() << ")" << std::endl;

  SimulationTrace trace;
  trace.inside_temps.reserve(horizon_hours_ + 1);
  trace.electrical_energy.reserve(horizon_hours_);
  trace.heating_power.reserve(horizon_hours_);
  trace.heat_loss.reserve(horizon_hours_);

  trace.inside_temps.push_back(initial_inside_temp);

  double total_heat = 0.0;
  double total_electric = 0.0;
  for (std::size_t hour = 0; hour < horizon_hours_; ++hour) {
    const StepResult r = step(setpoints[hour], trace.inside_temps.back(),
                              outside_temps[hour], controller);

    trace.inside_temps.push_back(r.new_temperature);
    trace.electrical_energy.push_back(r.electrical_energy_kwh);
    trace.heating_power.push_back(r.heating_power_kw);
    trace.heat_loss.push_back(r.heat_loss_kwh_h);

    total_heat += r.heating_power_kw * dt_h_;
    total_electric += r.electrical_energy_kwh;
  }

  std::ostringstream summary;
  summary << std::fixed << std::setprecision(2)
          << "[Simulator] Run complete (final=" << trace.inside_temps.back()
          << " C, heat=" << total_heat << " kWh, electric=" << total_electric
          << " kWh)";
  std::cerr << summary.str() << std::endl;

  return trace;
}

SimulationTrace simulate_heating(const std::vector<double> &outside_temps,
                                 const std::vector<double> &setpoints,
                                 double initial_inside_temp,
                                 sim_control::Controller &controller,
                                 const sim_physics::BuildingEnvelope &building,
                                 const HeatPumpSpec &heat_pump,
                                 double dt_h) {
  Simulator simulator(building, heat_pump, dt_h);
  return simulator.simulate_heating(outside_temps, setpoints,
                                    initial_inside_temp, controller);
}

} // namespace sim_engine
