#pragma once

#include "physics/building_envelope.hpp"
#include "physics/heat_loss_model.hpp"
#include "physics/thermal_mass_model.hpp"
#include "simulation/simulation_trace.hpp"

#include <cstddef>
#include <vector>

namespace sim_control {
class Controller;
}

namespace sim_engine {

// Fixed simulation horizon (hours)
constexpr std::size_t kHorizonHours = 24;

// Heat pump actuator
struct HeatPumpSpec {
  double cop = 3.5;
  double min_heat_kw = 0.0;
  double max_heat_kw = 5.0;
};

// Closed-loop indoor temperature simulation
//
// Per hour h:
//   dT        = T_in[h] - T_out[h]
//   Q_loss    = heat_loss.total_heat_loss(dT)            (kWh/h)
//   Q_heating = controller.step(setpoint[h], T_in[h])     (kW)
//   T_in[h+1] = T_in[h] + (Q_heating - Q_loss) * dt / C   (C in kWh/K)
//   E_el[h]   = Q_heating / COP
//
// The simulator owns its models; the controller is owned by the caller and
// carries its state across every step of the run. The controller must be
// built with the heat pump's output limits and, for PID, the same dt.
class Simulator {
public:
  // Throws building_sim::ConfigurationError for COP <= 0, min > max,
  // dt <= 0, a zero horizon, or a building with unusable thermal mass
  Simulator(const sim_physics::BuildingEnvelope &building,
            const HeatPumpSpec &heat_pump, double dt_h = 1.0,
            std::size_t horizon_hours = kHorizonHours);

  // One step of the recurrence
  // Throws building_sim::ConfigurationError if the controller's output
  // limits differ from the heat pump's
  StepResult step(double setpoint, double inside_temp, double outside_temp,
                  sim_control::Controller &controller) const;

  // Throws building_sim::ValidationError if either series does not hold
  // exactly horizon_hours() samples or holds a non-finite value, and
  // building_sim::ConfigurationError for a mismatched controller
  SimulationTrace simulate_heating(const std::vector<double> &outside_temps,
                                   const std::vector<double> &setpoints,
                                   double initial_inside_temp,
                                   sim_control::Controller &controller) const;

  const sim_physics::HeatLossModel &heat_loss_model() const {
    return heat_loss_;
  }
  const sim_physics::ThermalMassModel &thermal_mass_model() const {
    return thermal_mass_;
  }
  const HeatPumpSpec &heat_pump() const { return heat_pump_; }
  double dt_h() const { return dt_h_; }
  std::size_t horizon_hours() const { return horizon_hours_; }

private:
  void check_controller(const sim_control::Controller &controller) const;

  sim_physics::HeatLossModel heat_loss_;
  sim_physics::ThermalMassModel thermal_mass_;
  HeatPumpSpec heat_pump_;
  double dt_h_;
  std::size_t horizon_hours_;
};

// Single-call form over the fixed 24-hour horizon
// dt_h is the step length and must match the controller's timestep
SimulationTrace simulate_heating(const std::vector<double> &outside_temps,
                                 const std::vector<double> &setpoints,
                                 double initial_inside_temp,
                                 sim_control::Controller &controller,
                                 const sim_physics::BuildingEnvelope &building,
                                 const HeatPumpSpec &heat_pump,
                                 double dt_h = 1.0);

} // namespace sim_engine
