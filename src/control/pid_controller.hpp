#pragma once

#include "control/controller.hpp"

namespace sim_control {

struct PidGains {
  double kp = 10.0;
  double ki = 0.05;
  double kd = 5.0;
};

struct PidState {
  double integral = 0.0;
  double previous_error = 0.0;
};

// PID feedback controller with output saturation
//
//   e      = setpoint - measured
//   I     += e * dt
//   D      = (e - e_prev) / dt
//   u      = clamp(Kp * e + Ki * I + Kd * D, min_output, max_output)
//
// The integral keeps accumulating while the output is saturated
// (no anti-windup).
class PidController : public Controller {
public:
  // Throws building_sim::ConfigurationError if dt <= 0, min > max, or any
  // gain or limit is not finite
  PidController(const PidGains &gains, double dt, double min_output,
                double max_output);

  double step(double setpoint, double measured) override;

  std::string kind() const override { return "pid"; }
  double min_output() const override { return min_output_; }
  double max_output() const override { return max_output_; }

  const PidGains &gains() const { return gains_; }
  double dt() const { return dt_; }
  const PidState &state() const { return state_; }

private:
  PidGains gains_;
  double dt_;
  double min_output_;
  double max_output_;

  PidState state_;
};

} // namespace sim_control
