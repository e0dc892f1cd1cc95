#include "control/pid_controller.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>

namespace sim_control {

using building_sim::ConfigurationError;

PidController::PidController(const PidGains &gains, double dt,
                             double min_output, double max_output)
    : gains_(gains), dt_(dt), min_output_(min_output),
      max_output_(max_output) {
  if (!std::isfinite(gains_.kp) || !std::isfinite(gains_.ki) ||
      !std::isfinite(gains_.kd)) {
    throw ConfigurationError("[PidController] gains must be finite");
  }
  if (!std::isfinite(dt_) || dt_ <= 0.0) {
    throw ConfigurationError("[PidController] dt must be > 0.0");
  }
  if (!std::isfinite(min_output_) || !std::isfinite(max_output_)) {
    throw ConfigurationError("[PidController] output limits must be finite");
  }
  if (min_output_ > max_output_) {
    throw ConfigurationError(
        "[PidController] min_output must be <= max_output");
  }
}

double PidController::step(double setpoint, double measured) {
  const double error = setpoint - measured;
  state_.integral += error * dt_;

  const double derivative = (error - state_.previous_error) / dt_;

  const double output = gains_.kp * error + gains_.ki * state_.integral +
                        gains_.kd * derivative;

  state_.previous_error = error;
  return std::max(std::min(output, max_output_), min_output_);
}

} // namespace sim_control
