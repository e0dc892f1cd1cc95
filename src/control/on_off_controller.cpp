#include "control/on_off_controller.hpp"

#include "errors.hpp"

#include <cmath>

namespace sim_control {

OnOffController::OnOffController(double min_output, double max_output)
    : min_output_(min_output), max_output_(max_output) {
  if (!std::isfinite(min_output_) || !std::isfinite(max_output_)) {
    throw building_sim::ConfigurationError(
        "[OnOffController] output limits must be finite");
  }
  if (min_output_ > max_output_) {
    throw building_sim::ConfigurationError(
        "[OnOffController] min_output must be <= max_output");
  }
}

double OnOffController::step(double setpoint, double measured) {
  return measured < setpoint ? max_output_ : min_output_;
}

} // namespace sim_control
