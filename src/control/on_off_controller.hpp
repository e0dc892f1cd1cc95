#pragma once

#include "control/controller.hpp"

namespace sim_control {

// Bang-bang thermostat: full output below setpoint, minimum output otherwise
class OnOffController : public Controller {
public:
  OnOffController(double min_output, double max_output);

  double step(double setpoint, double measured) override;

  std::string kind() const override { return "on_off"; }
  double min_output() const override { return min_output_; }
  double max_output() const override { return max_output_; }

private:
  double min_output_;
  double max_output_;
};

} // namespace sim_control
