#pragma once

#include <string>

namespace sim_control {

// Abstract interface for heating controllers
// One instance drives exactly one simulation run; its state is never shared
class Controller {
public:
  virtual ~Controller() = default;

  // Heating command (kW) for one step, within [min_output(), max_output()]
  virtual double step(double setpoint, double measured) = 0;

  virtual std::string kind() const = 0;
  virtual double min_output() const = 0;
  virtual double max_output() const = 0;
};

} // namespace sim_control
