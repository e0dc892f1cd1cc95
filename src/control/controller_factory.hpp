#pragma once

#include "control/controller.hpp"
#include "control/pid_controller.hpp"

#include <memory>
#include <string>

namespace sim_control {

enum class ControllerType { Pid, OnOff };

// Throws building_sim::ConfigurationError for anything but pid | on_off
ControllerType parse_controller_type(const std::string &type_str);
std::string to_string(ControllerType type);

// Controller tuning; gains are ignored by on_off. dt_h is also the
// simulation step length.
struct ControllerSpec {
  ControllerType type = ControllerType::Pid;
  PidGains gains;
  double dt_h = 1.0;
};

// Build a fresh controller. Call once per simulation run.
std::unique_ptr<Controller> create_controller(const ControllerSpec &spec,
                                              double min_output,
                                              double max_output);

} // namespace sim_control
