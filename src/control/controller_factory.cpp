#include "control/controller_factory.hpp"

#include "control/controller.hpp"
#include "control/on_off_controller.hpp"
#include "control/pid_controller.hpp"
#include "errors.hpp"

#include <memory>

namespace sim_control {

ControllerType parse_controller_type(const std::string &type_str) {
  if (type_str == "pid") {
    return ControllerType::Pid;
  } else if (type_str == "on_off") {
    return ControllerType::OnOff;
  } else {
    throw building_sim::ConfigurationError(
        "[ControllerFactory] Invalid controller type: '" + type_str +
        "'. Valid values: pid, on_off");
  }
}

std::string to_string(ControllerType type) {
  switch (type) {
  case ControllerType::Pid:
    return "pid";
  case ControllerType::OnOff:
    return "on_off";
  }
  throw building_sim::ConfigurationError(
      "[ControllerFactory] Invalid controller type #" +
      std::to_string(static_cast<int>(type)));
}

std::unique_ptr<Controller> create_controller(const ControllerSpec &spec,
                                              double min_output,
                                              double max_output) {
  switch (spec.type) {
  case ControllerType::Pid:
    return std::make_unique<PidController>(spec.gains, spec.dt_h, min_output,
                                           max_output);
  case ControllerType::OnOff:
    return std::make_unique<OnOffController>(min_output, max_output);
  }

  throw building_sim::ConfigurationError(
      "[ControllerFactory] Unknown controller type #" +
      std::to_string(static_cast<int>(spec.type)));
}

} // namespace sim_control
