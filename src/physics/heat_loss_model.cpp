#include "physics/heat_loss_model.hpp"

#include "errors.hpp"

#include <cmath>

namespace sim_physics {

namespace {

ThermalBridgeSet derive_bridges(const BuildingEnvelope &env) {
  const double length = env.length();
  const double width = env.width();
  const double perimeter = 2.0 * (length + width);

  // Square panes of equal size
  double window_length = 0.0;
  if (env.num_windows() > 0) {
    const double side = std::sqrt(env.window_area() / env.num_windows());
    window_length = 4.0 * side * env.num_windows();
  }

  double roof_length = perimeter;
  switch (env.roof_type()) {
  case RoofType::Flat:
  case RoofType::Shed:
    roof_length = perimeter;
    break;
  case RoofType::Gable:
    roof_length = perimeter + length;
    break;
  case RoofType::Hip:
    roof_length =
        perimeter + 4.0 * std::sqrt(std::pow(length / 2.0, 2.0) +
                                    std::pow(width / 2.0, 2.0));
    break;
  }

  ThermalBridgeSet bridges;
  bridges[BridgeCategory::Window] = {psi_value(BridgeCategory::Window),
                                     window_length};
  bridges[BridgeCategory::Door] = {psi_value(BridgeCategory::Door),
                                   2.0 * (kDoorHeight + kDoorWidth) *
                                       env.num_doors()};
  bridges[BridgeCategory::Floor] = {psi_value(BridgeCategory::Floor),
                                    perimeter};
  bridges[BridgeCategory::Corner] = {psi_value(BridgeCategory::Corner),
                                     4.0 * env.total_height()};
  bridges[BridgeCategory::Roof] = {psi_value(BridgeCategory::Roof),
                                   roof_length};
  return bridges;
}

} // namespace

std::string to_string(BridgeCategory category) {
  switch (category) {
  case BridgeCategory::Window:
    return "window";
  case BridgeCategory::Door:
    return "door";
  case BridgeCategory::Floor:
    return "floor";
  case BridgeCategory::Corner:
    return "corner";
  case BridgeCategory::Roof:
    return "roof";
  }
  throw building_sim::ConfigurationError(
      "[HeatLossModel] Invalid bridge category #" +
      std::to_string(static_cast<int>(category)));
}

double psi_value(BridgeCategory category) {
  switch (category) {
  case BridgeCategory::Window:
    return 0.03;
  case BridgeCategory::Door:
    return 0.03;
  case BridgeCategory::Floor:
    return 0.07;
  case BridgeCategory::Corner:
    return 0.04;
  case BridgeCategory::Roof:
    return 0.06;
  }
  throw building_sim::ConfigurationError(
      "[HeatLossModel] Invalid bridge category #" +
      std::to_string(static_cast<int>(category)));
}

HeatLossModel::HeatLossModel(const BuildingEnvelope &envelope)
    : envelope_(envelope), bridges_(derive_bridges(envelope)) {}

double HeatLossModel::ventilation_flow() const {
  return envelope_.ventilation_rate() * envelope_.floor_area();
}

double HeatLossModel::infiltration_flow() const {
  return envelope_.air_leakage_rate() * envelope_.total_volume();
}

TransmissionLoss HeatLossModel::transmission(double delta_t) const {
  TransmissionLoss loss;
  loss.wall_w = envelope_.u_values().wall * envelope_.wall_area() * delta_t;
  loss.roof_w = envelope_.u_values().roof * envelope_.roof_area() * delta_t;
  loss.door_w = envelope_.u_values().door * envelope_.door_area() * delta_t;
  loss.floor_w = envelope_.u_values().floor * envelope_.floor_area() * delta_t;

  // Window transmission is not part of the sum; window area only enters
  // through the window thermal bridge.
  loss.total_w = loss.wall_w + loss.roof_w + loss.door_w + loss.floor_w;
  loss.total_kwh_h = loss.total_w / 1000.0;
  return loss;
}

VentilationLoss HeatLossModel::ventilation(double delta_t) const {
  VentilationLoss loss;
  loss.ventilation_w =
      ventilation_flow() * kAirSpecificHeat * kAirDensity * delta_t;
  loss.infiltration_w =
      infiltration_flow() * kAirSpecificHeat * kAirDensity * delta_t;
  loss.total_w = loss.ventilation_w + loss.infiltration_w;
  // Flows are per hour, so the product is J/h
  loss.total_kwh_h = loss.total_w / 3600000.0;
  return loss;
}

ThermalBridgeLoss HeatLossModel::thermal_bridge_loss(double delta_t) const {
  ThermalBridgeLoss loss;
  for (const auto &[category, bridge] : bridges_) {
    const double w = bridge.psi * bridge.length * delta_t;
    loss.breakdown_w[category] = w;
    loss.total_w += w;
  }
  loss.total_kwh_h = loss.total_w / 1000.0;
  return loss;
}

double HeatLossModel::total_heat_loss(double delta_t) const {
  return transmission(delta_t).total_kwh_h + ventilation(delta_t).total_kwh_h +
         thermal_bridge_loss(delta_t).total_kwh_h;
}

HeatLossBreakdown HeatLossModel::breakdown(double delta_t) const {
  HeatLossBreakdown result;
  result.delta_t = delta_t;
  result.transmission = transmission(delta_t);
  result.ventilation = ventilation(delta_t);
  result.thermal_bridges = thermal_bridge_loss(delta_t);
  result.total_kwh_h = result.transmission.total_kwh_h +
                       result.ventilation.total_kwh_h +
                       result.thermal_bridges.total_kwh_h;
  return result;
}

} // namespace sim_physics
