#pragma once

#include "physics/building_envelope.hpp"

#include <map>
#include <string>

namespace sim_physics {

// Junction categories with a linear heat-loss coefficient
enum class BridgeCategory { Window, Door, Floor, Corner, Roof };

std::string to_string(BridgeCategory category);

// Fixed psi-value per category, W/(m*K) (TEK17)
double psi_value(BridgeCategory category);

struct ThermalBridge {
  double psi;    // W/(m*K)
  double length; // m
};

using ThermalBridgeSet = std::map<BridgeCategory, ThermalBridge>;

struct TransmissionLoss {
  double wall_w = 0.0;
  double roof_w = 0.0;
  double door_w = 0.0;
  double floor_w = 0.0;
  double total_w = 0.0;
  double total_kwh_h = 0.0;
};

struct VentilationLoss {
  double ventilation_w = 0.0;
  double infiltration_w = 0.0;
  double total_w = 0.0;
  double total_kwh_h = 0.0;
};

struct ThermalBridgeLoss {
  std::map<BridgeCategory, double> breakdown_w;
  double total_w = 0.0;
  double total_kwh_h = 0.0;
};

struct HeatLossBreakdown {
  double delta_t = 0.0;
  TransmissionLoss transmission;
  VentilationLoss ventilation;
  ThermalBridgeLoss thermal_bridges;
  double total_kwh_h = 0.0;
};

// Steady-state heat loss of a building envelope
//
// All losses are linear in delta_t = T_inside - T_outside. A negative
// delta_t yields a negative loss (passive gain).
//
//   transmission: sum of U * A * dT over wall, roof, door, floor
//   ventilation:  (vent_rate * A_floor + leak_rate * V) * c_air * rho_air * dT
//   bridges:      sum of psi * length * dT over the bridge set
class HeatLossModel {
public:
  explicit HeatLossModel(const BuildingEnvelope &envelope);

  const BuildingEnvelope &envelope() const { return envelope_; }

  double ventilation_flow() const;
  double infiltration_flow() const;

  TransmissionLoss transmission(double delta_t) const;
  VentilationLoss ventilation(double delta_t) const;

  const ThermalBridgeSet &estimate_thermal_bridges() const { return bridges_; }
  ThermalBridgeLoss thermal_bridge_loss(double delta_t) const;

  // Combined loss in kWh/h
  double total_heat_loss(double delta_t) const;

  HeatLossBreakdown breakdown(double delta_t) const;

private:
  BuildingEnvelope envelope_;
  ThermalBridgeSet bridges_;
};

} // namespace sim_physics
