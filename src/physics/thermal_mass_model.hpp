#pragma once

#include "physics/building_envelope.hpp"

namespace sim_physics {

// Lumped thermal mass of a building
// Aggregates envelope heat capacities and indoor air into one capacity
//
// Parameters (from the envelope):
//   - wall/floor/roof area (m2) and material tags
//   - total_volume (m3) for the air term
//
// Physics:
//   C = A_wall * c_wall + A_floor * c_floor + A_roof * c_roof
//       + V * rho_air * c_air
//   c_* in kJ/(m2*K) from the material tables, C reported in kWh/K
class ThermalMassModel {
public:
  // Throws building_sim::ConfigurationError if a material has no table
  // entry or the resulting capacity is not a finite positive number
  explicit ThermalMassModel(const BuildingEnvelope &envelope);

  // Effective capacity (kWh/K)
  double effective_thermal_mass() const { return thermal_mass_kwh_k_; }

  // Per-component capacities (J/K)
  double wall_capacity_j_k() const { return wall_j_k_; }
  double floor_capacity_j_k() const { return floor_j_k_; }
  double roof_capacity_j_k() const { return roof_j_k_; }
  double air_capacity_j_k() const { return air_j_k_; }

private:
  double wall_j_k_;
  double floor_j_k_;
  double roof_j_k_;
  double air_j_k_;

  double thermal_mass_kwh_k_;
};

} // namespace sim_physics
