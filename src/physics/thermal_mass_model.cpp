#include "physics/thermal_mass_model.hpp"

#include "errors.hpp"

#include <cmath>

namespace sim_physics {

ThermalMassModel::ThermalMassModel(const BuildingEnvelope &envelope)
    : wall_j_k_(envelope.wall_area() *
                heat_capacity_kj_m2k(envelope.wall_material()) * 1000.0),
      floor_j_k_(envelope.floor_area() *
                 heat_capacity_kj_m2k(envelope.floor_material()) * 1000.0),
      roof_j_k_(envelope.roof_area() *
                heat_capacity_kj_m2k(envelope.roof_material()) * 1000.0),
      air_j_k_(envelope.total_volume() * kAirDensity * kAirSpecificHeat),
      thermal_mass_kwh_k_(0.0) {
  const double total_j_k = air_j_k_ + wall_j_k_ + floor_j_k_ + roof_j_k_;
  thermal_mass_kwh_k_ = total_j_k / 3600000.0;

  // The simulator divides by this value every step
  if (!std::isfinite(thermal_mass_kwh_k_) || thermal_mass_kwh_k_ <= 0.0) {
    throw building_sim::ConfigurationError(
        "[ThermalMassModel] thermal mass must be > 0.0 (got " +
        std::to_string(thermal_mass_kwh_k_) + " kWh/K)");
  }
}

} // namespace sim_physics
