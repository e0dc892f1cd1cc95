#pragma once

#include <string>
#include <vector>

namespace sim_physics {

// Air properties shared by ventilation loss and air thermal mass
constexpr double kAirSpecificHeat = 1005.0; // J/(kg*K)
constexpr double kAirDensity = 1.2;         // kg/m3

enum class WallMaterial {
  TimberFrame,
  Brick,
  CavityBrick,
  ConcreteBlock,
  Stone,
  LightSteel,
  Log
};

enum class FloorMaterial { Timber, ConcreteSlab, ConcreteScreed, RaisedAccess };

enum class RoofMaterial { TimberJoist, ConcreteDeck, MetalDeck, GreenRoof };

// Parse material tags from strings
// Throws building_sim::ConfigurationError if the tag is not in the table
WallMaterial parse_wall_material(const std::string &tag);
FloorMaterial parse_floor_material(const std::string &tag);
RoofMaterial parse_roof_material(const std::string &tag);

std::string to_string(WallMaterial material);
std::string to_string(FloorMaterial material);
std::string to_string(RoofMaterial material);

// Per-area heat capacity for typical construction thickness (kJ/(m2*K))
double heat_capacity_kj_m2k(WallMaterial material);
double heat_capacity_kj_m2k(FloorMaterial material);
double heat_capacity_kj_m2k(RoofMaterial material);

// Known tags per category (used in error messages and by the CLI)
std::vector<std::string> wall_material_tags();
std::vector<std::string> floor_material_tags();
std::vector<std::string> roof_material_tags();

} // namespace sim_physics
