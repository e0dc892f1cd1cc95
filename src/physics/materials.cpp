#include "physics/materials.hpp"

#include "errors.hpp"

#include <array>

namespace sim_physics {

namespace {

template <typename Material> struct MaterialEntry {
  Material material;
  const char *tag;
  double capacity_kj_m2k;
};

// Thermal mass per unit area for typical construction thicknesses.
// Process-wide, never modified after static initialization.
constexpr std::array<MaterialEntry<WallMaterial>, 7> kWallTable = {{
    {WallMaterial::TimberFrame, "timber_frame", 110.0},    // 150mm + plasterboard
    {WallMaterial::Brick, "brick", 190.0},                 // 220mm solid brick
    {WallMaterial::CavityBrick, "cavity_brick", 150.0},    // double brick
    {WallMaterial::ConcreteBlock, "concrete_block", 170.0}, // 200mm block
    {WallMaterial::Stone, "stone", 250.0},                 // 500mm stone
    {WallMaterial::LightSteel, "light_steel", 120.0},      // steel frame
    {WallMaterial::Log, "log", 160.0},                     // 200mm solid wood
}};

constexpr std::array<MaterialEntry<FloorMaterial>, 4> kFloorTable = {{
    {FloorMaterial::Timber, "timber", 70.0},                    // suspended
    {FloorMaterial::ConcreteSlab, "concrete_slab", 180.0},      // 150mm slab
    {FloorMaterial::ConcreteScreed, "concrete_screed", 110.0},  // 75mm screed
    {FloorMaterial::RaisedAccess, "raised_access", 60.0},
}};

constexpr std::array<MaterialEntry<RoofMaterial>, 4> kRoofTable = {{
    {RoofMaterial::TimberJoist, "timber_joist", 100.0},
    {RoofMaterial::ConcreteDeck, "concrete_deck", 140.0},
    {RoofMaterial::MetalDeck, "metal_deck", 80.0},
    {RoofMaterial::GreenRoof, "green_roof", 170.0},
}};

template <typename Material, std::size_t N>
std::vector<std::string>
table_tags(const std::array<MaterialEntry<Material>, N> &table) {
  std::vector<std::string> tags;
  tags.reserve(N);
  for (const auto &entry : table) {
    tags.emplace_back(entry.tag);
  }
  return tags;
}

template <typename Material, std::size_t N>
Material parse_tag(const std::array<MaterialEntry<Material>, N> &table,
                   const std::string &tag, const char *category) {
  for (const auto &entry : table) {
    if (tag == entry.tag) {
      return entry.material;
    }
  }

  std::string valid;
  for (const auto &entry : table) {
    if (!valid.empty()) {
      valid += ", ";
    }
    valid += entry.tag;
  }
  throw building_sim::ConfigurationError("[Materials] Unknown " +
                                         std::string(category) +
                                         " material: '" + tag +
                                         "'. Valid values: " + valid);
}

template <typename Material, std::size_t N>
const MaterialEntry<Material> &
find_entry(const std::array<MaterialEntry<Material>, N> &table,
           Material material, const char *category) {
  for (const auto &entry : table) {
    if (entry.material == material) {
      return entry;
    }
  }
  throw building_sim::ConfigurationError(
      "[Materials] No table entry for " + std::string(category) +
      " material #" + std::to_string(static_cast<int>(material)));
}

} // namespace

WallMaterial parse_wall_material(const std::string &tag) {
  return parse_tag(kWallTable, tag, "wall");
}

FloorMaterial parse_floor_material(const std::string &tag) {
  return parse_tag(kFloorTable, tag, "floor");
}

RoofMaterial parse_roof_material(const std::string &tag) {
  return parse_tag(kRoofTable, tag, "roof");
}

std::string to_string(WallMaterial material) {
  return find_entry(kWallTable, material, "wall").tag;
}

std::string to_string(FloorMaterial material) {
  return find_entry(kFloorTable, material, "floor").tag;
}

std::string to_string(RoofMaterial material) {
  return find_entry(kRoofTable, material, "roof").tag;
}

double heat_capacity_kj_m2k(WallMaterial material) {
  return find_entry(kWallTable, material, "wall").capacity_kj_m2k;
}

double heat_capacity_kj_m2k(FloorMaterial material) {
  return find_entry(kFloorTable, material, "floor").capacity_kj_m2k;
}

double heat_capacity_kj_m2k(RoofMaterial material) {
  return find_entry(kRoofTable, material, "roof").capacity_kj_m2k;
}

std::vector<std::string> wall_material_tags() { return table_tags(kWallTable); }

std::vector<std::string> floor_material_tags() {
  return table_tags(kFloorTable);
}

std::vector<std::string> roof_material_tags() { return table_tags(kRoofTable); }

} // namespace sim_physics
