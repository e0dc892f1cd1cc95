#pragma once

#include "physics/materials.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace sim_physics {

enum class RoofType { Flat, Gable, Shed, Hip };

// Throws building_sim::ConfigurationError for anything but
// flat | gable | shed | hip
RoofType parse_roof_type(const std::string &tag);
std::string to_string(RoofType type);

// Envelope surfaces carrying a U-value
enum class Surface { Wall, Floor, Roof, Window, Door };

Surface parse_surface(const std::string &tag);
std::string to_string(Surface surface);

// Standard exterior door leaf (m)
constexpr double kDoorHeight = 2.033;
constexpr double kDoorWidth = 0.925;

// Heat-transfer coefficients, W/(m2*K). Defaults are the TEK17 minimums.
struct UValues {
  double wall = 0.18;
  double floor = 0.10;
  double roof = 0.13;
  double window = 0.8;
  double door = 0.8;
};

// Parametric inputs of a building envelope
struct EnvelopeParams {
  double length = 0.0;      // m
  double width = 0.0;       // m
  double wall_height = 0.0; // m
  RoofType roof_type = RoofType::Flat;
  double roof_pitch = 0.0;    // degrees, [0, 90)
  double glazing_ratio = 0.0; // window area / wall area
  int num_windows = 0;
  int num_doors = 0;
  UValues u_values;
  double ventilation_rate = 0.7; // per m2 floor area
  double air_leakage_rate = 0.1; // per m3 volume
  WallMaterial wall_material = WallMaterial::TimberFrame;
  FloorMaterial floor_material = FloorMaterial::Timber;
  RoofMaterial roof_material = RoofMaterial::TimberJoist;
};

// Building envelope with derived geometry
//
// Derived fields:
//   wall_area   = 2 * (L + W) * H_wall
//   floor_area  = L * W
//   roof_area   = flat: L * W
//                 gable: 2 * L * W / cos(p)
//                 shed: L * W / cos(p)
//                 hip: (W / cos(p)) * (L / cos(p))
//   total_height = flat: H_wall
//                  gable, hip: H_wall + (W / 2) * tan(p)
//                  shed: H_wall + W * tan(p)
//   total_volume = L * W * total_height
//   window_area  = wall_area * glazing_ratio
//   door_area    = num_doors * kDoorHeight * kDoorWidth
//
// Inputs change only through the validating setters below. Every setter
// recomputes the derived fields and leaves the envelope untouched on failure.
class BuildingEnvelope {
public:
  // Value accepted by set_property: real, integer or tag string
  using PropertyValue = std::variant<double, int64_t, std::string>;

  // Throws building_sim::ConfigurationError if params are out of range or
  // produce a non-finite geometry (pitch near 90 degrees)
  explicit BuildingEnvelope(const EnvelopeParams &params);

  const EnvelopeParams &params() const { return params_; }

  double length() const { return params_.length; }
  double width() const { return params_.width; }
  double wall_height() const { return params_.wall_height; }
  RoofType roof_type() const { return params_.roof_type; }
  double roof_pitch() const { return params_.roof_pitch; }
  double glazing_ratio() const { return params_.glazing_ratio; }
  int num_windows() const { return params_.num_windows; }
  int num_doors() const { return params_.num_doors; }
  const UValues &u_values() const { return params_.u_values; }
  double u_value(Surface surface) const;
  double ventilation_rate() const { return params_.ventilation_rate; }
  double air_leakage_rate() const { return params_.air_leakage_rate; }
  WallMaterial wall_material() const { return params_.wall_material; }
  FloorMaterial floor_material() const { return params_.floor_material; }
  RoofMaterial roof_material() const { return params_.roof_material; }

  double wall_area() const { return wall_area_; }
  double floor_area() const { return floor_area_; }
  double roof_area() const { return roof_area_; }
  double window_area() const { return window_area_; }
  double door_area() const { return door_area_; }
  double total_height() const { return total_height_; }
  double total_volume() const { return total_volume_; }

  void set_length(double length);
  void set_width(double width);
  void set_wall_height(double wall_height);
  void set_roof_type(RoofType roof_type);
  void set_roof_pitch(double roof_pitch);
  void set_glazing_ratio(double glazing_ratio);
  void set_num_windows(int num_windows);
  void set_num_doors(int num_doors);
  void set_u_value(Surface surface, double u_value);
  void set_ventilation_rate(double rate);
  void set_air_leakage_rate(double rate);
  void set_wall_material(WallMaterial material);
  void set_floor_material(FloorMaterial material);
  void set_roof_material(RoofMaterial material);

  // Set a field by name. Names are the EnvelopeParams field names, with
  // U-values addressed as wall_u_value, floor_u_value, roof_u_value,
  // window_u_value and door_u_value. Enumerated fields take their tag string.
  // Throws building_sim::ConfigurationError for unknown names or values of
  // the wrong type.
  void set_property(const std::string &name, const PropertyValue &value);

  // Multi-line description of the derived geometry
  std::string summary() const;

private:
  // Validate candidate params, derive geometry, and commit both
  void apply(const EnvelopeParams &candidate);

  EnvelopeParams params_;

  double wall_area_ = 0.0;
  double floor_area_ = 0.0;
  double roof_area_ = 0.0;
  double window_area_ = 0.0;
  double door_area_ = 0.0;
  double total_height_ = 0.0;
  double total_volume_ = 0.0;
};

} // namespace sim_physics
