#include "physics/building_envelope.hpp"

#include "errors.hpp"

#include <cmath>
#include <functional>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

namespace sim_physics {

using building_sim::ConfigurationError;

namespace {

constexpr double kPi = 3.14159265358979323846;

double deg_to_rad(double degrees) { return degrees * kPi / 180.0; }

void require(bool condition, const std::string &msg) {
  if (!condition) {
    throw ConfigurationError("[BuildingEnvelope] " + msg);
  }
}

void require_positive(double value, const char *name) {
  require(std::isfinite(value) && value > 0.0,
          std::string(name) + ": must be > 0 (got " + std::to_string(value) +
              ")");
}

void require_non_negative(double value, const char *name) {
  require(std::isfinite(value) && value >= 0.0,
          std::string(name) + ": must be >= 0 (got " + std::to_string(value) +
              ")");
}

void validate(const EnvelopeParams &p) {
  require_positive(p.length, "length");
  require_positive(p.width, "width");
  require_positive(p.wall_height, "wall_height");

  require(std::isfinite(p.roof_pitch) && p.roof_pitch >= 0.0,
          "roof_pitch: must be >= 0 degrees (got " +
              std::to_string(p.roof_pitch) + ")");
  require(p.roof_pitch < 90.0, "roof_pitch: must be < 90 degrees (got " +
                                   std::to_string(p.roof_pitch) + ")");

  require(std::isfinite(p.glazing_ratio) && p.glazing_ratio >= 0.0 &&
              p.glazing_ratio <= 1.0,
          "glazing_ratio: must be in [0, 1] (got " +
              std::to_string(p.glazing_ratio) + ")");
  require(p.num_windows >= 0, "num_windows: must be >= 0");
  require(p.num_doors >= 0, "num_doors: must be >= 0");
  // Window bridges assume num_windows equal square panes
  require(p.glazing_ratio == 0.0 || p.num_windows > 0,
          "glazing_ratio: > 0 requires num_windows > 0");

  require_non_negative(p.u_values.wall, "u_values.wall");
  require_non_negative(p.u_values.floor, "u_values.floor");
  require_non_negative(p.u_values.roof, "u_values.roof");
  require_non_negative(p.u_values.window, "u_values.window");
  require_non_negative(p.u_values.door, "u_values.door");
  require_non_negative(p.ventilation_rate, "ventilation_rate");
  require_non_negative(p.air_leakage_rate, "air_leakage_rate");

  // Resolve tags once so a corrupt enum value fails here, not mid-run
  to_string(p.wall_material);
  to_string(p.floor_material);
  to_string(p.roof_material);
}

double as_real(const std::string &name,
               const BuildingEnvelope::PropertyValue &value) {
  if (const auto *d = std::get_if<double>(&value)) {
    return *d;
  }
  if (const auto *i = std::get_if<int64_t>(&value)) {
    return static_cast<double>(*i);
  }
  throw ConfigurationError("[BuildingEnvelope] property '" + name +
                           "' expects a number");
}

int as_count(const std::string &name,
             const BuildingEnvelope::PropertyValue &value) {
  const auto *i = std::get_if<int64_t>(&value);
  if (!i) {
    throw ConfigurationError("[BuildingEnvelope] property '" + name +
                             "' expects an integer");
  }
  if (*i < 0 || *i > std::numeric_limits<int>::max()) {
    throw ConfigurationError("[BuildingEnvelope] property '" + name +
                             "' out of range: " + std::to_string(*i));
  }
  return static_cast<int>(*i);
}

const std::string &as_tag(const std::string &name,
                          const BuildingEnvelope::PropertyValue &value) {
  const auto *s = std::get_if<std::string>(&value);
  if (!s) {
    throw ConfigurationError("[BuildingEnvelope] property '" + name +
                             "' expects a tag string");
  }
  return *s;
}

using PropertySetter = std::function<void(
    EnvelopeParams &, const std::string &, const BuildingEnvelope::PropertyValue &)>;

// Closed set of settable fields
const std::map<std::string, PropertySetter> &property_setters() {
  static const std::map<std::string, PropertySetter> setters = {
      {"length", [](auto &p, auto &n, auto &v) { p.length = as_real(n, v); }},
      {"width", [](auto &p, auto &n, auto &v) { p.width = as_real(n, v); }},
      {"wall_height",
       [](auto &p, auto &n, auto &v) { p.wall_height = as_real(n, v); }},
      {"roof_type",
       [](auto &p, auto &n, auto &v) {
         p.roof_type = parse_roof_type(as_tag(n, v));
       }},
      {"roof_pitch",
       [](auto &p, auto &n, auto &v) { p.roof_pitch = as_real(n, v); }},
      {"glazing_ratio",
       [](auto &p, auto &n, auto &v) { p.glazing_ratio = as_real(n, v); }},
      {"num_windows",
       [](auto &p, auto &n, auto &v) { p.num_windows = as_count(n, v); }},
      {"num_doors",
       [](auto &p, auto &n, auto &v) { p.num_doors = as_count(n, v); }},
      {"wall_u_value",
       [](auto &p, auto &n, auto &v) { p.u_values.wall = as_real(n, v); }},
      {"floor_u_value",
       [](auto &p, auto &n, auto &v) { p.u_values.floor = as_real(n, v); }},
      {"roof_u_value",
       [](auto &p, auto &n, auto &v) { p.u_values.roof = as_real(n, v); }},
      {"window_u_value",
       [](auto &p, auto &n, auto &v) { p.u_values.window = as_real(n, v); }},
      {"door_u_value",
       [](auto &p, auto &n, auto &v) { p.u_values.door = as_real(n, v); }},
      {"ventilation_rate",
       [](auto &p, auto &n, auto &v) { p.ventilation_rate = as_real(n, v); }},
      {"air_leakage_rate",
       [](auto &p, auto &n, auto &v) { p.air_leakage_rate = as_real(n, v); }},
      {"wall_material",
       [](auto &p, auto &n, auto &v) {
         p.wall_material = parse_wall_material(as_tag(n, v));
       }},
      {"floor_material",
       [](auto &p, auto &n, auto &v) {
         p.floor_material = parse_floor_material(as_tag(n, v));
       }},
      {"roof_material",
       [](auto &p, auto &n, auto &v) {
         p.roof_material = parse_roof_material(as_tag(n, v));
       }},
  };
  return setters;
}

} // namespace

RoofType parse_roof_type(const std::string &tag) {
  if (tag == "flat") {
    return RoofType::Flat;
  } else if (tag == "gable") {
    return RoofType::Gable;
  } else if (tag == "shed") {
    return RoofType::Shed;
  } else if (tag == "hip") {
    return RoofType::Hip;
  } else {
    throw ConfigurationError("[BuildingEnvelope] Invalid roof type: '" + tag +
                             "'. Valid values: flat, gable, shed, hip");
  }
}

std::string to_string(RoofType type) {
  switch (type) {
  case RoofType::Flat:
    return "flat";
  case RoofType::Gable:
    return "gable";
  case RoofType::Shed:
    return "shed";
  case RoofType::Hip:
    return "hip";
  }
  throw ConfigurationError("[BuildingEnvelope] Invalid roof type #" +
                           std::to_string(static_cast<int>(type)));
}

Surface parse_surface(const std::string &tag) {
  if (tag == "wall") {
    return Surface::Wall;
  } else if (tag == "floor") {
    return Surface::Floor;
  } else if (tag == "roof") {
    return Surface::Roof;
  } else if (tag == "window") {
    return Surface::Window;
  } else if (tag == "door") {
    return Surface::Door;
  } else {
    throw ConfigurationError(
        "[BuildingEnvelope] Invalid surface: '" + tag +
        "'. Valid values: wall, floor, roof, window, door");
  }
}

std::string to_string(Surface surface) {
  switch (surface) {
  case Surface::Wall:
    return "wall";
  case Surface::Floor:
    return "floor";
  case Surface::Roof:
    return "roof";
  case Surface::Window:
    return "window";
  case Surface::Door:
    return "door";
  }
  throw ConfigurationError("[BuildingEnvelope] Invalid surface #" +
                           std::to_string(static_cast<int>(surface)));
}

BuildingEnvelope::BuildingEnvelope(const EnvelopeParams &params) {
  apply(params);
}

void BuildingEnvelope::apply(const EnvelopeParams &candidate) {
  validate(candidate);

  const double length = candidate.length;
  const double width = candidate.width;
  const double wall_height = candidate.wall_height;
  const double pitch_rad = deg_to_rad(candidate.roof_pitch);

  const double wall_area = 2.0 * (length + width) * wall_height;
  const double floor_area = length * width;

  double roof_area = 0.0;
  double total_height = 0.0;
  switch (candidate.roof_type) {
  case RoofType::Flat:
    roof_area = length * width;
    total_height = wall_height;
    break;
  case RoofType::Gable:
    roof_area = 2.0 * length * (width / std::cos(pitch_rad));
    total_height = wall_height + (width / 2.0) * std::tan(pitch_rad);
    break;
  case RoofType::Shed:
    roof_area = length * (width / std::cos(pitch_rad));
    total_height = wall_height + width * std::tan(pitch_rad);
    break;
  case RoofType::Hip:
    roof_area = (width / std::cos(pitch_rad)) * (length / std::cos(pitch_rad));
    total_height = wall_height + (width / 2.0) * std::tan(pitch_rad);
    break;
  default:
    throw ConfigurationError("[BuildingEnvelope] Invalid roof type #" +
                             std::to_string(
                                 static_cast<int>(candidate.roof_type)));
  }

  const double total_volume = length * width * total_height;
  const double window_area = wall_area * candidate.glazing_ratio;
  const double door_area = candidate.num_doors * (kDoorHeight * kDoorWidth);

  // cos(pitch) collapses as pitch approaches 90 degrees
  require(std::isfinite(roof_area) && std::isfinite(total_height) &&
              std::isfinite(total_volume) && std::isfinite(wall_area) &&
              std::isfinite(window_area),
          "roof_pitch: degenerate geometry at " +
              std::to_string(candidate.roof_pitch) + " degrees");

  params_ = candidate;
  wall_area_ = wall_area;
  floor_area_ = floor_area;
  roof_area_ = roof_area;
  window_area_ = window_area;
  door_area_ = door_area;
  total_height_ = total_height;
  total_volume_ = total_volume;
}

double BuildingEnvelope::u_value(Surface surface) const {
  switch (surface) {
  case Surface::Wall:
    return params_.u_values.wall;
  case Surface::Floor:
    return params_.u_values.floor;
  case Surface::Roof:
    return params_.u_values.roof;
  case Surface::Window:
    return params_.u_values.window;
  case Surface::Door:
    return params_.u_values.door;
  }
  throw ConfigurationError("[BuildingEnvelope] Invalid surface #" +
                           std::to_string(static_cast<int>(surface)));
}

void BuildingEnvelope::set_length(double length) {
  EnvelopeParams next = params_;
  next.length = length;
  apply(next);
}

void BuildingEnvelope::set_width(double width) {
  EnvelopeParams next = params_;
  next.width = width;
  apply(next);
}

void BuildingEnvelope::set_wall_height(double wall_height) {
  EnvelopeParams next = params_;
  next.wall_height = wall_height;
  apply(next);
}

void BuildingEnvelope::set_roof_type(RoofType roof_type) {
  EnvelopeParams next = params_;
  next.roof_type = roof_type;
  apply(next);
}

void BuildingEnvelope::set_roof_pitch(double roof_pitch) {
  EnvelopeParams next = params_;
  next.roof_pitch = roof_pitch;
  apply(next);
}

void BuildingEnvelope::set_glazing_ratio(double glazing_ratio) {
  EnvelopeParams next = params_;
  next.glazing_ratio = glazing_ratio;
  apply(next);
}

void BuildingEnvelope::set_num_windows(int num_windows) {
  EnvelopeParams next = params_;
  next.num_windows = num_windows;
  apply(next);
}

void BuildingEnvelope::set_num_doors(int num_doors) {
  EnvelopeParams next = params_;
  next.num_doors = num_doors;
  apply(next);
}

void BuildingEnvelope::set_u_value(Surface surface, double u_value) {
  EnvelopeParams next = params_;
  switch (surface) {
  case Surface::Wall:
    next.u_values.wall = u_value;
    break;
  case Surface::Floor:
    next.u_values.floor = u_value;
    break;
  case Surface::Roof:
    next.u_values.roof = u_value;
    break;
  case Surface::Window:
    next.u_values.window = u_value;
    break;
  case Surface::Door:
    next.u_values.door = u_value;
    break;
  }
  apply(next);
}

void BuildingEnvelope::set_ventilation_rate(double rate) {
  EnvelopeParams next = params_;
  next.ventilation_rate = rate;
  apply(next);
}

void BuildingEnvelope::set_air_leakage_rate(double rate) {
  EnvelopeParams next = params_;
  next.air_leakage_rate = rate;
  apply(next);
}

void BuildingEnvelope::set_wall_material(WallMaterial material) {
  EnvelopeParams next = params_;
  next.wall_material = material;
  apply(next);
}

void BuildingEnvelope::set_floor_material(FloorMaterial material) {
  EnvelopeParams next = params_;
  next.floor_material = material;
  apply(next);
}

void BuildingEnvelope::set_roof_material(RoofMaterial material) {
  EnvelopeParams next = params_;
  next.roof_material = material;
  apply(next);
}

void BuildingEnvelope::set_property(const std::string &name,
                                    const PropertyValue &value) {
  const auto &setters = property_setters();
  auto it = setters.find(name);
  if (it == setters.end()) {
    throw ConfigurationError("[BuildingEnvelope] Unknown property: '" + name +
                             "'");
  }

  EnvelopeParams next = params_;
  it->second(next, name, value);
  apply(next);
}

std::string BuildingEnvelope::summary() const {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2);
  out << "House Properties:\n"
      << "  Wall Area: " << wall_area_ << " m²\n"
      << "  Floor Area: " << floor_area_ << " m²\n"
      << "  Roof Area: " << roof_area_ << " m²\n"
      << "  Total Height: " << total_height_ << " m\n"
      << "  Window Area: " << window_area_ << " m²\n"
      << "  Door Area: " << door_area_ << " m²\n"
      << "  Total Volume: " << total_volume_ << " m³\n"
      << "  Roof Type: " << to_string(params_.roof_type) << "\n"
      << "  Roof Pitch: " << params_.roof_pitch << "°";
  return out.str();
}

} // namespace sim_physics
