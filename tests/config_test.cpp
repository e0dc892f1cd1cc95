#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "test_buildings.hpp"

#include <string>
#include <yaml-cpp/yaml.h>

using building_sim::ConfigurationError;
using building_sim::ScenarioConfig;
using test_buildings::config_error;
using test_buildings::starts_with;

namespace {

const char *kMinimalScenario = R"(
building:
  length: 8
  width: 6
  wall_height: 2.4
  roof_type: gable
  roof_pitch: 35
  glazing_ratio: 0.15
  num_windows: 4
  num_doors: 1
heat_pump:
  cop: 3.5
  min_heat_kw: 0
  max_heat_kw: 5
simulation:
  initial_inside_temp: 18
  outside_temps: [10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10,
                  10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10]
  setpoint: 20
)";

ScenarioConfig parse(const std::string &text) {
  return building_sim::parse_scenario(YAML::Load(text));
}

// Minimal scenario with one line replaced
std::string with_line(const std::string &from, const std::string &to) {
  std::string text = kMinimalScenario;
  auto pos = text.find(from);
  EXPECT_NE(pos, std::string::npos) << from;
  text.replace(pos, from.size(), to);
  return text;
}

} // namespace

// ── Happy paths ─────────────────────────────────────────────────────

TEST(ConfigTest, MinimalScenarioUsesDefaults) {
  ScenarioConfig config = parse(kMinimalScenario);

  EXPECT_DOUBLE_EQ(config.building.length, 8.0);
  EXPECT_EQ(config.building.roof_type, sim_physics::RoofType::Gable);
  EXPECT_EQ(config.building.num_windows, 4);
  EXPECT_DOUBLE_EQ(config.building.u_values.wall, 0.18);
  EXPECT_DOUBLE_EQ(config.building.u_values.door, 0.8);
  EXPECT_DOUBLE_EQ(config.building.ventilation_rate, 0.7);
  EXPECT_DOUBLE_EQ(config.building.air_leakage_rate, 0.1);
  EXPECT_EQ(config.building.wall_material,
            sim_physics::WallMaterial::TimberFrame);

  EXPECT_EQ(config.controller.type, sim_control::ControllerType::Pid);
  EXPECT_DOUBLE_EQ(config.controller.gains.kp, 10.0);
  EXPECT_DOUBLE_EQ(config.controller.gains.ki, 0.05);
  EXPECT_DOUBLE_EQ(config.controller.gains.kd, 5.0);
  EXPECT_DOUBLE_EQ(config.controller.dt_h, 1.0);

  EXPECT_DOUBLE_EQ(config.heat_pump.cop, 3.5);
  EXPECT_DOUBLE_EQ(config.simulation.initial_inside_temp, 18.0);
  EXPECT_EQ(config.simulation.outside_temps.size(), 24u);
}

TEST(ConfigTest, ScalarSetpointCoversHorizon) {
  ScenarioConfig config = parse(kMinimalScenario);

  ASSERT_EQ(config.simulation.setpoints.size(), sim_engine::kHorizonHours);
  for (double s : config.simulation.setpoints) {
    EXPECT_EQ(s, 20.0);
  }
}

TEST(ConfigTest, LoadsShippedScenarios) {
  ScenarioConfig small =
      building_sim::load_scenario(BUILDING_SIM_CONFIG_DIR "/small_house.yaml");
  EXPECT_EQ(small.building.roof_type, sim_physics::RoofType::Gable);
  EXPECT_EQ(small.simulation.outside_temps.size(), 24u);
  EXPECT_FALSE(small.config_file_path.empty());

  ScenarioConfig large = building_sim::load_scenario(
      BUILDING_SIM_CONFIG_DIR "/large_house_hip.yaml");
  EXPECT_EQ(large.building.roof_type, sim_physics::RoofType::Hip);
  EXPECT_EQ(large.building.wall_material, sim_physics::WallMaterial::Brick);
  EXPECT_EQ(large.building.floor_material,
            sim_physics::FloorMaterial::ConcreteSlab);
  EXPECT_EQ(large.controller.type, sim_control::ControllerType::OnOff);
  EXPECT_EQ(large.simulation.setpoints.size(), 24u);
}

TEST(ConfigTest, ExplicitSections) {
  std::string text = with_line("  num_doors: 1\n",
                               "  num_doors: 1\n"
                               "  u_values: {window: 1.1}\n"
                               "  materials: {roof: metal_deck}\n");
  text += "controller: {type: pid, kp: 4.0, dt_h: 0.5}\n";
  ScenarioConfig config = parse(text);

  EXPECT_DOUBLE_EQ(config.building.u_values.window, 1.1);
  EXPECT_DOUBLE_EQ(config.building.u_values.wall, 0.18);
  EXPECT_EQ(config.building.roof_material,
            sim_physics::RoofMaterial::MetalDeck);
  EXPECT_DOUBLE_EQ(config.controller.gains.kp, 4.0);
  EXPECT_DOUBLE_EQ(config.controller.gains.ki, 0.05);
  EXPECT_DOUBLE_EQ(config.controller.dt_h, 0.5);
}

TEST(ConfigTest, ShortSeriesIsLeftToTheSimulator) {
  ScenarioConfig config =
      parse(with_line("[10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10,",
                      "[10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10,"));

  EXPECT_EQ(config.simulation.outside_temps.size(), 23u);
}

TEST(ConfigTest, OnOffAcceptsTimestep) {
  ScenarioConfig config = parse(std::string(kMinimalScenario) +
                                "controller: {type: on_off, dt_h: 0.25}\n");

  EXPECT_EQ(config.controller.type, sim_control::ControllerType::OnOff);
  EXPECT_DOUBLE_EQ(config.controller.dt_h, 0.25);
  EXPECT_DOUBLE_EQ(building_sim::make_simulator(config).dt_h(), 0.25);
}

// ── Scenario to simulation ──────────────────────────────────────────

TEST(ConfigTest, ConfiguredTimestepDrivesSimulation) {
  ScenarioConfig config = parse(std::string(kMinimalScenario) +
                                "controller: {type: pid, dt_h: 0.5}\n");

  sim_engine::Simulator simulator = building_sim::make_simulator(config);
  EXPECT_DOUBLE_EQ(simulator.dt_h(), 0.5);

  auto controller = building_sim::make_controller(config);
  sim_engine::SimulationTrace trace = simulator.simulate_heating(
      config.simulation.outside_temps, config.simulation.setpoints,
      config.simulation.initial_inside_temp, *controller);

  EXPECT_NEAR(trace.inside_temps[1], 18.359235119995752, 1e-8);
  EXPECT_NEAR(trace.inside_temps[24], 19.995992440577933, 1e-8);
}

TEST(ConfigTest, DefaultTimestepIsOneHour) {
  ScenarioConfig config = parse(kMinimalScenario);

  sim_engine::Simulator simulator = building_sim::make_simulator(config);
  auto controller = building_sim::make_controller(config);
  sim_engine::SimulationTrace trace = simulator.simulate_heating(
      config.simulation.outside_temps, config.simulation.setpoints,
      config.simulation.initial_inside_temp, *controller);

  EXPECT_NEAR(trace.inside_temps[1], 18.71847024, 1e-8);
  EXPECT_NEAR(trace.inside_temps[24], 20.044582323, 1e-8);
}

TEST(ConfigTest, ControllerUsesHeatPumpLimits) {
  ScenarioConfig config = parse(with_line("max_heat_kw: 5", "max_heat_kw: 3"));

  auto controller = building_sim::make_controller(config);
  EXPECT_EQ(controller->min_output(), 0.0);
  EXPECT_EQ(controller->max_output(), 3.0);
  EXPECT_EQ(controller->step(20.0, 10.0), 3.0);
}

// ── Rejections ──────────────────────────────────────────────────────

TEST(ConfigTest, MissingFile) {
  EXPECT_THROW(building_sim::load_scenario("/nonexistent/scenario.yaml"),
               ConfigurationError);
}

TEST(ConfigTest, MissingSections) {
  EXPECT_THROW(parse("heat_pump: {cop: 3, min_heat_kw: 0, max_heat_kw: 1}"),
               ConfigurationError);
  EXPECT_THROW(parse(with_line("heat_pump:", "heat_pumps:")),
               ConfigurationError);
  EXPECT_THROW(parse("[1, 2, 3]"), ConfigurationError);
}

TEST(ConfigTest, MissingRequiredBuildingKey) {
  EXPECT_THROW(parse(with_line("  wall_height: 2.4\n", "")),
               ConfigurationError);
}

TEST(ConfigTest, UnknownKeysRejected) {
  EXPECT_THROW(parse(with_line("  num_doors: 1\n",
                               "  num_doors: 1\n  colour: red\n")),
               ConfigurationError);
  EXPECT_THROW(parse(with_line("  cop: 3.5\n", "  cop: 3.5\n  brand: x\n")),
               ConfigurationError);
}

TEST(ConfigTest, InvalidRoofType) {
  EXPECT_THROW(parse(with_line("roof_type: gable", "roof_type: dome")),
               ConfigurationError);
}

TEST(ConfigTest, PitchAt90Rejected) {
  EXPECT_THROW(parse(with_line("roof_pitch: 35", "roof_pitch: 90")),
               ConfigurationError);
}

TEST(ConfigTest, UnknownMaterialRejected) {
  EXPECT_THROW(
      parse(with_line("  num_doors: 1\n",
                      "  num_doors: 1\n  materials: {wall: unobtainium}\n")),
      ConfigurationError);
}

TEST(ConfigTest, WrongValueTypes) {
  EXPECT_THROW(parse(with_line("length: 8", "length: long")),
               ConfigurationError);
  EXPECT_THROW(parse(with_line("num_windows: 4", "num_windows: 4.5")),
               ConfigurationError);
  EXPECT_THROW(parse(with_line("length: 8", "length: [8]")),
               ConfigurationError);
}

TEST(ConfigTest, HeatPumpLimits) {
  EXPECT_THROW(parse(with_line("cop: 3.5", "cop: 0")), ConfigurationError);
  EXPECT_THROW(parse(with_line("min_heat_kw: 0", "min_heat_kw: 9")),
               ConfigurationError);
}

TEST(ConfigTest, ControllerRejections) {
  std::string text = kMinimalScenario;
  EXPECT_THROW(parse(text + "controller: {type: fuzzy}\n"),
               ConfigurationError);
  EXPECT_THROW(parse(text + "controller: {type: on_off, kp: 3}\n"),
               ConfigurationError);
  EXPECT_THROW(parse(text + "controller: {dt_h: 0}\n"), ConfigurationError);
}

TEST(ConfigTest, SetpointFormsAreExclusive) {
  EXPECT_THROW(parse(with_line("  setpoint: 20\n",
                               "  setpoint: 20\n  setpoints: [20]\n")),
               ConfigurationError);
  EXPECT_THROW(parse(with_line("  setpoint: 20\n", "")), ConfigurationError);
}

TEST(ConfigTest, ErrorsNameTheKeyPath) {
  EXPECT_TRUE(starts_with(config_error([] {
                            parse(with_line("roof_pitch: 35", "roof_pitch: 90"));
                          }),
                          "[CONFIG] building.roof_pitch: "));
  EXPECT_TRUE(starts_with(config_error([] {
                            parse(with_line("glazing_ratio: 0.15",
                                            "glazing_ratio: 1.5"));
                          }),
                          "[CONFIG] building.glazing_ratio: "));
  EXPECT_TRUE(starts_with(config_error([] {
                            parse(with_line("  num_doors: 1\n",
                                            "  num_doors: 1\n"
                                            "  u_values: {wall: -1}\n"));
                          }),
                          "[CONFIG] building.u_values.wall: "));
  EXPECT_TRUE(starts_with(config_error([] {
                            parse(with_line("roof_type: gable",
                                            "roof_type: dome"));
                          }),
                          "[CONFIG] building.roof_type: [BuildingEnvelope] "));
  EXPECT_TRUE(starts_with(
      config_error([] { parse(with_line("cop: 3.5", "cop: 0")); }),
      "[CONFIG] heat_pump.cop: "));
  EXPECT_TRUE(starts_with(
      config_error([] {
        parse(std::string(kMinimalScenario) + "controller: {dt_h: -1}\n");
      }),
      "[CONFIG] controller.dt_h: "));
  EXPECT_TRUE(starts_with(config_error([] {
                            building_sim::load_scenario(
                                "/nonexistent/scenario.yaml");
                          }),
                          "[CONFIG] "));
}
