#include <gtest/gtest.h>

#include "control/controller.hpp"
#include "control/controller_factory.hpp"
#include "control/on_off_controller.hpp"
#include "control/pid_controller.hpp"
#include "errors.hpp"

#include <cmath>
#include <memory>
#include <string>

using building_sim::ConfigurationError;
using sim_control::OnOffController;
using sim_control::PidController;
using sim_control::PidGains;

// ── PID ─────────────────────────────────────────────────────────────

TEST(PidControllerTest, ZeroErrorHoldsClampedZero) {
  PidController pid(PidGains{}, 1.0, 0.0, 5.0);
  for (int i = 0; i < 1000; ++i) {
    EXPECT_EQ(pid.step(20.0, 20.0), 0.0);
  }
  EXPECT_EQ(pid.state().integral, 0.0);

  PidController floored(PidGains{}, 1.0, 1.5, 5.0);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(floored.step(-3.0, -3.0), 1.5);
  }
}

TEST(PidControllerTest, FirstStepTerms) {
  PidController pid(PidGains{}, 1.0, -1000.0, 1000.0);

  // e = 2, I = 2, D = 2 -> 10*2 + 0.05*2 + 5*2
  EXPECT_DOUBLE_EQ(pid.step(20.0, 18.0), 30.1);
  EXPECT_DOUBLE_EQ(pid.state().integral, 2.0);
  EXPECT_DOUBLE_EQ(pid.state().previous_error, 2.0);

  // e = 2, I = 4, D = 0
  EXPECT_DOUBLE_EQ(pid.step(20.0, 18.0), 20.2);
}

TEST(PidControllerTest, OutputIsClamped) {
  PidController pid(PidGains{}, 1.0, 0.0, 5.0);

  EXPECT_EQ(pid.step(20.0, 18.0), 5.0);
  EXPECT_EQ(pid.step(20.0, 25.0), 0.0);
}

TEST(PidControllerTest, IntegralWindsUpWhileSaturated) {
  PidController pid(PidGains{}, 1.0, 0.0, 5.0);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(pid.step(20.0, 18.0), 5.0);
  }
  EXPECT_DOUBLE_EQ(pid.state().integral, 20.0);

  // Error drops to zero: 0.05 * 20 + 5 * (0 - 2) = -9 -> clamped
  EXPECT_EQ(pid.step(20.0, 20.0), 0.0);
  // Accumulated integral alone keeps the output up
  EXPECT_DOUBLE_EQ(pid.step(20.0, 20.0), 1.0);
}

TEST(PidControllerTest, TimestepScalesIntegralAndDerivative) {
  PidController pid(PidGains{}, 0.5, -1000.0, 1000.0);

  // e = 2, I = 1, D = 4
  EXPECT_DOUBLE_EQ(pid.step(20.0, 18.0), 20.0 + 0.05 + 20.0);
}

TEST(PidControllerTest, CustomGains) {
  PidController pid(PidGains{2.0, 0.0, 0.0}, 1.0, -10.0, 10.0);

  EXPECT_DOUBLE_EQ(pid.step(21.0, 20.0), 2.0);
  EXPECT_DOUBLE_EQ(pid.step(19.0, 20.0), -2.0);
  EXPECT_EQ(pid.kind(), "pid");
}

TEST(PidControllerTest, DeterministicAcrossInstances) {
  PidController a(PidGains{}, 1.0, 0.0, 5.0);
  PidController b(PidGains{}, 1.0, 0.0, 5.0);
  const double measured[] = {15.0, 16.2, 18.9, 20.4, 19.7, 20.1};

  for (double m : measured) {
    EXPECT_EQ(a.step(20.0, m), b.step(20.0, m));
  }
}

TEST(PidControllerTest, RejectsBadConfiguration) {
  EXPECT_THROW(PidController(PidGains{}, 0.0, 0.0, 5.0), ConfigurationError);
  EXPECT_THROW(PidController(PidGains{}, -1.0, 0.0, 5.0), ConfigurationError);
  EXPECT_THROW(PidController(PidGains{}, 1.0, 6.0, 5.0), ConfigurationError);
  EXPECT_THROW(PidController(PidGains{std::nan(""), 0.0, 0.0}, 1.0, 0.0, 5.0),
               ConfigurationError);
}

// ── On/off ──────────────────────────────────────────────────────────

TEST(OnOffControllerTest, FullPowerBelowSetpoint) {
  OnOffController ctl(0.0, 5.0);

  EXPECT_EQ(ctl.step(20.0, 19.9), 5.0);
  EXPECT_EQ(ctl.step(20.0, 20.0), 0.0);
  EXPECT_EQ(ctl.step(20.0, 23.0), 0.0);
  EXPECT_EQ(ctl.kind(), "on_off");
}

TEST(OnOffControllerTest, RejectsInvertedLimits) {
  EXPECT_THROW(OnOffController(5.0, 0.0), ConfigurationError);
}

// ── Factory ─────────────────────────────────────────────────────────

TEST(ControllerFactoryTest, CreatesConfiguredController) {
  sim_control::ControllerSpec spec;
  auto pid = sim_control::create_controller(spec, 0.0, 5.0);
  ASSERT_NE(pid, nullptr);
  EXPECT_EQ(pid->kind(), "pid");
  EXPECT_EQ(pid->max_output(), 5.0);

  spec.type = sim_control::ControllerType::OnOff;
  auto on_off = sim_control::create_controller(spec, 0.0, 3.0);
  EXPECT_EQ(on_off->kind(), "on_off");
  EXPECT_EQ(on_off->step(20.0, 10.0), 3.0);
}

TEST(ControllerFactoryTest, FreshInstancesDoNotShareState) {
  sim_control::ControllerSpec spec;
  auto first = sim_control::create_controller(spec, 0.0, 5.0);
  for (int i = 0; i < 5; ++i) {
    first->step(20.0, 15.0);
  }

  auto second = sim_control::create_controller(spec, 0.0, 5.0);
  auto &pid = dynamic_cast<PidController &>(*second);
  EXPECT_EQ(pid.state().integral, 0.0);
  EXPECT_EQ(pid.state().previous_error, 0.0);
}

TEST(ControllerFactoryTest, ParsesTypeTags) {
  EXPECT_EQ(sim_control::parse_controller_type("pid"),
            sim_control::ControllerType::Pid);
  EXPECT_EQ(sim_control::parse_controller_type("on_off"),
            sim_control::ControllerType::OnOff);
  EXPECT_THROW(sim_control::parse_controller_type("fuzzy"),
               ConfigurationError);

  try {
    sim_control::parse_controller_type("fuzzy");
  } catch (const ConfigurationError &e) {
    EXPECT_EQ(std::string(e.what()).rfind("[ControllerFactory] ", 0), 0u)
        << e.what();
  }
}
