#include <gtest/gtest.h>

#include <string>

#include "Data/RoomData.hpp"
#include "Formula/Atmosphere.hpp"
#include "Formula/GasExchange.hpp"
#include "Process/Room.hpp"
#include "TestFluids.hpp"

using namespace thermini;

namespace {
RoomData<double> SimpleRoom() {
  RoomData<double> data;
  data.pressureMode = PressureModeEnum::SeaLevel;
  data.atmosphere = Composition<double>{ { "N2", 0.79 }, { "O2", 0.21 } };
  return data;
}
}

TEST(RoomTest, CreateUsesEarthByDefault) {
  const auto state = Room<double>::Create(RoomData<double>{});
  EXPECT_NEAR(state.composition.Get("O2"), 0.2095, 1e-12);
  EXPECT_NEAR(state.pressure, 101325.0, 1e-9);
  EXPECT_DOUBLE_EQ(state.ambientPressure, state.pressure);
  EXPECT_DOUBLE_EQ(state.temperature, 20.0);
  EXPECT_DOUBLE_EQ(state.elapsed, 0.0);
  EXPECT_EQ(state.airHandlerMode, "off");
}

TEST(RoomTest, InitialPressureModes) {
  RoomData<double> data;
  data.pressureMode = PressureModeEnum::SeaLevel;
  EXPECT_DOUBLE_EQ(Room<double>::InitialPressure(data), 101325.0);

  data.pressureMode = PressureModeEnum::Custom;
  data.initialPressure = 90000.0;
  EXPECT_DOUBLE_EQ(Room<double>::InitialPressure(data), 90000.0);

  data.pressureMode = PressureModeEnum::Location;
  data.altitude = 1500.0;
  EXPECT_DOUBLE_EQ(Room<double>::InitialPressure(data), Atmosphere<double>::Pressure(1500.0));
}

TEST(RoomTest, AddVaporDilutesAndPressurizes) {
  const auto state = Room<double>::Create(SimpleRoom());
  const double total = state.pressure * state.volume / (8.314 * 293.15);

  // One mole of water vapor
  const auto next = Room<double>::AddVapor(state, "H\xE2\x82\x82O", 0.018015, 18.015);
  EXPECT_TRUE(next.composition.Contains("H2O"));
  EXPECT_NEAR(next.composition.Get("H2O"), 1.0 / (total + 1.0), 1e-12);
  EXPECT_NEAR(next.composition.Get("N2"), 0.79 * total / (total + 1.0), 1e-12);
  EXPECT_NEAR(next.composition.Sum(), 1.0, 1e-12);
  EXPECT_NEAR(next.pressure, state.pressure * (total + 1.0) / total, 1e-6);
}

TEST(RoomTest, AddVaporIgnoresInvalidInput) {
  const auto state = Room<double>::Create(SimpleRoom());
  const auto next = Room<double>::AddVapor(state, "H2O", -1.0, 18.015);
  EXPECT_FALSE(next.composition.Contains("H2O"));
  EXPECT_DOUBLE_EQ(next.pressure, state.pressure);
}

TEST(RoomTest, ApplyHeat) {
  const auto state = Room<double>::Create(SimpleRoom());
  const auto next = Room<double>::ApplyHeat(state, 3600.0, 10.0, "burner");
  EXPECT_NEAR(next.temperature, 21.0, 1e-12);
  ASSERT_EQ(next.heatLog.size(), 1u);
  EXPECT_EQ(next.heatLog.back().source, "burner");
}

TEST(RoomTest, BurnerWasteHeat) {
  const auto state = Room<double>::Create(SimpleRoom());
  RoomInputs<double> inputs;
  inputs.externalHeatWatts = 1000.0;

  const auto next = Room<double>::Step(state, nullptr, nullptr, 1.0, inputs);
  EXPECT_NEAR(next.temperature, 20.0 + 100.0 / 36000.0, 1e-12);
  EXPECT_NEAR(next.energyTotals.burnerWasteJoules, 100.0, 1e-12);
  EXPECT_EQ(next.acStatus, "No AC");
  EXPECT_EQ(next.airHandlerStatus, "No Air Handler");
  EXPECT_DOUBLE_EQ(next.elapsed, 1.0);
}

TEST(RoomTest, PressureLeakIsRateLimited) {
  auto state = Room<double>::Create(SimpleRoom());
  state.pressure = state.ambientPressure + 100.0;

  auto next = Room<double>::Step(state, nullptr, nullptr, 1.0);
  EXPECT_NEAR(next.pressure, state.ambientPressure + 90.0, 1e-9);

  state.pressure = state.ambientPressure - 5.0;
  next = Room<double>::Step(state, nullptr, nullptr, 1.0);
  EXPECT_NEAR(next.pressure, state.ambientPressure, 1e-9);
}

TEST(RoomTest, CombinedAirflow) {
  const auto ac = test::BalancedAc();
  const auto airHandler = test::AirHandler();
  auto state = Room<double>::Create(SimpleRoom());

  auto airflow = Room<double>::CombinedAirflow(state, &ac, &airHandler);
  EXPECT_DOUBLE_EQ(airflow.acCfm, 150.0);
  EXPECT_DOUBLE_EQ(airflow.airHandlerCfm, 0.0);

  state = Room<double>::SetAirHandlerMode(state, "high");
  airflow = Room<double>::CombinedAirflow(state, &ac, &airHandler);
  EXPECT_DOUBLE_EQ(airflow.airHandlerCfm, 150.0);
  EXPECT_DOUBLE_EQ(airflow.totalCfm, 300.0);
  EXPECT_DOUBLE_EQ(airflow.totalM3PerHour, 510.0);

  state = Room<double>::SetAirHandlerMode(state, "low");
  airflow = Room<double>::CombinedAirflow(state, &ac, &airHandler);
  EXPECT_DOUBLE_EQ(airflow.airHandlerCfm, 37.5);
}

TEST(RoomTest, AcCoolsRoom) {
  const auto ac = test::BalancedAc();
  auto state = Room<double>::Create(SimpleRoom());
  state.temperature = 30.0;
  state = Room<double>::SetAcEnabled(state, true);
  state = Room<double>::SetAcSetpoint(state, 20.0);

  for (int i = 0; i < 10; ++i)
    state = Room<double>::Step(state, &ac, nullptr, 1.0);

  EXPECT_LT(state.temperature, 30.0);
  EXPECT_GT(state.energyTotals.acCoolingJoules, 0.0);
  EXPECT_DOUBLE_EQ(state.energyTotals.acHeatingJoules, 0.0);
  EXPECT_EQ(state.acStatus.rfind("Cooling", 0), 0u);
  EXPECT_FALSE(state.heatLog.empty());
  EXPECT_EQ(state.heatLog.back().source, "ac_cooling");
}

TEST(RoomTest, AcOffReportsOff) {
  const auto ac = test::BalancedAc();
  auto state = Room<double>::Create(SimpleRoom());
  state.temperature = 30.0;

  state = Room<double>::Step(state, &ac, nullptr, 1.0);
  EXPECT_DOUBLE_EQ(state.temperature, 30.0);
  EXPECT_EQ(state.acStatus, "Off");
}

TEST(RoomTest, OperatorActionsResetControllers) {
  auto state = Room<double>::Create(SimpleRoom());
  state.acPid.integral = 12.0;
  state.airHandlerPid.integral = 3.0;

  state = Room<double>::SetAcEnabled(state, false);
  EXPECT_DOUBLE_EQ(state.acPid.integral, 12.0);
  state = Room<double>::SetAcEnabled(state, true);
  EXPECT_DOUBLE_EQ(state.acPid.integral, 0.0);

  state = Room<double>::SetAirHandlerMode(state, "off");
  EXPECT_DOUBLE_EQ(state.airHandlerPid.integral, 3.0);
  state = Room<double>::SetAirHandlerMode(state, "auto");
  EXPECT_DOUBLE_EQ(state.airHandlerPid.integral, 0.0);

  state.acPid.integral = 5.0;
  state = Room<double>::ResetAcPid(state);
  EXPECT_DOUBLE_EQ(state.acPid.integral, 0.0);

  state = Room<double>::SetAcSetpoint(state, std::nan(""));
  EXPECT_DOUBLE_EQ(state.acSetpoint, 20.0);
}

TEST(RoomTest, AutoAirHandlerScrubsAmmonia) {
  const auto airHandler = test::AirHandler();
  auto data = SimpleRoom();
  data.airHandlerMode = "auto";
  auto state = Room<double>::Create(data);
  state.composition.Set("NH3", 0.01);
  const double sum = state.composition.Sum();

  for (int i = 0; i < 600; ++i)
    state = Room<double>::Step(state, nullptr, &airHandler, 1.0);

  EXPECT_LT(state.composition.Get("NH3"), 0.008);
  EXPECT_NEAR(state.composition.Sum(), sum, 1e-9);
  EXPECT_GT(state.energyTotals.airHandlerJoules, 0.0);
  EXPECT_GT(state.scrubberActivity, 0.0);
}

TEST(RoomTest, NamedModeUsesCombinedAirflow) {
  const auto airHandler = test::AirHandler();
  auto state = Room<double>::Create(SimpleRoom());
  state = Room<double>::SetAirHandlerMode(state, "high");
  state.composition.Set("CO2", 0.02);

  state = Room<double>::Step(state, nullptr, &airHandler, 10.0);
  EXPECT_LT(state.composition.Get("CO2"), 0.02);
  EXPECT_DOUBLE_EQ(state.scrubberActivity, 1.0);
  EXPECT_EQ(state.airHandlerStatus, "high (510 m3/h)");
  EXPECT_NEAR(state.energyTotals.airHandlerJoules, 150.0 * 0.5 * 10.0, 1e-9);
}

TEST(RoomTest, AlertsFollowComposition) {
  auto state = Room<double>::Create(SimpleRoom());
  state.composition.Set("O2", 0.15);

  state = Room<double>::Step(state, nullptr, nullptr, 1.0);
  ASSERT_EQ(state.alerts.size(), 1u);
  EXPECT_EQ(state.alerts.front().severity, SeverityEnum::Critical);
  EXPECT_EQ(state.alerts.front().species, "O2");
}

TEST(RoomTest, CompositionLogInterval) {
  auto state = Room<double>::Create(SimpleRoom());
  for (int i = 0; i < 25; ++i)
    state = Room<double>::Step(state, nullptr, nullptr, 1.0);

  ASSERT_EQ(state.compositionLog.size(), 2u);
  EXPECT_DOUBLE_EQ(state.compositionLog[0].time, 10.0);
  EXPECT_DOUBLE_EQ(state.compositionLog[1].time, 20.0);
}

TEST(RoomTest, Summarize) {
  auto state = Room<double>::Create(SimpleRoom());
  state.temperature = 20.04;
  const auto summary = Room<double>::Summarize(state);
  EXPECT_DOUBLE_EQ(summary.temperature, 20.0);
  EXPECT_DOUBLE_EQ(summary.pressure, 101.33);
  EXPECT_NEAR(summary.oxygen, 21.0, 1e-12);
  EXPECT_DOUBLE_EQ(summary.humidity, 0.0);
}
