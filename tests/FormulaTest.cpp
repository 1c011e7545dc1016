#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "Formula/Antoine.hpp"
#include "Formula/Atmosphere.hpp"
#include "Formula/Diffusion.hpp"
#include "Formula/Ebullioscopy.hpp"
#include "Formula/GasExchange.hpp"
#include "Formula/HeatCapacity.hpp"
#include "Formula/LatentHeat.hpp"
#include "Formula/MassTransfer.hpp"
#include "Formula/NewtonCooling.hpp"
#include "Formula/Pid.hpp"
#include "Formula/TemperatureConversion.hpp"
#include "Utils.hpp"

using namespace thermini;

namespace {
const AntoineCoefficients<double> kWaterAntoine{ 8.07131, 1730.63, 233.426, 1.0, 100.0 };
}

// ── Heat capacity and latent heat ───────────────────────────────────

TEST(HeatCapacityTest, SensibleEnergy) {
  EXPECT_NEAR(HeatCapacity<double>::Energy(1.0, 4.186, 80.0), 334880.0, 1e-6);
  EXPECT_NEAR(HeatCapacity<double>::TemperatureChange(1.0, 4.186, 4186.0), 1.0, 1e-12);
}

TEST(HeatCapacityTest, InvalidInputsYieldZero) {
  EXPECT_DOUBLE_EQ(HeatCapacity<double>::Energy(0.0, 4.186, 10.0), 0.0);
  EXPECT_DOUBLE_EQ(HeatCapacity<double>::Energy(-1.0, 4.186, 10.0), 0.0);
  EXPECT_DOUBLE_EQ(HeatCapacity<double>::TemperatureChange(1.0, 0.0, 1000.0), 0.0);
  EXPECT_DOUBLE_EQ(HeatCapacity<double>::Energy(1.0, 4.186, std::nan("")), 0.0);
}

TEST(HeatCapacityTest, HeatingTime) {
  EXPECT_NEAR(HeatCapacity<double>::HeatingTime(1.0, 4.186, 20.0, 100.0, 1700.0), 334880.0 / 1700.0, 1e-9);
  EXPECT_TRUE(std::isinf(HeatCapacity<double>::HeatingTime(1.0, 4.186, 20.0, 100.0, 0.0)));
}

TEST(LatentHeatTest, EnergyAndMass) {
  EXPECT_NEAR(LatentHeat<double>::VaporizationEnergy(0.1, 2257.0), 225700.0, 1e-6);
  EXPECT_NEAR(LatentHeat<double>::VaporizedMass(225700.0, 2257.0), 0.1, 1e-12);
  EXPECT_NEAR(LatentHeat<double>::FusionEnergy(1.0, 334.0), 334000.0, 1e-6);
  EXPECT_DOUBLE_EQ(LatentHeat<double>::Mass(-5.0, 2257.0), 0.0);
  EXPECT_DOUBLE_EQ(LatentHeat<double>::Energy(1.0, 0.0), 0.0);
}

// ── Newton cooling ───────────────────────────────────────────────────

TEST(NewtonCoolingTest, StepTowardAmbient) {
  EXPECT_NEAR(NewtonCooling<double>::Step(90.0, 20.0, 0.01, 1.0), 89.3, 1e-12);
  EXPECT_NEAR(NewtonCooling<double>::Step(10.0, 20.0, 0.01, 1.0), 10.1, 1e-12);
}

TEST(NewtonCoolingTest, StepNeverOvershoots) {
  EXPECT_DOUBLE_EQ(NewtonCooling<double>::Step(21.0, 20.0, 10.0, 1.0), 20.0);
  EXPECT_DOUBLE_EQ(NewtonCooling<double>::Step(19.0, 20.0, 10.0, 1.0), 20.0);
}

TEST(NewtonCoolingTest, InvalidCoefficientLeavesTemperature) {
  EXPECT_DOUBLE_EQ(NewtonCooling<double>::Step(90.0, 20.0, 0.0, 1.0), 90.0);
  EXPECT_DOUBLE_EQ(NewtonCooling<double>::Step(90.0, 20.0, 0.01, -1.0), 90.0);
}

TEST(NewtonCoolingTest, ClosedForm) {
  EXPECT_NEAR(NewtonCooling<double>::TemperatureAtTime(90.0, 20.0, 0.01, 100.0), 20.0 + 70.0 * std::exp(-1.0), 1e-12);
  EXPECT_NEAR(NewtonCooling<double>::TimeToCool(90.0, 55.0, 20.0, 0.01), std::log(2.0) / 0.01, 1e-9);
  EXPECT_TRUE(std::isinf(NewtonCooling<double>::TimeToCool(90.0, 10.0, 20.0, 0.01)));
  EXPECT_DOUBLE_EQ(NewtonCooling<double>::TimeToCool(50.0, 60.0, 20.0, 0.01), 0.0);
  EXPECT_TRUE(std::isinf(NewtonCooling<double>::TimeToCool(90.0, 55.0, 20.0, 0.0)));
}

TEST(NewtonCoolingTest, EffectiveCoefficient) {
  EXPECT_NEAR(NewtonCooling<double>::EffectiveCoefficient(0.3, 1.0, 4.186), 0.3 / 4186.0, 1e-15);
  EXPECT_DOUBLE_EQ(NewtonCooling<double>::EffectiveCoefficient(0.3, 0.0, 4.186), 0.0015);
}

// ── Antoine ──────────────────────────────────────────────────────────

TEST(AntoineTest, WaterNormalBoilingPoint) {
  const auto result = Antoine<double>::Temperature(101325.0, kWaterAntoine);
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->temperature, 99.997, 0.01);
  EXPECT_FALSE(result->isExtrapolated);
  ASSERT_TRUE(result->verifiedRange.max.has_value());
  EXPECT_DOUBLE_EQ(*result->verifiedRange.max, 100.0);
}

TEST(AntoineTest, VaporPressureInvertsTemperature) {
  const auto pressure = Antoine<double>::VaporPressure(100.0, kWaterAntoine);
  ASSERT_TRUE(pressure.has_value());
  EXPECT_NEAR(*pressure, 101336.2, 1.0);

  const auto temperature = Antoine<double>::Temperature(*pressure, kWaterAntoine);
  ASSERT_TRUE(temperature.has_value());
  EXPECT_NEAR(temperature->temperature, 100.0, 1e-9);
}

TEST(AntoineTest, VaporPressureRisesWithTemperature) {
  double previous = 0.0;
  for (double temperature = -20.0; temperature <= 150.0; temperature += 0.5) {
    const auto pressure = Antoine<double>::VaporPressure(temperature, kWaterAntoine);
    ASSERT_TRUE(pressure.has_value());
    EXPECT_GT(*pressure, previous) << "at " << temperature << " C";
    previous = *pressure;
  }
}

TEST(AntoineTest, RoundTripAcrossVerifiedRange) {
  for (double temperature = 1.0; temperature <= 100.0; temperature += 0.25) {
    const auto pressure = Antoine<double>::VaporPressure(temperature, kWaterAntoine);
    ASSERT_TRUE(pressure.has_value());
    const auto result = Antoine<double>::Temperature(*pressure, kWaterAntoine);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->temperature, temperature, 1e-9);
    EXPECT_FALSE(result->isExtrapolated) << "at " << temperature << " C";
  }
}

TEST(AntoineTest, ExtrapolationFlag) {
  const auto result = Antoine<double>::Temperature(202650.0, kWaterAntoine);
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->temperature, 120.52, 0.01);
  EXPECT_TRUE(result->isExtrapolated);
}

TEST(AntoineTest, InvalidInputs) {
  const AntoineCoefficients<double> zeroA{ 0.0, 1730.63, 233.426, std::nullopt, std::nullopt };
  EXPECT_FALSE(Antoine<double>::Temperature(101325.0, zeroA).has_value());
  EXPECT_FALSE(Antoine<double>::Temperature(0.0, kWaterAntoine).has_value());
  EXPECT_FALSE(Antoine<double>::Temperature(-10.0, kWaterAntoine).has_value());
  EXPECT_FALSE(Antoine<double>::VaporPressure(-233.426, kWaterAntoine).has_value());
}

// ── Atmosphere ───────────────────────────────────────────────────────

TEST(AtmosphereTest, Pressure) {
  EXPECT_NEAR(Atmosphere<double>::Pressure(0.0), 101325.0, 1e-9);
  EXPECT_NEAR(Atmosphere<double>::Pressure(1500.0), 84556.3, 0.5);
  EXPECT_NEAR(Atmosphere<double>::Pressure(std::nan("")), 101325.0, 1e-9);
  EXPECT_GT(Atmosphere<double>::Pressure(50000.0), 0.0);
}

TEST(AtmosphereTest, PressureFallsWithAltitude) {
  double previous = Atmosphere<double>::Pressure(-500.0);
  for (double altitude = 0.0; altitude <= 30000.0; altitude += 250.0) {
    const double pressure = Atmosphere<double>::Pressure(altitude);
    EXPECT_LT(pressure, previous) << "at " << altitude << " m";
    EXPECT_GT(pressure, 0.0);
    previous = pressure;
  }

  // Continuous across the tropopause
  EXPECT_NEAR(Atmosphere<double>::Pressure(11000.0), Atmosphere<double>::Pressure(11000.001), 0.01);
  EXPECT_NEAR(Atmosphere<double>::Pressure(11000.0), 22632.0, 1.0);
  EXPECT_GT(Atmosphere<double>::Pressure(44000.0), Atmosphere<double>::Pressure(45000.0));
}

TEST(AtmosphereTest, TemperatureClampsAtTropopause) {
  EXPECT_NEAR(Atmosphere<double>::Temperature(0.0), 288.15, 1e-12);
  EXPECT_DOUBLE_EQ(Atmosphere<double>::Temperature(20000.0), 216.65);
}

TEST(AtmosphereTest, AltitudeFromPressure) {
  EXPECT_NEAR(Atmosphere<double>::AltitudeFromPressure(Atmosphere<double>::Pressure(2000.0)), 2000.0, 1e-6);
  EXPECT_DOUBLE_EQ(Atmosphere<double>::AltitudeFromPressure(110000.0), 0.0);
  EXPECT_NEAR(Atmosphere<double>::AltitudeFromPressure(Atmosphere<double>::Pressure(20000.0)), 20000.0, 1e-6);
  EXPECT_TRUE(std::isinf(Atmosphere<double>::AltitudeFromPressure(0.0)));
}

// ── Ebullioscopy and diffusion ──────────────────────────────────────

TEST(EbullioscopyTest, WaterConstant) {
  EXPECT_NEAR(Ebullioscopy<double>::DynamicKb(100.0), 0.513, 0.001);
  EXPECT_NEAR(Ebullioscopy<double>::Elevation(2.0, 0.512, 1.0), 1.024, 1e-12);
  EXPECT_NEAR(Ebullioscopy<double>::MassPercentToMolality(10.0, 58.44), 1.9013, 1e-4);
  EXPECT_DOUBLE_EQ(Ebullioscopy<double>::MassPercentToMolality(100.0, 58.44), 0.0);
}

TEST(DiffusionTest, VolumeSum) {
  const auto water = Diffusion<double>::VolumeSum({ { 2, 2.31 }, { 1, 6.11 } });
  ASSERT_TRUE(water.has_value());
  EXPECT_NEAR(*water, 10.73, 1e-12);
  EXPECT_FALSE(Diffusion<double>::VolumeSum({}).has_value());
  EXPECT_FALSE(Diffusion<double>::VolumeSum({ { 1, -1.0 } }).has_value());
}

TEST(DiffusionTest, WaterVaporInAir) {
  EXPECT_NEAR(Diffusion<double>::Coefficient(298.15, 1.0, 18.015, 13.1), 0.2537, 1e-3);
  EXPECT_NEAR(Diffusion<double>::InAir(25.0, 101325.0, 18.015, 13.1), 0.2537e-4, 1e-7);
  EXPECT_DOUBLE_EQ(Diffusion<double>::Coefficient(0.0, 1.0, 18.015, 13.1), 0.0);
}

// ── Mass transfer ────────────────────────────────────────────────────

TEST(MassTransferTest, SherwoodRegimes) {
  EXPECT_DOUBLE_EQ(MassTransfer<double>::Sherwood(0.0), 0.1);
  EXPECT_NEAR(MassTransfer<double>::Sherwood(1.0e4), 0.54 * 10.0, 1e-9);
  EXPECT_NEAR(MassTransfer<double>::Sherwood(1.0e8), 0.15 * std::pow(1.0e8, 0.333), 1e-9);
}

TEST(MassTransferTest, EvaporationNeedsDrivingForce) {
  EXPECT_GT(MassTransfer<double>::EvaporatedMass(0.005, 5000.0, 0.0, 293.15, 0.0314, 0.046, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(MassTransfer<double>::EvaporatedMass(0.005, 5000.0, 6000.0, 293.15, 0.0314, 0.046, 1.0), 0.0);
  EXPECT_DOUBLE_EQ(MassTransfer<double>::KineticFlux(5000.0, 5000.0, 293.15, 0.046), 0.0);
}

TEST(MassTransferTest, EvaporativeCoolingIsNegative) {
  EXPECT_NEAR(MassTransfer<double>::EvaporativeCooling(0.001, 1.0, 2257.0, 4.186), -2257.0 / 4186.0, 1e-12);
  EXPECT_DOUBLE_EQ(MassTransfer<double>::EvaporativeCooling(0.001, 0.0, 2257.0, 4.186), 0.0);
}

// ── PID ──────────────────────────────────────────────────────────────

TEST(PidTest, OutputSaturates) {
  const PidGains<double> gains = PidGains<double>::Preset(PidPresetEnum::Balanced);
  const auto result = Pid<double>::Update(20.0, 15.0, gains, PidState<double>{}, 1.0);
  EXPECT_DOUBLE_EQ(result.error, 5.0);
  EXPECT_DOUBLE_EQ(result.p, 250.0);
  EXPECT_DOUBLE_EQ(result.i, 10.0);
  EXPECT_DOUBLE_EQ(result.d, 50.0);
  EXPECT_DOUBLE_EQ(result.output, 1.0);
  EXPECT_DOUBLE_EQ(result.state.previousError, 5.0);
  EXPECT_DOUBLE_EQ(result.state.lastUpdate, 1.0);
}

TEST(PidTest, IntegralIsClamped) {
  const PidGains<double> gains = PidGains<double>::Preset(PidPresetEnum::Balanced);
  PidState<double> state;
  state.integral = 99.0;
  const auto result = Pid<double>::Update(20.0, 15.0, gains, state, 1.0);
  EXPECT_DOUBLE_EQ(result.state.integral, 100.0);
}

TEST(PidTest, ZeroDtSkipsDerivative) {
  const PidGains<double> gains = PidGains<double>::Preset(PidPresetEnum::Balanced);
  PidState<double> state;
  state.integral = 3.0;
  const auto result = Pid<double>::Update(20.0, 19.5, gains, state, 0.0);
  EXPECT_DOUBLE_EQ(result.d, 0.0);
  EXPECT_DOUBLE_EQ(result.state.integral, 3.0);
  EXPECT_NEAR(result.output, (25.0 + 6.0) / 100.0, 1e-12);
}

TEST(PidTest, Deadband) {
  EXPECT_DOUBLE_EQ(Pid<double>::ApplyDeadband(0.5, 0.2, 0.5), 0.0);
  EXPECT_DOUBLE_EQ(Pid<double>::ApplyDeadband(0.5, -0.7, 0.5), 0.5);
}

// ── Gas exchange ─────────────────────────────────────────────────────

TEST(GasExchangeTest, ExchangeFraction) {
  EXPECT_NEAR(GasExchange<double>::ExchangeFraction(360.0, 30.0, 10.0), 1.0 / 30.0, 1e-12);
  EXPECT_DOUBLE_EQ(GasExchange<double>::ExchangeFraction(1.0e9, 30.0, 10.0), 1.0);
  EXPECT_DOUBLE_EQ(GasExchange<double>::ExchangeFraction(0.0, 30.0, 10.0), 0.0);
  EXPECT_NEAR(GasExchange<double>::CfmToM3PerHour(150.0), 254.85, 1e-9);
}

TEST(GasExchangeTest, FullExchangeReachesTarget) {
  const Composition<double> current{ { "N2", 1.0 } };
  const Composition<double> target{ { "N2", 0.8 }, { "O2", 0.2 } };
  const auto result = GasExchange<double>::Mix(current, target, 1.0, { { "N2", 1.0 }, { "O2", 1.0 } });
  EXPECT_NEAR(result.composition.Get("N2"), 0.8, 1e-12);
  EXPECT_NEAR(result.composition.Get("O2"), 0.2, 1e-12);
  EXPECT_NEAR(result.changes.Get("O2"), 0.2, 1e-12);
  EXPECT_NEAR(result.changes.Get("N2"), -0.2, 1e-12);
}

TEST(GasExchangeTest, UnequalEfficienciesKeepTheSum) {
  const Composition<double> current{ { "N2", 0.7 }, { "O2", 0.2 }, { "CO2", 0.1 } };
  const Composition<double> target{ { "N2", 0.79 }, { "O2", 0.21 } };
  const auto result = GasExchange<double>::Mix(current, target, 0.5, { { "CO2", 0.9 }, { "O2", 0.2 } });
  EXPECT_NEAR(result.composition.Sum(), 1.0, 1e-12);
  EXPECT_LT(result.composition.Get("CO2"), 0.1);
  for (Eigen::Index i = 0; i < result.composition.Size(); ++i)
    EXPECT_GE(result.composition.Fractions()(i), 0.0);
}

TEST(GasExchangeTest, StandardAtmospheres) {
  EXPECT_NEAR(GasExchange<double>::Earth().Get("O2"), 0.2095, 1e-12);
  const auto mars = GasExchange<double>::StandardAtmosphere("mars");
  ASSERT_TRUE(mars.has_value());
  EXPECT_NEAR(mars->Get("CO2"), 0.9532, 1e-12);
  EXPECT_FALSE(GasExchange<double>::StandardAtmosphere("venus").has_value());
}

// ── Utilities ────────────────────────────────────────────────────────

TEST(UtilsTest, NormalizeFormula) {
  EXPECT_EQ(NormalizeFormula("H\xE2\x82\x82O"), "H2O");
  EXPECT_EQ(NormalizeFormula("C\xE2\x82\x82H\xE2\x82\x85OH"), "C2H5OH");
  EXPECT_EQ(NormalizeFormula("NH3"), "NH3");
}

TEST(UtilsTest, TemperatureConversion) {
  EXPECT_NEAR(TemperatureConversion<double>::CelsiusToFahrenheit(100.0), 212.0, 1e-12);
  EXPECT_NEAR(TemperatureConversion<double>::FahrenheitToCelsius(32.0), 0.0, 1e-12);
  EXPECT_NEAR(TemperatureConversion<double>::KelvinToFahrenheit(273.15), 32.0, 1e-9);
}
