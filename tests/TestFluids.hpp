#ifndef THERMINI_TESTS_TEST_FLUIDS_HPP_
#define THERMINI_TESTS_TEST_FLUIDS_HPP_

#include "Data/EquipmentData.hpp"
#include "Data/FluidData.hpp"
#include "Data/PidData.hpp"

namespace thermini::test {

// Water without a diffusion volume: boils but never evaporates below boiling
inline FluidData<double> Water() {
  FluidData<double> fluid{};
  fluid.id = "water";
  fluid.chemicalFormula = "H\xE2\x82\x82O";
  fluid.specificHeat = 4.186;
  fluid.heatOfVaporization = 2257.0;
  fluid.heatOfFusion = 334.0;
  fluid.meltingPoint = 0.0;
  fluid.boilingPointSeaLevel = 100.0;
  fluid.density = 1000.0;
  fluid.molarMass = 18.015;
  fluid.antoine = AntoineCoefficients<double>{ 8.07131, 1730.63, 233.426, 1.0, 100.0 };
  return fluid;
}

inline FluidData<double> WaterWithoutAntoine() {
  FluidData<double> fluid = Water();
  fluid.antoine.reset();
  return fluid;
}

inline FluidData<double> Ethanol() {
  FluidData<double> fluid{};
  fluid.id = "ethanol";
  fluid.chemicalFormula = "C2H5OH";
  fluid.specificHeat = 2.44;
  fluid.heatOfVaporization = 838.0;
  fluid.boilingPointSeaLevel = 78.37;
  fluid.density = 789.0;
  fluid.molarMass = 46.07;
  fluid.diffusionVolumeSum = 51.77;
  fluid.antoine = AntoineCoefficients<double>{ 8.20417, 1642.89, 230.3, -57.0, 80.0 };
  return fluid;
}

// Cooking oil: heats without a boiling point
inline FluidData<double> Oil() {
  FluidData<double> fluid{};
  fluid.id = "oil";
  fluid.specificHeat = 2.0;
  fluid.density = 920.0;
  return fluid;
}

inline AcData<double> BalancedAc() {
  AcData<double> ac{};
  ac.coolingMaxWatts = 2000.0;
  ac.heatingMaxWatts = 2000.0;
  ac.gains = PidGains<double>::Preset(PidPresetEnum::Balanced);
  return ac;
}

inline AirHandlerData<double> AirHandler() {
  AirHandlerData<double> airHandler{};
  airHandler.filtrationEfficiency = { { "NH3", 0.95 }, { "CO2", 0.9 } };
  airHandler.operatingModes = { { "low", 25.0 }, { "high", 100.0 } };
  return airHandler;
}

} // namespace thermini::test

#endif // THERMINI_TESTS_TEST_FLUIDS_HPP_
