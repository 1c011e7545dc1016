#ifndef THERMINI_PROCESS_FLUID_STEP_HPP_
#define THERMINI_PROCESS_FLUID_STEP_HPP_

#include <algorithm>
#include <cmath>
#include <optional>

#include "Data/FluidData.hpp"
#include "Data/FluidState.hpp"
#include "Formula/Antoine.hpp"
#include "Formula/Atmosphere.hpp"
#include "Formula/Constants.hpp"
#include "Formula/Diffusion.hpp"
#include "Formula/HeatCapacity.hpp"
#include "Formula/LatentHeat.hpp"
#include "Formula/MassTransfer.hpp"
#include "Formula/NewtonCooling.hpp"
#include "Process/BoilingPoint.hpp"

namespace thermini {

enum class FluidPhaseEnum {
  Idle,
  Heating,
  Boiling,
  Cooling,
};

template<typename Scalar>
struct Surroundings {
  Scalar temperature = Scalar(20.0);   // Ambient air, C
  std::optional<Scalar> pressure;      // Room pressure, Pa (ISA at the pot altitude when empty)
  Scalar vaporPartialPressure = Scalar(0.0); // Bulk partial pressure of this species, Pa
};

template<typename Scalar>
struct FluidStepResult {
  FluidState<Scalar> state;
  FluidPhaseEnum phase = FluidPhaseEnum::Idle;
  bool isBoiling = false;
  bool isEvaporating = false;
  bool allEvaporated = false;
  std::optional<Scalar> boilingPoint;
  bool isExtrapolated = false;
  VerifiedRange<Scalar> verifiedRange{};
  Scalar steamGenerated = Scalar(0.0);       // kg vaporized at the boiling plateau
  Scalar evaporatedMass = Scalar(0.0);       // kg lost below boiling
  Scalar energyToVaporization = Scalar(0.0); // J
  Scalar energyToEvaporation = Scalar(0.0);  // J

  Scalar VaporMass() const { return steamGenerated + evaporatedMass; }
};

// One tick of the fluid thermal state machine. The input state is never
// modified; absent fluid properties pass the state through unchanged.
template<typename Scalar>
class FluidStep {
public:
  static FluidStepResult<Scalar> Step(
    const FluidState<Scalar>& state,
    Scalar heaterWatts,
    Scalar dt,
    const FluidData<Scalar>* fluid,
    const Surroundings<Scalar>& surroundings = {},
    const VesselData<Scalar>& vessel = {}
  );

  static std::optional<BoilingPointResult<Scalar>> BoilingPointFor(
    const FluidState<Scalar>& state,
    const FluidData<Scalar>& fluid,
    const Surroundings<Scalar>& surroundings
  );

protected:
  struct HeatResult {
    Scalar temperature;
    Scalar energyToVaporization;
    Scalar steam;
  };

  static HeatResult applyHeat(
    Scalar mass,
    Scalar temperature,
    Scalar energy,
    const std::optional<Scalar>& boilingPoint,
    const FluidData<Scalar>& fluid
  );

  static Scalar coolingCoefficient(Scalar mass, const FluidData<Scalar>& fluid);

  static Scalar evaporation(
    const FluidState<Scalar>& state,
    Scalar temperature,
    Scalar available,
    Scalar dt,
    const FluidData<Scalar>& fluid,
    const Surroundings<Scalar>& surroundings,
    const VesselData<Scalar>& vessel
  );

  static Scalar coolingFloor(const FluidData<Scalar>& fluid, const Surroundings<Scalar>& surroundings);

private:
  inline static const Scalar kAmbientEpsilon_ = Scalar(0.01);
};

template<typename Scalar>
auto FluidStep<Scalar>::Step(
  const FluidState<Scalar>& state,
  const Scalar heaterWatts,
  const Scalar dt,
  const FluidData<Scalar>* fluid,
  const Surroundings<Scalar>& surroundings,
  const VesselData<Scalar>& vessel
) -> FluidStepResult<Scalar> {
  FluidStepResult<Scalar> result;
  result.state = state;

  const Scalar evaporable = state.EvaporableMass();
  if (!(state.mass > Scalar(0.0)) || !(evaporable > Scalar(0.0))) {
    result.allEvaporated = !(evaporable > Scalar(0.0));
    return result;
  }

  if (fluid == nullptr || !fluid->IsValid() || !std::isfinite(dt) || dt <= Scalar(0.0))
    return result;

  const auto boiling = BoilingPointFor(state, *fluid, surroundings);
  const bool canBoil = fluid->CanBoil() && boiling.has_value();
  const std::optional<Scalar> boilingPoint = canBoil ? std::optional<Scalar>(boiling->temperature) : std::nullopt;

  const Scalar watts = std::isfinite(heaterWatts) ? heaterWatts : Scalar(0.0);
  const Scalar ambient = std::isfinite(surroundings.temperature) ? surroundings.temperature : Scalar(20.0);

  Scalar temperature = state.temperature;
  HeatResult heat{ temperature, Scalar(0.0), Scalar(0.0) };
  bool cooled = false;

  // Heater on: sensible heat up to the boiling point, the rest into vapor
  if (watts > Scalar(0.0)) {
    heat = applyHeat(state.mass, temperature, watts * dt, boilingPoint, *fluid);
    temperature = heat.temperature;
  } else if (std::abs(temperature - ambient) > kAmbientEpsilon_) {
    temperature = NewtonCooling<Scalar>::Step(temperature, ambient, coolingCoefficient(state.mass, *fluid), dt);
    cooled = true;
  }

  const Scalar steam = canBoil ? std::min(heat.steam, evaporable) : Scalar(0.0);

  // Sub-boiling evaporation, concurrent with heating or cooling
  Scalar evaporated = Scalar(0.0);
  bool drained = steam >= evaporable;
  if (fluid->CanEvaporate() && (!boilingPoint || temperature < *boilingPoint)) {
    const Scalar available = evaporable - steam;
    evaporated = evaporation(state, temperature, available, dt, *fluid, surroundings, vessel);
    // A tick that drains the liquid leaves nothing to cool
    drained = drained || (evaporated > Scalar(0.0) && evaporated >= available);
    if (evaporated > Scalar(0.0) && !drained) {
      const Scalar liquid = state.mass - steam;
      const Scalar latentHeat = *fluid->heatOfVaporization;
      const Scalar floor = coolingFloor(*fluid, surroundings);

      // Latent heat is bounded by the sensible heat the liquid holds above the floor
      const Scalar heatLimit = liquid * fluid->specificHeat * std::max(Scalar(0.0), temperature - floor) / latentHeat;
      evaporated = std::min(evaporated, heatLimit);
      temperature = std::max(
        floor,
        temperature + MassTransfer<Scalar>::EvaporativeCooling(evaporated, liquid, latentHeat, fluid->specificHeat)
      );
    }
  }

  result.state.temperature = temperature;
  result.state.mass = drained
    ? state.residueMass
    : std::max(state.mass - steam - evaporated, state.residueMass);
  result.steamGenerated = steam;
  result.evaporatedMass = evaporated;
  result.energyToVaporization = canBoil ? heat.energyToVaporization : Scalar(0.0);
  result.energyToEvaporation = evaporated > Scalar(0.0)
    ? LatentHeat<Scalar>::VaporizationEnergy(evaporated, *fluid->heatOfVaporization)
    : Scalar(0.0);
  result.isBoiling = canBoil && temperature >= *boilingPoint && steam > Scalar(0.0);
  result.isEvaporating = evaporated > Scalar(0.0);
  result.allEvaporated = !(result.state.EvaporableMass() > Scalar(0.0));

  if (boiling) {
    result.boilingPoint = boiling->temperature;
    result.isExtrapolated = boiling->isExtrapolated;
    result.verifiedRange = boiling->verifiedRange;
  }

  if (result.isBoiling)
    result.phase = FluidPhaseEnum::Boiling;
  else if (watts > Scalar(0.0))
    result.phase = FluidPhaseEnum::Heating;
  else if (cooled)
    result.phase = FluidPhaseEnum::Cooling;
  else
    result.phase = FluidPhaseEnum::Idle;

  return result;
}

template<typename Scalar>
auto FluidStep<Scalar>::BoilingPointFor(
  const FluidState<Scalar>& state,
  const FluidData<Scalar>& fluid,
  const Surroundings<Scalar>& surroundings
) -> std::optional<BoilingPointResult<Scalar>> {
  // Antoine at the room pressure when one is known, otherwise the altitude chain
  if (surroundings.pressure && fluid.antoine) {
    const auto result = BoilingPoint<Scalar>::AtPressure(*surroundings.pressure, fluid);
    if (result && result->source == BoilingPointSourceEnum::Antoine)
      return result;
  }
  return BoilingPoint<Scalar>::AtAltitude(state.altitude, fluid);
}

template<typename Scalar>
auto FluidStep<Scalar>::applyHeat(
  const Scalar mass,
  const Scalar temperature,
  const Scalar energy,
  const std::optional<Scalar>& boilingPoint,
  const FluidData<Scalar>& fluid
) -> HeatResult {
  const Scalar rise = HeatCapacity<Scalar>::TemperatureChange(mass, fluid.specificHeat, energy);
  const Scalar reached = temperature + rise;

  if (!boilingPoint || reached < *boilingPoint)
    return { reached, Scalar(0.0), Scalar(0.0) };

  // Temperature plateaus at the boiling point
  const Scalar toBoiling = HeatCapacity<Scalar>::Energy(mass, fluid.specificHeat, *boilingPoint - temperature);
  const Scalar remaining = energy - toBoiling;
  const Scalar steam = LatentHeat<Scalar>::VaporizedMass(remaining, *fluid.heatOfVaporization);

  return { *boilingPoint, remaining, steam };
}

template<typename Scalar>
auto FluidStep<Scalar>::coolingCoefficient(const Scalar mass, const FluidData<Scalar>& fluid) -> Scalar {
  if (fluid.coolingCoefficient && std::isfinite(*fluid.coolingCoefficient) && *fluid.coolingCoefficient > Scalar(0.0))
    return *fluid.coolingCoefficient;

  const Scalar hA = (fluid.convectiveHeatTransfer && *fluid.convectiveHeatTransfer > Scalar(0.0))
    ? *fluid.convectiveHeatTransfer
    : NewtonCooling<Scalar>::kPotInStillAir;
  return NewtonCooling<Scalar>::EffectiveCoefficient(hA, mass, fluid.specificHeat);
}

// Dew point of the room vapor, the low end of the fitted Antoine range, or absolute zero
template<typename Scalar>
auto FluidStep<Scalar>::coolingFloor(const FluidData<Scalar>& fluid, const Surroundings<Scalar>& surroundings) -> Scalar {
  Scalar floor = -Constants<Scalar>::kKelvinOffset;
  if (fluid.antoine && fluid.antoine->TminC && std::isfinite(*fluid.antoine->TminC))
    floor = std::max(floor, *fluid.antoine->TminC);
  if (fluid.antoine && surroundings.vaporPartialPressure > Scalar(0.0)) {
    const auto dewPoint = Antoine<Scalar>::Temperature(surroundings.vaporPartialPressure, *fluid.antoine);
    if (dewPoint && std::isfinite(dewPoint->temperature))
      floor = std::max(floor, dewPoint->temperature);
  }
  return floor;
}

template<typename Scalar>
auto FluidStep<Scalar>::evaporation(
  const FluidState<Scalar>& state,
  const Scalar temperature,
  const Scalar available,
  const Scalar dt,
  const FluidData<Scalar>& fluid,
  const Surroundings<Scalar>& surroundings,
  const VesselData<Scalar>& vessel
) -> Scalar {
  if (!(available > Scalar(0.0)))
    return Scalar(0.0);

  const auto saturation = Antoine<Scalar>::VaporPressure(temperature, *fluid.antoine);
  if (!saturation || !(*saturation > Scalar(0.0)))
    return Scalar(0.0);

  const Scalar pressure = (surroundings.pressure && *surroundings.pressure > Scalar(0.0))
    ? *surroundings.pressure
    : Atmosphere<Scalar>::Pressure(state.altitude);
  const Scalar molarMass = *fluid.molarMass;

  const Scalar diffusivity = Diffusion<Scalar>::InAir(temperature, pressure, molarMass, *fluid.diffusionVolumeSum);
  const Scalar moleFraction = std::min(Scalar(1.0), *saturation / pressure);
  const auto transfer = MassTransfer<Scalar>::Coefficient(
    temperature,
    vessel.CharacteristicLength(),
    diffusivity,
    molarMass,
    moleFraction
  );

  const Scalar evaporated = MassTransfer<Scalar>::EvaporatedMass(
    transfer.coefficient,
    *saturation,
    std::max(Scalar(0.0), surroundings.vaporPartialPressure),
    temperature + Constants<Scalar>::kKelvinOffset,
    vessel.SurfaceArea(),
    molarMass / Scalar(1000.0),
    dt
  );

  return std::min(evaporated, available);
}

} // namespace thermini

#endif // THERMINI_PROCESS_FLUID_STEP_HPP_
