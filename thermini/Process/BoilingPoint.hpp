#ifndef THERMINI_PROCESS_BOILING_POINT_HPP_
#define THERMINI_PROCESS_BOILING_POINT_HPP_

#include <cmath>
#include <optional>

#include "Data/FluidData.hpp"
#include "Data/FluidState.hpp"
#include "Formula/Antoine.hpp"
#include "Formula/Atmosphere.hpp"
#include "Formula/Ebullioscopy.hpp"
#include "Formula/HeatCapacity.hpp"

namespace thermini {

enum class BoilingPointSourceEnum {
  Antoine,       // Antoine inverse at the ambient pressure
  LapseRate,     // Linear drop with altitude
  PressureRatio, // Linear drop with pressure ratio
};

template<typename Scalar>
struct BoilingPointResult {
  Scalar temperature;        // Base plus elevation, C
  Scalar baseBoilingPoint;   // Pure solvent, C
  Scalar elevation;          // Colligative elevation, C
  bool isExtrapolated;
  VerifiedRange<Scalar> verifiedRange;
  BoilingPointSourceEnum source;
};

// Boiling temperature of a fluid record at a given altitude or pressure.
// Antoine coefficients take precedence; without them the linear models are
// used as documented fallbacks and flagged through the result source.
template<typename Scalar>
class BoilingPoint {
public:
  inline static const Scalar kDefaultLapseRate = Scalar(1.0) / Scalar(300.0); // C/m
  inline static const Scalar kPressureRatioDrop = Scalar(30.0);                // C at zero pressure

  static std::optional<BoilingPointResult<Scalar>> AtAltitude(Scalar altitude, const FluidData<Scalar>& fluid);

  static std::optional<BoilingPointResult<Scalar>> AtPressure(Scalar pressure, const FluidData<Scalar>& fluid);

  // Seconds of heating to reach the boiling point, empty when it will not boil
  static std::optional<Scalar> ExpectedBoilTime(
    const FluidData<Scalar>& fluid,
    const FluidState<Scalar>& state,
    Scalar boilingPoint,
    Scalar watts
  );

  static Scalar Elevation(Scalar baseBoilingPoint, const FluidData<Scalar>& fluid);

protected:
  static std::optional<BoilingPointResult<Scalar>> fromAntoine(Scalar pressure, const FluidData<Scalar>& fluid);

  static BoilingPointResult<Scalar> fromBase(
    Scalar baseBoilingPoint,
    const FluidData<Scalar>& fluid,
    BoilingPointSourceEnum source
  );
};

template<typename Scalar>
auto BoilingPoint<Scalar>::AtAltitude(Scalar altitude, const FluidData<Scalar>& fluid)
  -> std::optional<BoilingPointResult<Scalar>> {
  if (!fluid.boilingPointSeaLevel || !std::isfinite(*fluid.boilingPointSeaLevel))
    return std::nullopt;

  if (!std::isfinite(altitude))
    altitude = Scalar(0.0);

  if (auto result = fromAntoine(Atmosphere<Scalar>::Pressure(altitude), fluid))
    return result;

  const Scalar lapseRate = (fluid.altitudeLapseRate && std::isfinite(*fluid.altitudeLapseRate))
    ? *fluid.altitudeLapseRate
    : kDefaultLapseRate;
  const Scalar base = *fluid.boilingPointSeaLevel - altitude * lapseRate;
  return fromBase(base, fluid, BoilingPointSourceEnum::LapseRate);
}

template<typename Scalar>
auto BoilingPoint<Scalar>::AtPressure(Scalar pressure, const FluidData<Scalar>& fluid)
  -> std::optional<BoilingPointResult<Scalar>> {
  if (!fluid.boilingPointSeaLevel || !std::isfinite(*fluid.boilingPointSeaLevel))
    return std::nullopt;

  if (!std::isfinite(pressure) || pressure <= Scalar(0.0))
    pressure = Atmosphere<Scalar>::kP0;

  if (auto result = fromAntoine(pressure, fluid))
    return result;

  const Scalar ratio = pressure / Atmosphere<Scalar>::kP0;
  const Scalar base = *fluid.boilingPointSeaLevel - (Scalar(1.0) - ratio) * kPressureRatioDrop;
  return fromBase(base, fluid, BoilingPointSourceEnum::PressureRatio);
}

template<typename Scalar>
auto BoilingPoint<Scalar>::ExpectedBoilTime(
  const FluidData<Scalar>& fluid,
  const FluidState<Scalar>& state,
  const Scalar boilingPoint,
  const Scalar watts
) -> std::optional<Scalar> {
  if (!fluid.CanBoil() || !fluid.IsValid() || !(state.mass > Scalar(0.0)) || !std::isfinite(boilingPoint))
    return std::nullopt;
  if (state.temperature >= boilingPoint || !(watts > Scalar(0.0)))
    return std::nullopt;

  return HeatCapacity<Scalar>::HeatingTime(state.mass, fluid.specificHeat, state.temperature, boilingPoint, watts);
}

template<typename Scalar>
auto BoilingPoint<Scalar>::Elevation(const Scalar baseBoilingPoint, const FluidData<Scalar>& fluid) -> Scalar {
  if (fluid.vanHoffFactor && fluid.molality && std::isfinite(*fluid.vanHoffFactor) && std::isfinite(*fluid.molality)) {
    // Solvent data from the record when present, water otherwise
    Scalar molarMass = Ebullioscopy<Scalar>::kWaterMolarMass;
    Scalar enthalpy = Ebullioscopy<Scalar>::kWaterHeatOfVaporization;
    if (fluid.molarMass && fluid.heatOfVaporization && *fluid.molarMass > Scalar(0.0)
        && *fluid.heatOfVaporization > Scalar(0.0)) {
      molarMass = *fluid.molarMass;
      enthalpy = *fluid.heatOfVaporization * molarMass / Scalar(1000.0);
    }
    const Scalar kb = Ebullioscopy<Scalar>::DynamicKb(baseBoilingPoint, molarMass, enthalpy);
    return Ebullioscopy<Scalar>::Elevation(*fluid.vanHoffFactor, kb, *fluid.molality);
  }

  if (fluid.boilingPointElevation && std::isfinite(*fluid.boilingPointElevation))
    return *fluid.boilingPointElevation;

  return Scalar(0.0);
}

template<typename Scalar>
auto BoilingPoint<Scalar>::fromAntoine(const Scalar pressure, const FluidData<Scalar>& fluid)
  -> std::optional<BoilingPointResult<Scalar>> {
  if (!fluid.antoine)
    return std::nullopt;

  const auto antoine = Antoine<Scalar>::Temperature(pressure, *fluid.antoine);
  if (!antoine || !std::isfinite(antoine->temperature))
    return std::nullopt;

  const Scalar elevation = Elevation(antoine->temperature, fluid);
  return BoilingPointResult<Scalar>{
    antoine->temperature + elevation,
    antoine->temperature,
    elevation,
    antoine->isExtrapolated,
    antoine->verifiedRange,
    BoilingPointSourceEnum::Antoine,
  };
}

template<typename Scalar>
auto BoilingPoint<Scalar>::fromBase(
  const Scalar baseBoilingPoint,
  const FluidData<Scalar>& fluid,
  const BoilingPointSourceEnum source
) -> BoilingPointResult<Scalar> {
  const Scalar elevation = Elevation(baseBoilingPoint, fluid);
  return { baseBoilingPoint + elevation, baseBoilingPoint, elevation, false, {}, source };
}

} // namespace thermini

#endif // THERMINI_PROCESS_BOILING_POINT_HPP_
