#ifndef THERMINI_FORMULA_NEWTON_COOLING_HPP_
#define THERMINI_FORMULA_NEWTON_COOLING_HPP_

#include <algorithm>
#include <cmath>
#include <limits>

#include "Formula/Constants.hpp"

namespace thermini {

template<typename Scalar>
class NewtonCooling {
public:
  // Convective h*A presets, W/C
  inline static const Scalar kPotInStillAir = Scalar(0.3);
  inline static const Scalar kPotWithLid = Scalar(0.15);
  inline static const Scalar kCupInStillAir = Scalar(0.1);
  inline static const Scalar kLargeStockpot = Scalar(0.5);
  inline static const Scalar kPotWithFan = Scalar(0.8);

  // k = hA / (m c), mass in kg, c in J/(g C)
  static Scalar EffectiveCoefficient(Scalar convectiveHeatTransfer, Scalar mass, Scalar specificHeat);

  static Scalar Step(Scalar temperature, Scalar ambient, Scalar coefficient, Scalar dt);

  static Scalar TemperatureAtTime(Scalar initial, Scalar ambient, Scalar coefficient, Scalar time);

  // Infinity when the target cannot be reached by the decay
  static Scalar TimeToCool(Scalar initial, Scalar target, Scalar ambient, Scalar coefficient);

private:
  inline static const Scalar kFallbackCoefficient_ = Scalar(0.0015);
};

template<typename Scalar>
auto NewtonCooling<Scalar>::EffectiveCoefficient(
  const Scalar convectiveHeatTransfer,
  const Scalar mass,
  const Scalar specificHeat
) -> Scalar {
  const Scalar thermalMass = mass * specificHeat * Constants<Scalar>::kGramsPerKilogram;
  if (!std::isfinite(thermalMass) || thermalMass <= Scalar(0.0))
    return kFallbackCoefficient_;

  return convectiveHeatTransfer / thermalMass;
}

template<typename Scalar>
auto NewtonCooling<Scalar>::Step(const Scalar temperature, const Scalar ambient, const Scalar coefficient, const Scalar dt)
  -> Scalar {
  if (!std::isfinite(coefficient) || !std::isfinite(dt) || coefficient <= Scalar(0.0) || dt <= Scalar(0.0))
    return temperature;

  const Scalar difference = temperature - ambient;
  const Scalar next = temperature - coefficient * difference * dt;

  // Never overshoot past ambient
  if (difference > Scalar(0.0))
    return std::max(next, ambient);
  if (difference < Scalar(0.0))
    return std::min(next, ambient);
  return next;
}

template<typename Scalar>
auto NewtonCooling<Scalar>::TemperatureAtTime(
  const Scalar initial,
  const Scalar ambient,
  const Scalar coefficient,
  const Scalar time
) -> Scalar {
  return ambient + (initial - ambient) * std::exp(-coefficient * time);
}

template<typename Scalar>
auto NewtonCooling<Scalar>::TimeToCool(
  const Scalar initial,
  const Scalar target,
  const Scalar ambient,
  const Scalar coefficient
) -> Scalar {
  const Scalar initialDiff = initial - ambient;
  const Scalar targetDiff = target - ambient;

  if (initialDiff * targetDiff < Scalar(0.0))
    return std::numeric_limits<Scalar>::infinity();

  if (std::abs(targetDiff) >= std::abs(initialDiff))
    return Scalar(0.0);

  const Scalar ratio = targetDiff / initialDiff;
  if (ratio <= Scalar(0.0) || coefficient <= Scalar(0.0))
    return std::numeric_limits<Scalar>::infinity();

  return -std::log(ratio) / coefficient;
}

} // namespace thermini

#endif // THERMINI_FORMULA_NEWTON_COOLING_HPP_
