#ifndef THERMINI_FORMULA_HEAT_CAPACITY_HPP_
#define THERMINI_FORMULA_HEAT_CAPACITY_HPP_

#include <cmath>
#include <limits>

#include "Formula/Constants.hpp"

namespace thermini {

// Sensible heat with mass in kg and specific heat in J/(g C)
template<typename Scalar>
class HeatCapacity {
public:
  static Scalar Energy(Scalar mass, Scalar specificHeat, Scalar deltaT);

  static Scalar TemperatureChange(Scalar mass, Scalar specificHeat, Scalar energy);

  static Scalar HeatingTime(Scalar mass, Scalar specificHeat, Scalar tempStart, Scalar tempEnd, Scalar watts);

protected:
  static bool validThermalMass(Scalar mass, Scalar specificHeat) {
    return std::isfinite(mass) && std::isfinite(specificHeat) && mass > Scalar(0.0) && specificHeat > Scalar(0.0);
  }
};

template<typename Scalar>
auto HeatCapacity<Scalar>::Energy(const Scalar mass, const Scalar specificHeat, const Scalar deltaT) -> Scalar {
  if (!validThermalMass(mass, specificHeat) || !std::isfinite(deltaT))
    return Scalar(0.0);

  return mass * Constants<Scalar>::kGramsPerKilogram * specificHeat * deltaT;
}

template<typename Scalar>
auto HeatCapacity<Scalar>::TemperatureChange(const Scalar mass, const Scalar specificHeat, const Scalar energy) -> Scalar {
  if (!validThermalMass(mass, specificHeat) || !std::isfinite(energy))
    return Scalar(0.0);

  return energy / (mass * Constants<Scalar>::kGramsPerKilogram * specificHeat);
}

template<typename Scalar>
auto HeatCapacity<Scalar>::HeatingTime(
  const Scalar mass,
  const Scalar specificHeat,
  const Scalar tempStart,
  const Scalar tempEnd,
  const Scalar watts
) -> Scalar {
  if (!(watts > Scalar(0.0)))
    return std::numeric_limits<Scalar>::infinity();

  return std::abs(Energy(mass, specificHeat, tempEnd - tempStart)) / watts;
}

} // namespace thermini

#endif // THERMINI_FORMULA_HEAT_CAPACITY_HPP_
