#ifndef THERMINI_FORMULA_LATENT_HEAT_HPP_
#define THERMINI_FORMULA_LATENT_HEAT_HPP_

#include <algorithm>
#include <cmath>

#include "Formula/Constants.hpp"

namespace thermini {

// Phase-change energy, latent heats in kJ/kg
template<typename Scalar>
class LatentHeat {
public:
  static Scalar Energy(Scalar mass, Scalar latentHeat);

  static Scalar Mass(Scalar energy, Scalar latentHeat);

  static Scalar VaporizationEnergy(Scalar mass, Scalar heatOfVaporization) { return Energy(mass, heatOfVaporization); }

  static Scalar VaporizedMass(Scalar energy, Scalar heatOfVaporization) { return Mass(energy, heatOfVaporization); }

  static Scalar FusionEnergy(Scalar mass, Scalar heatOfFusion) { return Energy(mass, heatOfFusion); }

  static Scalar MeltedMass(Scalar energy, Scalar heatOfFusion) { return Mass(energy, heatOfFusion); }
};

template<typename Scalar>
auto LatentHeat<Scalar>::Energy(const Scalar mass, const Scalar latentHeat) -> Scalar {
  if (!std::isfinite(mass) || !std::isfinite(latentHeat) || mass <= Scalar(0.0) || latentHeat <= Scalar(0.0))
    return Scalar(0.0);

  return mass * latentHeat * Constants<Scalar>::kGramsPerKilogram;
}

template<typename Scalar>
auto LatentHeat<Scalar>::Mass(const Scalar energy, const Scalar latentHeat) -> Scalar {
  if (!std::isfinite(energy) || !std::isfinite(latentHeat) || latentHeat <= Scalar(0.0))
    return Scalar(0.0);

  return std::max(Scalar(0.0), energy / (latentHeat * Constants<Scalar>::kGramsPerKilogram));
}

} // namespace thermini

#endif // THERMINI_FORMULA_LATENT_HEAT_HPP_
