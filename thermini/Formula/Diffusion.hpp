#ifndef THERMINI_FORMULA_DIFFUSION_HPP_
#define THERMINI_FORMULA_DIFFUSION_HPP_

#include <cmath>
#include <optional>
#include <utility>
#include <vector>

#include "Formula/Constants.hpp"

namespace thermini {

// Fuller-Schettler-Giddings binary gas diffusion
template<typename Scalar>
class Diffusion {
public:
  // Sum of (atom count, atomic diffusion volume) pairs
  static std::optional<Scalar> VolumeSum(const std::vector<std::pair<int, Scalar>>& elements);

  // D_AB in cm^2/s, temperature in K, pressure in atm, molar masses in g/mol
  static Scalar Coefficient(
    Scalar temperature,
    Scalar pressure,
    Scalar molarMassA,
    Scalar diffusionVolumeA,
    Scalar molarMassB = Constants<Scalar>::kAirMolarMass,
    Scalar diffusionVolumeB = Constants<Scalar>::kAirDiffusionVolume
  );

  // Vapor into air in m^2/s, temperature in C, pressure in Pa
  static Scalar InAir(Scalar temperature, Scalar pressure, Scalar molarMass, Scalar diffusionVolumeSum);
};

template<typename Scalar>
auto Diffusion<Scalar>::VolumeSum(const std::vector<std::pair<int, Scalar>>& elements) -> std::optional<Scalar> {
  if (elements.empty())
    return std::nullopt;

  Scalar sum = Scalar(0.0);
  for (const auto& [count, volume] : elements) {
    if (!std::isfinite(volume) || volume <= Scalar(0.0))
      return std::nullopt;
    sum += Scalar(count > 0 ? count : 1) * volume;
  }
  return sum;
}

template<typename Scalar>
auto Diffusion<Scalar>::Coefficient(
  const Scalar temperature,
  const Scalar pressure,
  const Scalar molarMassA,
  const Scalar diffusionVolumeA,
  const Scalar molarMassB,
  const Scalar diffusionVolumeB
) -> Scalar {
  if (!(temperature > Scalar(0.0)) || !(pressure > Scalar(0.0)) || !(molarMassA > Scalar(0.0))
      || !(molarMassB > Scalar(0.0)))
    return Scalar(0.0);
  if (!(diffusionVolumeA > Scalar(0.0)) || !(diffusionVolumeB > Scalar(0.0)))
    return Scalar(0.0);

  const Scalar reducedMass = Scalar(2.0) / (Scalar(1.0) / molarMassA + Scalar(1.0) / molarMassB);
  const Scalar third = Scalar(1.0) / Scalar(3.0);
  const Scalar volumes = std::pow(diffusionVolumeA, third) + std::pow(diffusionVolumeB, third);

  return Scalar(0.00143) * std::pow(temperature, Scalar(1.75)) / (pressure * std::sqrt(reducedMass) * volumes * volumes);
}

template<typename Scalar>
auto Diffusion<Scalar>::InAir(
  const Scalar temperature,
  const Scalar pressure,
  const Scalar molarMass,
  const Scalar diffusionVolumeSum
) -> Scalar {
  const Scalar kelvin = temperature + Constants<Scalar>::kKelvinOffset;
  const Scalar atm = pressure / Constants<Scalar>::kSeaLevelPressure;
  return Coefficient(kelvin, atm, molarMass, diffusionVolumeSum) * Scalar(1.0e-4);
}

} // namespace thermini

#endif // THERMINI_FORMULA_DIFFUSION_HPP_
