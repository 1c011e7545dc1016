#ifndef THERMINI_FORMULA_MASS_TRANSFER_HPP_
#define THERMINI_FORMULA_MASS_TRANSFER_HPP_

#include <algorithm>
#include <cmath>

#include "Formula/Constants.hpp"

namespace thermini {

template<typename Scalar>
struct MassTransferResult {
  Scalar coefficient; // k_m, m/s
  Scalar sherwood;
  Scalar rayleigh;
  Scalar schmidt;
  Scalar grashof;
};

// Natural-convection evaporation from a horizontal liquid surface
template<typename Scalar>
class MassTransfer {
public:
  // Sutherland law, temperature in K, m^2/s
  static Scalar AirKinematicViscosity(Scalar temperature);

  static Scalar Schmidt(Scalar kinematicViscosity, Scalar diffusivity) {
    return diffusivity > Scalar(0.0) ? kinematicViscosity / diffusivity : Scalar(1.0);
  }

  static Scalar DensityRatio(Scalar molarMassVapor, Scalar vaporMoleFraction) {
    return (Scalar(1.0) - molarMassVapor / Constants<Scalar>::kAirMolarMass) * vaporMoleFraction;
  }

  static Scalar Grashof(Scalar length, Scalar kinematicViscosity, Scalar densityRatio) {
    return Constants<Scalar>::kGravity * length * length * length * std::abs(densityRatio)
      / (kinematicViscosity * kinematicViscosity);
  }

  static Scalar Sherwood(Scalar rayleigh);

  // Temperature in C, diffusivity in m^2/s, molar mass in g/mol
  static MassTransferResult<Scalar> Coefficient(
    Scalar temperature,
    Scalar length,
    Scalar diffusivity,
    Scalar molarMassVapor,
    Scalar saturationMoleFraction
  );

  // kg evaporated over dt, pressures in Pa, temperature in K, molar mass in kg/mol
  static Scalar EvaporatedMass(
    Scalar coefficient,
    Scalar saturationPressure,
    Scalar partialPressure,
    Scalar temperature,
    Scalar area,
    Scalar molarMass,
    Scalar dt
  );

  // Hertz-Knudsen kinetic flux in mol/(m^2 s), net of the bulk partial pressure
  static Scalar KineticFlux(
    Scalar saturationPressure,
    Scalar partialPressure,
    Scalar temperature,
    Scalar molarMass,
    Scalar alpha = Scalar(0.2)
  );

  // Temperature change of the remaining liquid, latent heat in kJ/kg
  static Scalar EvaporativeCooling(Scalar evaporatedMass, Scalar remainingMass, Scalar latentHeat, Scalar specificHeat);

private:
  inline static const Scalar kNuRef_ = Scalar(1.327e-5);
  inline static const Scalar kTRef_ = Scalar(273.15);
  inline static const Scalar kSutherland_ = Scalar(110.4);
  inline static const Scalar kTurbulentRayleigh_ = Scalar(1.0e7);
};

template<typename Scalar>
auto MassTransfer<Scalar>::AirKinematicViscosity(const Scalar temperature) -> Scalar {
  return kNuRef_ * std::pow(temperature / kTRef_, Scalar(1.5)) * (kTRef_ + kSutherland_) / (temperature + kSutherland_);
}

template<typename Scalar>
auto MassTransfer<Scalar>::Sherwood(const Scalar rayleigh) -> Scalar {
  if (!(rayleigh > Scalar(0.0)))
    return Scalar(0.1);
  if (rayleigh < kTurbulentRayleigh_)
    return Scalar(0.54) * std::pow(rayleigh, Scalar(0.25));
  return Scalar(0.15) * std::pow(rayleigh, Scalar(0.333));
}

template<typename Scalar>
auto MassTransfer<Scalar>::Coefficient(
  const Scalar temperature,
  const Scalar length,
  const Scalar diffusivity,
  const Scalar molarMassVapor,
  const Scalar saturationMoleFraction
) -> MassTransferResult<Scalar> {
  const Scalar nu = AirKinematicViscosity(temperature + Constants<Scalar>::kKelvinOffset);
  const Scalar sc = Schmidt(nu, diffusivity);
  const Scalar gr = Grashof(length, nu, DensityRatio(molarMassVapor, saturationMoleFraction));
  const Scalar ra = gr * sc;
  const Scalar sh = Sherwood(ra);
  const Scalar km = length > Scalar(0.0) ? sh * diffusivity / length : Scalar(0.0);

  return { km, sh, ra, sc, gr };
}

template<typename Scalar>
auto MassTransfer<Scalar>::EvaporatedMass(
  const Scalar coefficient,
  const Scalar saturationPressure,
  const Scalar partialPressure,
  const Scalar temperature,
  const Scalar area,
  const Scalar molarMass,
  const Scalar dt
) -> Scalar {
  if (!(temperature > Scalar(0.0)) || !(coefficient > Scalar(0.0)) || !(dt > Scalar(0.0)))
    return Scalar(0.0);

  const Scalar rt = Constants<Scalar>::kGasConstant * temperature;
  const Scalar deltaC = std::max(Scalar(0.0), (saturationPressure - partialPressure) / rt);
  return coefficient * deltaC * molarMass * area * dt;
}

template<typename Scalar>
auto MassTransfer<Scalar>::KineticFlux(
  const Scalar saturationPressure,
  const Scalar partialPressure,
  const Scalar temperature,
  const Scalar molarMass,
  const Scalar alpha
) -> Scalar {
  if (!(saturationPressure > Scalar(0.0)) || !(temperature > Scalar(0.0)) || !(molarMass > Scalar(0.0)))
    return Scalar(0.0);

  const Scalar gross = alpha * saturationPressure
    / std::sqrt(Scalar(2.0) * Constants<Scalar>::kPi * molarMass * Constants<Scalar>::kGasConstant * temperature);
  const Scalar drivingForce = Scalar(1.0) - partialPressure / saturationPressure;
  return gross * std::max(Scalar(0.0), drivingForce);
}

template<typename Scalar>
auto MassTransfer<Scalar>::EvaporativeCooling(
  const Scalar evaporatedMass,
  const Scalar remainingMass,
  const Scalar latentHeat,
  const Scalar specificHeat
) -> Scalar {
  if (!(remainingMass > Scalar(0.0)) || !(specificHeat > Scalar(0.0)))
    return Scalar(0.0);

  const Scalar energyRemoved = evaporatedMass * latentHeat * Constants<Scalar>::kGramsPerKilogram;
  return -energyRemoved / (remainingMass * Constants<Scalar>::kGramsPerKilogram * specificHeat);
}

} // namespace thermini

#endif // THERMINI_FORMULA_MASS_TRANSFER_HPP_
