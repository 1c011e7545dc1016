#ifndef THERMINI_DATA_FLUID_DATA_HPP_
#define THERMINI_DATA_FLUID_DATA_HPP_

#include <cmath>
#include <optional>
#include <string>

namespace thermini {

template <typename Scalar>
struct AntoineCoefficients {
  Scalar A;                     // log10(P[mmHg]) = A - B / (C + T[C])
  Scalar B;
  Scalar C;
  std::optional<Scalar> TminC;  // Lower bound of the fitted range
  std::optional<Scalar> TmaxC;  // Upper bound of the fitted range

  bool IsValid() const {
    return std::isfinite(A) && std::isfinite(B) && std::isfinite(C) && A != Scalar(0.0) && B != Scalar(0.0);
  }
};

template <typename Scalar>
struct VerifiedRange {
  std::optional<Scalar> min;
  std::optional<Scalar> max;
};

// Immutable substance record for one phase
template <typename Scalar>
struct FluidData {
  std::string id;                                   // Substance identifier
  std::string chemicalFormula;                      // Room composition key
  Scalar specificHeat = Scalar(4.186);              // J/(g C)
  std::optional<Scalar> heatOfVaporization;         // kJ/kg
  std::optional<Scalar> heatOfFusion;               // kJ/kg
  std::optional<Scalar> meltingPoint;               // C
  std::optional<Scalar> boilingPointSeaLevel;       // C
  std::optional<Scalar> altitudeLapseRate;          // C/m, linear fallback model
  std::optional<AntoineCoefficients<Scalar>> antoine;
  Scalar density = Scalar(1000.0);                  // kg/m^3
  std::optional<Scalar> coolingCoefficient;         // 1/s, overrides the derived value
  std::optional<Scalar> convectiveHeatTransfer;     // h*A in W/C
  Scalar nonVolatileMassFraction = Scalar(0.0);     // Dissolved solids fraction
  std::optional<Scalar> molarMass;                  // g/mol
  std::optional<Scalar> diffusionVolumeSum;         // Fuller atomic volume sum
  std::optional<Scalar> vanHoffFactor;              // Solute dissociation factor
  std::optional<Scalar> molality;                   // mol solute / kg solvent
  std::optional<Scalar> boilingPointElevation;      // Precomputed elevation, C

  bool IsValid() const {
    return std::isfinite(specificHeat) && specificHeat > Scalar(0.0);
  }

  bool CanBoil() const {
    return boilingPointSeaLevel && std::isfinite(*boilingPointSeaLevel) && heatOfVaporization
      && std::isfinite(*heatOfVaporization) && *heatOfVaporization > Scalar(0.0);
  }

  bool CanFreeze() const {
    return meltingPoint && std::isfinite(*meltingPoint) && heatOfFusion && std::isfinite(*heatOfFusion)
      && *heatOfFusion > Scalar(0.0);
  }

  // Diffusion-driven evaporation needs the saturation curve and transport data
  bool CanEvaporate() const {
    return antoine && antoine->IsValid() && molarMass && *molarMass > Scalar(0.0) && diffusionVolumeSum
      && *diffusionVolumeSum > Scalar(0.0) && heatOfVaporization && *heatOfVaporization > Scalar(0.0);
  }
};

// Pot geometry used by the evaporation model
template <typename Scalar>
struct VesselData {
  Scalar diameter = Scalar(0.2); // m

  Scalar SurfaceArea() const { return Scalar(3.14159265358979323846) * diameter * diameter / Scalar(4.0); }

  Scalar CharacteristicLength() const { return diameter / Scalar(4.0); }
};

}  // namespace thermini

#endif  // THERMINI_DATA_FLUID_DATA_HPP_
