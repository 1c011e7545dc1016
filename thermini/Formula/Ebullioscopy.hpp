#ifndef THERMINI_FORMULA_EBULLIOSCOPY_HPP_
#define THERMINI_FORMULA_EBULLIOSCOPY_HPP_

#include <cmath>

#include "Formula/Constants.hpp"

namespace thermini {

// Colligative boiling-point elevation with a temperature-dependent Kb
template<typename Scalar>
class Ebullioscopy {
public:
  inline static const Scalar kWaterMolarMass = Scalar(18.015);     // g/mol
  inline static const Scalar kWaterHeatOfVaporization = Scalar(40.66); // kJ/mol

  // Kb = R Tb^2 M / dHvap, in C kg/mol
  static Scalar DynamicKb(
    Scalar boilingTemperature,
    Scalar solventMolarMass = kWaterMolarMass,
    Scalar heatOfVaporization = kWaterHeatOfVaporization
  );

  static Scalar Elevation(Scalar vanHoffFactor, Scalar kb, Scalar molality);

  static Scalar MassPercentToMolality(Scalar massPercent, Scalar soluteMolarMass);
};

template<typename Scalar>
auto Ebullioscopy<Scalar>::DynamicKb(
  const Scalar boilingTemperature,
  const Scalar solventMolarMass,
  const Scalar heatOfVaporization
) -> Scalar {
  const Scalar tb = boilingTemperature + Constants<Scalar>::kKelvinOffset;
  const Scalar molarMass = solventMolarMass / Scalar(1000.0);
  const Scalar enthalpy = heatOfVaporization * Scalar(1000.0);
  if (!std::isfinite(tb) || !std::isfinite(molarMass) || !(enthalpy > Scalar(0.0)))
    return Scalar(0.0);

  return Constants<Scalar>::kGasConstant * tb * tb * molarMass / enthalpy;
}

template<typename Scalar>
auto Ebullioscopy<Scalar>::Elevation(const Scalar vanHoffFactor, const Scalar kb, const Scalar molality) -> Scalar {
  if (!std::isfinite(vanHoffFactor) || !std::isfinite(kb) || !std::isfinite(molality))
    return Scalar(0.0);

  return vanHoffFactor * kb * molality;
}

template<typename Scalar>
auto Ebullioscopy<Scalar>::MassPercentToMolality(const Scalar massPercent, const Scalar soluteMolarMass) -> Scalar {
  if (!std::isfinite(massPercent) || !std::isfinite(soluteMolarMass) || soluteMolarMass <= Scalar(0.0)
      || massPercent >= Scalar(100.0))
    return Scalar(0.0);

  // Per 100 g of solution
  const Scalar solventKg = (Scalar(100.0) - massPercent) / Scalar(1000.0);
  return (massPercent / soluteMolarMass) / solventKg;
}

} // namespace thermini

#endif // THERMINI_FORMULA_EBULLIOSCOPY_HPP_
