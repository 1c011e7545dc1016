#ifndef THERMINI_FORMULA_ANTOINE_HPP_
#define THERMINI_FORMULA_ANTOINE_HPP_

#include <cmath>
#include <optional>

#include "Data/FluidData.hpp"
#include "Formula/Constants.hpp"

namespace thermini {

template<typename Scalar>
struct AntoineResult {
  Scalar temperature;            // C
  bool isExtrapolated;           // Outside the fitted range
  VerifiedRange<Scalar> verifiedRange;
};

// log10(P[mmHg]) = A - B / (C + T[C]), pressures exchanged in Pa
template<typename Scalar>
class Antoine {
public:
  static std::optional<Scalar> VaporPressure(Scalar temperature, const AntoineCoefficients<Scalar>& coefficients);

  static std::optional<AntoineResult<Scalar>> Temperature(Scalar pressure, const AntoineCoefficients<Scalar>& coefficients);

private:
  inline static const Scalar kTolerance_ = Scalar(0.5);
  inline static const Scalar kTiny_ = Scalar(1.0e-10);
};

template<typename Scalar>
auto Antoine<Scalar>::VaporPressure(const Scalar temperature, const AntoineCoefficients<Scalar>& coefficients)
  -> std::optional<Scalar> {
  if (!coefficients.IsValid() || !std::isfinite(temperature))
    return std::nullopt;

  const Scalar denominator = coefficients.C + temperature;
  if (std::abs(denominator) < kTiny_)
    return std::nullopt;

  const Scalar logP = coefficients.A - coefficients.B / denominator;
  return std::pow(Scalar(10.0), logP) * Constants<Scalar>::kPaPerMmHg;
}

template<typename Scalar>
auto Antoine<Scalar>::Temperature(const Scalar pressure, const AntoineCoefficients<Scalar>& coefficients)
  -> std::optional<AntoineResult<Scalar>> {
  if (!coefficients.IsValid() || !std::isfinite(pressure) || pressure <= Scalar(0.0))
    return std::nullopt;

  const Scalar logP = std::log10(pressure / Constants<Scalar>::kPaPerMmHg);
  const Scalar denominator = coefficients.A - logP;
  if (std::abs(denominator) < kTiny_)
    return std::nullopt;

  const Scalar temperature = coefficients.B / denominator - coefficients.C;

  const auto& tmin = coefficients.TminC;
  const auto& tmax = coefficients.TmaxC;
  const bool belowMin = tmin && temperature < *tmin - kTolerance_;
  const bool aboveMax = tmax && temperature > *tmax + kTolerance_;

  return AntoineResult<Scalar>{ temperature, belowMin || aboveMax, { tmin, tmax } };
}

} // namespace thermini

#endif // THERMINI_FORMULA_ANTOINE_HPP_
