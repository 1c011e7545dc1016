#ifndef THERMINI_FORMULA_ATMOSPHERE_HPP_
#define THERMINI_FORMULA_ATMOSPHERE_HPP_

#include <algorithm>
#include <cmath>
#include <limits>

namespace thermini {

// ISA barometric model: lapse-rate troposphere, isothermal layer above 11 km
template<typename Scalar>
class Atmosphere {
public:
  inline static const Scalar kT0 = Scalar(288.15);      // Sea level temperature, K
  inline static const Scalar kLapse = Scalar(0.0065);   // K/m
  inline static const Scalar kP0 = Scalar(101325.0);    // Pa
  inline static const Scalar kG = Scalar(9.80665);      // m/s^2
  inline static const Scalar kM = Scalar(0.0289644);    // kg/mol
  inline static const Scalar kR = Scalar(8.31447);      // J/(mol K)
  inline static const Scalar kTropopause = Scalar(11000.0);
  inline static const Scalar kTropopauseTemperature = Scalar(216.65);

  static Scalar Exponent() { return kG * kM / (kR * kLapse); }

  static Scalar TropopausePressure() { return kP0 * std::pow(kTropopauseTemperature / kT0, Exponent()); }

  static Scalar Pressure(Scalar altitude);

  static Scalar Temperature(Scalar altitude);

  static Scalar AltitudeFromPressure(Scalar pressure);
};

template<typename Scalar>
auto Atmosphere<Scalar>::Pressure(Scalar altitude) -> Scalar {
  if (!std::isfinite(altitude))
    altitude = Scalar(0.0);

  if (altitude > kTropopause) {
    const Scalar scaleHeight = kR * kTropopauseTemperature / (kG * kM);
    return TropopausePressure() * std::exp(-(altitude - kTropopause) / scaleHeight);
  }

  return kP0 * std::pow((kT0 - kLapse * altitude) / kT0, Exponent());
}

template<typename Scalar>
auto Atmosphere<Scalar>::Temperature(Scalar altitude) -> Scalar {
  if (!std::isfinite(altitude))
    altitude = Scalar(0.0);

  return std::max(kT0 - kLapse * altitude, kTropopauseTemperature);
}

template<typename Scalar>
auto Atmosphere<Scalar>::AltitudeFromPressure(const Scalar pressure) -> Scalar {
  if (pressure >= kP0)
    return Scalar(0.0);
  if (pressure <= Scalar(0.0))
    return std::numeric_limits<Scalar>::infinity();

  if (pressure < TropopausePressure()) {
    const Scalar scaleHeight = kR * kTropopauseTemperature / (kG * kM);
    return kTropopause - scaleHeight * std::log(pressure / TropopausePressure());
  }

  const Scalar temperatureRatio = std::pow(pressure / kP0, Scalar(1.0) / Exponent());
  return (kT0 / kLapse) * (Scalar(1.0) - temperatureRatio);
}

} // namespace thermini

#endif // THERMINI_FORMULA_ATMOSPHERE_HPP_
