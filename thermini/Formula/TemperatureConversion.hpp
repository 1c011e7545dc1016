#ifndef THERMINI_FORMULA_TEMPERATURE_CONVERSION_HPP_
#define THERMINI_FORMULA_TEMPERATURE_CONVERSION_HPP_

#include "Formula/Constants.hpp"

namespace thermini {

template<typename Scalar>
class TemperatureConversion {
public:
  static Scalar CelsiusToFahrenheit(Scalar celsius) { return celsius * Scalar(9.0) / Scalar(5.0) + Scalar(32.0); }

  static Scalar FahrenheitToCelsius(Scalar fahrenheit) { return (fahrenheit - Scalar(32.0)) * Scalar(5.0) / Scalar(9.0); }

  static Scalar CelsiusToKelvin(Scalar celsius) { return celsius + Constants<Scalar>::kKelvinOffset; }

  static Scalar KelvinToCelsius(Scalar kelvin) { return kelvin - Constants<Scalar>::kKelvinOffset; }

  static Scalar FahrenheitToKelvin(Scalar fahrenheit) { return CelsiusToKelvin(FahrenheitToCelsius(fahrenheit)); }

  static Scalar KelvinToFahrenheit(Scalar kelvin) { return CelsiusToFahrenheit(KelvinToCelsius(kelvin)); }
};

} // namespace thermini

#endif // THERMINI_FORMULA_TEMPERATURE_CONVERSION_HPP_
