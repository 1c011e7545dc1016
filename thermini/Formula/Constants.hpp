#ifndef THERMINI_FORMULA_CONSTANTS_HPP_
#define THERMINI_FORMULA_CONSTANTS_HPP_

namespace thermini {

template<typename Scalar>
struct Constants {
  inline static const Scalar kPi = Scalar(3.14159265358979323846);
  inline static const Scalar kGasConstant = Scalar(8.314);        // J/(mol K)
  inline static const Scalar kKelvinOffset = Scalar(273.15);
  inline static const Scalar kPaPerMmHg = Scalar(133.322);
  inline static const Scalar kSeaLevelPressure = Scalar(101325.0); // Pa
  inline static const Scalar kGravity = Scalar(9.81);              // m/s^2
  inline static const Scalar kAirDensity = Scalar(1.2);            // kg/m^3 at 20 C
  inline static const Scalar kAirSpecificHeat = Scalar(1.006);     // J/(g C)
  inline static const Scalar kAirMolarMass = Scalar(28.97);        // g/mol
  inline static const Scalar kAirDiffusionVolume = Scalar(19.7);   // Fuller volume sum
  inline static const Scalar kM3PerHourPerCfm = Scalar(1.699);
  inline static const Scalar kGramsPerKilogram = Scalar(1000.0);
};

} // namespace thermini

#endif // THERMINI_FORMULA_CONSTANTS_HPP_
