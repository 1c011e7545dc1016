#ifndef THERMINI_CONTROL_DATA_HPP_
#define THERMINI_CONTROL_DATA_HPP_

#include <Eigen/Dense>

#include <optional>
#include <vector>

namespace thermini {
template<typename Scalar>
struct ControlData {
  using Index = Eigen::Index;

  Scalar tmax;                          // Simulated time
  Scalar dt;                            // Wall-clock tick length
  Scalar timeMultiplier;                // Simulation speed-up applied to dt
  Index printStep;                      // Printing frequency
  Scalar mass;                          // Initial fluid mass, kg
  Scalar temperature;                   // Initial fluid temperature
  Scalar altitude;                      // Pot altitude
  Scalar heaterWatts;                   // Burner power
  std::optional<Scalar> heaterOffTime;  // Burner switched off at this simulated time
  bool acEnabled;                       // AC switch
  Scalar acSetpoint;                    // AC target temperature
  std::vector<Scalar> previewPowers;    // Burner powers for the boil-time preview
};
} // namespace thermini

#endif  // THERMINI_CONTROL_DATA_HPP_
