#ifndef THERMINI_DATA_EQUIPMENT_DATA_HPP_
#define THERMINI_DATA_EQUIPMENT_DATA_HPP_

#include <map>
#include <string>

#include "Data/PidData.hpp"

namespace thermini {

template<typename Scalar>
struct AcData {
  Scalar coolingMaxWatts = Scalar(2000.0);      // Maximum cooling power
  Scalar heatingMaxWatts = Scalar(2000.0);      // Maximum heating power
  Scalar deadbandDegrees = Scalar(0.5);         // No output within this error band
  Scalar responseTimeSeconds = Scalar(5.0);     // First-order lag time constant
  Scalar maxRateOfChangePerSec = Scalar(1.0);   // Room temperature slew limit, C/s
  Scalar baseFlowCfm = Scalar(150.0);           // Blower airflow
  Scalar baseFlowM3PerHour = Scalar(255.0);     // Blower airflow
  PidGains<Scalar> gains{};
};

template<typename Scalar>
struct AirHandlerData {
  Scalar maxFlowRateCfm = Scalar(150.0);
  Scalar maxFlowRateM3PerHour = Scalar(255.0);
  Scalar minFlowFraction = Scalar(0.05);             // Fan does not run below this
  std::map<std::string, Scalar> filtrationEfficiency; // Species -> 0..1
  std::map<std::string, Scalar> operatingModes;       // Mode name -> flow percent
  PidGains<Scalar> gains{ Scalar(100.0), Scalar(5.0), Scalar(10.0), Scalar(50.0) };

  Scalar FlowPercent(const std::string& mode) const {
    const auto it = operatingModes.find(mode);
    return it != operatingModes.end() ? it->second : Scalar(0.0);
  }

  Scalar Efficiency(const std::string& species) const {
    const auto it = filtrationEfficiency.find(species);
    return it != filtrationEfficiency.end() ? it->second : Scalar(0.0);
  }
};

} // namespace thermini

#endif  // THERMINI_DATA_EQUIPMENT_DATA_HPP_
