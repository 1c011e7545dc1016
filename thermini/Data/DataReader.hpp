#ifndef THERMINI_DATA_DATA_READER_HPP_
#define THERMINI_DATA_DATA_READER_HPP_

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "Data/Composition.hpp"
#include "Data/ControlData.hpp"
#include "Data/DataEnums.hpp"
#include "Data/EquipmentData.hpp"
#include "Data/FluidData.hpp"
#include "Data/PerformanceData.hpp"
#include "Data/PidData.hpp"
#include "Data/RoomData.hpp"
#include "Formula/Constants.hpp"
#include "Formula/GasExchange.hpp"

namespace thermini {

template<typename Scalar>
using Config = std::tuple<
  FluidData<Scalar>,
  VesselData<Scalar>,
  RoomData<Scalar>,
  std::optional<AcData<Scalar>>,
  std::optional<AirHandlerData<Scalar>>,
  ControlData<Scalar>,
  PerformanceData>;

inline const double kFlowTolerance = 0.01; // Relative mismatch allowed between CFM and m3/h

template<typename Type>
std::optional<Type> ReadOptional(const YAML::Node& node, const std::string& key) {
  if (!node || !node[key])
    return std::nullopt;
  return node[key].as<Type>();
}

template<typename Type>
Type ReadOr(const YAML::Node& node, const std::string& key, Type fallback) {
  if (!node || !node[key])
    return fallback;
  return node[key].as<Type>();
}

template<typename Scalar>
PidGains<Scalar> ReadPidGains(const YAML::Node& node, const PidGains<Scalar>& fallback) {
  if (!node)
    return fallback;
  if (node["preset"])
    return PidGains<Scalar>::Preset(node["preset"].as<PidPresetEnum>());

  PidGains<Scalar> gains = fallback;
  gains.kp = ReadOr<Scalar>(node, "kp", gains.kp);
  gains.ki = ReadOr<Scalar>(node, "ki", gains.ki);
  gains.kd = ReadOr<Scalar>(node, "kd", gains.kd);
  gains.integralLimit = ReadOr<Scalar>(node, "integralLimit", gains.integralLimit);
  return gains;
}

// Airflow pairs: a side given alone derives the other, both given must agree
template<typename Scalar>
void ReadFlow(const YAML::Node& node, const std::string& cfmKey, const std::string& m3Key, Scalar& cfm, Scalar& m3PerHour) {
  const auto cfmValue = ReadOptional<Scalar>(node, cfmKey);
  const auto m3Value = ReadOptional<Scalar>(node, m3Key);

  if (cfmValue && m3Value) {
    const Scalar expected = GasExchange<Scalar>::CfmToM3PerHour(*cfmValue);
    if (std::abs(*m3Value - expected) > kFlowTolerance * std::max(std::abs(expected), Scalar(1.0)))
      throw std::runtime_error(cfmKey + " and " + m3Key + " describe different airflows.");
    cfm = *cfmValue;
    m3PerHour = *m3Value;
  } else if (cfmValue) {
    cfm = *cfmValue;
    m3PerHour = GasExchange<Scalar>::CfmToM3PerHour(*cfmValue);
  } else if (m3Value) {
    cfm = *m3Value / Constants<Scalar>::kM3PerHourPerCfm;
    m3PerHour = *m3Value;
  }

  if (!(cfm >= Scalar(0.0)) || !(m3PerHour >= Scalar(0.0)))
    throw std::runtime_error(cfmKey + " must not be negative.");
}

template<typename Scalar>
Composition<Scalar> ReadComposition(const YAML::Node& node) {
  if (!node)
    return GasExchange<Scalar>::Earth();

  if (node.IsScalar()) {
    const auto name = node.as<std::string>();
    const auto atmosphere = GasExchange<Scalar>::StandardAtmosphere(name);
    if (!atmosphere)
      throw std::runtime_error("Unknown standard atmosphere: " + name);
    return *atmosphere;
  }

  Composition<Scalar> composition;
  for (const auto& entry : node) {
    const auto fraction = entry.second.as<Scalar>();
    if (fraction < Scalar(0.0))
      throw std::runtime_error("Negative fraction for species " + entry.first.as<std::string>());
    composition.Set(entry.first.as<std::string>(), fraction);
  }
  if (composition.Empty())
    throw std::runtime_error("Room atmosphere has no species.");
  return composition;
}

template<typename Scalar>
FluidData<Scalar> ReadFluid(const YAML::Node& node) {
  FluidData<Scalar> fluid{};
  fluid.id = node["id"].as<std::string>();
  fluid.chemicalFormula = ReadOr<std::string>(node, "chemicalFormula", "");
  fluid.specificHeat = node["specificHeat"].as<Scalar>();
  fluid.heatOfVaporization = ReadOptional<Scalar>(node, "heatOfVaporization");
  fluid.heatOfFusion = ReadOptional<Scalar>(node, "heatOfFusion");
  fluid.meltingPoint = ReadOptional<Scalar>(node, "meltingPoint");
  fluid.boilingPointSeaLevel = ReadOptional<Scalar>(node, "boilingPoint");
  fluid.altitudeLapseRate = ReadOptional<Scalar>(node, "altitudeLapseRate");
  fluid.density = ReadOr<Scalar>(node, "density", fluid.density);
  fluid.coolingCoefficient = ReadOptional<Scalar>(node, "coolingCoefficient");
  fluid.convectiveHeatTransfer = ReadOptional<Scalar>(node, "convectiveHeatTransfer");
  fluid.nonVolatileMassFraction = ReadOr<Scalar>(node, "nonVolatileMassFraction", Scalar(0.0));
  fluid.molarMass = ReadOptional<Scalar>(node, "molarMass");
  fluid.diffusionVolumeSum = ReadOptional<Scalar>(node, "diffusionVolumeSum");
  fluid.vanHoffFactor = ReadOptional<Scalar>(node, "vanHoffFactor");
  fluid.molality = ReadOptional<Scalar>(node, "molality");
  fluid.boilingPointElevation = ReadOptional<Scalar>(node, "boilingPointElevation");

  if (const auto antoine = node["antoine"]) {
    AntoineCoefficients<Scalar> coefficients{};
    coefficients.A = antoine["A"].as<Scalar>();
    coefficients.B = antoine["B"].as<Scalar>();
    coefficients.C = antoine["C"].as<Scalar>();
    coefficients.TminC = ReadOptional<Scalar>(antoine, "TminC");
    coefficients.TmaxC = ReadOptional<Scalar>(antoine, "TmaxC");
    fluid.antoine = coefficients;
  }

  if (!fluid.IsValid())
    throw std::runtime_error("Fluid specificHeat must be positive.");
  if (fluid.nonVolatileMassFraction < Scalar(0.0) || fluid.nonVolatileMassFraction > Scalar(1.0))
    throw std::runtime_error("Fluid nonVolatileMassFraction must be within [0, 1].");

  return fluid;
}

template<typename Scalar>
Config<Scalar> ReadConfig(const YAML::Node& config) {
  using Index = Eigen::Index;

  FluidData<Scalar> fluid = ReadFluid<Scalar>(config["Fluid"]);

  VesselData<Scalar> vessel{};
  vessel.diameter = ReadOr<Scalar>(config["Vessel"], "diameter", vessel.diameter);
  if (!(vessel.diameter > Scalar(0.0)))
    throw std::runtime_error("Vessel diameter must be positive.");

  RoomData<Scalar> room{};
  const YAML::Node roomNode = config["Room"];
  room.volume = ReadOr<Scalar>(roomNode, "volume", room.volume);
  room.heatCapacity = ReadOr<Scalar>(roomNode, "heatCapacity", room.heatCapacity);
  room.leakRatePaPerSecond = ReadOr<Scalar>(roomNode, "leakRatePaPerSecond", room.leakRatePaPerSecond);
  room.initialTemperature = ReadOr<Scalar>(roomNode, "initialTemperature", room.initialTemperature);
  room.pressureMode = ReadOr<PressureModeEnum>(roomNode, "pressureMode", room.pressureMode);
  room.initialPressure = ReadOptional<Scalar>(roomNode, "initialPressure");
  room.altitude = ReadOr<Scalar>(roomNode, "altitude", room.altitude);
  room.atmosphere = ReadComposition<Scalar>(roomNode ? roomNode["atmosphere"] : YAML::Node());
  room.airHandlerMode = ReadOr<std::string>(roomNode, "airHandlerMode", room.airHandlerMode);
  if (!(room.volume > Scalar(0.0)))
    throw std::runtime_error("Room volume must be positive.");
  if (!(room.heatCapacity > Scalar(0.0)))
    throw std::runtime_error("Room heatCapacity must be positive.");
  if (room.pressureMode == PressureModeEnum::Custom && !room.initialPressure)
    throw std::runtime_error("Room initialPressure is required in custom pressure mode.");

  std::optional<AcData<Scalar>> ac;
  if (const YAML::Node acNode = config["Ac"]) {
    AcData<Scalar> data{};
    data.coolingMaxWatts = acNode["coolingMaxWatts"].as<Scalar>();
    data.heatingMaxWatts = acNode["heatingMaxWatts"].as<Scalar>();
    data.deadbandDegrees = ReadOr<Scalar>(acNode, "deadbandDegrees", data.deadbandDegrees);
    data.responseTimeSeconds = ReadOr<Scalar>(acNode, "responseTimeSeconds", data.responseTimeSeconds);
    data.maxRateOfChangePerSec = ReadOr<Scalar>(acNode, "maxRateOfChangePerSec", data.maxRateOfChangePerSec);
    ReadFlow<Scalar>(acNode, "baseFlowCfm", "baseFlowM3PerHour", data.baseFlowCfm, data.baseFlowM3PerHour);
    data.gains = ReadPidGains<Scalar>(acNode["pid"], data.gains);
    ac = data;
  }

  std::optional<AirHandlerData<Scalar>> airHandler;
  if (const YAML::Node ahNode = config["AirHandler"]) {
    AirHandlerData<Scalar> data{};
    ReadFlow<Scalar>(ahNode, "maxFlowRateCfm", "maxFlowRateM3PerHour", data.maxFlowRateCfm, data.maxFlowRateM3PerHour);
    data.minFlowFraction = ReadOr<Scalar>(ahNode, "minFlowFraction", data.minFlowFraction);
    if (ahNode["filtrationEfficiency"])
      data.filtrationEfficiency = ahNode["filtrationEfficiency"].as<std::map<std::string, Scalar>>();
    if (ahNode["operatingModes"])
      data.operatingModes = ahNode["operatingModes"].as<std::map<std::string, Scalar>>();
    data.gains = ReadPidGains<Scalar>(ahNode["pid"], data.gains);
    airHandler = data;
  }

  const YAML::Node controlNode = config["Control"];
  ControlData<Scalar> control{};
  control.tmax = controlNode["tmax"].as<Scalar>();
  control.dt = controlNode["dt"].as<Scalar>();
  control.timeMultiplier = ReadOr<Scalar>(controlNode, "timeMultiplier", Scalar(1.0));
  control.printStep = controlNode["printStep"].as<Index>();
  control.mass = controlNode["mass"].as<Scalar>();
  control.temperature = controlNode["temperature"].as<Scalar>();
  control.altitude = ReadOr<Scalar>(controlNode, "altitude", room.altitude);
  control.heaterWatts = controlNode["heaterWatts"].as<Scalar>();
  control.heaterOffTime = ReadOptional<Scalar>(controlNode, "heaterOffTime");
  control.acEnabled = ReadOr<bool>(controlNode, "acEnabled", false);
  control.acSetpoint = ReadOr<Scalar>(controlNode, "acSetpoint", room.initialTemperature);
  if (controlNode["previewPowers"])
    control.previewPowers = controlNode["previewPowers"].as<std::vector<Scalar>>();
  if (!(control.dt > Scalar(0.0)) || !(control.timeMultiplier > Scalar(0.0)))
    throw std::runtime_error("Control dt and timeMultiplier must be positive.");
  if (control.printStep <= 0)
    throw std::runtime_error("Control printStep must be positive.");
  if (!(control.mass > Scalar(0.0)))
    throw std::runtime_error("Control mass must be positive.");

  PerformanceData performance{};
  performance.cores = ReadOr<Index>(config["Performance"], "cores", Index(0));

  return { fluid, vessel, room, ac, airHandler, control, performance };
}

template<typename Scalar>
Config<Scalar> ReadYaml(const std::string& filename) {
  return ReadConfig<Scalar>(YAML::LoadFile(filename));
}

} // namespace thermini

#endif  // THERMINI_DATA_DATA_READER_HPP_
