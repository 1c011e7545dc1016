#ifndef THERMINI_DATA_ROOM_DATA_HPP_
#define THERMINI_DATA_ROOM_DATA_HPP_

#include <optional>
#include <string>
#include <vector>

#include "Data/Composition.hpp"
#include "Data/DataEnums.hpp"
#include "Data/PidData.hpp"

namespace thermini {

template<typename Scalar>
struct RoomData {
  Scalar volume = Scalar(30.0);                   // m^3
  Scalar heatCapacity = Scalar(36000.0);          // J/C, air plus furnishings
  Scalar leakRatePaPerSecond = Scalar(10.0);      // Pressure equalization limit
  Scalar initialTemperature = Scalar(20.0);       // C
  PressureModeEnum pressureMode = PressureModeEnum::Location;
  std::optional<Scalar> initialPressure;          // Pa, custom mode only
  Scalar altitude = Scalar(0.0);                  // m, location mode
  Composition<Scalar> atmosphere;                 // Baseline composition (empty for Earth)
  std::string airHandlerMode = "off";
};

template<typename Scalar>
struct EnergyTotals {
  Scalar acHeatingJoules = Scalar(0.0);
  Scalar acCoolingJoules = Scalar(0.0);
  Scalar airHandlerJoules = Scalar(0.0);
  Scalar burnerWasteJoules = Scalar(0.0);
};

template<typename Scalar>
struct ExposureEvent {
  std::string species;
  std::string name;
  Scalar startTime;     // Simulated seconds since room creation
  Scalar duration;      // s
  Scalar peakPpm;
  SeverityEnum severity;
  std::string consequence;
  bool isProtected;     // Active filtration would mitigate it
};

struct Alert {
  SeverityEnum severity;
  std::string species;
  std::string message;
};

template<typename Scalar>
struct HeatLogEntry {
  Scalar time;
  std::string source;
  Scalar watts;
};

template<typename Scalar>
struct CompositionSample {
  Scalar time;
  Composition<Scalar> composition;
};

template<typename Scalar>
struct Airflow {
  Scalar totalCfm = Scalar(0.0);
  Scalar totalM3PerHour = Scalar(0.0);
  Scalar acCfm = Scalar(0.0);
  Scalar airHandlerCfm = Scalar(0.0);
};

template<typename Scalar>
struct RoomState {
  // Physical properties
  Scalar volume;
  Scalar heatCapacity;
  Scalar leakRatePaPerSecond;
  Scalar ambientPressure;            // Outside pressure the room leaks toward

  // Current state
  Scalar temperature;
  Scalar pressure;
  Composition<Scalar> composition;
  Scalar elapsed = Scalar(0.0);      // Simulated seconds

  // AC
  bool acEnabled = false;
  Scalar acSetpoint;
  PidState<Scalar> acPid{};
  Scalar acHeatOutput = Scalar(0.0);
  std::string acStatus = "Idle";

  // Air handler
  std::string airHandlerMode = "off";
  PidState<Scalar> airHandlerPid{};
  Scalar scrubberActivity = Scalar(0.0);
  std::string airHandlerStatus = "Off";
  Composition<Scalar> targetComposition;
  Airflow<Scalar> airflow{};

  EnergyTotals<Scalar> energyTotals{};
  std::vector<ExposureEvent<Scalar>> exposureEvents;
  std::vector<Alert> alerts;
  std::vector<HeatLogEntry<Scalar>> heatLog;
  std::vector<CompositionSample<Scalar>> compositionLog;

  // Snapshot for before/after comparison
  Composition<Scalar> initialComposition;
  Scalar initialTemperature;
  Scalar initialPressure;
};

} // namespace thermini

#endif  // THERMINI_DATA_ROOM_DATA_HPP_
