#ifndef THERMINI_PROCESS_ROOM_HPP_
#define THERMINI_PROCESS_ROOM_HPP_

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>

#include "Data/Composition.hpp"
#include "Data/EquipmentData.hpp"
#include "Data/RoomData.hpp"
#include "Formula/Atmosphere.hpp"
#include "Formula/Constants.hpp"
#include "Formula/GasExchange.hpp"
#include "Process/AcEffect.hpp"
#include "Process/AirHandlerEffect.hpp"
#include "Process/Exposure.hpp"
#include "Utils.hpp"

namespace thermini {

template<typename Scalar>
struct VaporInput {
  std::string species;  // Composition key, ASCII formula
  Scalar mass;          // kg
  Scalar molarMass;     // g/mol
};

template<typename Scalar>
struct RoomInputs {
  std::optional<Scalar> externalHeatWatts;  // Burner power near the room
  std::optional<VaporInput<Scalar>> vapor;  // Vapor released by the fluid this tick
};

template<typename Scalar>
struct RoomSummary {
  Scalar temperature;  // C, one decimal
  Scalar pressure;     // kPa, two decimals
  Scalar humidity;     // H2O percent
  Scalar oxygen;       // O2 percent
  Scalar carbonDioxide; // CO2 percent
};

// Room environment controller: AC and air-handler loops over one shared air
// volume, vapor injection, pressure leak, exposure tracking.
template<typename Scalar>
class Room {
public:
  inline static const Scalar kBurnerWasteFraction = Scalar(0.1);
  inline static const Scalar kFanWattsPerCfm = Scalar(0.5);
  inline static const Scalar kBaselineCfm = Scalar(150.0);
  inline static const Scalar kMaxAirflowEffectiveness = Scalar(1.5);
  inline static const Scalar kCompositionLogInterval = Scalar(10.0);
  inline static const std::size_t kCompositionLogSize = 100;
  inline static const std::size_t kHeatLogSize = 1000;

  static Scalar InitialPressure(const RoomData<Scalar>& data);

  static RoomState<Scalar> Create(const RoomData<Scalar>& data);

  static RoomState<Scalar> AddVapor(
    const RoomState<Scalar>& state,
    const std::string& species,
    Scalar mass,
    Scalar molarMass
  );

  static RoomState<Scalar> ApplyHeat(const RoomState<Scalar>& state, Scalar watts, Scalar dt, const std::string& source);

  static Airflow<Scalar> CombinedAirflow(
    const RoomState<Scalar>& state,
    const AcData<Scalar>* ac,
    const AirHandlerData<Scalar>* airHandler
  );

  static RoomState<Scalar> Step(
    const RoomState<Scalar>& state,
    const AcData<Scalar>* ac,
    const AirHandlerData<Scalar>* airHandler,
    Scalar dt,
    const RoomInputs<Scalar>& inputs = {}
  );

  // Operator actions
  static RoomState<Scalar> SetAcEnabled(const RoomState<Scalar>& state, bool enabled);

  static RoomState<Scalar> SetAcSetpoint(const RoomState<Scalar>& state, Scalar setpoint);

  static RoomState<Scalar> SetAirHandlerMode(const RoomState<Scalar>& state, const std::string& mode);

  static RoomState<Scalar> ResetAcPid(const RoomState<Scalar>& state);

  static Scalar PartialPressure(const RoomState<Scalar>& state, const std::string& species) {
    return state.composition.Get(species) * state.pressure;
  }

  static RoomSummary<Scalar> Summarize(const RoomState<Scalar>& state);

protected:
  static void logHeat(RoomState<Scalar>& state, Scalar watts, const std::string& source);

  static void applyAirHandler(RoomState<Scalar>& state, const AirHandlerData<Scalar>* airHandler, Scalar dt);

  static void logComposition(RoomState<Scalar>& state);
};

template<typename Scalar>
auto Room<Scalar>::InitialPressure(const RoomData<Scalar>& data) -> Scalar {
  switch (data.pressureMode) {
    case PressureModeEnum::SeaLevel:
      return Constants<Scalar>::kSeaLevelPressure;
    case PressureModeEnum::Custom:
      return ValueOr(data.initialPressure, Constants<Scalar>::kSeaLevelPressure);
    case PressureModeEnum::Location:
    default:
      return Atmosphere<Scalar>::Pressure(data.altitude);
  }
}

template<typename Scalar>
auto Room<Scalar>::Create(const RoomData<Scalar>& data) -> RoomState<Scalar> {
  const Composition<Scalar> atmosphere = data.atmosphere.Empty() ? GasExchange<Scalar>::Earth() : data.atmosphere;
  const Scalar pressure = InitialPressure(data);

  RoomState<Scalar> state;
  state.volume = data.volume;
  state.heatCapacity = data.heatCapacity;
  state.leakRatePaPerSecond = data.leakRatePaPerSecond;
  state.ambientPressure = pressure;
  state.temperature = data.initialTemperature;
  state.pressure = pressure;
  state.composition = atmosphere;
  state.acSetpoint = data.initialTemperature;
  state.airHandlerMode = data.airHandlerMode;
  state.targetComposition = atmosphere;
  state.initialComposition = atmosphere;
  state.initialTemperature = data.initialTemperature;
  state.initialPressure = pressure;
  return state;
}

template<typename Scalar>
auto Room<Scalar>::AddVapor(
  const RoomState<Scalar>& state,
  const std::string& species,
  const Scalar mass,
  const Scalar molarMass
) -> RoomState<Scalar> {
  if (!IsPositive(mass) || !IsPositive(molarMass) || !IsPositive(state.volume) || !IsPositive(state.pressure))
    return state;

  const Scalar kelvin = state.temperature + Constants<Scalar>::kKelvinOffset;
  if (!IsPositive(kelvin))
    return state;

  const Scalar rt = Constants<Scalar>::kGasConstant * kelvin;
  const Scalar added = mass / (molarMass / Scalar(1000.0));
  const Scalar total = state.pressure * state.volume / rt;

  RoomState<Scalar> next = state;
  const auto idx = next.composition.Ensure(NormalizeFormula(species));

  // Existing species dilute by N / (N + n)
  next.composition.Fractions() *= total / (total + added);
  next.composition.Fractions()(idx) += added / (total + added);
  next.pressure = (total + added) * rt / state.volume;
  return next;
}

template<typename Scalar>
auto Room<Scalar>::ApplyHeat(const RoomState<Scalar>& state, const Scalar watts, const Scalar dt, const std::string& source)
  -> RoomState<Scalar> {
  if (watts == Scalar(0.0) || !std::isfinite(watts) || !IsPositive(dt) || !IsPositive(state.heatCapacity))
    return state;

  RoomState<Scalar> next = state;
  next.temperature += watts * dt / state.heatCapacity;
  logHeat(next, watts, source);
  return next;
}

template<typename Scalar>
auto Room<Scalar>::CombinedAirflow(
  const RoomState<Scalar>& state,
  const AcData<Scalar>* ac,
  const AirHandlerData<Scalar>* airHandler
) -> Airflow<Scalar> {
  Airflow<Scalar> airflow;
  airflow.acCfm = ac != nullptr ? ac->baseFlowCfm : kBaselineCfm;
  const Scalar acM3PerHour = ac != nullptr ? ac->baseFlowM3PerHour : GasExchange<Scalar>::CfmToM3PerHour(kBaselineCfm);

  Scalar fraction = Scalar(0.0);
  if (airHandler != nullptr && state.airHandlerMode != "off") {
    fraction = state.airHandlerMode == "auto"
      ? state.airHandlerPid.lastOutput
      : airHandler->FlowPercent(state.airHandlerMode) / Scalar(100.0);
  }
  fraction = Clamp(fraction, Scalar(0.0), Scalar(1.0));

  airflow.airHandlerCfm = airHandler != nullptr ? airHandler->maxFlowRateCfm * fraction : Scalar(0.0);
  const Scalar ahM3PerHour = airHandler != nullptr ? airHandler->maxFlowRateM3PerHour * fraction : Scalar(0.0);

  airflow.totalCfm = airflow.acCfm + airflow.airHandlerCfm;
  airflow.totalM3PerHour = acM3PerHour + ahM3PerHour;
  return airflow;
}

template<typename Scalar>
auto Room<Scalar>::Step(
  const RoomState<Scalar>& state,
  const AcData<Scalar>* ac,
  const AirHandlerData<Scalar>* airHandler,
  const Scalar dt,
  const RoomInputs<Scalar>& inputs
) -> RoomState<Scalar> {
  if (!IsPositive(dt))
    return state;

  RoomState<Scalar> next = state;
  next.airflow = CombinedAirflow(state, ac, airHandler);

  // Burner waste heat
  if (inputs.externalHeatWatts && std::isfinite(*inputs.externalHeatWatts) && *inputs.externalHeatWatts != Scalar(0.0)) {
    const Scalar roomHeat = *inputs.externalHeatWatts * kBurnerWasteFraction;
    next = ApplyHeat(next, roomHeat, dt, "burner_waste");
    next.energyTotals.burnerWasteJoules += std::abs(roomHeat) * dt;
  }

  // AC, effectiveness scaled by airflow
  if (next.acEnabled && ac != nullptr) {
    const Scalar effectiveness = std::min(kMaxAirflowEffectiveness, next.airflow.totalCfm / kBaselineCfm);
    const auto acResult = AcEffect<Scalar>::Apply(
      next.temperature,
      next.acSetpoint,
      ac,
      next.acPid,
      dt * effectiveness,
      next.volume
    );
    next.temperature = acResult.temperature;
    next.acPid = acResult.state;
    next.acHeatOutput = acResult.heatOutputWatts;
    next.acStatus = acResult.status;

    const Scalar joules = std::abs(acResult.heatOutputWatts) * dt;
    if (acResult.heatOutputWatts > Scalar(0.0))
      next.energyTotals.acHeatingJoules += joules;
    else if (acResult.heatOutputWatts < Scalar(0.0))
      next.energyTotals.acCoolingJoules += joules;

    if (std::abs(acResult.heatOutputWatts) > Scalar(10.0))
      logHeat(next, acResult.heatOutputWatts, acResult.heatOutputWatts > Scalar(0.0) ? "ac_heating" : "ac_cooling");
  } else {
    next.acHeatOutput = Scalar(0.0);
    next.acStatus = ac != nullptr ? "Off" : "No AC";
  }

  // Vapor from the fluid
  if (inputs.vapor)
    next = AddVapor(next, inputs.vapor->species, inputs.vapor->mass, inputs.vapor->molarMass);

  applyAirHandler(next, airHandler, dt);
  next.energyTotals.airHandlerJoules += next.airflow.airHandlerCfm * kFanWattsPerCfm * dt;

  next.exposureEvents = ExposureMonitor<Scalar>::Track(next, airHandler, dt);

  // Leak toward the outside pressure, rate limited
  const Scalar difference = next.pressure - next.ambientPressure;
  const Scalar limit = std::max(Scalar(0.0), next.leakRatePaPerSecond) * dt;
  const Scalar change = std::min(std::abs(difference), limit);
  next.pressure -= difference > Scalar(0.0) ? change : -change;

  next.alerts = ExposureMonitor<Scalar>::CompositionAlerts(next.composition);

  next.elapsed += dt;
  logComposition(next);
  return next;
}

template<typename Scalar>
auto Room<Scalar>::SetAcEnabled(const RoomState<Scalar>& state, const bool enabled) -> RoomState<Scalar> {
  RoomState<Scalar> next = state;
  if (next.acEnabled != enabled)
    next.acPid = PidState<Scalar>{};
  next.acEnabled = enabled;
  return next;
}

template<typename Scalar>
auto Room<Scalar>::SetAcSetpoint(const RoomState<Scalar>& state, const Scalar setpoint) -> RoomState<Scalar> {
  RoomState<Scalar> next = state;
  if (std::isfinite(setpoint))
    next.acSetpoint = setpoint;
  return next;
}

template<typename Scalar>
auto Room<Scalar>::SetAirHandlerMode(const RoomState<Scalar>& state, const std::string& mode) -> RoomState<Scalar> {
  RoomState<Scalar> next = state;
  if (next.airHandlerMode != mode) {
    next.airHandlerMode = mode;
    next.airHandlerPid = PidState<Scalar>{};
  }
  return next;
}

template<typename Scalar>
auto Room<Scalar>::ResetAcPid(const RoomState<Scalar>& state) -> RoomState<Scalar> {
  RoomState<Scalar> next = state;
  next.acPid = PidState<Scalar>{};
  return next;
}

template<typename Scalar>
auto Room<Scalar>::Summarize(const RoomState<Scalar>& state) -> RoomSummary<Scalar> {
  return {
    std::round(state.temperature * Scalar(10.0)) / Scalar(10.0),
    std::round(state.pressure / Scalar(10.0)) / Scalar(100.0),
    state.composition.Get("H2O") * Scalar(100.0),
    state.composition.Get("O2") * Scalar(100.0),
    state.composition.Get("CO2") * Scalar(100.0),
  };
}

template<typename Scalar>
void Room<Scalar>::logHeat(RoomState<Scalar>& state, const Scalar watts, const std::string& source) {
  if (!state.heatLog.empty() && state.heatLog.back().source == source)
    return;

  state.heatLog.push_back({ state.elapsed, source, watts });
  if (state.heatLog.size() > kHeatLogSize)
    state.heatLog.erase(state.heatLog.begin());
}

template<typename Scalar>
void Room<Scalar>::applyAirHandler(RoomState<Scalar>& state, const AirHandlerData<Scalar>* airHandler, const Scalar dt) {
  if (airHandler == nullptr || state.airHandlerMode == "off") {
    state.scrubberActivity = Scalar(0.0);
    state.airHandlerStatus = airHandler != nullptr ? "Off" : "No Air Handler";
    return;
  }

  if (state.airHandlerMode == "auto") {
    const auto result = AirHandlerEffect<Scalar>::Apply(
      state.composition,
      state.targetComposition,
      airHandler,
      state.airHandlerPid,
      dt,
      state.volume
    );
    state.composition = result.composition;
    state.airHandlerPid = result.state;
    state.scrubberActivity = result.flowPercent / Scalar(100.0);
    state.airHandlerStatus = result.status;
    return;
  }

  // Named mode: fixed flow, mixing driven by the combined system airflow
  const Scalar fraction = GasExchange<Scalar>::ExchangeFraction(state.airflow.totalM3PerHour, state.volume, dt);
  const auto exchange = GasExchange<Scalar>::Mix(
    state.composition,
    state.targetComposition,
    fraction,
    airHandler->filtrationEfficiency
  );
  state.composition = exchange.composition;
  state.scrubberActivity = Clamp(airHandler->FlowPercent(state.airHandlerMode) / Scalar(100.0), Scalar(0.0), Scalar(1.0));
  state.airHandlerStatus = state.airHandlerMode + " ("
    + std::to_string(static_cast<long>(std::round(state.airflow.totalM3PerHour))) + " m3/h)";
}

template<typename Scalar>
void Room<Scalar>::logComposition(RoomState<Scalar>& state) {
  const Scalar last = state.compositionLog.empty() ? Scalar(0.0) : state.compositionLog.back().time;
  if (state.elapsed - last < kCompositionLogInterval)
    return;

  state.compositionLog.push_back({ state.elapsed, state.composition });
  if (state.compositionLog.size() > kCompositionLogSize)
    state.compositionLog.erase(state.compositionLog.begin());
}

} // namespace thermini

#endif // THERMINI_PROCESS_ROOM_HPP_
