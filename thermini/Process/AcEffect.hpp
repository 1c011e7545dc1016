#ifndef THERMINI_PROCESS_AC_EFFECT_HPP_
#define THERMINI_PROCESS_AC_EFFECT_HPP_

#include <algorithm>
#include <cmath>
#include <string>

#include "Data/EquipmentData.hpp"
#include "Data/PidData.hpp"
#include "Formula/Constants.hpp"
#include "Formula/HeatCapacity.hpp"
#include "Formula/Pid.hpp"

namespace thermini {

template<typename Scalar>
struct AcResult {
  Scalar temperature;       // New room temperature
  Scalar powerPercent;      // Rounded, of the larger of the two ratings
  Scalar heatOutputWatts;   // Positive heating, negative cooling
  PidState<Scalar> state;
  std::string status;
};

// AC thermal loop acting on the room air mass
template<typename Scalar>
class AcEffect {
public:
  static Scalar AirMass(Scalar volume) { return volume * Constants<Scalar>::kAirDensity; }

  static AcResult<Scalar> Apply(
    Scalar roomTemperature,
    Scalar setpoint,
    const AcData<Scalar>* ac,
    const PidState<Scalar>& state,
    Scalar dt,
    Scalar roomVolume = Scalar(30.0)
  );

  static std::string Status(Scalar watts, Scalar percent);

private:
  inline static const Scalar kIdleWatts_ = Scalar(10.0);
};

template<typename Scalar>
auto AcEffect<Scalar>::Apply(
  const Scalar roomTemperature,
  const Scalar setpoint,
  const AcData<Scalar>* ac,
  const PidState<Scalar>& state,
  const Scalar dt,
  const Scalar roomVolume
) -> AcResult<Scalar> {
  if (ac == nullptr)
    return { roomTemperature, Scalar(0.0), Scalar(0.0), state, "No AC" };

  if (!std::isfinite(dt) || dt <= Scalar(0.0))
    return { roomTemperature, Scalar(0.0), state.lastOutput, state, Status(state.lastOutput, Scalar(0.0)) };

  const auto pid = Pid<Scalar>::Update(setpoint, roomTemperature, ac->gains, state, dt);
  const Scalar output = Pid<Scalar>::ApplyDeadband(pid.output, pid.error, ac->deadbandDegrees);

  Scalar watts = Scalar(0.0);
  if (output > Scalar(0.0))
    watts = output * ac->heatingMaxWatts;
  else if (output < Scalar(0.0))
    watts = output * ac->coolingMaxWatts;

  // First-order lag toward the commanded power
  const Scalar responseTime = ac->responseTimeSeconds > Scalar(0.0) ? ac->responseTimeSeconds : Scalar(5.0);
  const Scalar response = std::min(Scalar(1.0), dt / responseTime);
  watts = watts * response + (Scalar(1.0) - response) * state.lastOutput;

  const Scalar change = HeatCapacity<Scalar>::TemperatureChange(
    AirMass(roomVolume),
    Constants<Scalar>::kAirSpecificHeat,
    watts * dt
  );
  const Scalar maxRate = ac->maxRateOfChangePerSec > Scalar(0.0) ? ac->maxRateOfChangePerSec : Scalar(1.0);
  const Scalar limited = std::max(-maxRate * dt, std::min(maxRate * dt, change));

  const Scalar maxWatts = std::max(ac->coolingMaxWatts, ac->heatingMaxWatts);
  const Scalar percent = maxWatts > Scalar(0.0) ? std::round(std::abs(watts) / maxWatts * Scalar(100.0)) : Scalar(0.0);

  PidState<Scalar> next = pid.state;
  next.lastOutput = watts;

  return { roomTemperature + limited, percent, watts, next, Status(watts, percent) };
}

template<typename Scalar>
auto AcEffect<Scalar>::Status(const Scalar watts, const Scalar percent) -> std::string {
  if (std::abs(watts) < kIdleWatts_)
    return "Idle";
  return std::string(watts > Scalar(0.0) ? "Heating " : "Cooling ") + std::to_string(static_cast<long>(percent)) + "%";
}

} // namespace thermini

#endif // THERMINI_PROCESS_AC_EFFECT_HPP_
