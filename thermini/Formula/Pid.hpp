#ifndef THERMINI_FORMULA_PID_HPP_
#define THERMINI_FORMULA_PID_HPP_

#include <algorithm>
#include <cmath>

#include "Data/PidData.hpp"

namespace thermini {

template<typename Scalar>
struct PidResult {
  Scalar output;        // Normalized to [-1, 1]
  Scalar error;         // setpoint - measured
  Scalar p;
  Scalar i;
  Scalar d;
  PidState<Scalar> state;
};

// Discrete PID with integral clamp; the caller owns and threads the state
template<typename Scalar>
class Pid {
public:
  static PidResult<Scalar> Update(
    Scalar setpoint,
    Scalar measured,
    const PidGains<Scalar>& gains,
    const PidState<Scalar>& state,
    Scalar dt
  );

  static Scalar ApplyDeadband(Scalar output, Scalar error, Scalar deadband) {
    return std::abs(error) < deadband ? Scalar(0.0) : output;
  }
};

template<typename Scalar>
auto Pid<Scalar>::Update(
  const Scalar setpoint,
  const Scalar measured,
  const PidGains<Scalar>& gains,
  const PidState<Scalar>& state,
  const Scalar dt
) -> PidResult<Scalar> {
  const Scalar error = setpoint - measured;
  const Scalar step = (std::isfinite(dt) && dt > Scalar(0.0)) ? dt : Scalar(0.0);

  const Scalar integral = std::max(-gains.integralLimit, std::min(gains.integralLimit, state.integral + error * step));
  const Scalar p = gains.kp * error;
  const Scalar i = gains.ki * integral;
  const Scalar d = step > Scalar(0.0) ? gains.kd * (error - state.previousError) / step : Scalar(0.0);

  const Scalar output = std::max(Scalar(-1.0), std::min(Scalar(1.0), (p + i + d) / Scalar(100.0)));

  PidState<Scalar> next = state;
  next.integral = integral;
  next.previousError = error;
  next.lastUpdate = state.lastUpdate + step;

  return { output, error, p, i, d, next };
}

} // namespace thermini

#endif // THERMINI_FORMULA_PID_HPP_
