#ifndef THERMINI_DATA_PID_DATA_HPP_
#define THERMINI_DATA_PID_DATA_HPP_

#include "Data/DataEnums.hpp"

namespace thermini {

template<typename Scalar>
struct PidGains {
  Scalar kp = Scalar(50.0);             // Proportional gain
  Scalar ki = Scalar(2.0);              // Integral gain
  Scalar kd = Scalar(10.0);             // Derivative gain
  Scalar integralLimit = Scalar(100.0); // Anti-windup clamp on the integral

  static PidGains Preset(PidPresetEnum preset) {
    switch (preset) {
      case PidPresetEnum::Conservative:
        return { Scalar(30.0), Scalar(1.0), Scalar(15.0), Scalar(50.0) };
      case PidPresetEnum::Aggressive:
        return { Scalar(80.0), Scalar(4.0), Scalar(5.0), Scalar(150.0) };
      case PidPresetEnum::CriticallyDamped:
        return { Scalar(40.0), Scalar(1.0), Scalar(20.0), Scalar(80.0) };
      case PidPresetEnum::Balanced:
      default:
        return { Scalar(50.0), Scalar(2.0), Scalar(10.0), Scalar(100.0) };
    }
  }
};

// Controller memory, owned by the loop it belongs to
template<typename Scalar>
struct PidState {
  Scalar integral = Scalar(0.0);
  Scalar previousError = Scalar(0.0);
  Scalar lastOutput = Scalar(0.0); // Last commanded actuator value (W or flow fraction)
  Scalar lastUpdate = Scalar(0.0); // Simulated seconds, diagnostic only
};

} // namespace thermini

#endif  // THERMINI_DATA_PID_DATA_HPP_
