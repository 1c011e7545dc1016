#ifndef THERMINI_PROCESS_AIR_HANDLER_EFFECT_HPP_
#define THERMINI_PROCESS_AIR_HANDLER_EFFECT_HPP_

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <map>
#include <string>

#include "Data/Composition.hpp"
#include "Data/EquipmentData.hpp"
#include "Data/PidData.hpp"
#include "Formula/GasExchange.hpp"
#include "Formula/Pid.hpp"

namespace thermini {

template<typename Scalar>
struct AirHandlerResult {
  Composition<Scalar> composition;
  Composition<Scalar> changes;
  PidState<Scalar> state;
  Scalar flowPercent;        // Rounded percent of max flow
  Scalar flowRateM3PerHour;
  Scalar airChangesPerHour;
  std::string status;
};

// Composition loop: PID on a weighted contamination level drives fan flow
template<typename Scalar>
class AirHandlerEffect {
public:
  using Index = Eigen::Index;

  static Scalar ContaminantWeight(const std::string& species);

  static Scalar ContaminationLevel(const Composition<Scalar>& current, const Composition<Scalar>& target);

  static AirHandlerResult<Scalar> Apply(
    const Composition<Scalar>& composition,
    const Composition<Scalar>& target,
    const AirHandlerData<Scalar>* airHandler,
    const PidState<Scalar>& state,
    Scalar dt,
    Scalar roomVolume = Scalar(30.0)
  );

  static std::string Status(Scalar flowFraction);
};

template<typename Scalar>
auto AirHandlerEffect<Scalar>::ContaminantWeight(const std::string& species) -> Scalar {
  static const std::map<std::string, Scalar> kWeights = {
    { "NH3", Scalar(10.0) },
    { "H2S", Scalar(10.0) },
    { "Cl2", Scalar(10.0) },
    { "CO", Scalar(8.0) },
    { "CO2", Scalar(3.0) },
    { "O2", Scalar(2.0) },
    { "H2O", Scalar(1.0) },
    { "N2", Scalar(0.5) },
    { "Ar", Scalar(0.1) },
  };
  const auto it = kWeights.find(species);
  return it != kWeights.end() ? it->second : Scalar(1.0);
}

template<typename Scalar>
auto AirHandlerEffect<Scalar>::ContaminationLevel(const Composition<Scalar>& current, const Composition<Scalar>& target)
  -> Scalar {
  const Composition<Scalar> aligned = current.AlignedWith(target);
  const typename Composition<Scalar>::Array deviation = (aligned.Fractions() - aligned.ValuesOf(target)).abs();

  Scalar level = Scalar(0.0);
  for (Index i = 0; i < aligned.Size(); ++i)
    level += deviation(i) * ContaminantWeight(aligned.Species()[i]);
  return level;
}

template<typename Scalar>
auto AirHandlerEffect<Scalar>::Apply(
  const Composition<Scalar>& composition,
  const Composition<Scalar>& target,
  const AirHandlerData<Scalar>* airHandler,
  const PidState<Scalar>& state,
  const Scalar dt,
  const Scalar roomVolume
) -> AirHandlerResult<Scalar> {
  if (airHandler == nullptr)
    return { composition, Composition<Scalar>{}, state, Scalar(0.0), Scalar(0.0), Scalar(0.0), "No Air Handler" };

  const Scalar maxFlow = airHandler->maxFlowRateM3PerHour > Scalar(0.0) ? airHandler->maxFlowRateM3PerHour : Scalar(255.0);

  // Setpoint is zero contamination
  const Scalar contamination = ContaminationLevel(composition, target);
  const auto pid = Pid<Scalar>::Update(Scalar(0.0), contamination, airHandler->gains, state, dt);

  Scalar flow = std::max(Scalar(0.0), std::min(Scalar(1.0), std::abs(pid.output)));
  if (flow < airHandler->minFlowFraction)
    flow = Scalar(0.0);

  const Scalar flowRate = flow * maxFlow;
  const Scalar fraction = GasExchange<Scalar>::ExchangeFraction(flowRate, roomVolume, dt);
  auto exchange = GasExchange<Scalar>::Mix(composition, target, fraction, airHandler->filtrationEfficiency);

  PidState<Scalar> next = pid.state;
  next.lastOutput = flow;

  return {
    exchange.composition,
    exchange.changes,
    next,
    std::round(flow * Scalar(100.0)),
    flowRate,
    GasExchange<Scalar>::AirChangesPerHour(flowRate, roomVolume),
    Status(flow),
  };
}

template<typename Scalar>
auto AirHandlerEffect<Scalar>::Status(const Scalar flowFraction) -> std::string {
  if (flowFraction < Scalar(0.05))
    return "Standby";
  if (flowFraction < Scalar(0.3))
    return "Low";
  if (flowFraction < Scalar(0.7))
    return "Medium";
  return "High";
}

} // namespace thermini

#endif // THERMINI_PROCESS_AIR_HANDLER_EFFECT_HPP_
