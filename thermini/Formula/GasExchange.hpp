#ifndef THERMINI_FORMULA_GAS_EXCHANGE_HPP_
#define THERMINI_FORMULA_GAS_EXCHANGE_HPP_

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <string>

#include "Data/Composition.hpp"
#include "Formula/Constants.hpp"

namespace thermini {

template<typename Scalar>
struct GasExchangeResult {
  Composition<Scalar> composition;
  Composition<Scalar> changes;     // Per-species fraction change
};

// Ventilation mixing of a room composition toward a target
template<typename Scalar>
class GasExchange {
public:
  using Index = Eigen::Index;
  using Array = typename Composition<Scalar>::Array;

  inline static const Scalar kDefaultEfficiency = Scalar(0.8);

  // min(1, Q dt / V), flow in m^3/h
  static Scalar ExchangeFraction(Scalar flowM3PerHour, Scalar volume, Scalar dt);

  static GasExchangeResult<Scalar> Mix(
    const Composition<Scalar>& current,
    const Composition<Scalar>& target,
    Scalar exchangeFraction,
    const std::map<std::string, Scalar>& efficiencies = {}
  );

  static Scalar CfmToM3PerHour(Scalar cfm) { return cfm * Constants<Scalar>::kM3PerHourPerCfm; }

  static Scalar AirChangesPerHour(Scalar flowM3PerHour, Scalar volume) {
    return volume > Scalar(0.0) ? flowM3PerHour / volume : Scalar(0.0);
  }

  // "earth", "mars" or "clean_room"
  static std::optional<Composition<Scalar>> StandardAtmosphere(const std::string& name);

  static Composition<Scalar> Earth() { return *StandardAtmosphere("earth"); }
};

template<typename Scalar>
auto GasExchange<Scalar>::ExchangeFraction(const Scalar flowM3PerHour, const Scalar volume, const Scalar dt) -> Scalar {
  if (!(flowM3PerHour > Scalar(0.0)) || !(volume > Scalar(0.0)) || !(dt > Scalar(0.0)))
    return Scalar(0.0);

  const Scalar exchanged = flowM3PerHour / Scalar(3600.0) * dt;
  return std::min(Scalar(1.0), exchanged / volume);
}

template<typename Scalar>
auto GasExchange<Scalar>::Mix(
  const Composition<Scalar>& current,
  const Composition<Scalar>& target,
  const Scalar exchangeFraction,
  const std::map<std::string, Scalar>& efficiencies
) -> GasExchangeResult<Scalar> {
  Composition<Scalar> mixed = current.AlignedWith(target);
  const Index n = mixed.Size();

  Array efficiency(n);
  for (Index i = 0; i < n; ++i) {
    const auto it = efficiencies.find(mixed.Species()[i]);
    const Scalar value = it != efficiencies.end() ? it->second : kDefaultEfficiency;
    efficiency(i) = std::max(Scalar(0.0), std::min(Scalar(1.0), value));
  }

  const Scalar fraction = std::max(Scalar(0.0), std::min(Scalar(1.0), exchangeFraction));
  const Array before = mixed.Fractions();
  const Array goal = mixed.ValuesOf(target);

  mixed.Fractions() = before + (goal - before) * fraction * efficiency;

  // Unequal efficiencies shift the total; keep the pre-step sum
  const Scalar sumBefore = before.sum();
  const Scalar sumAfter = mixed.Fractions().sum();
  if (sumAfter > Scalar(0.0) && std::abs(sumAfter - sumBefore) > Scalar(1.0e-12))
    mixed.Fractions() *= sumBefore / sumAfter;

  Composition<Scalar> changes = mixed;
  changes.Fractions() = mixed.Fractions() - before;

  return { mixed, changes };
}

template<typename Scalar>
auto GasExchange<Scalar>::StandardAtmosphere(const std::string& name) -> std::optional<Composition<Scalar>> {
  if (name == "earth") {
    return Composition<Scalar>{
      { "N2", Scalar(0.7808) },
      { "O2", Scalar(0.2095) },
      { "Ar", Scalar(0.0093) },
      { "CO2", Scalar(0.0004) },
      { "H2O", Scalar(0.01) },
    };
  }
  if (name == "mars") {
    return Composition<Scalar>{
      { "CO2", Scalar(0.9532) },
      { "N2", Scalar(0.027) },
      { "Ar", Scalar(0.016) },
      { "O2", Scalar(0.0013) },
      { "CO", Scalar(0.0007) },
    };
  }
  if (name == "clean_room") {
    return Composition<Scalar>{
      { "N2", Scalar(0.7808) },
      { "O2", Scalar(0.2095) },
      { "Ar", Scalar(0.0093) },
      { "CO2", Scalar(0.0004) },
      { "H2O", Scalar(0.005) },
    };
  }
  return std::nullopt;
}

} // namespace thermini

#endif // THERMINI_FORMULA_GAS_EXCHANGE_HPP_
