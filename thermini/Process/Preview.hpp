#ifndef THERMINI_PROCESS_PREVIEW_HPP_
#define THERMINI_PROCESS_PREVIEW_HPP_

#include <Eigen/Dense>
#include <omp.h>

#include <optional>
#include <vector>

#include "Data/FluidData.hpp"
#include "Data/FluidState.hpp"
#include "Data/PerformanceData.hpp"
#include "Process/BoilingPoint.hpp"
#include "Process/FluidStep.hpp"

namespace thermini {

template<typename Scalar>
struct BoilPreview {
  Scalar watts;
  std::optional<Scalar> expectedTime;   // Closed-form estimate
  std::optional<Scalar> simulatedTime;  // First tick reported as boiling
};

// Speculative what-if runs from one base state. Ticks are pure, so the
// candidates run in parallel without synchronization.
template<typename Scalar>
class Preview {
public:
  using Index = Eigen::Index;

  static std::vector<BoilPreview<Scalar>> BoilTimes(
    const FluidState<Scalar>& state,
    const FluidData<Scalar>& fluid,
    const Surroundings<Scalar>& surroundings,
    const VesselData<Scalar>& vessel,
    const std::vector<Scalar>& powers,
    Scalar dt,
    Scalar horizon,
    const PerformanceData& performance
  );

protected:
  static std::optional<Scalar> simulate(
    const FluidState<Scalar>& state,
    const FluidData<Scalar>& fluid,
    const Surroundings<Scalar>& surroundings,
    const VesselData<Scalar>& vessel,
    Scalar watts,
    Scalar dt,
    Scalar horizon
  );
};

template<typename Scalar>
auto Preview<Scalar>::BoilTimes(
  const FluidState<Scalar>& state,
  const FluidData<Scalar>& fluid,
  const Surroundings<Scalar>& surroundings,
  const VesselData<Scalar>& vessel,
  const std::vector<Scalar>& powers,
  const Scalar dt,
  const Scalar horizon,
  const PerformanceData& performance
) -> std::vector<BoilPreview<Scalar>> {
  if (performance.cores > 0)
    omp_set_num_threads(static_cast<int>(performance.cores));

  const auto boiling = FluidStep<Scalar>::BoilingPointFor(state, fluid, surroundings);
  const Index count = static_cast<Index>(powers.size());
  std::vector<BoilPreview<Scalar>> previews(powers.size());

  #pragma omp parallel for schedule(dynamic)
  for (Index i = 0; i < count; ++i) {
    const Scalar watts = powers[i];
    BoilPreview<Scalar>& preview = previews[i];
    preview.watts = watts;
    if (boiling)
      preview.expectedTime = BoilingPoint<Scalar>::ExpectedBoilTime(fluid, state, boiling->temperature, watts);
    preview.simulatedTime = simulate(state, fluid, surroundings, vessel, watts, dt, horizon);
  }

  return previews;
}

template<typename Scalar>
auto Preview<Scalar>::simulate(
  const FluidState<Scalar>& state,
  const FluidData<Scalar>& fluid,
  const Surroundings<Scalar>& surroundings,
  const VesselData<Scalar>& vessel,
  const Scalar watts,
  const Scalar dt,
  const Scalar horizon
) -> std::optional<Scalar> {
  if (!(watts > Scalar(0.0)) || !(dt > Scalar(0.0)) || !fluid.CanBoil())
    return std::nullopt;

  FluidState<Scalar> current = state;
  for (Scalar time = Scalar(0.0); time < horizon; time += dt) {
    const auto result = FluidStep<Scalar>::Step(current, watts, dt, &fluid, surroundings, vessel);
    if (result.isBoiling)
      return time + dt;
    if (result.allEvaporated)
      return std::nullopt;
    current = result.state;
  }
  return std::nullopt;
}

} // namespace thermini

#endif // THERMINI_PROCESS_PREVIEW_HPP_
