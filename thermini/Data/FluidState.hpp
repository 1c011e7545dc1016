#ifndef THERMINI_DATA_FLUID_STATE_HPP_
#define THERMINI_DATA_FLUID_STATE_HPP_

#include <algorithm>

#include "Data/FluidData.hpp"

namespace thermini {

template <typename Scalar>
struct FluidState {
  Scalar mass;         // kg, includes residue
  Scalar residueMass;  // kg, never evaporates
  Scalar temperature;  // C
  Scalar altitude;     // m

  Scalar EvaporableMass() const { return std::max(Scalar(0.0), mass - residueMass); }
};

template <typename Scalar>
FluidState<Scalar> MakeFluidState(const FluidData<Scalar>& fluid, Scalar mass, Scalar temperature, Scalar altitude) {
  const Scalar fraction = std::max(Scalar(0.0), std::min(Scalar(1.0), fluid.nonVolatileMassFraction));
  return { mass, mass * fraction, temperature, altitude };
}

}  // namespace thermini

#endif  // THERMINI_DATA_FLUID_STATE_HPP_
