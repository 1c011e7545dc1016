#ifndef THERMINI_OUTPUT_HPP_
#define THERMINI_OUTPUT_HPP_

#include <Eigen/Dense>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <string>
#include <vector>

#include "Data/ControlData.hpp"
#include "Data/DataEnums.hpp"
#include "Formula/TemperatureConversion.hpp"
#include "Process/FluidStep.hpp"
#include "Process/Scheduler.hpp"

namespace thermini {

inline std::string PhaseName(const FluidPhaseEnum phase) {
  switch (phase) {
    case FluidPhaseEnum::Heating:
      return "heating";
    case FluidPhaseEnum::Boiling:
      return "boiling";
    case FluidPhaseEnum::Cooling:
      return "cooling";
    default:
      return "idle";
  }
}

inline std::string SeverityName(const SeverityEnum severity) {
  return YAML::convert<SeverityEnum>::encode(severity).as<std::string>();
}

// Composition columns: the starting atmosphere plus the fluid vapor
template<typename Scalar_>
std::vector<std::string> OutputHeader(std::ostream& file, const Scheduler<Scalar_>& scheduler) {
  std::vector<std::string> columns = scheduler.Environment().composition.Species();
  if (!scheduler.Environment().composition.Contains(scheduler.VaporSpecies()))
    columns.push_back(scheduler.VaporSpecies());

  file << "time,fluidT,fluidF,mass,phase,boilingPoint,steam,evaporated,roomT,roomP,acStatus,airHandlerStatus";
  for (const auto& species : columns)
    file << "," << species;
  file << "\n";
  return columns;
}

template<typename Scalar_>
void OutputRow(std::ostream& file, const Scheduler<Scalar_>& scheduler, const std::vector<std::string>& columns) {
  using Conversion = TemperatureConversion<Scalar_>;

  const auto& fluid = scheduler.Fluid();
  const auto& step = scheduler.LastFluidStep();
  const auto& room = scheduler.Environment();

  file << scheduler.Time() << ","
    << fluid.temperature << "," << Conversion::CelsiusToFahrenheit(fluid.temperature) << ","
    << fluid.mass << "," << PhaseName(step.phase) << ","
    << (step.boilingPoint ? *step.boilingPoint : Scalar_(NAN)) << ","
    << step.steamGenerated << "," << step.evaporatedMass << ","
    << room.temperature << "," << room.pressure << ","
    << room.acStatus << "," << room.airHandlerStatus;
  for (const auto& species : columns)
    file << "," << room.composition.Get(species);
  file << "\n";
}

// Runs the schedule to tmax, one history row and one progress line per printStep
template<typename Scalar_>
void Simulate(
  Scheduler<Scalar_>& scheduler,
  const ControlData<Scalar_>& control,
  std::ostream& history,
  std::ostream& log
) {
  using Index = Eigen::Index;

  const auto columns = OutputHeader(history, scheduler);
  OutputRow(history, scheduler, columns);

  const Index kSteps = static_cast<Index>(control.tmax / (control.dt * control.timeMultiplier));
  for (Index i = 0; i < kSteps; ) {
    const Index stepsPerChunk = std::min(control.printStep, kSteps - i);
    scheduler.Run(stepsPerChunk);
    i += stepsPerChunk;

    log << "Time: " << scheduler.Time() << " s" << std::endl;
    OutputRow(history, scheduler, columns);
    if (scheduler.LastFluidStep().allEvaporated) {
      log << "Fluid fully evaporated at t = " << scheduler.Time() << " s" << std::endl;
      break;
    }
  }
}

} // namespace thermini

#endif // THERMINI_OUTPUT_HPP_
