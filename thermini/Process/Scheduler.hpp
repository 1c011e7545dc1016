#ifndef THERMINI_PROCESS_SCHEDULER_HPP_
#define THERMINI_PROCESS_SCHEDULER_HPP_

#include <Eigen/Dense>

#include <optional>
#include <string>

#include "Data/ControlData.hpp"
#include "Data/EquipmentData.hpp"
#include "Data/FluidData.hpp"
#include "Data/FluidState.hpp"
#include "Data/RoomData.hpp"
#include "Process/FluidStep.hpp"
#include "Process/Room.hpp"
#include "Utils.hpp"

namespace thermini {

// Host-owned driving loop. Each Step() is one wall-clock tick: the time
// multiplier scales dt before it reaches the pure step functions, and the
// fluid vapor is handed to the room.
template<typename Scalar_>
class Scheduler {
public:
  using Index = Eigen::Index;

  Scheduler(
    const FluidData<Scalar_>& fluid,
    const VesselData<Scalar_>& vessel,
    const RoomData<Scalar_>& room,
    const std::optional<AcData<Scalar_>>& ac,
    const std::optional<AirHandlerData<Scalar_>>& airHandler,
    const ControlData<Scalar_>& control
  );

  const FluidState<Scalar_>& Fluid() const { return fluid_; }

  const RoomState<Scalar_>& Environment() const { return room_; }

  const FluidStepResult<Scalar_>& LastFluidStep() const { return lastFluid_; }

  Scalar_ Time() const { return time_; }

  Scalar_ HeaterWatts() const;

  std::string VaporSpecies() const;

  void SetHeaterWatts(Scalar_ watts) { heaterWatts_ = watts; }

  void SetTimeMultiplier(Scalar_ multiplier);

  void SetAcEnabled(bool enabled);

  void SetAcSetpoint(Scalar_ setpoint);

  void SetAirHandlerMode(const std::string& mode);

  void Init();

  void Step();

  void Run(Index steps);

  Surroundings<Scalar_> CurrentSurroundings() const;

private:
  // Members
  const FluidData<Scalar_> kFluid_;
  const VesselData<Scalar_> kVessel_;
  const RoomData<Scalar_> kRoom_;
  const std::optional<AcData<Scalar_>> kAc_;
  const std::optional<AirHandlerData<Scalar_>> kAirHandler_;
  const ControlData<Scalar_> kControl_;

  FluidState<Scalar_> fluid_;
  RoomState<Scalar_> room_;
  FluidStepResult<Scalar_> lastFluid_;
  Scalar_ heaterWatts_;
  Scalar_ timeMultiplier_;
  Scalar_ time_;
};

template<typename Scalar_>
Scheduler<Scalar_>::Scheduler(
  const FluidData<Scalar_>& fluid,
  const VesselData<Scalar_>& vessel,
  const RoomData<Scalar_>& room,
  const std::optional<AcData<Scalar_>>& ac,
  const std::optional<AirHandlerData<Scalar_>>& airHandler,
  const ControlData<Scalar_>& control
)
  : kFluid_(fluid), kVessel_(vessel), kRoom_(room), kAc_(ac), kAirHandler_(airHandler), kControl_(control) {
  Init();
}

template<typename Scalar_>
void Scheduler<Scalar_>::Init() {
  fluid_ = MakeFluidState(kFluid_, kControl_.mass, kControl_.temperature, kControl_.altitude);
  room_ = Room<Scalar_>::Create(kRoom_);
  room_ = Room<Scalar_>::SetAcEnabled(room_, kControl_.acEnabled);
  room_ = Room<Scalar_>::SetAcSetpoint(room_, kControl_.acSetpoint);
  lastFluid_ = FluidStepResult<Scalar_>{};
  lastFluid_.state = fluid_;
  heaterWatts_ = kControl_.heaterWatts;
  timeMultiplier_ = kControl_.timeMultiplier;
  time_ = Scalar_(0.0);
}

template<typename Scalar_>
auto Scheduler<Scalar_>::HeaterWatts() const -> Scalar_ {
  if (kControl_.heaterOffTime && time_ >= *kControl_.heaterOffTime)
    return Scalar_(0.0);
  return heaterWatts_;
}

template<typename Scalar_>
auto Scheduler<Scalar_>::VaporSpecies() const -> std::string {
  return kFluid_.chemicalFormula.empty() ? kFluid_.id : NormalizeFormula(kFluid_.chemicalFormula);
}

template<typename Scalar_>
void Scheduler<Scalar_>::SetTimeMultiplier(const Scalar_ multiplier) {
  if (IsPositive(multiplier))
    timeMultiplier_ = multiplier;
}

template<typename Scalar_>
void Scheduler<Scalar_>::SetAcEnabled(const bool enabled) {
  room_ = Room<Scalar_>::SetAcEnabled(room_, enabled);
}

template<typename Scalar_>
void Scheduler<Scalar_>::SetAcSetpoint(const Scalar_ setpoint) {
  room_ = Room<Scalar_>::SetAcSetpoint(room_, setpoint);
}

template<typename Scalar_>
void Scheduler<Scalar_>::SetAirHandlerMode(const std::string& mode) {
  room_ = Room<Scalar_>::SetAirHandlerMode(room_, mode);
}

template<typename Scalar_>
auto Scheduler<Scalar_>::CurrentSurroundings() const -> Surroundings<Scalar_> {
  Surroundings<Scalar_> surroundings;
  surroundings.temperature = room_.temperature;
  surroundings.pressure = room_.pressure;
  surroundings.vaporPartialPressure = Room<Scalar_>::PartialPressure(room_, VaporSpecies());
  return surroundings;
}

template<typename Scalar_>
void Scheduler<Scalar_>::Step() {
  const Scalar_ dt = kControl_.dt * timeMultiplier_;
  const Scalar_ watts = HeaterWatts();

  lastFluid_ = FluidStep<Scalar_>::Step(fluid_, watts, dt, &kFluid_, CurrentSurroundings(), kVessel_);
  fluid_ = lastFluid_.state;

  RoomInputs<Scalar_> inputs;
  if (watts > Scalar_(0.0))
    inputs.externalHeatWatts = watts;
  if (lastFluid_.VaporMass() > Scalar_(0.0) && kFluid_.molarMass)
    inputs.vapor = VaporInput<Scalar_>{ VaporSpecies(), lastFluid_.VaporMass(), *kFluid_.molarMass };

  room_ = Room<Scalar_>::Step(
    room_,
    kAc_ ? &*kAc_ : nullptr,
    kAirHandler_ ? &*kAirHandler_ : nullptr,
    dt,
    inputs
  );

  time_ += dt;
}

template<typename Scalar_>
void Scheduler<Scalar_>::Run(Index steps) {
  for (Index step = 0; step < steps; ++step)
    Step();
}

} // namespace thermini

#endif // THERMINI_PROCESS_SCHEDULER_HPP_
