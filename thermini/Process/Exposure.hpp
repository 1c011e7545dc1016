#ifndef THERMINI_PROCESS_EXPOSURE_HPP_
#define THERMINI_PROCESS_EXPOSURE_HPP_

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "Data/Composition.hpp"
#include "Data/DataEnums.hpp"
#include "Data/EquipmentData.hpp"
#include "Data/RoomData.hpp"
#include "Utils.hpp"

namespace thermini {

template<typename Scalar>
struct ExposureThreshold {
  std::string name;
  Scalar safePpm;
  Scalar warningPpm;
  Scalar dangerPpm;
  std::string warningText;
  std::string dangerText;
  std::string criticalText;
};

// Read-only overlay on the room: never touches temperature, pressure or composition
template<typename Scalar>
class ExposureMonitor {
public:
  // Keyed by room composition species
  static const std::map<std::string, ExposureThreshold<Scalar>>& Thresholds();

  static SeverityEnum Classify(Scalar ppm, const ExposureThreshold<Scalar>& threshold);

  static std::vector<ExposureEvent<Scalar>> Track(
    const RoomState<Scalar>& state,
    const AirHandlerData<Scalar>* airHandler,
    Scalar dt
  );

  static std::vector<Alert> CompositionAlerts(const Composition<Scalar>& composition);

private:
  inline static const Scalar kProtectionEfficiency_ = Scalar(0.5);
};

template<typename Scalar>
auto ExposureMonitor<Scalar>::Thresholds() -> const std::map<std::string, ExposureThreshold<Scalar>>& {
  static const std::map<std::string, ExposureThreshold<Scalar>> kThresholds = {
    { "NH3",
      { "Ammonia", Scalar(25.0), Scalar(50.0), Scalar(300.0),
        "Eye and respiratory irritation. Headache developing.",
        "Severe respiratory distress! Immediate evacuation required.",
        "Life-threatening exposure. Pulmonary edema risk." } },
    { "C3H6O",
      { "Acetone", Scalar(250.0), Scalar(500.0), Scalar(2500.0),
        "Mild dizziness and headache. Eyes watering.",
        "Significant CNS depression. Confusion and weakness.",
        "Loss of consciousness possible. Evacuate immediately." } },
    { "C2H5OH",
      { "Ethanol", Scalar(1000.0), Scalar(2000.0), Scalar(3300.0),
        "Feeling lightheaded. Sweet smell noticeable.",
        "Intoxication symptoms. Impaired judgment.",
        "Severe intoxication. Risk of unconsciousness." } },
    { "CH4",
      { "Methane", Scalar(10000.0), Scalar(50000.0), Scalar(150000.0),
        "Oxygen being displaced. Ventilate immediately.",
        "Explosive atmosphere! No sparks or flames!",
        "Asphyxiation risk. Explosive mixture present." } },
  };
  return kThresholds;
}

template<typename Scalar>
auto ExposureMonitor<Scalar>::Classify(const Scalar ppm, const ExposureThreshold<Scalar>& threshold) -> SeverityEnum {
  if (ppm > threshold.dangerPpm)
    return SeverityEnum::Critical;
  if (ppm > threshold.warningPpm)
    return SeverityEnum::Danger;
  if (ppm > threshold.safePpm)
    return SeverityEnum::Warning;
  return SeverityEnum::Safe;
}

template<typename Scalar>
auto ExposureMonitor<Scalar>::Track(
  const RoomState<Scalar>& state,
  const AirHandlerData<Scalar>* airHandler,
  const Scalar dt
) -> std::vector<ExposureEvent<Scalar>> {
  std::vector<ExposureEvent<Scalar>> events = state.exposureEvents;

  for (const auto& [species, threshold] : Thresholds()) {
    const Scalar ppm = FractionToPpm(state.composition.Get(species));
    const SeverityEnum severity = Classify(ppm, threshold);
    if (severity == SeverityEnum::Safe)
      continue;

    std::string consequence = threshold.warningText;
    if (severity == SeverityEnum::Danger)
      consequence = threshold.dangerText;
    else if (severity == SeverityEnum::Critical)
      consequence = threshold.criticalText;

    const Scalar efficiency = airHandler != nullptr ? airHandler->Efficiency(species) : Scalar(0.0);
    const bool isProtected = efficiency > kProtectionEfficiency_ && state.airHandlerMode != "off";

    auto it = std::find_if(events.begin(), events.end(), [&](const ExposureEvent<Scalar>& event) {
      return event.species == species;
    });
    if (it != events.end()) {
      it->duration += dt;
      it->peakPpm = std::max(it->peakPpm, ppm);
      it->severity = severity;
      it->consequence = consequence;
      it->isProtected = isProtected;
    } else {
      events.push_back({ species, threshold.name, state.elapsed, dt, ppm, severity, consequence, isProtected });
    }
  }

  return events;
}

template<typename Scalar>
auto ExposureMonitor<Scalar>::CompositionAlerts(const Composition<Scalar>& composition) -> std::vector<Alert> {
  std::vector<Alert> alerts;

  const Scalar o2 = composition.Get("O2");
  if (o2 < Scalar(0.16))
    alerts.push_back({ SeverityEnum::Critical, "O2", "Oxygen depletion - dangerous!" });
  else if (o2 < Scalar(0.195))
    alerts.push_back({ SeverityEnum::Warning, "O2", "Low oxygen" });

  const Scalar co2 = composition.Get("CO2");
  if (co2 > Scalar(0.03))
    alerts.push_back({ SeverityEnum::Critical, "CO2", "Dangerous CO2 levels!" });
  else if (co2 > Scalar(0.01))
    alerts.push_back({ SeverityEnum::Warning, "CO2", "High CO2" });

  const Scalar nh3 = composition.Get("NH3");
  if (nh3 > Scalar(0.0025))
    alerts.push_back({ SeverityEnum::Critical, "NH3", "Toxic: Ammonia detected!" });
  else if (nh3 > Scalar(0.001))
    alerts.push_back({ SeverityEnum::Warning, "NH3", "Ammonia vapors present" });

  const Scalar ethanol = composition.Get("C2H5OH");
  if (ethanol > Scalar(0.03))
    alerts.push_back({ SeverityEnum::Critical, "C2H5OH", "Flammable: Ethanol vapors!" });
  else if (ethanol > Scalar(0.01))
    alerts.push_back({ SeverityEnum::Warning, "C2H5OH", "Ethanol vapors present" });

  if (composition.Get("toxic_generic") > Scalar(0.001))
    alerts.push_back({ SeverityEnum::Critical, "toxic", "Toxic vapors detected!" });

  return alerts;
}

} // namespace thermini

#endif // THERMINI_PROCESS_EXPOSURE_HPP_
