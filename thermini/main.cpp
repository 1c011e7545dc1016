#include <Eigen/Dense>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "Data.hpp"
#include "Output.hpp"
#include "Process/Preview.hpp"
#include "Process/Room.hpp"
#include "Process/Scheduler.hpp"

using namespace Eigen;

// Exposure events and final alerts
template<typename Scalar_>
void OutputExposure(const thermini::RoomState<Scalar_>& room, const std::string& outDir) {
  std::ofstream file(std::filesystem::path(outDir) / "exposure.csv");
  file << "species,name,startTime,duration,peakPpm,severity,protected,consequence\n";
  for (const auto& event : room.exposureEvents) {
    file << event.species << "," << event.name << "," << event.startTime << "," << event.duration << ","
      << event.peakPpm << "," << thermini::SeverityName(event.severity) << "," << event.isProtected << ","
      << "\"" << event.consequence << "\"\n";
  }
  file.close();

  for (const auto& alert : room.alerts)
    std::cout << "[" << thermini::SeverityName(alert.severity) << "] " << alert.message << std::endl;

  const auto& energy = room.energyTotals;
  std::cout << "AC heating: " << energy.acHeatingJoules << " J, AC cooling: " << energy.acCoolingJoules
    << " J, air handler: " << energy.airHandlerJoules << " J, burner waste: " << energy.burnerWasteJoules
    << " J" << std::endl;
}

template<typename Scalar_>
void OutputPreview(
  const thermini::FluidData<Scalar_>& fluid,
  const thermini::VesselData<Scalar_>& vessel,
  const thermini::ControlData<Scalar_>& control,
  const thermini::PerformanceData& performance,
  const thermini::Scheduler<Scalar_>& scheduler,
  const std::string& outDir
) {
  if (control.previewPowers.empty())
    return;

  const auto previews = thermini::Preview<Scalar_>::BoilTimes(
    scheduler.Fluid(),
    fluid,
    scheduler.CurrentSurroundings(),
    vessel,
    control.previewPowers,
    control.dt,
    control.tmax,
    performance
  );

  std::ofstream file(std::filesystem::path(outDir) / "preview.csv");
  file << "watts,expectedTime,simulatedTime\n";
  for (const auto& preview : previews) {
    file << preview.watts << ","
      << (preview.expectedTime ? *preview.expectedTime : Scalar_(NAN)) << ","
      << (preview.simulatedTime ? *preview.simulatedTime : Scalar_(NAN)) << "\n";
  }
  file.close();
}

template<typename Scalar_>
void run(
  const thermini::FluidData<Scalar_>& fluid,
  const thermini::VesselData<Scalar_>& vessel,
  const thermini::RoomData<Scalar_>& room,
  const std::optional<thermini::AcData<Scalar_>>& ac,
  const std::optional<thermini::AirHandlerData<Scalar_>>& airHandler,
  const thermini::ControlData<Scalar_>& control,
  const thermini::PerformanceData& performance,
  const std::string& outpath
) {
  thermini::Scheduler<Scalar_> scheduler(fluid, vessel, room, ac, airHandler, control);
  OutputPreview(fluid, vessel, control, performance, scheduler, outpath);

  std::ofstream file(std::filesystem::path(outpath) / "history.csv");
  thermini::Simulate(scheduler, control, file, std::cout);
  file.close();

  const auto summary = thermini::Room<Scalar_>::Summarize(scheduler.Environment());
  std::cout << "Fluid: " << scheduler.Fluid().temperature << " C, " << scheduler.Fluid().mass << " kg" << std::endl;
  std::cout << "Room: " << summary.temperature << " C, " << summary.pressure << " kPa, O2 "
    << summary.oxygen << " %, H2O " << summary.humidity << " %" << std::endl;

  OutputExposure(scheduler.Environment(), outpath);
}

int main(int argc, char* argv[]) {
  using Scalar = double;

  std::string config_path = "config.yaml";
  std::string output_path_base = "out";
  for (int i = 1; i < argc; ++i) {
    if (std::string arg = argv[i]; arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      }
    } else if (arg == "--outpath") {
      if (i + 1 < argc) {
        output_path_base = argv[++i];
      }
    }
  }

  // Read simulation settings from YAML file
  thermini::Config<Scalar> config;
  try {
    config = thermini::ReadYaml<Scalar>(config_path);
  } catch (const YAML::Exception& e) {
    std::cerr << "Failed to read " << config_path << ": " << e.what() << std::endl;
    return 1;
  } catch (const std::runtime_error& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl;
    return 1;
  }
  const auto& [fluid, vessel, room, ac, airHandler, control, performance] = config;

  // Create unique output directory
  std::string output_path = output_path_base;
  Index counter = 1;
  while (std::filesystem::exists(output_path) && !std::filesystem::is_empty(output_path))
    output_path = output_path_base + std::to_string(counter++);

  std::filesystem::create_directory(output_path);
  std::cout << "Outputting to directory: " << output_path << std::endl;

  // Copy config file
  std::filesystem::copy(config_path, std::filesystem::path(output_path) / "config.yaml");

  std::cout << "Fluid: " << fluid.id << ", room: " << room.volume << " m3" << std::endl;

  const auto start_time = std::chrono::high_resolution_clock::now();

  run<Scalar>(fluid, vessel, room, ac, airHandler, control, performance, output_path);

  const auto end_time = std::chrono::high_resolution_clock::now();
  const std::chrono::duration<double> elapsed_time = end_time - start_time;
  std::cout << "Simulation completed. Total run time: " << elapsed_time.count() << " s" << std::endl;

  return 0;
}
