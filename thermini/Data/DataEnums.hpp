#ifndef THERMINI_DATA_DATAENUMS_HPP_
#define THERMINI_DATA_DATAENUMS_HPP_

#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace thermini {
enum class PressureModeEnum {
  SeaLevel,
  Custom,
  Location,
};

enum class PidPresetEnum {
  Conservative,
  Balanced,
  Aggressive,
  CriticallyDamped,
};

enum class SeverityEnum {
  Safe,
  Warning,
  Danger,
  Critical,
};
} // namespace thermini

namespace YAML {
// Specialization for PressureModeEnum
template<>
struct convert<thermini::PressureModeEnum> {
  static Node encode(const thermini::PressureModeEnum& mode) {
    Node node;
    switch (mode) {
      case thermini::PressureModeEnum::SeaLevel:
        node = "sealevel";
        break;
      case thermini::PressureModeEnum::Custom:
        node = "custom";
        break;
      case thermini::PressureModeEnum::Location:
        node = "location";
        break;
      default:
        throw std::runtime_error("Invalid PressureModeEnum value for encoding.");
    }
    return node;
  }

  static bool decode(const Node& node, thermini::PressureModeEnum& mode) {
    if (!node.IsScalar()) {
      return false;
    }

    const auto value = node.as<std::string>();
    if (value == "sealevel") {
      mode = thermini::PressureModeEnum::SeaLevel;
    } else if (value == "custom") {
      mode = thermini::PressureModeEnum::Custom;
    } else if (value == "location") {
      mode = thermini::PressureModeEnum::Location;
    } else {
      return false; // Invalid value
    }
    return true;
  }
};

// Specialization for PidPresetEnum
template<>
struct convert<thermini::PidPresetEnum> {
  static Node encode(const thermini::PidPresetEnum& preset) {
    Node node;
    switch (preset) {
      case thermini::PidPresetEnum::Conservative:
        node = "conservative";
        break;
      case thermini::PidPresetEnum::Balanced:
        node = "balanced";
        break;
      case thermini::PidPresetEnum::Aggressive:
        node = "aggressive";
        break;
      case thermini::PidPresetEnum::CriticallyDamped:
        node = "criticallyDamped";
        break;
      default:
        throw std::runtime_error("Invalid PidPresetEnum value for encoding.");
    }
    return node;
  }

  static bool decode(const Node& node, thermini::PidPresetEnum& preset) {
    if (!node.IsScalar()) {
      return false;
    }

    const auto value = node.as<std::string>();
    if (value == "conservative") {
      preset = thermini::PidPresetEnum::Conservative;
    } else if (value == "balanced") {
      preset = thermini::PidPresetEnum::Balanced;
    } else if (value == "aggressive") {
      preset = thermini::PidPresetEnum::Aggressive;
    } else if (value == "criticallyDamped") {
      preset = thermini::PidPresetEnum::CriticallyDamped;
    } else {
      return false; // Invalid value
    }
    return true;
  }
};

// Specialization for SeverityEnum
template<>
struct convert<thermini::SeverityEnum> {
  static Node encode(const thermini::SeverityEnum& severity) {
    Node node;
    switch (severity) {
      case thermini::SeverityEnum::Safe:
        node = "safe";
        break;
      case thermini::SeverityEnum::Warning:
        node = "warning";
        break;
      case thermini::SeverityEnum::Danger:
        node = "danger";
        break;
      case thermini::SeverityEnum::Critical:
        node = "critical";
        break;
      default:
        throw std::runtime_error("Invalid SeverityEnum value for encoding.");
    }
    return node;
  }

  static bool decode(const Node& node, thermini::SeverityEnum& severity) {
    if (!node.IsScalar()) {
      return false;
    }

    const auto value = node.as<std::string>();
    if (value == "safe") {
      severity = thermini::SeverityEnum::Safe;
    } else if (value == "warning") {
      severity = thermini::SeverityEnum::Warning;
    } else if (value == "danger") {
      severity = thermini::SeverityEnum::Danger;
    } else if (value == "critical") {
      severity = thermini::SeverityEnum::Critical;
    } else {
      return false; // Invalid value
    }
    return true;
  }
};
} // namespace YAML

#endif // THERMINI_DATA_DATAENUMS_HPP_
