#include "SolverConfig.h"

#include <stdexcept>

using namespace BOOLSAT;

namespace {

std::string scalar(const YAML::Node& cfg, const char* key) {
  if (!cfg[key].IsScalar()) {
    throw std::runtime_error(std::string("config: '") + key +
                             "' must be a scalar");
  }
  return cfg[key].as<std::string>();
}

}  // namespace

SolverConfig SolverConfig::fromYaml(const YAML::Node& cfg) {
  SolverConfig config;
  if (!cfg || cfg.IsNull()) {
    return config;
  }
  if (!cfg.IsMap()) {
    throw std::runtime_error("config: top level must be a map");
  }

  // mode
  if (cfg["mode"]) {
    std::string mode = scalar(cfg, "mode");
    if (mode == "solve")
      config.mode = Mode::SOLVE;
    else if (mode == "enumerate" || mode == "all")
      config.mode = Mode::ENUMERATE;
    else
      throw std::runtime_error("config: unrecognized mode: " + mode);
  }

  // selector
  if (cfg["selector"]) {
    std::string selector = scalar(cfg, "selector");
    if (selector == "first-unset" || selector == "first_unset")
      config.selector = SelectorType::FIRST_UNSET;
    else if (selector == "occurrence")
      config.selector = SelectorType::OCCURRENCE;
    else
      throw std::runtime_error("config: unrecognized selector: " + selector);
  }

  try {
    if (cfg["parallel"]) {
      config.parallel = cfg["parallel"].as<bool>();
    }
    if (cfg["max_enumeration_vars"]) {
      config.maxEnumerationVars = cfg["max_enumeration_vars"].as<size_t>();
    }
  } catch (const YAML::BadConversion& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }

  // log level
  if (cfg["log_level"]) {
    config.logLevel = scalar(cfg, "log_level");
  }

  // Add log file name
  if (cfg["log_file"]) {
    config.logFile = scalar(cfg, "log_file");
  }
  return config;
}

SolverConfig SolverConfig::loadFile(const std::string& path) {
  YAML::Node cfg;
  try {
    cfg = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse config " + path + ": " +
                             e.what());
  }
  return fromYaml(cfg);
}

std::unique_ptr<VariableSelector> SolverConfig::makeSelector(
    const BoolExpr& expr) const {
  switch (selector) {
    case SelectorType::OCCURRENCE:
      return std::make_unique<OccurrenceSelector>(expr);
    default:
      return std::make_unique<FirstUnsetSelector>();
  }
}
