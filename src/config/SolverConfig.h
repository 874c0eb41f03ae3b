#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <yaml-cpp/yaml.h>

#include "BoolExpr.h"
#include "VariableSelector.h"

namespace BOOLSAT {

/// Run settings for the boolsat driver.
///
/// YAML keys (all optional):
///   mode: solve | enumerate
///   selector: first-unset | occurrence
///   parallel: bool
///   log_level: trace | debug | info | warn | error | critical | off
///   log_file: path
///   max_enumeration_vars: integer
struct SolverConfig {
  enum class Mode { SOLVE, ENUMERATE };
  enum class SelectorType { FIRST_UNSET, OCCURRENCE };

  Mode mode = Mode::SOLVE;
  SelectorType selector = SelectorType::FIRST_UNSET;
  bool parallel = false;
  std::string logLevel = "info";
  std::string logFile;
  size_t maxEnumerationVars = 20;

  /// Throws std::runtime_error on unknown values or wrongly typed keys.
  static SolverConfig fromYaml(const YAML::Node& node);
  static SolverConfig loadFile(const std::string& path);

  /// Selector instance for expr according to the selector setting.
  std::unique_ptr<VariableSelector> makeSelector(const BoolExpr& expr) const;
};

}  // namespace BOOLSAT
