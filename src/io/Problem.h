#pragma once

#include <istream>
#include <ostream>
#include <string>

#include <yaml-cpp/yaml.h>

#include "Assignment.h"
#include "BoolExpr.h"

namespace BOOLSAT {

/// A formula with optional seeded assumptions, read from YAML:
///
///   formula:
///     and:
///       - not: b
///       - or: [a, b]
///       - xor: [b, c]
///       - implies: [c, {and: [d, e]}]
///   assumptions:
///     a: true
///
/// A scalar is a variable. A node is a single-key map: and/or take a
/// sequence, not takes one operand, implies/xor take a pair.
struct Problem {
  BoolExpr formula;
  Assignment assumptions;

  /// Throws std::runtime_error naming the offending key on malformed input.
  static Problem fromYaml(const YAML::Node& node);
  static Problem load(std::istream& in);
  static Problem loadFile(const std::string& path);

  static BoolExpr parseFormula(const YAML::Node& node);
  static YAML::Node formulaToYaml(const BoolExpr& expr);

  /// Write in the format read by load().
  void save(std::ostream& out) const;
};

}  // namespace BOOLSAT
