#pragma once

#include <unordered_set>
#include <vector>
#include "BoolExpr.h"

namespace BOOLSAT {

class VariableExtractor {
 public:
  /// Distinct variables of expr in first-occurrence order of a pre-order,
  /// left-to-right walk. This order drives the default search order and
  /// the bit layout of brute-force enumeration.
  static std::vector<Variable> extract(const BoolExpr& expr);

 private:
  static void collectVars(const BoolExpr& e,
                          std::unordered_set<Variable>& seen,
                          std::vector<Variable>& ordered);
};

}  // namespace BOOLSAT
