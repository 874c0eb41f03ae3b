// Copyright 2024-2025 keplertech.io
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "Assignment.h"
#include "BoolExpr.h"
#include "VariableSelector.h"

namespace BOOLSAT {

struct SearchStats {
  size_t nodes = 0;       // search nodes visited, leaves included
  size_t leaves = 0;      // complete assignments evaluated
  size_t backtracks = 0;  // first branches that failed
};

/// Exhaustive binary backtracking search over the variables of an
/// expression.
///
/// Each node asks the selector for a variable, tries the preferred value in
/// a fresh copy of the assignment, then the opposite value. The formula is
/// only evaluated at complete assignments; there is no propagation.
/// Recursion depth equals the number of unassigned variables.
class BacktrackingSolver {
 public:
  /// selector must outlive the solver.
  BacktrackingSolver(const BoolExpr& expr, VariableSelector& selector);

  /// Search from initial. Variables of the expression missing from initial
  /// start UNSET; extra entries of initial are kept in the result.
  /// Throws std::logic_error if the selector breaks its contract.
  std::optional<Assignment> solve(const Assignment& initial = Assignment());

  const std::vector<Variable>& getVariables() const { return variables_; }
  const SearchStats& getStats() const { return stats_; }

 private:
  std::optional<Assignment> search(Assignment assignment);
  void checkDecision(const Decision& decision,
                     const Assignment& assignment) const;

  BoolExpr expr_;
  std::vector<Variable> variables_;
  VariableSelector& selector_;
  SearchStats stats_;
};

/// Every variable of expr bound to UNSET: the starting point of a search.
Assignment getInitialAssignments(const BoolExpr& expr);

/// Find one satisfying assignment of expr, or std::nullopt when none
/// exists. Uses FirstUnsetSelector when selector is null.
std::optional<Assignment> getSolution(const BoolExpr& expr,
                                      const Assignment& initial = Assignment(),
                                      VariableSelector* selector = nullptr);

/// Overload for a plain callable heuristic.
std::optional<Assignment> getSolution(const BoolExpr& expr,
                                      const Assignment& initial,
                                      FunctionSelector::Function selectNextVar);

}  // namespace BOOLSAT
