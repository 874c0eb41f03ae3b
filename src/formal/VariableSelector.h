// Copyright 2024-2025 keplertech.io
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>
#include "Assignment.h"
#include "BoolExpr.h"

namespace BOOLSAT {

/// Next branching decision: the variable to split on and the value to try
/// first.
struct Decision {
  Variable variable;
  bool firstValue = false;

  bool operator==(const Decision& other) const {
    return variable == other.variable && firstValue == other.firstValue;
  }
};

/// Branching heuristic for BacktrackingSolver.
///
/// select() is called once per search node with the full variable list and
/// the current partial assignment. It must return std::nullopt only when no
/// variable of the list is UNSET, and otherwise an UNSET variable of the
/// list. Any such choice gives a correct answer; the choice only changes
/// how much of the decision tree is explored.
class VariableSelector {
 public:
  virtual ~VariableSelector() = default;
  virtual std::optional<Decision> select(const std::vector<Variable>& variables,
                                         const Assignment& assignment) = 0;
};

/// First UNSET variable in extraction order, false first.
class FirstUnsetSelector : public VariableSelector {
 public:
  std::optional<Decision> select(const std::vector<Variable>& variables,
                                 const Assignment& assignment) override;
};

/// Adapts a plain callable.
class FunctionSelector : public VariableSelector {
 public:
  using Function = std::function<std::optional<Decision>(
      const std::vector<Variable>&, const Assignment&)>;

  explicit FunctionSelector(Function function) : function_(std::move(function)) {}

  std::optional<Decision> select(const std::vector<Variable>& variables,
                                 const Assignment& assignment) override {
    return function_(variables, assignment);
  }

 private:
  Function function_;
};

/// Branches on the UNSET variable with the most occurrences in the
/// expression (ties broken by extraction order). The first value is the
/// polarity under which the variable occurs more often: an occurrence under
/// an odd number of NOTs counts as negative.
/// Counts are computed once at construction.
class OccurrenceSelector : public VariableSelector {
 public:
  explicit OccurrenceSelector(const BoolExpr& expr);

  std::optional<Decision> select(const std::vector<Variable>& variables,
                                 const Assignment& assignment) override;

  size_t getOccurrences(const Variable& var) const;

 private:
  struct Counts {
    size_t positive = 0;
    size_t negative = 0;
  };
  void count(const BoolExpr& e, bool negated);

  std::unordered_map<Variable, Counts> counts_;
};

}  // namespace BOOLSAT
