#include "VariableSelector.h"
#include <stdexcept>

using namespace BOOLSAT;

std::optional<Decision> FirstUnsetSelector::select(
    const std::vector<Variable>& variables,
    const Assignment& assignment) {
  for (const auto& var : variables) {
    if (!assignment.isSet(var)) {
      return Decision{var, false};
    }
  }
  return std::nullopt;
}

OccurrenceSelector::OccurrenceSelector(const BoolExpr& expr) {
  count(expr, false);
}

void OccurrenceSelector::count(const BoolExpr& e, bool negated) {
  switch (e.getOp()) {
    case Op::VAR: {
      auto& c = counts_[e.getName()];
      if (negated)
        ++c.negative;
      else
        ++c.positive;
      break;
    }
    case Op::NOT:
      count(e.getOperand(), !negated);
      break;
    case Op::AND:
    case Op::OR:
      for (const auto& operand : e.getOperands()) {
        count(operand, negated);
      }
      break;
    default:
      throw std::logic_error("OccurrenceSelector: malformed BoolExpr node");
  }
}

size_t OccurrenceSelector::getOccurrences(const Variable& var) const {
  auto it = counts_.find(var);
  if (it == counts_.end())
    return 0;
  return it->second.positive + it->second.negative;
}

std::optional<Decision> OccurrenceSelector::select(
    const std::vector<Variable>& variables,
    const Assignment& assignment) {
  const Variable* best = nullptr;
  size_t bestCount = 0;
  for (const auto& var : variables) {
    if (assignment.isSet(var))
      continue;
    size_t occurrences = getOccurrences(var);
    if (best == nullptr || occurrences > bestCount) {
      best = &var;
      bestCount = occurrences;
    }
  }
  if (best == nullptr)
    return std::nullopt;
  auto it = counts_.find(*best);
  bool firstValue =
      it != counts_.end() && it->second.positive >= it->second.negative;
  return Decision{*best, firstValue};
}
