#include "VariableExtractor.h"
#include <stdexcept>

using namespace BOOLSAT;

std::vector<Variable> VariableExtractor::extract(const BoolExpr& expr) {
  std::unordered_set<Variable> seen;
  std::vector<Variable> ordered;
  collectVars(expr, seen, ordered);
  return ordered;
}

// Recursively collect variable names from a BoolExpr tree
void VariableExtractor::collectVars(const BoolExpr& e,
                                    std::unordered_set<Variable>& seen,
                                    std::vector<Variable>& ordered) {
  switch (e.getOp()) {
    case Op::VAR:
      if (seen.insert(e.getName()).second) {
        ordered.push_back(e.getName());
      }
      break;
    case Op::NOT:
    case Op::AND:
    case Op::OR:
      for (const auto& operand : e.getOperands()) {
        collectVars(operand, seen, ordered);
      }
      break;
    default:
      throw std::logic_error("collectVars: malformed BoolExpr node");
  }
}
