#include "BoolExpr.h"
#include <sstream>
#include <stdexcept>
#include <utility>
#include "Assignment.h"

namespace BOOLSAT {

/// Private ctor. Only Not() builds NOT nodes, always with one operand.
BoolExpr::BoolExpr(Op op, Variable name, std::vector<BoolExpr> operands)
    : op_(op), name_(std::move(name)), operands_(std::move(operands)) {}

BoolExpr::BoolExpr(const char* name) : BoolExpr(Var(name)) {}

BoolExpr::BoolExpr(const Variable& name) : BoolExpr(Var(name)) {}

// Factory methods

BoolExpr BoolExpr::Var(const Variable& name) {
  return BoolExpr(Op::VAR, name, {});
}

BoolExpr BoolExpr::And(std::vector<BoolExpr> operands) {
  return BoolExpr(Op::AND, Variable(), std::move(operands));
}

BoolExpr BoolExpr::Or(std::vector<BoolExpr> operands) {
  return BoolExpr(Op::OR, Variable(), std::move(operands));
}

BoolExpr BoolExpr::Not(BoolExpr operand) {
  std::vector<BoolExpr> operands;
  operands.push_back(std::move(operand));
  return BoolExpr(Op::NOT, Variable(), std::move(operands));
}

BoolExpr BoolExpr::Implies(BoolExpr a, BoolExpr b) {
  return Or({Not(std::move(a)), std::move(b)});
}

// Both operands are duplicated: nested Xor doubles in size per level.
BoolExpr BoolExpr::Xor(BoolExpr a, BoolExpr b) {
  return Or({And({a, Not(b)}), And({Not(a), b})});
}

const Variable& BoolExpr::getName() const {
  if (op_ != Op::VAR)
    throw std::logic_error("getName: not a variable");
  return name_;
}

const BoolExpr& BoolExpr::getOperand() const {
  if (op_ != Op::NOT)
    throw std::logic_error("getOperand: not a NOT node");
  return operands_.front();
}

size_t BoolExpr::size() const {
  size_t count = 1;
  for (const auto& operand : operands_) {
    count += operand.size();
  }
  return count;
}

bool BoolExpr::evaluate(const Assignment& assignment) const {
  switch (op_) {
    case Op::VAR:
      switch (assignment.get(name_)) {
        case Value::TRUE:
          return true;
        case Value::FALSE:
          return false;
        default:
          throw std::logic_error("evaluate: variable '" + name_ +
                                 "' is not assigned");
      }
    case Op::AND:
      for (const auto& operand : operands_) {
        if (!operand.evaluate(assignment))
          return false;
      }
      return true;
    case Op::OR:
      for (const auto& operand : operands_) {
        if (operand.evaluate(assignment))
          return true;
      }
      return false;
    case Op::NOT:
      return !operands_.front().evaluate(assignment);
    default:
      throw std::logic_error("evaluate: malformed BoolExpr node");
  }
}

void BoolExpr::Print(std::ostream& out) const {
  switch (op_) {
    case Op::VAR:
      out << name_;
      break;
    case Op::NOT:
    case Op::AND:
    case Op::OR: {
      out << OpToString(op_) << "(";
      bool first = true;
      for (const auto& operand : operands_) {
        if (!first)
          out << ", ";
        operand.Print(out);
        first = false;
      }
      out << ")";
      break;
    }
    default:
      out << OpToString(op_);
  }
}

std::string BoolExpr::toString() const {
  // print content to string
  std::ostringstream oss;
  Print(oss);
  return oss.str();
}

std::string BoolExpr::OpToString(Op op) {
  switch (op) {
    case Op::VAR: return "VAR";
    case Op::NOT: return "NOT";
    case Op::AND: return "AND";
    case Op::OR:  return "OR";
    default:      return "UNKNOWN";
  }
}

std::ostream& operator<<(std::ostream& out, const BoolExpr& expr) {
  expr.Print(out);
  return out;
}

}  // namespace BOOLSAT
