#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

namespace BOOLSAT {

class Assignment;

using Variable = std::string;

enum class Op { VAR, AND, OR, NOT, NONE };

/// An immutable Boolean expression tree.
///
/// A VAR node is a variable leaf; AND/OR nodes own an ordered list of
/// operands, NOT owns exactly one. Every node owns its children outright,
/// so copies are deep and no two trees ever share a node.
/// A default-constructed node has op NONE and is rejected by every
/// traversal.
class BoolExpr {
 public:
  // default constructor
  BoolExpr() = default;

  // Variable leaves convert implicitly so formulas read like And({"a", "b"})
  BoolExpr(const char* name);
  BoolExpr(const Variable& name);

  // Factory methods
  static BoolExpr Var(const Variable& name);
  static BoolExpr And(std::vector<BoolExpr> operands);
  static BoolExpr Or(std::vector<BoolExpr> operands);
  static BoolExpr Not(BoolExpr operand);
  // Derived operators, rewritten into AND/OR/NOT
  static BoolExpr Implies(BoolExpr a, BoolExpr b);
  static BoolExpr Xor(BoolExpr a, BoolExpr b);

  // Print and stringify
  void Print(std::ostream& out) const;
  std::string toString() const;

  // Evaluate under a complete assignment. Throws std::logic_error if a
  // reachable variable is UNSET or missing, or on a NONE node.
  bool evaluate(const Assignment& assignment) const;

  // Accessors
  Op getOp() const { return op_; }
  bool isVariable() const { return op_ == Op::VAR; }
  const Variable& getName() const;
  const std::vector<BoolExpr>& getOperands() const { return operands_; }
  const BoolExpr& getOperand() const;

  // number of nodes in the tree, leaves included
  size_t size() const;

  bool operator==(const BoolExpr& other) const {
    return op_ == other.op_ && name_ == other.name_ &&
           operands_ == other.operands_;
  }
  bool operator!=(const BoolExpr& other) const { return !(*this == other); }

 private:
  // Private ctor: use factory methods
  BoolExpr(Op op, Variable name, std::vector<BoolExpr> operands);

  Op op_ = Op::NONE;
  Variable name_;  // only for VAR
  std::vector<BoolExpr> operands_;

  static std::string OpToString(Op);
};

std::ostream& operator<<(std::ostream& out, const BoolExpr& expr);

}  // namespace BOOLSAT
