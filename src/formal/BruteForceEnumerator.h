#pragma once

#include <cstdint>
#include <vector>
#include "Assignment.h"
#include "BoolExpr.h"

namespace BOOLSAT {

/// Exhaustive enumeration of all satisfying assignments.
///
/// Mask k in [0, 2^n) binds variables_[i] to bit (n - 1 - i) of k, so the
/// first extracted variable is the most significant bit. Solutions come
/// out in increasing mask order. Meant as a correctness oracle for small n.
class BruteForceEnumerator {
 public:
  static constexpr size_t MaxVariables = 63;

  explicit BruteForceEnumerator(const BoolExpr& expr);

  std::vector<Assignment> allSolutions() const;
  // Same result as allSolutions(), masks split across TBB workers.
  // Runs sequentially when BOOLSAT_NO_MT is set in the environment.
  std::vector<Assignment> allSolutionsParallel() const;

  const std::vector<Variable>& getVariables() const { return variables_; }

 private:
  Assignment assignmentFromMask(uint64_t mask) const;
  uint64_t numAssignments() const;

  BoolExpr expr_;
  std::vector<Variable> variables_;
};

std::vector<Assignment> bruteForceAllSolutions(const BoolExpr& expr);

}  // namespace BOOLSAT
