#pragma once

#include <ostream>

#include "Problem.h"
#include "SolverConfig.h"

namespace BOOLSAT {

/// Runs a loaded problem in the configured mode and prints the result.
/// Solutions go to out one per line; "UNSAT" when there is none.
/// Returns EXIT_SUCCESS or EXIT_FAILURE.
class Runner {
 public:
  static int run(const Problem& problem,
                 const SolverConfig& config,
                 std::ostream& out);

  // Refuses formulas with more than config.maxEnumerationVars variables.
  static int enumerate(const Problem& problem,
                       const SolverConfig& config,
                       std::ostream& out);
  static int solve(const Problem& problem,
                   const SolverConfig& config,
                   std::ostream& out);
};

}  // namespace BOOLSAT
