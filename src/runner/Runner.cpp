#include "Runner.h"

#include <cstdlib>

#include "BacktrackingSolver.h"
#include "BruteForceEnumerator.h"
#include "SolverLogger.h"

using namespace BOOLSAT;

int Runner::run(const Problem& problem,
                const SolverConfig& config,
                std::ostream& out) {
  auto logger = SolverLogger::get();
  if (logger->should_log(spdlog::level::debug)) {
    logger->debug("Formula: {}", problem.formula.toString());
  }
  if (config.mode == SolverConfig::Mode::ENUMERATE) {
    if (!problem.assumptions.empty()) {
      logger->warn("Assumptions are ignored when enumerating");
    }
    return enumerate(problem, config, out);
  }
  return solve(problem, config, out);
}

int Runner::enumerate(const Problem& problem,
                      const SolverConfig& config,
                      std::ostream& out) {
  auto logger = SolverLogger::get();
  BruteForceEnumerator enumerator(problem.formula);
  if (enumerator.getVariables().size() > config.maxEnumerationVars) {
    logger->critical("Refusing to enumerate {} variables (max_enumeration_vars: {})",
                     enumerator.getVariables().size(),
                     config.maxEnumerationVars);
    return EXIT_FAILURE;
  }
  auto solutions = config.parallel ? enumerator.allSolutionsParallel()
                                   : enumerator.allSolutions();
  for (const auto& solution : solutions) {
    out << solution << '\n';
  }
  if (solutions.empty()) {
    out << "UNSAT\n";
  }
  logger->info("{} solutions", solutions.size());
  return EXIT_SUCCESS;
}

int Runner::solve(const Problem& problem,
                  const SolverConfig& config,
                  std::ostream& out) {
  auto logger = SolverLogger::get();
  auto selector = config.makeSelector(problem.formula);
  BacktrackingSolver solver(problem.formula, *selector);
  auto solution = solver.solve(problem.assumptions);
  if (solution) {
    out << *solution << '\n';
  } else {
    out << "UNSAT\n";
  }
  const auto& stats = solver.getStats();
  logger->info("Explored {} nodes ({} leaves, {} backtracks)", stats.nodes,
               stats.leaves, stats.backtracks);
  return EXIT_SUCCESS;
}
