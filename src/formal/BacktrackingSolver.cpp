#include "BacktrackingSolver.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "SolverLogger.h"
#include "VariableExtractor.h"

using namespace BOOLSAT;

BacktrackingSolver::BacktrackingSolver(const BoolExpr& expr,
                                       VariableSelector& selector)
    : expr_(expr),
      variables_(VariableExtractor::extract(expr)),
      selector_(selector) {}

std::optional<Assignment> BacktrackingSolver::solve(const Assignment& initial) {
  auto logger = SolverLogger::get();
  stats_ = SearchStats();
  Assignment seeded(initial);
  for (const auto& var : variables_) {
    if (!seeded.isSet(var)) {
      seeded.set(var, Value::UNSET);
    }
  }
  if (logger->should_log(spdlog::level::debug)) {
    logger->debug("Solving {} over {} variables", expr_.toString(),
                  variables_.size());
  }
  auto result = search(std::move(seeded));
  logger->debug("Search {} after {} nodes, {} leaves, {} backtracks",
                result ? "succeeded" : "failed", stats_.nodes, stats_.leaves,
                stats_.backtracks);
  return result;
}

void BacktrackingSolver::checkDecision(const Decision& decision,
                                       const Assignment& assignment) const {
  if (std::find(variables_.begin(), variables_.end(), decision.variable) ==
      variables_.end()) {
    throw std::logic_error("VariableSelector chose unknown variable '" +
                           decision.variable + "'");
  }
  if (assignment.isSet(decision.variable)) {
    throw std::logic_error("VariableSelector chose assigned variable '" +
                           decision.variable + "'");
  }
}

// assignment is this node's own copy; children get copies with one more
// binding
std::optional<Assignment> BacktrackingSolver::search(Assignment assignment) {
  ++stats_.nodes;
  auto decision = selector_.select(variables_, assignment);
  if (!decision) {
    ++stats_.leaves;
    if (expr_.evaluate(assignment)) {
      return assignment;
    }
    return std::nullopt;
  }
  checkDecision(*decision, assignment);
  const Variable& var = decision->variable;
  SolverLogger::get()->trace("Branch on {} = {}", var, decision->firstValue);

  auto first =
      search(assignment.with(var, toValue(decision->firstValue)));
  if (first) {
    return first;
  }
  ++stats_.backtracks;
  return search(assignment.with(var, toValue(!decision->firstValue)));
}

Assignment BOOLSAT::getInitialAssignments(const BoolExpr& expr) {
  Assignment assignment;
  for (const auto& var : VariableExtractor::extract(expr)) {
    assignment.set(var, Value::UNSET);
  }
  return assignment;
}

std::optional<Assignment> BOOLSAT::getSolution(const BoolExpr& expr,
                                               const Assignment& initial,
                                               VariableSelector* selector) {
  FirstUnsetSelector defaultSelector;
  BacktrackingSolver solver(expr, selector ? *selector : defaultSelector);
  return solver.solve(initial);
}

std::optional<Assignment> BOOLSAT::getSolution(
    const BoolExpr& expr,
    const Assignment& initial,
    FunctionSelector::Function selectNextVar) {
  FunctionSelector selector(std::move(selectNextVar));
  return getSolution(expr, initial, &selector);
}
