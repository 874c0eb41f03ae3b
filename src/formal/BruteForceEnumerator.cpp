// Copyright 2024-2025 keplertech.io
// SPDX-License-Identifier: GPL-3.0-only

#include "BruteForceEnumerator.h"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <tbb/blocked_range.h>
#include <tbb/concurrent_vector.h>
#include <tbb/parallel_for.h>

#include "SolverLogger.h"
#include "VariableExtractor.h"

using namespace BOOLSAT;

BruteForceEnumerator::BruteForceEnumerator(const BoolExpr& expr)
    : expr_(expr), variables_(VariableExtractor::extract(expr)) {
  if (variables_.size() > MaxVariables) {
    throw std::length_error("BruteForceEnumerator: " +
                            std::to_string(variables_.size()) +
                            " variables exceed the 64-bit mask range");
  }
}

uint64_t BruteForceEnumerator::numAssignments() const {
  return 1ULL << variables_.size();  // 2^n assignments
}

Assignment BruteForceEnumerator::assignmentFromMask(uint64_t mask) const {
  const size_t numVars = variables_.size();
  Assignment env;
  for (size_t i = 0; i < numVars; ++i) {
    env.set(variables_[i], toValue(((mask >> (numVars - 1 - i)) & 1) != 0));
  }
  return env;
}

std::vector<Assignment> BruteForceEnumerator::allSolutions() const {
  auto logger = SolverLogger::get();
  const uint64_t total = numAssignments();
  logger->debug("Enumerating {} assignments over {} variables", total,
                variables_.size());
  std::vector<Assignment> solutions;
  for (uint64_t mask = 0; mask < total; ++mask) {
    // build one assignment from bits of mask
    Assignment env = assignmentFromMask(mask);
    if (expr_.evaluate(env)) {
      solutions.push_back(std::move(env));
    }
  }
  logger->debug("Found {} solutions", solutions.size());
  return solutions;
}

std::vector<Assignment> BruteForceEnumerator::allSolutionsParallel() const {
  if (getenv("BOOLSAT_NO_MT")) {
    return allSolutions();
  }
  auto logger = SolverLogger::get();
  const uint64_t total = numAssignments();
  logger->debug("Enumerating {} assignments over {} variables in parallel",
                total, variables_.size());
  tbb::concurrent_vector<uint64_t> satisfying;
  tbb::parallel_for(tbb::blocked_range<uint64_t>(0, total),
                    [&](const tbb::blocked_range<uint64_t>& r) {
                      for (uint64_t mask = r.begin(); mask < r.end(); ++mask) {
                        if (expr_.evaluate(assignmentFromMask(mask))) {
                          satisfying.push_back(mask);
                        }
                      }
                    });
  // workers append in arbitrary order
  std::vector<uint64_t> masks(satisfying.begin(), satisfying.end());
  std::sort(masks.begin(), masks.end());
  std::vector<Assignment> solutions;
  solutions.reserve(masks.size());
  for (auto mask : masks) {
    solutions.push_back(assignmentFromMask(mask));
  }
  logger->debug("Found {} solutions", solutions.size());
  return solutions;
}

std::vector<Assignment> BOOLSAT::bruteForceAllSolutions(const BoolExpr& expr) {
  return BruteForceEnumerator(expr).allSolutions();
}
