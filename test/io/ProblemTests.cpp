#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

#include "BacktrackingSolver.h"
#include "Problem.h"

using namespace BOOLSAT;

namespace {

Problem parse(const std::string& text) {
  std::istringstream in(text);
  return Problem::load(in);
}

}  // namespace

TEST(ProblemTest, ParsesFormulaTree) {
  Problem problem = parse(
      "formula:\n"
      "  and:\n"
      "    - not: b\n"
      "    - or: [a, b]\n"
      "    - xor: [b, c]\n"
      "    - implies: [c, {and: [d, e]}]\n");
  auto expected =
      BoolExpr::And({BoolExpr::Not("b"), BoolExpr::Or({"a", "b"}),
                     BoolExpr::Xor("b", "c"),
                     BoolExpr::Implies("c", BoolExpr::And({"d", "e"}))});
  EXPECT_EQ(problem.formula, expected);
  EXPECT_TRUE(problem.assumptions.empty());
}

TEST(ProblemTest, ScalarFormulaIsVariable) {
  EXPECT_EQ(parse("formula: x\n").formula, BoolExpr("x"));
}

TEST(ProblemTest, EmptyOperands) {
  EXPECT_EQ(parse("formula: {and: []}\n").formula, BoolExpr::And({}));
  EXPECT_EQ(parse("formula: {or: []}\n").formula, BoolExpr::Or({}));
}

TEST(ProblemTest, Assumptions) {
  Problem problem = parse(
      "formula: {or: [a, b]}\n"
      "assumptions:\n"
      "  a: false\n");
  EXPECT_EQ(problem.assumptions, (Assignment{{"a", false}}));
  auto solution = getSolution(problem.formula, problem.assumptions);
  ASSERT_TRUE(solution.has_value());
  EXPECT_EQ(*solution, (Assignment{{"a", false}, {"b", true}}));
}

TEST(ProblemTest, MalformedDocuments) {
  EXPECT_THROW(parse("other: a\n"), std::runtime_error);
  EXPECT_THROW(parse("formula: {nand: [a, b]}\n"), std::runtime_error);
  EXPECT_THROW(parse("formula: {and: a}\n"), std::runtime_error);
  EXPECT_THROW(parse("formula: {xor: [a]}\n"), std::runtime_error);
  EXPECT_THROW(parse("formula: {and: [a], or: [b]}\n"), std::runtime_error);
  EXPECT_THROW(parse("formula: a\nassumptions: [a]\n"), std::runtime_error);
  EXPECT_THROW(parse("formula: a\nassumptions: {a: sometimes}\n"),
               std::runtime_error);
  EXPECT_THROW(parse("formula: [a\n"), std::runtime_error);
}

TEST(ProblemTest, MissingFileThrows) {
  EXPECT_THROW(Problem::loadFile("/nonexistent/problem.yaml"),
               std::runtime_error);
}

TEST(ProblemTest, SaveWritesLoadableDocument) {
  Problem problem;
  problem.formula = BoolExpr::And(
      {BoolExpr::Implies("c", BoolExpr::And({"d", "e"})), BoolExpr::Or({})});
  problem.assumptions.set("c", Value::TRUE);
  std::ostringstream out;
  problem.save(out);

  Problem reloaded = parse(out.str());
  EXPECT_EQ(reloaded.formula, problem.formula);
  EXPECT_EQ(reloaded.assumptions, problem.assumptions);
}
