#include <gtest/gtest.h>
#include <stdexcept>

#include "BacktrackingSolver.h"
#include "VariableExtractor.h"
#include "VariableSelector.h"

using namespace BOOLSAT;

TEST(FirstUnsetSelectorTest, PicksFirstUnsetInOrder) {
  FirstUnsetSelector selector;
  std::vector<Variable> vars{"b", "a", "c"};
  Assignment assignment{{"b", Value::TRUE}, {"a", Value::UNSET}};
  auto decision = selector.select(vars, assignment);
  ASSERT_TRUE(decision.has_value());
  EXPECT_EQ(decision->variable, "a");
  EXPECT_FALSE(decision->firstValue);
}

TEST(FirstUnsetSelectorTest, NulloptWhenComplete) {
  FirstUnsetSelector selector;
  std::vector<Variable> vars{"a", "b"};
  EXPECT_FALSE(selector.select(vars, Assignment{{"a", true}, {"b", false}})
                   .has_value());
  EXPECT_FALSE(selector.select({}, Assignment()).has_value());
}

TEST(OccurrenceSelectorTest, CountsOccurrences) {
  auto expr = BoolExpr::And({BoolExpr::Or({"a", "b"}), BoolExpr::Not("b"),
                             BoolExpr::Implies("b", "c")});
  OccurrenceSelector selector(expr);
  EXPECT_EQ(selector.getOccurrences("a"), 1u);
  EXPECT_EQ(selector.getOccurrences("b"), 3u);
  EXPECT_EQ(selector.getOccurrences("c"), 1u);
  EXPECT_EQ(selector.getOccurrences("missing"), 0u);
}

TEST(OccurrenceSelectorTest, MostFrequentFirstWithPolarity) {
  // b appears twice negated, once positive
  auto expr = BoolExpr::And({BoolExpr::Or({"a", "b"}), BoolExpr::Not("b"),
                             BoolExpr::Implies("b", "c")});
  OccurrenceSelector selector(expr);
  auto vars = VariableExtractor::extract(expr);
  auto decision = selector.select(vars, Assignment());
  ASSERT_TRUE(decision.has_value());
  EXPECT_EQ(*decision, (Decision{"b", false}));

  // tie between a and c goes to extraction order
  decision = selector.select(vars, Assignment{{"b", false}});
  ASSERT_TRUE(decision.has_value());
  EXPECT_EQ(*decision, (Decision{"a", true}));

  EXPECT_FALSE(selector
                   .select(vars, Assignment{{"a", true}, {"b", false},
                                            {"c", false}})
                   .has_value());
}

TEST(OccurrenceSelectorTest, DoubleNegationIsPositive) {
  OccurrenceSelector selector(BoolExpr::Not(BoolExpr::Not("x")));
  auto decision = selector.select({"x"}, Assignment());
  ASSERT_TRUE(decision.has_value());
  EXPECT_TRUE(decision->firstValue);
}

TEST(OccurrenceSelectorTest, SolvesWithFewerNodes) {
  // x occurs everywhere and must be true
  auto expr = BoolExpr::And({"a", "b", "c", "x", BoolExpr::Or({"x", "a"}),
                             BoolExpr::Or({"x", "b"}), BoolExpr::Or({"x", "c"})});
  OccurrenceSelector occurrence(expr);
  BacktrackingSolver guided(expr, occurrence);
  auto solution = guided.solve();
  ASSERT_TRUE(solution.has_value());
  EXPECT_EQ(guided.getStats().nodes, 5u);

  FirstUnsetSelector firstUnset;
  BacktrackingSolver unguided(expr, firstUnset);
  auto other = unguided.solve();
  ASSERT_TRUE(other.has_value());
  EXPECT_EQ(*other, *solution);
  EXPECT_GT(unguided.getStats().nodes, guided.getStats().nodes);
}

TEST(OccurrenceSelectorTest, MalformedExpressionThrows) {
  EXPECT_THROW(OccurrenceSelector(BoolExpr::Or({"a", BoolExpr()})),
               std::logic_error);
}
