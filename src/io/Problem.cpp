#include "Problem.h"

#include <stdexcept>
#include <vector>

using namespace BOOLSAT;

namespace {

std::vector<BoolExpr> parseOperands(const std::string& key,
                                    const YAML::Node& node) {
  if (!node.IsSequence()) {
    throw std::runtime_error("formula: '" + key + "' expects a sequence");
  }
  std::vector<BoolExpr> operands;
  for (const auto& n : node) {
    operands.push_back(Problem::parseFormula(n));
  }
  return operands;
}

}  // namespace

BoolExpr Problem::parseFormula(const YAML::Node& node) {
  if (node.IsScalar()) {
    return BoolExpr::Var(node.as<std::string>());
  }
  if (!node.IsMap() || node.size() != 1) {
    throw std::runtime_error(
        "formula: expected a variable or a single-key operator map");
  }
  auto it = node.begin();
  const std::string key = it->first.as<std::string>();
  const YAML::Node& value = it->second;

  if (key == "and")
    return BoolExpr::And(parseOperands(key, value));
  if (key == "or")
    return BoolExpr::Or(parseOperands(key, value));
  if (key == "not")
    return BoolExpr::Not(parseFormula(value));
  if (key == "implies" || key == "xor") {
    auto operands = parseOperands(key, value);
    if (operands.size() != 2) {
      throw std::runtime_error("formula: '" + key + "' expects two operands");
    }
    if (key == "implies")
      return BoolExpr::Implies(operands[0], operands[1]);
    return BoolExpr::Xor(operands[0], operands[1]);
  }
  throw std::runtime_error("formula: unknown operator '" + key + "'");
}

YAML::Node Problem::formulaToYaml(const BoolExpr& expr) {
  switch (expr.getOp()) {
    case Op::VAR:
      return YAML::Node(expr.getName());
    case Op::NOT: {
      YAML::Node node;
      node["not"] = formulaToYaml(expr.getOperand());
      return node;
    }
    case Op::AND:
    case Op::OR: {
      YAML::Node operands(YAML::NodeType::Sequence);
      for (const auto& operand : expr.getOperands()) {
        operands.push_back(formulaToYaml(operand));
      }
      YAML::Node node;
      node[expr.getOp() == Op::AND ? "and" : "or"] = operands;
      return node;
    }
    default:
      throw std::logic_error("formulaToYaml: malformed BoolExpr node");
  }
}

Problem Problem::fromYaml(const YAML::Node& node) {
  if (!node.IsMap() || !node["formula"]) {
    throw std::runtime_error("problem: missing 'formula'");
  }
  Problem problem;
  problem.formula = parseFormula(node["formula"]);

  if (node["assumptions"]) {
    const YAML::Node& assumptions = node["assumptions"];
    if (!assumptions.IsMap()) {
      throw std::runtime_error("problem: 'assumptions' must be a map");
    }
    for (const auto& kv : assumptions) {
      const std::string var = kv.first.as<std::string>();
      try {
        problem.assumptions.set(var, toValue(kv.second.as<bool>()));
      } catch (const YAML::BadConversion&) {
        throw std::runtime_error("problem: assumption '" + var +
                                 "' is not a boolean");
      }
    }
  }
  return problem;
}

Problem Problem::load(std::istream& in) {
  try {
    return fromYaml(YAML::Load(in));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("problem: parse error: ") + e.what());
  }
}

Problem Problem::loadFile(const std::string& path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse problem " + path + ": " +
                             e.what());
  }
  return fromYaml(node);
}

void Problem::save(std::ostream& out) const {
  YAML::Node node;
  node["formula"] = formulaToYaml(formula);
  if (!assumptions.empty()) {
    YAML::Node seeded(YAML::NodeType::Map);
    for (const auto& [var, value] : assumptions) {
      if (value != Value::UNSET) {
        seeded[var] = value == Value::TRUE;
      }
    }
    node["assumptions"] = seeded;
  }
  out << node << '\n';
}
