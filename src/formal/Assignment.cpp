#include "Assignment.h"
#include <sstream>

namespace BOOLSAT {

Assignment::Assignment(
    std::initializer_list<std::pair<const Variable, bool>> values) {
  for (const auto& [var, b] : values) {
    values_[var] = toValue(b);
  }
}

Value Assignment::get(const Variable& var) const {
  auto it = values_.find(var);
  if (it == values_.end())
    return Value::UNSET;
  return it->second;
}

Assignment Assignment::with(const Variable& var, Value value) const {
  Assignment copy(*this);
  copy.values_[var] = value;
  return copy;
}

bool Assignment::isComplete(const std::vector<Variable>& vars) const {
  for (const auto& var : vars) {
    if (!isSet(var))
      return false;
  }
  return true;
}

std::string Assignment::toString() const {
  std::ostringstream oss;
  oss << "{";
  bool first = true;
  for (const auto& [var, value] : values_) {
    if (!first)
      oss << ", ";
    oss << var << ": " << value;
    first = false;
  }
  oss << "}";
  return oss.str();
}

std::ostream& operator<<(std::ostream& out, Value value) {
  switch (value) {
    case Value::TRUE:
      return out << "true";
    case Value::FALSE:
      return out << "false";
    default:
      return out << "unset";
  }
}

std::ostream& operator<<(std::ostream& out, const Assignment& assignment) {
  return out << assignment.toString();
}

}  // namespace BOOLSAT
