#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "BoolExpr.h"

namespace BOOLSAT {

enum class Value { UNSET, FALSE, TRUE };

inline Value toValue(bool b) { return b ? Value::TRUE : Value::FALSE; }

/// Binding of variables to tri-state values.
///
/// Absent variables read as UNSET. Search branches never mutate a shared
/// instance: with() hands back a copy carrying one extra binding.
class Assignment {
 public:
  using Map = std::map<Variable, Value>;

  Assignment() = default;
  Assignment(std::initializer_list<std::pair<const Variable, Value>> values)
      : values_(values) {}
  // convenience for complete assignments, e.g. {{"a", true}, {"b", false}}
  Assignment(std::initializer_list<std::pair<const Variable, bool>> values);

  Value get(const Variable& var) const;
  bool isSet(const Variable& var) const { return get(var) != Value::UNSET; }
  void set(const Variable& var, Value value) { values_[var] = value; }

  // copy of this assignment with var bound to value
  Assignment with(const Variable& var, Value value) const;

  // every variable in vars bound to TRUE or FALSE
  bool isComplete(const std::vector<Variable>& vars) const;

  size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }
  Map::const_iterator begin() const { return values_.begin(); }
  Map::const_iterator end() const { return values_.end(); }

  bool operator==(const Assignment& other) const {
    return values_ == other.values_;
  }
  bool operator!=(const Assignment& other) const { return !(*this == other); }

  std::string toString() const;

 private:
  Map values_;
};

std::ostream& operator<<(std::ostream& out, Value value);
std::ostream& operator<<(std::ostream& out, const Assignment& assignment);

}  // namespace BOOLSAT
