#include "constraint_model.h"

#include <stdexcept>

namespace blm {

int ConstraintModel::new_bool(std::string name) {
  names_.push_back(std::move(name));
  return static_cast<int>(names_.size()) - 1;
}

void ConstraintModel::check_var(int var) const {
  if (var < 0 || var >= num_vars())
    throw std::logic_error("ConstraintModel: variable " + std::to_string(var) + " out of range");
}

void ConstraintModel::add_cardinality(std::vector<int> vars, Sense sense, int rhs) {
  for (int v : vars) check_var(v);
  cardinalities_.push_back({std::move(vars), sense, rhs});
}

void ConstraintModel::add_or_equivalence(int target, std::vector<int> vars) {
  check_var(target);
  for (int v : vars) {
    check_var(v);
    if (v == target) throw std::logic_error("ConstraintModel: equivalence target inside its own OR");
  }
  equivalences_.push_back({target, std::move(vars)});
}

void ConstraintModel::add_clause(std::vector<Literal> literals) {
  if (literals.empty()) throw std::logic_error("ConstraintModel: empty clause");
  for (const auto& l : literals) check_var(l.var);
  clauses_.push_back({std::move(literals)});
}

void ConstraintModel::fix(int var, bool value) {
  check_var(var);
  fixings_.push_back({var, !value});
}

void ConstraintModel::maximize(std::vector<ObjectiveTerm> terms) {
  for (const auto& t : terms) check_var(t.var);
  objective_ = std::move(terms);
  has_objective_ = true;
}

} // namespace blm
