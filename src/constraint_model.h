// constraint_model.h
#pragma once
#include <string>
#include <vector>

namespace blm {

// Backend-neutral 0/1 model. Built fresh for each solve and handed to a
// SolverBackend; it owns no solver state of its own.

struct Literal {
  int var;
  bool negated = false;
};

enum class Sense { kEqual, kLessOrEqual, kGreaterOrEqual };

// sum(vars) <sense> rhs, all coefficients 1
struct CardinalityConstraint {
  std::vector<int> vars;
  Sense sense;
  int rhs;
};

// target <=> OR(vars), i.e. target == 1 exactly when sum(vars) >= 1.
// An empty vars list forces target to 0.
struct OrEquivalence {
  int target;
  std::vector<int> vars;
};

struct Clause {
  std::vector<Literal> literals;
};

struct ObjectiveTerm {
  int var;
  double coeff;
};

class ConstraintModel {
 public:
  int new_bool(std::string name);

  void add_cardinality(std::vector<int> vars, Sense sense, int rhs);
  void add_or_equivalence(int target, std::vector<int> vars);
  void add_clause(std::vector<Literal> literals);
  void fix(int var, bool value);
  void maximize(std::vector<ObjectiveTerm> terms);

  int num_vars() const { return static_cast<int>(names_.size()); }
  const std::string& name(int var) const { return names_.at(var); }
  const std::vector<CardinalityConstraint>& cardinalities() const { return cardinalities_; }
  const std::vector<OrEquivalence>& equivalences() const { return equivalences_; }
  const std::vector<Clause>& clauses() const { return clauses_; }
  const std::vector<Literal>& fixings() const { return fixings_; }  // negated = fixed to 0
  const std::vector<ObjectiveTerm>& objective() const { return objective_; }
  bool has_objective() const { return has_objective_; }

 private:
  void check_var(int var) const;

  std::vector<std::string> names_;
  std::vector<CardinalityConstraint> cardinalities_;
  std::vector<OrEquivalence> equivalences_;
  std::vector<Clause> clauses_;
  std::vector<Literal> fixings_;
  std::vector<ObjectiveTerm> objective_;
  bool has_objective_ = false;
};

} // namespace blm
