// formulator.h
#pragma once
#include <map>
#include <vector>

#include "constraint_model.h"
#include "preferences.h"
#include "types.h"

namespace blm {

struct Formulation {
  ConstraintModel model;
  std::map<MatchPair, int> pair_vars;  // decision variable per candidate pair
  std::map<MatchPair, double> scores;  // WeightedOptimize only
};

// Dispatches on the variant. Inputs must already be validated.
Formulation formulate(Variant variant,
                      const MatchingProblem& problem,
                      const PreferenceModel& proposer_model,
                      const PreferenceModel& receiver_model,
                      const SolveOptions& options);

// TotalOrder / RankedTies / PartialTies: cardinality + stability, no objective.
Formulation formulate_stable(Variant variant,
                             const MatchingProblem& problem,
                             const PreferenceModel& proposer_model,
                             const PreferenceModel& receiver_model,
                             const std::vector<MatchPair>& forced);

// WeightedOptimize: capacity bounds + score objective, no stability.
Formulation formulate_weighted(const MatchingProblem& problem,
                               const PreferenceModel& proposer_model,
                               const PreferenceModel& receiver_model,
                               const SolveOptions& options);

// Pairs whose decision variable is set in a backend solution.
Matching extract_matching(const Formulation& f, const std::vector<bool>& values);

} // namespace blm
