// scoring.h
#pragma once
#include <map>

#include "preferences.h"
#include "types.h"

namespace blm {

// Rank 1 maps to sentinel-1 (the candidate count), the sentinel maps to 0.
inline double rank_quality(int rank, int sentinel) {
  return rank >= sentinel ? 0.0 : static_cast<double>(sentinel - rank);
}

// weight * q(p's rank of r) + (1 - weight) * q(r's rank of p)
double pair_score(const PreferenceModel& proposer_model,
                  const PreferenceModel& receiver_model,
                  const std::string& proposer,
                  const std::string& receiver,
                  double weight);

// Score for every (proposer, receiver) in the cross product.
std::map<MatchPair, double> build_scores(const PreferenceModel& proposer_model,
                                         const PreferenceModel& receiver_model,
                                         double weight);

// Objective value a matching would get under the given scores.
double total_score(const std::map<MatchPair, double>& scores, const Matching& matching);

} // namespace blm
