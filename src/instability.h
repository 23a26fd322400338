// instability.h
#pragma once
#include <map>
#include <set>
#include <string>

#include "preferences.h"
#include "types.h"

namespace blm {

// Blocking pairs of a matching under the given preference models.
//
// (p, r) blocks when neither holds the other, p would take r over its worst
// current partner (or over a free slot) and r would take p likewise. Both
// comparisons are strict whatever the variant: the solvers use weak
// comparison for what they must not leave on the table, but a blocking pair
// always needs a strict improvement on both sides.
//
// capacities default to 1 for anyone not listed. When examine_unmatched is
// false, proposers without a partner are skipped (complete-list variants).
std::set<BlockingPair> find_blocking_pairs(const PreferenceModel& proposer_model,
                                           const PreferenceModel& receiver_model,
                                           const Matching& matching,
                                           const std::map<std::string, int>& proposer_capacity,
                                           const std::map<std::string, int>& receiver_capacity,
                                           bool examine_unmatched);

// Validates the problem and the matching's ids for the variant first.
// Capacities are honoured only for WeightedOptimize.
std::set<BlockingPair> detect_instabilities(const MatchingProblem& problem,
                                            const Matching& matching,
                                            Variant variant);

// Participants are taken from the preference maps and the matching, all with
// capacity 1.
std::set<BlockingPair> detect_instabilities(const Matching& matching,
                                            const PreferenceMap& proposer_prefs,
                                            const PreferenceMap& receiver_prefs,
                                            Variant variant);

} // namespace blm
