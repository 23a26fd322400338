// validation.h
#pragma once
#include <string>
#include <vector>

#include "types.h"

namespace blm {

// Primary validator: everything a solve needs checked before any model is
// built. Throws InvalidInputError / IncompletePreferenceError.
void validate_all(Variant variant,
                  const MatchingProblem& problem,
                  const SolveOptions& options);

// ---- Participants ----
void validate_participants(const std::vector<Participant>& side, const std::string& side_name);
void validate_side_sizes(Variant variant, const MatchingProblem& problem);

// ---- Preference lists ----
void validate_preference_owners(const PreferenceMap& prefs,
                                const std::vector<Participant>& owners,
                                const std::string& side_name);
void validate_preference_list(const std::string& owner,
                              const PreferenceList& list,
                              const std::vector<Participant>& candidates);
void validate_list_kinds(Variant variant, const MatchingProblem& problem);
void validate_completeness(const PreferenceMap& prefs,
                           const std::vector<Participant>& owners,
                           const std::vector<Participant>& candidates);

// ---- Options ----
void validate_weight(double weight);
void validate_forced_pairs(Variant variant,
                           const MatchingProblem& problem,
                           const std::vector<MatchPair>& forced);

// ---- Candidate matchings (detector input) ----
void validate_matching_ids(const MatchingProblem& problem, const Matching& matching);

} // namespace blm
