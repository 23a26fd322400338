// deferred_acceptance.h
#pragma once
#include "preferences.h"
#include "types.h"

namespace blm {

struct DeferredAcceptanceStats {
  long long proposals = 0;
  int unmatched_proposers = 0;
};

// Proposer-optimal stable matching for strict total orders (Gale-Shapley).
// Participants are the keys of the two maps. Input is validated as a
// TotalOrder problem first, so both sides must be the same size with complete
// lists and every proposer ends up matched. Unequal sides or partial lists go
// through the PreferenceModel overload below.
Matching deferred_acceptance(const PreferenceMap& proposer_prefs,
                             const PreferenceMap& receiver_prefs,
                             DeferredAcceptanceStats* stats = nullptr);

// Same algorithm over already-built models (receivers compare by rank_of).
// A proposer who runs out of acceptable receivers stays single and is
// counted in stats->unmatched_proposers.
Matching deferred_acceptance(const PreferenceModel& proposer_model,
                             const PreferenceModel& receiver_model,
                             DeferredAcceptanceStats* stats = nullptr);

} // namespace blm
