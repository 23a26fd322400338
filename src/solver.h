// solver.h
#pragma once
#include <vector>

#include "backend.h"
#include "types.h"

namespace blm {

// Main entry point. Validates the input, picks the engine, solves, and runs
// the instability detector on the result. Throws:
//   InvalidInputError / IncompletePreferenceError  bad input
//   NoStableMatchingError                          stability variant infeasible
//   InfeasibleError                                WeightedOptimize bounds unmet
//   BackendError                                   backend failed or timed out empty
// A fresh model is built for every call; nothing is kept between calls.
SolveResult solve(Variant variant,
                  const MatchingProblem& problem,
                  const SolveOptions& options,
                  SolverBackend& backend);

// Same, with the CP-SAT backend.
SolveResult solve(Variant variant,
                  const MatchingProblem& problem,
                  const SolveOptions& options = SolveOptions{});

SolveResult solve(Variant variant,
                  const std::vector<Participant>& proposers,
                  const std::vector<Participant>& receivers,
                  const PreferenceMap& proposer_prefs,
                  const PreferenceMap& receiver_prefs,
                  const SolveOptions& options = SolveOptions{});

// Engine a solve with these options would use. Deferred acceptance is the
// default for TotalOrder without forced pairs.
Engine resolve_engine(Variant variant, const SolveOptions& options);

} // namespace blm
