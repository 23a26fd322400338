#pragma once
#include "types.h"
#include "cpsat_backend.h"
#include "deferred_acceptance.h"
#include "formulator.h"
#include "instability.h"
#include "preferences.h"
#include "scoring.h"
#include "utils.h"
#include "validation.h"
#include <iostream>
#include <map>

namespace blm {

// Quick smoke test: solve TotalOrder with both engines and re-check each
// result with the standalone detector. Other variants only get the backend
// run and the re-check. Engines are driven directly, so a blocking pair in a
// backend answer is reported here instead of being thrown by solve().
// Returns false when a stability variant result has a blocking pair.
inline bool self_check_engines(Variant variant,
                               const MatchingProblem& problem,
                               const SolveOptions& base,
                               SolverBackend& backend) {
    validate_all(variant, problem, base);
    const bool complete = requires_complete_lists(variant);
    const PreferenceModel pm(problem.proposers, problem.receivers, problem.proposer_prefs, complete);
    const PreferenceModel rm(problem.receivers, problem.proposers, problem.receiver_prefs, complete);

    std::map<std::string, int> p_caps, r_caps;
    if (variant == Variant::kWeightedOptimize) {
        for (const auto& p : problem.proposers) p_caps[p.id] = p.capacity;
        for (const auto& r : problem.receivers) r_caps[r.id] = r.capacity;
    }

    bool ok = true;
    auto report = [&](const char* engine, const Matching& m, long long ms) {
        auto again = find_blocking_pairs(pm, rm, m, p_caps, r_caps, !complete);
        const bool stable = again.empty() || variant == Variant::kWeightedOptimize;
        if (!stable) ok = false;
        std::cout << "[self-check] " << engine
                  << " pairs=" << m.size()
                  << " blocking=" << again.size()
                  << " time=" << ms << "ms"
                  << (stable ? "" : "  <-- UNSTABLE") << "\n";
    };

    const bool both = variant == Variant::kTotalOrder && base.forced_pairs.empty();
    Matching da;
    if (both) {
        long long t0 = NowMillis();
        da = deferred_acceptance(pm, rm);
        report(engine_tag(Engine::kDeferredAcceptance), da, NowMillis() - t0);
    }

    long long t0 = NowMillis();
    const Formulation f = formulate(variant, problem, pm, rm, base);
    BackendParams bp;
    bp.time_limit_seconds = base.time_limit_seconds;
    bp.num_workers = base.num_workers;
    bp.random_seed = base.random_seed;
    const BackendResult br = backend.solve(f.model, bp);
    if (br.status != BackendStatus::kOptimal && br.status != BackendStatus::kFeasible) {
        std::cout << "[self-check] " << backend.name() << " returned no solution\n";
        return ok;
    }
    const Matching cp = extract_matching(f, br.values);
    report(backend.name(), cp, NowMillis() - t0);

    if (variant == Variant::kWeightedOptimize)
        std::cout << "[self-check] objective=" << br.objective_value
                  << " recomputed=" << total_score(f.scores, cp) << "\n";
    if (both)
        std::cout << "[self-check] engines "
                  << (da == cp ? "agree" : "differ (both may be stable)") << "\n";
    return ok;
}

inline bool self_check_engines(Variant variant,
                               const MatchingProblem& problem,
                               const SolveOptions& base) {
    CpSatBackend backend;
    return self_check_engines(variant, problem, base, backend);
}

} // namespace blm
