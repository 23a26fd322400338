#include "solver.h"
#include "cpsat_backend.h"
#include "deferred_acceptance.h"
#include "errors.h"
#include "formulator.h"
#include "instability.h"
#include "preferences.h"
#include "utils.h"
#include "validation.h"

#include <iostream>
#include <map>
#include <stdexcept>

namespace blm
{

    Engine resolve_engine(Variant variant, const SolveOptions &options)
    {
        switch (options.engine)
        {
        case Engine::kAuto:
            return (variant == Variant::kTotalOrder && options.forced_pairs.empty())
                       ? Engine::kDeferredAcceptance
                       : Engine::kConstraintBackend;
        case Engine::kDeferredAcceptance:
            if (variant != Variant::kTotalOrder)
                throw InvalidInputError(std::string("Deferred acceptance only handles TotalOrder, not ") +
                                        variant_tag(variant));
            if (!options.forced_pairs.empty())
                throw InvalidInputError("Forced pairs need the constraint backend.");
            return Engine::kDeferredAcceptance;
        case Engine::kConstraintBackend:
            return Engine::kConstraintBackend;
        }
        return Engine::kConstraintBackend;
    }

    SolveResult solve(Variant variant,
                      const MatchingProblem &problem,
                      const SolveOptions &options)
    {
        CpSatBackend backend;
        return solve(variant, problem, options, backend);
    }

    SolveResult solve(Variant variant,
                      const std::vector<Participant> &proposers,
                      const std::vector<Participant> &receivers,
                      const PreferenceMap &proposer_prefs,
                      const PreferenceMap &receiver_prefs,
                      const SolveOptions &options)
    {
        MatchingProblem problem{proposers, receivers, proposer_prefs, receiver_prefs};
        return solve(variant, problem, options);
    }

    SolveResult solve(Variant variant,
                      const MatchingProblem &problem,
                      const SolveOptions &options,
                      SolverBackend &backend)
    {
        validate_all(variant, problem, options);
        const Engine engine = resolve_engine(variant, options);

        const long long t0 = NowMillis();
        const bool complete = requires_complete_lists(variant);
        const PreferenceModel pm(problem.proposers, problem.receivers, problem.proposer_prefs, complete);
        const PreferenceModel rm(problem.receivers, problem.proposers, problem.receiver_prefs, complete);

        SolveResult out;
        out.engine = engine;

        if (engine == Engine::kDeferredAcceptance)
        {
            DeferredAcceptanceStats st;
            out.matching = deferred_acceptance(pm, rm, &st);
            if (options.log_search)
            {
                std::cerr << "[solve] deferred acceptance: proposals=" << st.proposals
                          << " unmatched=" << st.unmatched_proposers << "\n";
            }
        }
        else
        {
            const Formulation f = formulate(variant, problem, pm, rm, options);

            BackendParams bp;
            bp.time_limit_seconds = options.time_limit_seconds;
            bp.num_workers = options.num_workers;
            bp.random_seed = options.random_seed;
            bp.log_search = options.log_search;

            const BackendResult br = backend.solve(f.model, bp);
            out.backend_stats = br.stats;

            switch (br.status)
            {
            case BackendStatus::kOptimal:
            case BackendStatus::kFeasible:
                break;
            case BackendStatus::kInfeasible:
                if (variant == Variant::kWeightedOptimize)
                    throw InfeasibleError("No matching satisfies the capacity bounds.");
                throw NoStableMatchingError(std::string("No stable matching exists for this ") +
                                            variant_tag(variant) + " instance.");
            case BackendStatus::kUnknown:
                throw BackendError(std::string(backend.name()) +
                                   ": limit reached before any solution was found");
            case BackendStatus::kError:
                throw BackendError(std::string(backend.name()) + ": " + br.error);
            }

            out.matching = extract_matching(f, br.values);
            if (variant == Variant::kWeightedOptimize)
                out.objective_value = br.objective_value;

            if (options.log_search)
            {
                std::cerr << "[solve] " << backend.name() << " " << variant_tag(variant)
                          << (br.status == BackendStatus::kOptimal ? " optimal" : " feasible")
                          << " pairs=" << out.matching.size() << "\n";
            }
        }

        std::map<std::string, int> p_caps, r_caps;
        if (variant == Variant::kWeightedOptimize)
        {
            for (const auto &p : problem.proposers)
                p_caps[p.id] = p.capacity;
            for (const auto &r : problem.receivers)
                r_caps[r.id] = r.capacity;
        }
        out.blocking_pairs = find_blocking_pairs(pm, rm, out.matching, p_caps, r_caps, !complete);

        // the stability variants are built so that this cannot happen
        if (variant != Variant::kWeightedOptimize && !out.blocking_pairs.empty())
        {
            const auto &bp = *out.blocking_pairs.begin();
            throw std::logic_error(std::string(variant_tag(variant)) + " result has blocking pair (" +
                                   bp.proposer + ", " + bp.receiver + ")");
        }

        out.elapsed_ms = NowMillis() - t0;
        return out;
    }

} // namespace blm
