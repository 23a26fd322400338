#include "formulator.h"
#include "scoring.h"

#include <set>
#include <stdexcept>
#include <utility>

namespace blm
{

    namespace
    {

        // Shares "matched to someone at least this good" auxiliaries per
        // (owner, threshold rank), so tied candidates reuse one variable.
        class BetterMatchAux
        {
        public:
            BetterMatchAux(ConstraintModel &model, const PreferenceModel &prefs, bool strict, char side)
                : model_(model), prefs_(prefs), strict_(strict), side_(side) {}

            // owner_vars: candidate id -> decision variable, for this owner
            int get(const std::string &owner, int threshold, const std::map<std::string, int> &owner_vars)
            {
                const auto key = std::make_pair(owner, threshold);
                auto it = cache_.find(key);
                if (it != cache_.end())
                    return it->second;

                std::vector<int> better;
                for (const auto &kv : owner_vars)
                {
                    const int rank = prefs_.rank_of(owner, kv.first);
                    if (strict_ ? rank < threshold : rank <= threshold)
                        better.push_back(kv.second);
                }
                const int aux = model_.new_bool(std::string(1, side_) + "_" + owner + (strict_ ? "_better_" : "_geq_") +
                                                std::to_string(threshold));
                model_.add_or_equivalence(aux, std::move(better));
                cache_.emplace(key, aux);
                return aux;
            }

        private:
            ConstraintModel &model_;
            const PreferenceModel &prefs_;
            bool strict_;
            char side_;
            std::map<std::pair<std::string, int>, int> cache_;
        };

        void add_side_bounds(ConstraintModel &model, const std::vector<int> &vars,
                             bool exactly_one, bool at_most_one, int capacity)
        {
            if (exactly_one)
            {
                model.add_cardinality(vars, Sense::kEqual, 1);
            }
            else if (at_most_one)
            {
                if (!vars.empty())
                    model.add_cardinality(vars, Sense::kLessOrEqual, 1);
            }
            else
            {
                model.add_cardinality(vars, Sense::kGreaterOrEqual, 1);
                model.add_cardinality(vars, Sense::kLessOrEqual, capacity);
            }
        }

    } // namespace

    Formulation formulate(Variant variant,
                          const MatchingProblem &problem,
                          const PreferenceModel &proposer_model,
                          const PreferenceModel &receiver_model,
                          const SolveOptions &options)
    {
        if (variant == Variant::kWeightedOptimize)
            return formulate_weighted(problem, proposer_model, receiver_model, options);
        return formulate_stable(variant, problem, proposer_model, receiver_model, options.forced_pairs);
    }

    Formulation formulate_stable(Variant variant,
                                 const MatchingProblem &problem,
                                 const PreferenceModel &proposer_model,
                                 const PreferenceModel &receiver_model,
                                 const std::vector<MatchPair> &forced)
    {
        if (variant == Variant::kWeightedOptimize)
            throw std::logic_error("formulate_stable called for WeightedOptimize");

        Formulation f;
        ConstraintModel &model = f.model;
        const bool partial = variant == Variant::kPartialTies;

        // ---- Decision variables ----
        // by_proposer[p][r] and by_receiver[r][p] both hold x[p,r]
        std::map<std::string, std::map<std::string, int>> by_proposer, by_receiver;
        for (const auto &p : problem.proposers)
        {
            for (const auto &r : problem.receivers)
            {
                if (partial && !(proposer_model.is_acceptable(p.id, r.id) &&
                                 receiver_model.is_acceptable(r.id, p.id)))
                    continue;
                const int x = model.new_bool("x_" + p.id + "_" + r.id);
                f.pair_vars.emplace(MatchPair{p.id, r.id}, x);
                by_proposer[p.id][r.id] = x;
                by_receiver[r.id][p.id] = x;
            }
        }

        // ---- Cardinality ----
        auto vars_of = [](const std::map<std::string, int> &m)
        {
            std::vector<int> v;
            v.reserve(m.size());
            for (const auto &kv : m)
                v.push_back(kv.second);
            return v;
        };
        for (const auto &p : problem.proposers)
            add_side_bounds(model, vars_of(by_proposer[p.id]), !partial, partial, p.capacity);
        for (const auto &r : problem.receivers)
            add_side_bounds(model, vars_of(by_receiver[r.id]), !partial, partial, r.capacity);

        // ---- Forced pairs ----
        std::set<MatchPair> forced_set(forced.begin(), forced.end());
        for (const auto &fp : forced_set)
        {
            auto it = f.pair_vars.find(fp);
            if (it == f.pair_vars.end())
                throw std::logic_error("forced pair without a decision variable: " + fp.proposer + "/" + fp.receiver);
            model.fix(it->second, true);
        }

        // ---- Stability ----
        // x[p,r] OR p has someone (strictly|weakly) better than r OR r has
        // someone (strictly|weakly) better than p
        const bool strict = variant == Variant::kTotalOrder;
        BetterMatchAux p_aux(model, proposer_model, strict, 'p');
        BetterMatchAux r_aux(model, receiver_model, strict, 'r');
        for (const auto &kv : f.pair_vars)
        {
            const MatchPair &mp = kv.first;
            if (forced_set.count(mp))
                continue;
            const int p_rank = proposer_model.rank_of(mp.proposer, mp.receiver);
            const int r_rank = receiver_model.rank_of(mp.receiver, mp.proposer);
            const int p_better = p_aux.get(mp.proposer, p_rank, by_proposer[mp.proposer]);
            const int r_better = r_aux.get(mp.receiver, r_rank, by_receiver[mp.receiver]);
            model.add_clause({Literal{kv.second}, Literal{p_better}, Literal{r_better}});
        }
        return f;
    }

    Formulation formulate_weighted(const MatchingProblem &problem,
                                   const PreferenceModel &proposer_model,
                                   const PreferenceModel &receiver_model,
                                   const SolveOptions &options)
    {
        Formulation f;
        ConstraintModel &model = f.model;

        std::map<std::string, std::vector<int>> by_proposer, by_receiver;
        for (const auto &p : problem.proposers)
        {
            for (const auto &r : problem.receivers)
            {
                const int x = model.new_bool("x_" + p.id + "_" + r.id);
                f.pair_vars.emplace(MatchPair{p.id, r.id}, x);
                by_proposer[p.id].push_back(x);
                by_receiver[r.id].push_back(x);
            }
        }

        for (const auto &r : problem.receivers)
            add_side_bounds(model, by_receiver[r.id], options.enforce_exactly_one, false, r.capacity);
        for (const auto &p : problem.proposers)
            add_side_bounds(model, by_proposer[p.id], options.enforce_exactly_one, false, p.capacity);

        for (const auto &fp : options.forced_pairs)
            model.fix(f.pair_vars.at(fp), true);

        f.scores = build_scores(proposer_model, receiver_model, options.weight);
        std::vector<ObjectiveTerm> terms;
        terms.reserve(f.pair_vars.size());
        for (const auto &kv : f.pair_vars)
            terms.push_back({kv.second, f.scores.at(kv.first)});
        model.maximize(std::move(terms));
        return f;
    }

    Matching extract_matching(const Formulation &f, const std::vector<bool> &values)
    {
        if (static_cast<int>(values.size()) != f.model.num_vars())
            throw std::logic_error("solution size does not match the model");
        Matching m;
        for (const auto &kv : f.pair_vars)
            if (values[kv.second])
                m.pairs.insert(kv.first);
        return m;
    }

} // namespace blm
