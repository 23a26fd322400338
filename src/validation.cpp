#include "validation.h"
#include "errors.h"
#include "preferences.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <unordered_set>

namespace blm
{

    inline bool is_blank(const std::string &s)
    {
        return std::all_of(s.begin(), s.end(), [](unsigned char c)
                           { return std::isspace(c); });
    }

    [[noreturn]] static void fail(const std::string &msg)
    {
        throw InvalidInputError(msg);
    }

    static std::unordered_set<std::string> id_set(const std::vector<Participant> &side)
    {
        std::unordered_set<std::string> ids;
        for (const auto &p : side)
            ids.insert(p.id);
        return ids;
    }

    void validate_all(Variant variant,
                      const MatchingProblem &problem,
                      const SolveOptions &options)
    {
        // 1) Participants
        validate_participants(problem.proposers, "proposer");
        validate_participants(problem.receivers, "receiver");
        validate_side_sizes(variant, problem);

        // 2) Preference lists refer to known people and are well formed
        validate_preference_owners(problem.proposer_prefs, problem.proposers, "proposer");
        validate_preference_owners(problem.receiver_prefs, problem.receivers, "receiver");
        for (const auto &kv : problem.proposer_prefs)
            validate_preference_list(kv.first, kv.second, problem.receivers);
        for (const auto &kv : problem.receiver_prefs)
            validate_preference_list(kv.first, kv.second, problem.proposers);
        validate_list_kinds(variant, problem);

        // 3) Completeness where the variant needs it
        if (requires_complete_lists(variant))
        {
            validate_completeness(problem.proposer_prefs, problem.proposers, problem.receivers);
            validate_completeness(problem.receiver_prefs, problem.receivers, problem.proposers);
        }

        // 4) Options
        if (variant == Variant::kWeightedOptimize)
            validate_weight(options.weight);
        validate_forced_pairs(variant, problem, options.forced_pairs);
    }

    void validate_participants(const std::vector<Participant> &side, const std::string &side_name)
    {
        std::unordered_set<std::string> seen;
        for (const auto &p : side)
        {
            if (p.id.empty() || is_blank(p.id))
                fail("Blank " + side_name + " id.");
            if (!seen.insert(p.id).second)
                fail("Duplicate " + side_name + " id: " + p.id);
            if (p.capacity <= 0)
                fail(side_name + " " + p.id + " has capacity " + std::to_string(p.capacity) +
                     " (must be > 0).");
        }
    }

    void validate_side_sizes(Variant variant, const MatchingProblem &problem)
    {
        if (problem.proposers.empty() || problem.receivers.empty())
            fail("Both sides need at least one participant.");
        // exactly-one-per-participant cannot hold otherwise
        if (requires_complete_lists(variant) && problem.proposers.size() != problem.receivers.size())
        {
            fail(std::string(variant_tag(variant)) + " needs equally sized sides, got " +
                 std::to_string(problem.proposers.size()) + " proposers and " +
                 std::to_string(problem.receivers.size()) + " receivers.");
        }
    }

    void validate_preference_owners(const PreferenceMap &prefs,
                                    const std::vector<Participant> &owners,
                                    const std::string &side_name)
    {
        const auto ids = id_set(owners);
        for (const auto &kv : prefs)
        {
            if (!ids.count(kv.first))
                fail("Preferences given for unknown " + side_name + ": " + kv.first);
        }
    }

    void validate_preference_list(const std::string &owner,
                                  const PreferenceList &list,
                                  const std::vector<Participant> &candidates)
    {
        const auto ids = id_set(candidates);
        const int max_rank = static_cast<int>(candidates.size());

        if (list.kind == PreferenceKind::kTotalOrder)
        {
            std::unordered_set<std::string> seen;
            for (const auto &c : list.order)
            {
                if (!ids.count(c))
                    fail(owner + " ranks unknown candidate " + c);
                if (!seen.insert(c).second)
                    fail(owner + " lists " + c + " more than once.");
            }
            return;
        }

        for (const auto &kv : list.ranks)
        {
            if (!ids.count(kv.first))
                fail(owner + " ranks unknown candidate " + kv.first);
            if (kv.second < 1 || kv.second > max_rank)
            {
                fail(owner + " gives " + kv.first + " rank " + std::to_string(kv.second) +
                     " (must be within 1.." + std::to_string(max_rank) + ").");
            }
        }
    }

    void validate_list_kinds(Variant variant, const MatchingProblem &problem)
    {
        if (variant != Variant::kTotalOrder)
            return;
        auto check = [](const PreferenceMap &prefs)
        {
            for (const auto &kv : prefs)
                if (kv.second.kind != PreferenceKind::kTotalOrder)
                    fail("TotalOrder needs ordered lists; " + kv.first + " gave a rank map.");
        };
        check(problem.proposer_prefs);
        check(problem.receiver_prefs);
    }

    void validate_completeness(const PreferenceMap &prefs,
                               const std::vector<Participant> &owners,
                               const std::vector<Participant> &candidates)
    {
        for (const auto &o : owners)
        {
            auto it = prefs.find(o.id);
            const bool empty = it == prefs.end() ||
                               (it->second.kind == PreferenceKind::kTotalOrder ? it->second.order.empty()
                                                                               : it->second.ranks.empty());
            if (empty)
                fail("Empty preference list for " + o.id + " (complete lists are required).");

            const PreferenceList &list = it->second;
            for (const auto &c : candidates)
            {
                const bool ranked = (list.kind == PreferenceKind::kTotalOrder)
                                        ? std::find(list.order.begin(), list.order.end(), c.id) != list.order.end()
                                        : list.ranks.count(c.id) > 0;
                if (!ranked)
                    throw IncompletePreferenceError(o.id + " does not rank " + c.id);
            }
        }
    }

    void validate_weight(double weight)
    {
        if (!(weight >= 0.0 && weight <= 1.0))
            fail("Preference weight must be within [0,1], got " + std::to_string(weight));
    }

    void validate_forced_pairs(Variant variant,
                               const MatchingProblem &problem,
                               const std::vector<MatchPair> &forced)
    {
        if (forced.empty())
            return;
        const auto pids = id_set(problem.proposers);
        const auto rids = id_set(problem.receivers);
        std::set<MatchPair> seen;
        for (const auto &fp : forced)
        {
            if (!pids.count(fp.proposer))
                fail("Forced pair names unknown proposer " + fp.proposer);
            if (!rids.count(fp.receiver))
                fail("Forced pair names unknown receiver " + fp.receiver);
            if (!seen.insert(fp).second)
                fail("Forced pair (" + fp.proposer + ", " + fp.receiver + ") given twice.");
        }

        // one-to-one variants take one forced partner each, WeightedOptimize up to capacity
        std::map<std::string, int> p_load, r_load;
        for (const auto &fp : forced)
        {
            ++p_load[fp.proposer];
            ++r_load[fp.receiver];
        }
        auto check_load = [&](const std::vector<Participant> &side, const std::map<std::string, int> &load,
                              const std::string &side_name)
        {
            for (const auto &p : side)
            {
                auto it = load.find(p.id);
                if (it == load.end())
                    continue;
                const int limit = variant == Variant::kWeightedOptimize ? p.capacity : 1;
                if (it->second > limit)
                {
                    fail(side_name + " " + p.id + " is named in " + std::to_string(it->second) +
                         " forced pairs but can take " + std::to_string(limit) + ".");
                }
            }
        };
        check_load(problem.proposers, p_load, "proposer");
        check_load(problem.receivers, r_load, "receiver");

        if (variant != Variant::kPartialTies)
            return;
        const PreferenceModel pm(problem.proposers, problem.receivers, problem.proposer_prefs, false);
        const PreferenceModel rm(problem.receivers, problem.proposers, problem.receiver_prefs, false);
        for (const auto &fp : forced)
        {
            if (!pm.is_acceptable(fp.proposer, fp.receiver) || !rm.is_acceptable(fp.receiver, fp.proposer))
            {
                fail("Forced pair (" + fp.proposer + ", " + fp.receiver +
                     ") is not mutually acceptable.");
            }
        }
    }

    void validate_matching_ids(const MatchingProblem &problem, const Matching &matching)
    {
        const auto pids = id_set(problem.proposers);
        const auto rids = id_set(problem.receivers);
        for (const auto &mp : matching.pairs)
        {
            if (!pids.count(mp.proposer))
                fail("Matching names unknown proposer " + mp.proposer);
            if (!rids.count(mp.receiver))
                fail("Matching names unknown receiver " + mp.receiver);
        }
    }

} // namespace blm
