#pragma once
#include <algorithm>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "types.h"

namespace blm_test {

using namespace blm;

inline Matching make_matching(std::initializer_list<std::pair<const char*, const char*>> pairs) {
    Matching m;
    for (const auto& p : pairs) m.pairs.insert(MatchPair{p.first, p.second});
    return m;
}

inline std::vector<Participant> people(const std::vector<std::string>& ids) {
    std::vector<Participant> out;
    for (const auto& id : ids) out.push_back(Participant{id, 1});
    return out;
}

// 3x3 Latin square: proposer i ranks receivers i, i+1, i+2 and receiver j
// ranks proposers j+1, j+2, j. Its stable matchings are
// {AX,BY,CZ}, {AY,BZ,CX} and {AZ,BX,CY}.
inline MatchingProblem latin_square(bool as_rank_maps) {
    MatchingProblem p;
    p.proposers = people({"A", "B", "C"});
    p.receivers = people({"X", "Y", "Z"});
    auto list = [&](std::vector<std::string> order) {
        if (!as_rank_maps) return PreferenceList::ordered(order);
        std::map<std::string, int> r;
        for (std::size_t i = 0; i < order.size(); ++i) r[order[i]] = static_cast<int>(i) + 1;
        return PreferenceList::ranked(r);
    };
    p.proposer_prefs = {{"A", list({"X", "Y", "Z"})},
                        {"B", list({"Y", "Z", "X"})},
                        {"C", list({"Z", "X", "Y"})}};
    p.receiver_prefs = {{"X", list({"B", "C", "A"})},
                        {"Y", list({"C", "A", "B"})},
                        {"Z", list({"A", "B", "C"})}};
    return p;
}

// n x n strict total orders drawn from a seeded generator.
inline MatchingProblem random_total_order(int n, unsigned seed) {
    std::mt19937 rng(seed);
    MatchingProblem p;
    std::vector<std::string> ps, rs;
    for (int i = 0; i < n; ++i) {
        ps.push_back("p" + std::to_string(i));
        rs.push_back("r" + std::to_string(i));
    }
    p.proposers = people(ps);
    p.receivers = people(rs);
    for (const auto& id : ps) {
        auto order = rs;
        std::shuffle(order.begin(), order.end(), rng);
        p.proposer_prefs[id] = PreferenceList::ordered(order);
    }
    for (const auto& id : rs) {
        auto order = ps;
        std::shuffle(order.begin(), order.end(), rng);
        p.receiver_prefs[id] = PreferenceList::ordered(order);
    }
    return p;
}

} // namespace blm_test
