#include "instability.h"
#include "validation.h"

#include <algorithm>
#include <vector>

namespace blm {

namespace {

int capacity_of(const std::map<std::string, int>& caps, const std::string& id) {
  auto it = caps.find(id);
  return it == caps.end() ? 1 : it->second;
}

// Rank a newcomer must beat: the sentinel while a slot is free, otherwise
// the worst current partner.
int threshold(const PreferenceModel& model, const std::string& owner,
              const std::vector<std::string>& partners, int capacity) {
  if (static_cast<int>(partners.size()) < capacity) return model.sentinel();
  int worst = 0;
  for (const auto& c : partners) worst = std::max(worst, model.rank_of(owner, c));
  return worst;
}

void add_missing(std::vector<Participant>& side, const std::string& id) {
  for (const auto& p : side)
    if (p.id == id) return;
  side.push_back(Participant{id, 1});
}

} // namespace

std::set<BlockingPair> find_blocking_pairs(const PreferenceModel& proposer_model,
                                           const PreferenceModel& receiver_model,
                                           const Matching& matching,
                                           const std::map<std::string, int>& proposer_capacity,
                                           const std::map<std::string, int>& receiver_capacity,
                                           bool examine_unmatched) {
  std::set<BlockingPair> out;
  std::map<std::string, int> receiver_threshold;  // memo, receivers recur across proposers

  for (const auto& p : proposer_model.owners()) {
    const auto p_partners = matching.partners_of_proposer(p);
    if (p_partners.empty() && !examine_unmatched) continue;
    const int p_bar = threshold(proposer_model, p, p_partners, capacity_of(proposer_capacity, p));

    for (const auto& r : proposer_model.ranked_candidates(p)) {
      if (matching.contains(p, r)) continue;
      if (proposer_model.rank_of(p, r) >= p_bar) continue;
      if (!receiver_model.has_owner(r)) continue;

      auto it = receiver_threshold.find(r);
      if (it == receiver_threshold.end()) {
        const auto r_partners = matching.partners_of_receiver(r);
        it = receiver_threshold
                 .emplace(r, threshold(receiver_model, r, r_partners, capacity_of(receiver_capacity, r)))
                 .first;
      }
      if (receiver_model.rank_of(r, p) < it->second) out.insert(BlockingPair{p, r});
    }
  }
  return out;
}

std::set<BlockingPair> detect_instabilities(const MatchingProblem& problem,
                                            const Matching& matching,
                                            Variant variant) {
  validate_all(variant, problem, SolveOptions{});
  validate_matching_ids(problem, matching);

  const bool complete = requires_complete_lists(variant);
  const PreferenceModel pm(problem.proposers, problem.receivers, problem.proposer_prefs, complete);
  const PreferenceModel rm(problem.receivers, problem.proposers, problem.receiver_prefs, complete);

  std::map<std::string, int> p_caps, r_caps;
  if (variant == Variant::kWeightedOptimize) {
    for (const auto& p : problem.proposers) p_caps[p.id] = p.capacity;
    for (const auto& r : problem.receivers) r_caps[r.id] = r.capacity;
  }
  return find_blocking_pairs(pm, rm, matching, p_caps, r_caps, !complete);
}

std::set<BlockingPair> detect_instabilities(const Matching& matching,
                                            const PreferenceMap& proposer_prefs,
                                            const PreferenceMap& receiver_prefs,
                                            Variant variant) {
  MatchingProblem problem;
  for (const auto& kv : proposer_prefs) add_missing(problem.proposers, kv.first);
  for (const auto& kv : receiver_prefs) add_missing(problem.receivers, kv.first);
  for (const auto& mp : matching.pairs) {
    add_missing(problem.proposers, mp.proposer);
    add_missing(problem.receivers, mp.receiver);
  }
  problem.proposer_prefs = proposer_prefs;
  problem.receiver_prefs = receiver_prefs;
  return detect_instabilities(problem, matching, variant);
}

} // namespace blm
