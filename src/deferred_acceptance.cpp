#include "deferred_acceptance.h"
#include "validation.h"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_map>

namespace blm {

namespace {

std::vector<Participant> participants_of(const PreferenceMap& prefs) {
  std::vector<Participant> out;
  out.reserve(prefs.size());
  for (const auto& kv : prefs) out.push_back(Participant{kv.first, 1});
  return out;
}

} // namespace

Matching deferred_acceptance(const PreferenceMap& proposer_prefs,
                             const PreferenceMap& receiver_prefs,
                             DeferredAcceptanceStats* stats) {
  MatchingProblem problem;
  problem.proposers = participants_of(proposer_prefs);
  problem.receivers = participants_of(receiver_prefs);
  problem.proposer_prefs = proposer_prefs;
  problem.receiver_prefs = receiver_prefs;
  validate_all(Variant::kTotalOrder, problem, SolveOptions{});

  const PreferenceModel pm(problem.proposers, problem.receivers, proposer_prefs, true);
  const PreferenceModel rm(problem.receivers, problem.proposers, receiver_prefs, true);
  return deferred_acceptance(pm, rm, stats);
}

Matching deferred_acceptance(const PreferenceModel& proposer_model,
                             const PreferenceModel& receiver_model,
                             DeferredAcceptanceStats* stats) {
  const auto& proposers = proposer_model.owners();

  std::size_t max_len = 0;
  for (const auto& p : proposers)
    max_len = std::max(max_len, proposer_model.ranked_candidates(p).size());
  const long long bound = static_cast<long long>(proposers.size()) * static_cast<long long>(max_len);

  std::deque<std::string> free_proposers(proposers.begin(), proposers.end());
  std::unordered_map<std::string, std::size_t> cursor;  // next list position per proposer
  std::unordered_map<std::string, std::string> held;    // receiver -> tentative proposer
  long long proposals = 0;
  int unmatched = 0;

  while (!free_proposers.empty()) {
    const std::string p = free_proposers.front();
    free_proposers.pop_front();

    const auto& list = proposer_model.ranked_candidates(p);
    std::size_t& next = cursor[p];
    if (next >= list.size()) {
      ++unmatched;  // exhausted: stays single
      continue;
    }
    const std::string& r = list[next++];

    if (++proposals > bound)
      throw std::logic_error("deferred acceptance exceeded its proposal bound");

    auto it = held.find(r);
    if (!receiver_model.is_acceptable(r, p)) {
      free_proposers.push_back(p);
    } else if (it == held.end()) {
      held.emplace(r, p);
    } else if (receiver_model.rank_of(r, p) < receiver_model.rank_of(r, it->second)) {
      free_proposers.push_back(it->second);
      it->second = p;
    } else {
      free_proposers.push_back(p);
    }
  }

  if (stats) {
    stats->proposals = proposals;
    stats->unmatched_proposers = unmatched;
  }

  Matching m;
  for (const auto& kv : held) m.pairs.insert(MatchPair{kv.second, kv.first});
  return m;
}

} // namespace blm
