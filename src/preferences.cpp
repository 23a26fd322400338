#include "preferences.h"
#include "errors.h"

#include <algorithm>

namespace blm {

PreferenceModel::PreferenceModel(const std::vector<Participant>& owners,
                                 const std::vector<Participant>& candidates,
                                 const PreferenceMap& prefs,
                                 bool complete_lists)
    : sentinel_(static_cast<int>(candidates.size()) + 1), complete_(complete_lists) {
  owner_ids_.reserve(owners.size());
  for (const auto& o : owners) owner_ids_.push_back(o.id);

  for (const auto& o : owners) {
    Row r;
    auto it = prefs.find(o.id);
    if (it != prefs.end()) {
      const PreferenceList& list = it->second;
      if (list.kind == PreferenceKind::kTotalOrder) {
        int pos = 1;
        for (const auto& c : list.order) {
          r.rank.emplace(c, pos++);
          r.ordered.push_back(c);
        }
      } else {
        std::vector<std::pair<int, std::string>> by_rank;
        by_rank.reserve(list.ranks.size());
        for (const auto& kv : list.ranks) {
          r.rank.emplace(kv.first, kv.second);
          by_rank.emplace_back(kv.second, kv.first);
        }
        std::stable_sort(by_rank.begin(), by_rank.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        for (auto& e : by_rank) r.ordered.push_back(std::move(e.second));
      }
    }
    if (r.ordered.empty() && complete_)
      throw InvalidInputError("Empty preference list for " + o.id +
                              " (complete lists are required)");
    table_.emplace(o.id, std::move(r));
  }
}

const PreferenceModel::Row& PreferenceModel::row(const std::string& p) const {
  auto it = table_.find(p);
  if (it == table_.end()) throw InvalidInputError("Unknown participant: " + p);
  return it->second;
}

int PreferenceModel::rank_of(const std::string& p, const std::string& c) const {
  const Row& r = row(p);
  auto it = r.rank.find(c);
  if (it != r.rank.end()) return it->second;
  if (complete_)
    throw IncompletePreferenceError(p + " does not rank " + c);
  return sentinel_;
}

const std::vector<std::string>& PreferenceModel::ranked_candidates(const std::string& p) const {
  return row(p).ordered;
}

} // namespace blm
