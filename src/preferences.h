// preferences.h
#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "types.h"

namespace blm {

// Uniform rank queries over one side's preference lists.
//
// Every list is turned into a rank table when the model is built, so callers
// never branch on PreferenceKind. A total-order list ranks by 1-based
// position; rank maps are taken as given. Candidates missing from a list get
// the sentinel rank (candidate count + 1), unless the model was built for a
// complete-list variant, in which case asking for them is an input error.
class PreferenceModel {
 public:
  PreferenceModel(const std::vector<Participant>& owners,
                  const std::vector<Participant>& candidates,
                  const PreferenceMap& prefs,
                  bool complete_lists);

  // Throws IncompletePreferenceError for a missing candidate when complete
  // lists are required, InvalidInputError for an unknown owner.
  int rank_of(const std::string& p, const std::string& c) const;

  bool prefers_or_equal(const std::string& p, const std::string& a, const std::string& b) const {
    return rank_of(p, a) <= rank_of(p, b);
  }
  bool is_acceptable(const std::string& p, const std::string& c) const {
    return rank_of(p, c) != sentinel_;
  }

  // Acceptable candidates, best first. Ties keep list order.
  const std::vector<std::string>& ranked_candidates(const std::string& p) const;

  int sentinel() const { return sentinel_; }
  const std::vector<std::string>& owners() const { return owner_ids_; }
  bool has_owner(const std::string& p) const { return table_.count(p) > 0; }

 private:
  struct Row {
    std::unordered_map<std::string, int> rank;
    std::vector<std::string> ordered;
  };
  const Row& row(const std::string& p) const;

  std::unordered_map<std::string, Row> table_;
  std::vector<std::string> owner_ids_;
  int sentinel_;
  bool complete_;
};

} // namespace blm
