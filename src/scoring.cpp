#include "scoring.h"

namespace blm {

double pair_score(const PreferenceModel& proposer_model,
                  const PreferenceModel& receiver_model,
                  const std::string& proposer,
                  const std::string& receiver,
                  double weight) {
  const double qp = rank_quality(proposer_model.rank_of(proposer, receiver), proposer_model.sentinel());
  const double qr = rank_quality(receiver_model.rank_of(receiver, proposer), receiver_model.sentinel());
  return weight * qp + (1.0 - weight) * qr;
}

std::map<MatchPair, double> build_scores(const PreferenceModel& proposer_model,
                                         const PreferenceModel& receiver_model,
                                         double weight) {
  std::map<MatchPair, double> scores;
  for (const auto& p : proposer_model.owners())
    for (const auto& r : receiver_model.owners())
      scores[MatchPair{p, r}] = pair_score(proposer_model, receiver_model, p, r, weight);
  return scores;
}

double total_score(const std::map<MatchPair, double>& scores, const Matching& matching) {
  double sum = 0.0;
  for (const auto& mp : matching.pairs) {
    auto it = scores.find(mp);
    if (it != scores.end()) sum += it->second;
  }
  return sum;
}

} // namespace blm
