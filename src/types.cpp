#include "types.h"
#include "errors.h"

#include <algorithm>
#include <cctype>

namespace blm {

std::vector<std::string> Matching::partners_of_proposer(const std::string& p) const {
  std::vector<std::string> out;
  // pairs are sorted by proposer first, so partners are contiguous
  for (auto it = pairs.lower_bound(MatchPair{p, std::string()});
       it != pairs.end() && it->proposer == p; ++it)
    out.push_back(it->receiver);
  return out;
}

std::vector<std::string> Matching::partners_of_receiver(const std::string& r) const {
  std::vector<std::string> out;
  for (const auto& mp : pairs)
    if (mp.receiver == r) out.push_back(mp.proposer);
  return out;
}

const char* variant_tag(Variant v) {
  switch (v) {
    case Variant::kTotalOrder: return "TotalOrder";
    case Variant::kRankedTies: return "RankedTies";
    case Variant::kPartialTies: return "PartialTies";
    case Variant::kWeightedOptimize: return "WeightedOptimize";
  }
  return "?";
}

const char* engine_tag(Engine e) {
  switch (e) {
    case Engine::kAuto: return "auto";
    case Engine::kDeferredAcceptance: return "deferred_acceptance";
    case Engine::kConstraintBackend: return "backend";
  }
  return "?";
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

Variant parse_variant(const std::string& s) {
  const std::string k = lower(s);
  if (k == "totalorder" || k == "smp") return Variant::kTotalOrder;
  if (k == "rankedties" || k == "smt") return Variant::kRankedTies;
  if (k == "partialties" || k == "smti") return Variant::kPartialTies;
  if (k == "weightedoptimize" || k == "optimize") return Variant::kWeightedOptimize;
  throw InvalidInputError("Unknown variant: " + s);
}

Engine parse_engine(const std::string& s) {
  const std::string k = lower(s);
  if (k == "auto") return Engine::kAuto;
  if (k == "da" || k == "deferred_acceptance") return Engine::kDeferredAcceptance;
  if (k == "backend" || k == "cpsat") return Engine::kConstraintBackend;
  throw InvalidInputError("Unknown engine: " + s);
}

} // namespace blm
