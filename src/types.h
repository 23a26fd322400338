// types.h
#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace blm {

enum class Variant {
  kTotalOrder,       // SMP: strict orders, complete lists, exactly one
  kRankedTies,       // SMT: ties allowed, complete lists, exactly one
  kPartialTies,      // SMTI: ties + incomplete lists, at most one
  kWeightedOptimize  // capacity-aware score maximisation, no stability
};

// Which solving path produced a matching.
enum class Engine {
  kAuto,               // deferred acceptance for TotalOrder, backend otherwise
  kDeferredAcceptance,
  kConstraintBackend
};

struct Participant {
  std::string id;
  int capacity = 1;  // max simultaneous matches ("max" in problem files)
};

enum class PreferenceKind {
  kTotalOrder,    // order[0] is most preferred
  kRankedTies,    // ranks, equal = indifferent, absence is an input error
  kPartialRanked  // ranks, absence = unacceptable
};

struct PreferenceList {
  PreferenceKind kind = PreferenceKind::kTotalOrder;
  std::vector<std::string> order;    // kTotalOrder
  std::map<std::string, int> ranks;  // kRankedTies / kPartialRanked

  static PreferenceList ordered(std::vector<std::string> ids) {
    PreferenceList l;
    l.kind = PreferenceKind::kTotalOrder;
    l.order = std::move(ids);
    return l;
  }
  static PreferenceList ranked(std::map<std::string, int> r, bool partial = false) {
    PreferenceList l;
    l.kind = partial ? PreferenceKind::kPartialRanked : PreferenceKind::kRankedTies;
    l.ranks = std::move(r);
    return l;
  }
};

// owner id -> list
using PreferenceMap = std::map<std::string, PreferenceList>;

struct MatchPair {
  std::string proposer;
  std::string receiver;

  bool operator<(const MatchPair& o) const {
    return std::tie(proposer, receiver) < std::tie(o.proposer, o.receiver);
  }
  bool operator==(const MatchPair& o) const {
    return proposer == o.proposer && receiver == o.receiver;
  }
};

struct BlockingPair {
  std::string proposer;
  std::string receiver;

  bool operator<(const BlockingPair& o) const {
    return std::tie(proposer, receiver) < std::tie(o.proposer, o.receiver);
  }
  bool operator==(const BlockingPair& o) const {
    return proposer == o.proposer && receiver == o.receiver;
  }
};

// Pairs kept in canonical (proposer, receiver) order.
struct Matching {
  std::set<MatchPair> pairs;

  bool contains(const std::string& p, const std::string& r) const {
    return pairs.count(MatchPair{p, r}) > 0;
  }
  std::vector<std::string> partners_of_proposer(const std::string& p) const;
  std::vector<std::string> partners_of_receiver(const std::string& r) const;
  std::size_t size() const { return pairs.size(); }
  bool empty() const { return pairs.empty(); }
  bool operator==(const Matching& o) const { return pairs == o.pairs; }
};

struct MatchingProblem {
  std::vector<Participant> proposers;  // "bigs"
  std::vector<Participant> receivers;  // "littles"
  PreferenceMap proposer_prefs;
  PreferenceMap receiver_prefs;
};

struct SolveOptions {
  double weight = 0.5;               // WeightedOptimize only, proposer share
  bool enforce_exactly_one = false;  // WeightedOptimize only
  Engine engine = Engine::kAuto;
  int time_limit_seconds = 0;        // 0 = no limit
  int num_workers = 0;               // 0 = backend default
  int random_seed = 0;
  bool log_search = false;
  std::vector<MatchPair> forced_pairs;
};

struct SolveResult {
  Matching matching;
  std::optional<double> objective_value;  // WeightedOptimize only
  std::set<BlockingPair> blocking_pairs;
  Engine engine = Engine::kAuto;          // path actually taken
  long long elapsed_ms = 0;
  std::string backend_stats;              // empty for deferred acceptance

  bool stable() const { return blocking_pairs.empty(); }
};

const char* variant_tag(Variant v);
const char* engine_tag(Engine e);
// Accepts tags ("TotalOrder") and short names ("smp", "smt", "smti", "optimize").
Variant parse_variant(const std::string& s);
Engine parse_engine(const std::string& s);

inline bool requires_complete_lists(Variant v) {
  return v == Variant::kTotalOrder || v == Variant::kRankedTies;
}

} // namespace blm
