// matching_io.h
#pragma once
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "types.h"

namespace blm {

// The durable artifact of a solve.
struct MatchingRecord {
  Variant variant = Variant::kTotalOrder;
  Matching matching;
  std::optional<double> objective_value;
};

// {"variant": "...", "matches": [{"proposer": .., "receiver": ..}], "objective_value": x|null}
nlohmann::json matching_to_json(const MatchingRecord& record);
MatchingRecord matching_from_json(const nlohmann::json& j);

nlohmann::json blocking_pairs_to_json(const std::set<BlockingPair>& pairs);

// Full CLI result: the record plus blocking pairs and solve metadata.
nlohmann::json result_to_json(Variant variant, const SolveResult& result);

} // namespace blm
