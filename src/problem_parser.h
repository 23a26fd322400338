// problem_parser.h
#pragma once
#include <nlohmann/json.hpp>

#include "types.h"

namespace blm {

// Reads a problem file:
//   {"bigs":   {"Ishaan": {"max": 1}, ...},   (or an array of ids)
//    "littles": {...},
//    "big_prefs":    {"Ishaan": ["Swapneel", "Zora"], ...},
//    "little_prefs": {"Swapneel": {"Ishaan": 2, "Thomas": 1}, ...}}
// An array is an ordered list; an object is a rank map, read as partial for
// PartialTies and WeightedOptimize. Shape errors become InvalidInputError;
// semantic checks are left to validate_all.
MatchingProblem problem_from_json(const nlohmann::json& j, Variant variant);

nlohmann::json problem_to_json(const MatchingProblem& problem);

} // namespace blm
