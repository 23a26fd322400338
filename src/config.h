// config.h
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "types.h"

namespace blm {

struct Cfg {
  SolveOptions solve;      // TIME_LIMIT_SECONDS, NUM_WORKERS, RANDOM_SEED, LOG_SEARCH,
                           // PREFERENCE_WEIGHT, ENFORCE_EXACTLY_ONE, ENGINE, FORCED_PAIRS
  std::string result_out;  // RESULT_OUT, empty = don't write
};

// Missing keys keep their defaults. Bad values throw InvalidInputError.
Cfg parse_config(const nlohmann::json& j);

} // namespace blm
