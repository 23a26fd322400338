#include "config.h"
#include "errors.h"

using json = nlohmann::json;

namespace blm {

Cfg parse_config(const json& j) {
  if (!j.is_object()) throw InvalidInputError("config must be a JSON object.");
  const SolveOptions def{};
  Cfg c;
  try {
    c.solve.time_limit_seconds  = j.value("TIME_LIMIT_SECONDS", def.time_limit_seconds);
    c.solve.num_workers         = j.value("NUM_WORKERS", def.num_workers);
    c.solve.random_seed         = j.value("RANDOM_SEED", def.random_seed);
    c.solve.log_search          = j.value("LOG_SEARCH", def.log_search);
    c.solve.weight              = j.value("PREFERENCE_WEIGHT", def.weight);
    c.solve.enforce_exactly_one = j.value("ENFORCE_EXACTLY_ONE", def.enforce_exactly_one);
    c.solve.engine              = parse_engine(j.value("ENGINE", std::string("auto")));
    c.result_out                = j.value("RESULT_OUT", std::string());

    // [["Ishaan", "Swapneel"], ...]
    if (j.contains("FORCED_PAIRS")) {
      for (const auto& fp : j.at("FORCED_PAIRS")) {
        if (!fp.is_array() || fp.size() != 2)
          throw InvalidInputError("FORCED_PAIRS entries must be [proposer, receiver].");
        c.solve.forced_pairs.push_back(MatchPair{fp[0].get<std::string>(), fp[1].get<std::string>()});
      }
    }
  } catch (const json::exception& e) {
    throw InvalidInputError(std::string("bad config value: ") + e.what());
  }

  if (c.solve.time_limit_seconds < 0) throw InvalidInputError("TIME_LIMIT_SECONDS must be >= 0.");
  if (c.solve.num_workers < 0) throw InvalidInputError("NUM_WORKERS must be >= 0.");
  return c;
}

} // namespace blm
