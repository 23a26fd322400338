// main.cpp
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "config.h"
#include "errors.h"
#include "examples.h"
#include "matching_io.h"
#include "problem_parser.h"
#include "self_check.h"
#include "solver.h"
#include "utils.h"

using namespace blm;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string variant;            // required
  std::string input_path;         // required unless --example
  bool use_example = false;
  std::string config_path;        // optional
  std::string out_path;           // optional, overrides RESULT_OUT
  std::string engine;             // optional, overrides ENGINE
  std::string weight;             // optional, overrides PREFERENCE_WEIGHT
  bool exactly_one = false;
  bool self_check = false;
  bool dump_problem = false;
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  blmatch --variant {smp|smt|smti|optimize} (--input problem.json | --example) [options]

Required:
  --variant V         smp|smt|smti|optimize (or TotalOrder|RankedTies|PartialTies|WeightedOptimize)
  --input PATH        problem file with bigs/littles/big_prefs/little_prefs
  --example           use the built-in example for the variant instead

Optional:
  --config PATH       JSON config (TIME_LIMIT_SECONDS, NUM_WORKERS, ENGINE, ...)
  --out PATH          write the result JSON here
  --engine E          auto|da|backend
  --weight W          preference weight in [0,1] (optimize only)
  --exactly-one       one match per participant (optimize only)
  --self-check        cross-check engines and re-run the detector
  --dump-problem      print the problem as JSON before solving
  --quiet             Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--variant") f.variant = need("--variant");
    else if (a == "--input")   f.input_path = need("--input");
    else if (a == "--example") f.use_example = true;
    else if (a == "--config")  f.config_path = need("--config");
    else if (a == "--out")     f.out_path = need("--out");
    else if (a == "--engine")  f.engine = need("--engine");
    else if (a == "--weight")  f.weight = need("--weight");
    else if (a == "--exactly-one") f.exactly_one = true;
    else if (a == "--self-check")  f.self_check = true;
    else if (a == "--dump-problem") f.dump_problem = true;
    else if (a == "--quiet") f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.variant.empty() || (f.input_path.empty() && !f.use_example)) {
    std::cerr << "Missing required --variant and --input/--example.\n"; print_usage(); std::exit(2);
  }
  return f;
}

static double parse_weight(const std::string& s) {
  std::istringstream in(s);
  double w = 0.0;
  if (!(in >> w) || !in.eof()) throw InvalidInputError("Bad --weight value: " + s);
  return w;
}

static void print_result(const SolveResult& r) {
  std::cout << "Matches (" << r.matching.size() << "):\n";
  for (const auto& mp : r.matching.pairs)
    std::cout << "  " << mp.proposer << " - " << mp.receiver << "\n";
  if (r.objective_value)
    std::cout << "Total preference score: " << std::fixed << std::setprecision(2)
              << *r.objective_value << "\n";
  if (r.blocking_pairs.empty()) {
    std::cout << "No blocking pairs: the matching is stable.\n";
  } else {
    std::cout << "Found " << r.blocking_pairs.size() << " blocking pairs:\n";
    for (const auto& bp : r.blocking_pairs)
      std::cout << "  (" << bp.proposer << ", " << bp.receiver << ")\n";
  }
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  Variant variant = Variant::kTotalOrder;
  Cfg cfg;
  MatchingProblem problem;
  try {
    variant = parse_variant(flags.variant);
    if (!flags.config_path.empty()) cfg = parse_config(load_json(flags.config_path));
    problem = flags.use_example ? example_problem(variant)
                                : problem_from_json(load_json(flags.input_path), variant);
  } catch (const InvalidInputError& e) {
    std::cerr << "Invalid input: " << e.what() << "\n"; return 4;
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  SolveOptions opts = cfg.solve;
  try {
    if (!flags.engine.empty()) opts.engine = parse_engine(flags.engine);
    if (!flags.weight.empty()) opts.weight = parse_weight(flags.weight);
  } catch (const InvalidInputError& e) {
    std::cerr << e.what() << "\n"; return 2;
  }
  if (flags.exactly_one) opts.enforce_exactly_one = true;
  const std::string out_path = flags.out_path.empty() ? cfg.result_out : flags.out_path;

  if (flags.verbose) {
    std::cout << "Big-Little matcher\n";
    std::cout << "Variant: " << variant_tag(variant)
              << " bigs=" << problem.proposers.size()
              << " littles=" << problem.receivers.size() << "\n";
  }
  if (flags.dump_problem) std::cout << std::setw(2) << problem_to_json(problem) << "\n";

  SolveResult result;
  try {
    if (flags.self_check && !self_check_engines(variant, problem, opts)) {
      std::cerr << "Self-check found an unstable result.\n"; return 6;
    }
    result = solve(variant, problem, opts);
  } catch (const NoStableMatchingError& e) {
    std::cerr << "No stable matching: " << e.what() << "\n"; return 3;
  } catch (const InfeasibleError& e) {
    std::cerr << "Infeasible: " << e.what() << "\n"; return 3;
  } catch (const InvalidInputError& e) {
    std::cerr << "Invalid input: " << e.what() << "\n"; return 4;
  } catch (const BackendError& e) {
    std::cerr << "Solver failed: " << e.what() << "\n"; return 5;
  }

  if (flags.verbose) {
    std::cout << "Engine: " << engine_tag(result.engine)
              << " (" << result.elapsed_ms << " ms)\n";
    if (opts.log_search && !result.backend_stats.empty()) std::cout << result.backend_stats << "\n";
  }
  print_result(result);

  if (!out_path.empty()) {
    try { save_json(out_path, result_to_json(variant, result)); }
    catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 1; }
    if (flags.verbose) std::cout << "Result written to " << out_path << "\n";
  }
  return 0;
}
