// backend.h
#pragma once
#include <string>
#include <vector>

#include "constraint_model.h"

namespace blm {

struct BackendParams {
  int time_limit_seconds = 0;  // 0 = no limit
  int num_workers = 0;         // 0 = backend default
  int random_seed = 0;
  bool log_search = false;
};

enum class BackendStatus {
  kOptimal,     // proven optimal (or any point of a pure feasibility model)
  kFeasible,    // limit reached with a solution in hand
  kInfeasible,  // proven to have no solution
  kUnknown,     // limit reached without a solution
  kError        // backend failed for reasons unrelated to the model
};

struct BackendResult {
  BackendStatus status = BackendStatus::kUnknown;
  std::vector<bool> values;  // one per model variable when a solution exists
  double objective_value = 0.0;
  double wall_time_seconds = 0.0;
  std::string stats;         // human-readable solver summary
  std::string error;         // set for kError
};

// Generic 0/1 optimisation engine. Implementations must not keep state
// between solve() calls.
class SolverBackend {
 public:
  virtual ~SolverBackend() = default;
  virtual BackendResult solve(const ConstraintModel& model, const BackendParams& params) = 0;
  virtual const char* name() const = 0;
};

} // namespace blm
