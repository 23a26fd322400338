// cpsat_backend.h
#pragma once
#include "backend.h"

namespace blm {

// SolverBackend on top of OR-tools CP-SAT.
class CpSatBackend : public SolverBackend {
 public:
  BackendResult solve(const ConstraintModel& model, const BackendParams& params) override;
  const char* name() const override { return "cp-sat"; }
};

} // namespace blm
