// examples.h
#pragma once
#include "types.h"

namespace blm {

// Small built-in big/little instances, one per variant (3 bigs; the
// WeightedOptimize one has 4 littles and a big with capacity 2).
MatchingProblem example_problem(Variant variant);

} // namespace blm
