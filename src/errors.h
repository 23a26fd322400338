// errors.h
#pragma once
#include <stdexcept>
#include <string>

namespace blm {

// Recoverable failures reported to callers. Internal invariant violations use
// std::logic_error instead and are not part of this hierarchy.
struct MatchError : std::runtime_error {
  explicit MatchError(const std::string& msg) : std::runtime_error(msg) {}
};

struct InvalidInputError : MatchError {
  explicit InvalidInputError(const std::string& msg) : MatchError(msg) {}
};

// A complete-list variant was asked for a rank the owner never gave.
struct IncompletePreferenceError : InvalidInputError {
  explicit IncompletePreferenceError(const std::string& msg) : InvalidInputError(msg) {}
};

// The backend proved the model has no solution.
struct InfeasibleError : MatchError {
  explicit InfeasibleError(const std::string& msg) : MatchError(msg) {}
};

struct NoStableMatchingError : InfeasibleError {
  explicit NoStableMatchingError(const std::string& msg) : InfeasibleError(msg) {}
};

struct BackendError : MatchError {
  explicit BackendError(const std::string& msg) : MatchError(msg) {}
};

} // namespace blm
