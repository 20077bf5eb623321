#pragma once

#include <stdexcept>
#include <string>

namespace dfs_core {

// Malformed input data (pool, configuration, correlation entries).
class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string &what)
      : std::invalid_argument(what) {}
};

class InvalidCorrelationError : public ValidationError {
public:
  explicit InvalidCorrelationError(const std::string &what)
      : ValidationError(what) {}
};

// Internally inconsistent constraint definitions, raised before any solve.
class ConstraintConfigError : public std::invalid_argument {
public:
  explicit ConstraintConfigError(const std::string &what)
      : std::invalid_argument(what) {}
};

enum class InfeasibilityReason {
  salary_cap,
  salary_floor,
  roster_size,
  position,
  locks,
  team_limit,
  stack,
  games,
  uniqueness,
  exposure,
  unknown
};

inline const char *to_string(InfeasibilityReason r) {
  switch (r) {
  case InfeasibilityReason::salary_cap:
    return "salary_cap";
  case InfeasibilityReason::salary_floor:
    return "salary_floor";
  case InfeasibilityReason::roster_size:
    return "roster_size";
  case InfeasibilityReason::position:
    return "position";
  case InfeasibilityReason::locks:
    return "locks";
  case InfeasibilityReason::team_limit:
    return "team_limit";
  case InfeasibilityReason::stack:
    return "stack";
  case InfeasibilityReason::games:
    return "games";
  case InfeasibilityReason::uniqueness:
    return "uniqueness";
  case InfeasibilityReason::exposure:
    return "exposure";
  case InfeasibilityReason::unknown:
    break;
  }
  return "unknown";
}

// A well-formed constraint system with no solution for the lineup being
// solved. reason() names the constraint class when it can be determined.
class InfeasibleError : public std::runtime_error {
public:
  InfeasibleError(InfeasibilityReason reason, const std::string &what)
      : std::runtime_error(what), reason_(reason) {}

  InfeasibilityReason reason() const { return reason_; }

private:
  InfeasibilityReason reason_;
};

class TimeoutError : public std::runtime_error {
public:
  explicit TimeoutError(const std::string &what) : std::runtime_error(what) {}
};

// The MIP backend is missing or reported an abnormal termination.
class SolverError : public std::runtime_error {
public:
  explicit SolverError(const std::string &what) : std::runtime_error(what) {}
};

class ResourceBudgetExceeded : public std::runtime_error {
public:
  explicit ResourceBudgetExceeded(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace dfs_core
