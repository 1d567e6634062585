#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/resolution.hpp"
#include "internal/model/period_inputs.hpp"

namespace normbalance::util {

/*
  Central error types.

  The CLI maps these to exit codes; the report layer maps resolution
  failures to a non-authoritative BalanceReport.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Base for everything that aborts a single resolution.
class ResolutionError : public std::runtime_error {
 public:
  explicit ResolutionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed graph or inputs. Raised before any propagation pass.
class ValidationError : public ResolutionError {
 public:
  explicit ValidationError(std::vector<std::string> issues);

  const std::vector<std::string>& Issues() const {
    return issues_;
  }

 private:
  std::vector<std::string> issues_;
};

class ConvergenceError : public ResolutionError {
 public:
  ConvergenceError(model::QuantityMap last_quantities, model::UtilityId max_delta_utility, double max_delta, std::uint32_t iterations);

  // Non-authoritative: the vector of the last pass.
  const model::QuantityMap& LastQuantities() const {
    return last_quantities_;
  }
  const model::UtilityId& MaxDeltaUtility() const {
    return max_delta_utility_;
  }
  double MaxDelta() const {
    return max_delta_;
  }
  std::uint32_t Iterations() const {
    return iterations_;
  }

 private:
  model::QuantityMap last_quantities_;
  model::UtilityId   max_delta_utility_;
  double             max_delta_;
  std::uint32_t      iterations_;
};

struct CapacityShortfall {
  model::AssetId   asset_id;
  model::UtilityId utility_id;
  double           resolved = 0.0;
  double           capacity = 0.0;

  double Shortfall() const {
    return resolved - capacity;
  }
};

class CapacityExceeded : public ResolutionError {
 public:
  CapacityExceeded(std::vector<CapacityShortfall> shortfalls, model::QuantityMap quantities, std::uint32_t iterations,
                   std::vector<core::Diagnostic> warnings = {});

  const std::vector<CapacityShortfall>& Shortfalls() const {
    return shortfalls_;
  }
  // Converged vector, reported but not authoritative.
  const model::QuantityMap& Quantities() const {
    return quantities_;
  }
  std::uint32_t Iterations() const {
    return iterations_;
  }
  // Warnings raised before the capacity check failed.
  const std::vector<core::Diagnostic>& Warnings() const {
    return warnings_;
  }

 private:
  std::vector<CapacityShortfall> shortfalls_;
  model::QuantityMap             quantities_;
  std::uint32_t                  iterations_;
  std::vector<core::Diagnostic>  warnings_;
};

// A distribution node with positive demand has no available supplier left.
class SupplyUnavailable : public ResolutionError {
 public:
  SupplyUnavailable(model::UtilityId consumer, model::QuantityMap quantities, std::uint32_t iterations);

  const model::UtilityId& Consumer() const {
    return consumer_;
  }
  const model::QuantityMap& Quantities() const {
    return quantities_;
  }
  std::uint32_t Iterations() const {
    return iterations_;
  }

 private:
  model::UtilityId   consumer_;
  model::QuantityMap quantities_;
  std::uint32_t      iterations_;
};

} // namespace normbalance::util
