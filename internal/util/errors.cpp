#include "errors.hpp"

#include <sstream>

namespace normbalance::util {

namespace {

std::string JoinIssues(const std::vector<std::string>& issues) {
  std::ostringstream out;
  out << "norms graph validation failed (" << issues.size() << " issue" << (issues.size() == 1 ? "" : "s") << ")";
  for (const auto& issue : issues) {
    out << "; " << issue;
  }
  return out.str();
}

std::string ConvergenceMessage(const model::UtilityId& utility, double delta, std::uint32_t iterations) {
  std::ostringstream out;
  out << "balance did not converge after " << iterations << " iterations; max delta " << delta << " at utility " << utility;
  return out.str();
}

std::string CapacityMessage(const std::vector<CapacityShortfall>& shortfalls) {
  std::ostringstream out;
  out << "capacity exceeded";
  for (const auto& s : shortfalls) {
    out << "; asset " << s.asset_id << " (utility " << s.utility_id << ") needs " << s.resolved << " of " << s.capacity
        << ", short by " << s.Shortfall();
  }
  return out.str();
}

} // namespace

ValidationError::ValidationError(std::vector<std::string> issues)
    : ResolutionError(JoinIssues(issues)), issues_(std::move(issues)) {
}

ConvergenceError::ConvergenceError(model::QuantityMap last_quantities, model::UtilityId max_delta_utility, double max_delta,
                                   std::uint32_t iterations)
    : ResolutionError(ConvergenceMessage(max_delta_utility, max_delta, iterations)),
      last_quantities_(std::move(last_quantities)),
      max_delta_utility_(std::move(max_delta_utility)),
      max_delta_(max_delta),
      iterations_(iterations) {
}

CapacityExceeded::CapacityExceeded(std::vector<CapacityShortfall> shortfalls, model::QuantityMap quantities, std::uint32_t iterations,
                                   std::vector<core::Diagnostic> warnings)
    : ResolutionError(CapacityMessage(shortfalls)),
      shortfalls_(std::move(shortfalls)),
      quantities_(std::move(quantities)),
      iterations_(iterations),
      warnings_(std::move(warnings)) {
}

SupplyUnavailable::SupplyUnavailable(model::UtilityId consumer, model::QuantityMap quantities, std::uint32_t iterations)
    : ResolutionError("no available supplier for distribution utility " + consumer),
      consumer_(std::move(consumer)),
      quantities_(std::move(quantities)),
      iterations_(iterations) {
}

} // namespace normbalance::util
