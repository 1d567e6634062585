#include "result_aggregator.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace normbalance::report {

namespace {

void AddUtilities(const ReportContext& context, const model::QuantityMap& quantities, v1::BalanceReport& report) {
  for (const auto& utility : context.graph.Utilities()) {
    auto* row = report.add_utilities();
    row->set_utility_id(utility.id);
    row->set_code(utility.code);
    row->set_name(utility.name);
    row->set_uom(utility.uom);
    row->set_utility_type(std::string(model::ToString(utility.type)));

    model::DemandRecord demand;
    if (auto it = context.demand.find(utility.id); it != context.demand.end()) {
      demand = it->second;
    }
    row->set_process_requirement(demand.process);
    row->set_fixed_requirement(demand.fixed);

    double resolved = 0.0;
    if (auto it = quantities.find(utility.id); it != quantities.end()) {
      resolved = it->second;
    }
    row->set_resolved_quantity(resolved);
    row->set_derived_quantity(resolved - demand.process - demand.fixed);

    if (auto it = context.benchmarks.find(utility.id); it != context.benchmarks.end()) {
      row->set_benchmark_quantity(it->second);
      if (it->second != 0.0) {
        row->set_deviation_percent((resolved - it->second) / it->second * 100.0);
      }
    }
  }
}

void AddFlows(const core::Resolution& resolution, v1::BalanceReport& report) {
  for (const auto& flow : resolution.flows) {
    auto* row = report.add_flows();
    row->set_consumer_utility_id(flow.consumer);
    row->set_supplier_utility_id(flow.supplier);
    row->set_norm_type(std::string(model::ToString(flow.type)));
    row->set_quantity(flow.quantity);
    row->set_formula(flow.formula);

    auto consumer = resolution.quantities.find(flow.consumer);
    if (consumer != resolution.quantities.end() && consumer->second != 0.0) {
      row->set_derived_norm(flow.quantity / consumer->second);
    }
  }
}

void AddWarnings(const std::vector<core::Diagnostic>& warnings, v1::BalanceReport& report) {
  for (const auto& warning : warnings) {
    auto* row = report.add_warnings();
    row->set_kind(std::string(core::ToString(warning.kind)));
    row->set_utility_id(warning.utility_id);
    row->set_asset_id(warning.asset_id);
    row->set_message(warning.message);
    row->set_value(warning.value);
  }
}

} // namespace

v1::BalanceReport ResultAggregator::FromResolution(const ReportContext& context, const core::Resolution& resolution) {
  v1::BalanceReport report;
  report.set_period(context.period);
  report.set_status(v1::RESOLUTION_STATUS_CONVERGED);
  report.set_authoritative(true);
  report.set_iterations(resolution.iterations);
  report.set_max_delta(resolution.max_delta);

  AddUtilities(context, resolution.quantities, report);
  AddFlows(resolution, report);
  AddWarnings(resolution.warnings, report);
  return report;
}

v1::BalanceReport ResultAggregator::FromFailure(const ReportContext& context, const util::ResolutionError& error) {
  v1::BalanceReport report;
  report.set_period(context.period);
  report.set_authoritative(false);
  report.set_error_message(error.what());

  if (const auto* convergence = dynamic_cast<const util::ConvergenceError*>(&error)) {
    report.set_status(v1::RESOLUTION_STATUS_CONVERGENCE_FAILED);
    report.set_iterations(convergence->Iterations());
    report.set_max_delta(convergence->MaxDelta());
    AddUtilities(context, convergence->LastQuantities(), report);
    return report;
  }

  if (const auto* capacity = dynamic_cast<const util::CapacityExceeded*>(&error)) {
    report.set_status(v1::RESOLUTION_STATUS_CAPACITY_EXCEEDED);
    report.set_iterations(capacity->Iterations());
    AddUtilities(context, capacity->Quantities(), report);
    for (const auto& shortfall : capacity->Shortfalls()) {
      auto* row = report.add_shortfalls();
      row->set_asset_id(shortfall.asset_id);
      row->set_utility_id(shortfall.utility_id);
      row->set_resolved_quantity(shortfall.resolved);
      row->set_capacity(shortfall.capacity);
      row->set_shortfall(shortfall.Shortfall());
    }
    AddWarnings(capacity->Warnings(), report);
    return report;
  }

  if (const auto* supply = dynamic_cast<const util::SupplyUnavailable*>(&error)) {
    report.set_status(v1::RESOLUTION_STATUS_SUPPLY_UNAVAILABLE);
    report.set_iterations(supply->Iterations());
    AddUtilities(context, supply->Quantities(), report);
    return report;
  }

  report.set_status(v1::RESOLUTION_STATUS_UNSPECIFIED);
  return report;
}

void ResultAggregator::Stamp(v1::BalanceReport& report, std::chrono::steady_clock::time_point started) {
  *report.mutable_generated_at() = util::ToProto(util::Now());
  report.set_elapsed_ms(util::ElapsedMillis(started));
}

std::string ResultAggregator::ToJson(const v1::BalanceReport& report, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = pretty;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(report, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize report: " + std::string(status.message()));
  }
  return json;
}

std::string ResultAggregator::ToText(const v1::BalanceReport& report) {
  std::ostringstream out;
  out << "period " << report.period() << "  status " << v1::ResolutionStatus_Name(report.status())
      << (report.authoritative() ? "" : "  (NOT AUTHORITATIVE)") << "  iterations " << report.iterations() << '\n';
  if (!report.error_message().empty()) {
    out << "error: " << report.error_message() << '\n';
  }

  out << std::left << std::setw(14) << "utility" << std::setw(8) << "uom" << std::right << std::setw(18) << "process"
      << std::setw(18) << "fixed" << std::setw(18) << "derived" << std::setw(18) << "resolved" << std::setw(12) << "dev %" << '\n';
  out << std::fixed << std::setprecision(3);
  for (const auto& row : report.utilities()) {
    out << std::left << std::setw(14) << row.code() << std::setw(8) << row.uom() << std::right << std::setw(18)
        << row.process_requirement() << std::setw(18) << row.fixed_requirement() << std::setw(18) << row.derived_quantity()
        << std::setw(18) << row.resolved_quantity();
    if (row.has_deviation_percent()) {
      out << std::setw(12) << std::setprecision(2) << row.deviation_percent() << std::setprecision(3);
    }
    out << '\n';
  }

  for (const auto& shortfall : report.shortfalls()) {
    out << "capacity exceeded: " << shortfall.asset_id() << " resolved " << shortfall.resolved_quantity() << " capacity "
        << shortfall.capacity() << '\n';
  }
  for (const auto& warning : report.warnings()) {
    out << "warning " << warning.kind() << ": " << warning.message() << '\n';
  }
  return out.str();
}

} // namespace normbalance::report
