#include "internal/report/result_aggregator.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/core/balance_resolver.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/plant_fixture.hpp"

namespace {

using normbalance::availability::AvailabilityView;
using normbalance::core::BalanceResolver;
using normbalance::formula::FormulaEvaluator;
using normbalance::graph::NormsGraph;
using normbalance::graph::NormsSnapshot;
using normbalance::model::BenchmarkMap;
using normbalance::model::DemandMap;
using normbalance::report::ReportContext;
using normbalance::report::ResultAggregator;
using namespace normbalance::testing;
namespace v1 = normbalance::report::v1;

bool Near(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) <= eps;
}

NormsGraph LpPlant() {
  NormsSnapshot s;
  s.utilities = {MakeUtility("LP_DIS", true), MakeUtility("LP_STG"), MakeUtility("LP_PRDS"),
                 MakeUtility("POWER", false, normbalance::model::UtilityType::kPower)};
  s.norms     = {Distribution("LP_DIS", "LP_STG", 0.4), Residual("LP_DIS", "LP_PRDS"), Conversion("LP_STG", "POWER", 2.0)};
  return NormsGraph(std::move(s));
}

const v1::UtilityBalance& Row(const v1::BalanceReport& report, const std::string& id) {
  for (const auto& row : report.utilities()) {
    if (row.utility_id() == id) {
      return row;
    }
  }
  assert(false && "utility missing from report");
  return report.utilities(0);
}

void TestReportFromResolution() {
  const auto             graph = LpPlant();
  const AvailabilityView availability;
  const FormulaEvaluator formulas;

  const DemandMap    demand{{"LP_DIS", {80.0, 20.0}}, {"POWER", {5.0, 5.0}}};
  const BenchmarkMap benchmarks{{"POWER", 100.0}, {"LP_STG", 0.0}};

  const auto          resolution = BalanceResolver(graph, availability, formulas).Resolve(demand, {}, "FY2526-04");
  const ReportContext context{graph, demand, benchmarks, "FY2526-04"};
  const auto          report = ResultAggregator::FromResolution(context, resolution);

  assert(report.period() == "FY2526-04");
  assert(report.status() == v1::RESOLUTION_STATUS_CONVERGED);
  assert(report.authoritative());
  assert(report.utilities_size() == 4);

  // graph order
  assert(report.utilities(0).utility_id() == "LP_DIS");
  assert(report.utilities(3).utility_id() == "POWER");

  const auto& power = Row(report, "POWER");
  assert(Near(power.process_requirement(), 5.0));
  assert(Near(power.fixed_requirement(), 5.0));
  assert(Near(power.resolved_quantity(), 90.0));
  assert(Near(power.derived_quantity(), 80.0));
  assert(power.has_benchmark_quantity());
  assert(Near(power.deviation_percent(), -10.0));

  // zero reference: benchmark shown, no deviation
  const auto& stg = Row(report, "LP_STG");
  assert(stg.has_benchmark_quantity());
  assert(!stg.has_deviation_percent());
  assert(Near(stg.derived_quantity(), 40.0));

  const auto& prds = Row(report, "LP_PRDS");
  assert(!prds.has_benchmark_quantity());

  assert(report.flows_size() == 3);
  for (const auto& flow : report.flows()) {
    if (flow.consumer_utility_id() == "LP_STG") {
      assert(flow.norm_type() == "CONVERSION");
      assert(Near(flow.derived_norm(), 2.0));
    }
    if (flow.supplier_utility_id() == "LP_PRDS") {
      assert(flow.norm_type() == "DISTRIBUTION");
      assert(Near(flow.derived_norm(), 0.6));
    }
  }
}

void TestReportFromFailures() {
  const auto         graph = LpPlant();
  const DemandMap    demand{{"LP_DIS", {100.0, 0.0}}};
  const BenchmarkMap benchmarks;
  const ReportContext context{graph, demand, benchmarks, "P"};

  const normbalance::util::ConvergenceError convergence({{"LP_DIS", 100.0}, {"POWER", 7.0}}, "POWER", 3.5, 500);
  const auto failed = ResultAggregator::FromFailure(context, convergence);
  assert(failed.status() == v1::RESOLUTION_STATUS_CONVERGENCE_FAILED);
  assert(!failed.authoritative());
  assert(failed.iterations() == 500);
  assert(failed.max_delta() == 3.5);
  assert(Near(Row(failed, "POWER").resolved_quantity(), 7.0));
  assert(failed.error_message().find("did not converge") != std::string::npos);

  const normbalance::util::CapacityExceeded capacity({{"HRSG2", "LP_STG", 120.0, 100.0}}, {{"LP_STG", 120.0}}, 4);
  const auto exceeded = ResultAggregator::FromFailure(context, capacity);
  assert(exceeded.status() == v1::RESOLUTION_STATUS_CAPACITY_EXCEEDED);
  assert(exceeded.shortfalls_size() == 1);
  assert(Near(exceeded.shortfalls(0).shortfall(), 20.0));
  assert(exceeded.utilities_size() == 4);
  assert(exceeded.warnings_size() == 0);

  // warnings gathered before the capacity check survive into the report
  const normbalance::util::CapacityExceeded explained(
      {{"HRSG2", "LP_STG", 120.0, 100.0}}, {{"LP_STG", 120.0}}, 4,
      {{normbalance::core::DiagnosticKind::kMissingAvailability, "LP_PRDS", "HRSG1", "no availability record", 0.0}});
  const auto with_warnings = ResultAggregator::FromFailure(context, explained);
  assert(with_warnings.warnings_size() == 1);
  assert(with_warnings.warnings(0).kind() == "MISSING_AVAILABILITY");
  assert(with_warnings.warnings(0).asset_id() == "HRSG1");

  const normbalance::util::SupplyUnavailable supply("LP_DIS", {{"LP_DIS", 100.0}}, 1);
  const auto unavailable = ResultAggregator::FromFailure(context, supply);
  assert(unavailable.status() == v1::RESOLUTION_STATUS_SUPPLY_UNAVAILABLE);
  assert(!unavailable.authoritative());

  const normbalance::util::ResolutionError other("boom");
  const auto unknown = ResultAggregator::FromFailure(context, other);
  assert(unknown.status() == v1::RESOLUTION_STATUS_UNSPECIFIED);
  assert(unknown.utilities_size() == 0);
  assert(unknown.error_message() == "boom");
}

void TestRendering() {
  const auto             graph = LpPlant();
  const AvailabilityView availability;
  const FormulaEvaluator formulas;
  const DemandMap        demand{{"LP_DIS", {100.0, 0.0}}};
  const BenchmarkMap     benchmarks{{"POWER", 100.0}};

  const auto          resolution = BalanceResolver(graph, availability, formulas).Resolve(demand, {}, "P");
  const ReportContext context{graph, demand, benchmarks, "P"};
  auto                report = ResultAggregator::FromResolution(context, resolution);
  ResultAggregator::Stamp(report, std::chrono::steady_clock::now());
  assert(report.has_generated_at());
  assert(report.generated_at().seconds() > 0);
  assert(report.elapsed_ms() >= 0.0);

  const auto json = ResultAggregator::ToJson(report);
  assert(json.find("\"resolved_quantity\"") != std::string::npos);
  assert(json.find("RESOLUTION_STATUS_CONVERGED") != std::string::npos);

  const auto compact = ResultAggregator::ToJson(report, false);
  assert(compact.find('\n') == std::string::npos);

  const auto text = ResultAggregator::ToText(report);
  assert(text.find("period P") != std::string::npos);
  assert(text.find("LP_PRDS") != std::string::npos);
  assert(text.find("NOT AUTHORITATIVE") == std::string::npos);
}

} // namespace

int main() {
  TestReportFromResolution();
  TestReportFromFailures();
  TestRendering();

  std::cout << "normbalance_unit_result_aggregator: pass\n";
  return 0;
}
