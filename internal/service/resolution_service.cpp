#include "resolution_service.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>

#include "internal/availability/availability_view.hpp"
#include "internal/core/balance_resolver.hpp"
#include "internal/db/api/snapshot_source.hpp"
#include "internal/graph/norms_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/result_aggregator.hpp"
#include "internal/util/errors.hpp"

namespace normbalance::service {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

graph::NormsGraph BuildGraph(const db::ReferenceData& reference, const ServiceContext& ctx) {
  graph::ValidationOptions options;
  options.distribution_epsilon = ctx.distribution_epsilon;
  options.formulas             = ctx.formulas.get();
  return graph::NormsGraph(graph::NormsSnapshot{reference.utilities, reference.norms}, options);
}

availability::AvailabilityView BuildAvailability(const db::ReferenceData& reference, std::vector<model::AvailabilityRecord> records,
                                                 double default_hours) {
  availability::AvailabilitySnapshot snapshot;
  snapshot.steam_assets  = reference.steam_assets;
  snapshot.power_assets  = reference.power_assets;
  snapshot.links         = reference.links;
  snapshot.records       = std::move(records);
  snapshot.default_hours = default_hours;
  return availability::AvailabilityView(std::move(snapshot));
}

void LogWarnings(const report::v1::BalanceReport& report) {
  for (const auto& warning : report.warnings()) {
    NORMBALANCE_LOG_WARN("resolution warning", {StringField("period", report.period()), StringField("kind", warning.kind()),
                                                StringField("utility", warning.utility_id()), StringField("asset", warning.asset_id()),
                                                StringField("detail", warning.message())});
  }
}

} // namespace

ResolutionService::ResolutionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.source) {
    throw std::invalid_argument("ResolutionService requires a snapshot source");
  }
  if (!ctx_.formulas) {
    ctx_.formulas = std::make_shared<const formula::FormulaEvaluator>(formula::FormulaEvaluator::WithBuiltins());
  }
}

ValidationSummary ResolutionService::Validate() {
  auto reference = ctx_.source->LoadReference();

  try {
    auto graph        = BuildGraph(reference, ctx_);
    auto availability = BuildAvailability(reference, {}, ctx_.default_hours);

    ValidationSummary summary;
    summary.utilities    = graph.Size();
    summary.norms        = graph.Edges().size();
    summary.steam_assets = reference.steam_assets.size();
    summary.power_assets = reference.power_assets.size();
    summary.periods      = ctx_.source->ListPeriods().size();

    NORMBALANCE_LOG_INFO("reference data valid", {IntField("utilities", static_cast<std::int64_t>(summary.utilities)),
                                                  IntField("norms", static_cast<std::int64_t>(summary.norms)),
                                                  IntField("residual_zero", static_cast<std::int64_t>(graph.ZeroResiduals().size()))});
    return summary;
  } catch (const util::ValidationError& e) {
    for (const auto& issue : e.Issues()) {
      NORMBALANCE_LOG_ERROR("reference data invalid", {StringField("issue", issue)});
    }
    throw;
  }
}

report::v1::BalanceReport ResolutionService::Resolve(const model::PeriodId& period) {
  const auto started = std::chrono::steady_clock::now();

  auto reference = ctx_.source->LoadReference();
  auto inputs    = ctx_.source->LoadPeriod(period);

  NORMBALANCE_LOG_INFO("resolving period", {StringField("period", period), IntField("demand_rows", static_cast<std::int64_t>(inputs.demand.size())),
                                            IntField("availability_rows", static_cast<std::int64_t>(inputs.availability.size()))});

  auto graph        = BuildGraph(reference, ctx_);
  auto availability = BuildAvailability(reference, std::move(inputs.availability), ctx_.default_hours);

  core::BalanceResolver     resolver(graph, availability, *ctx_.formulas, ctx_.solver);
  report::ReportContext     context{graph, inputs.demand, inputs.benchmarks, period};
  report::v1::BalanceReport out;

  try {
    auto resolution = resolver.Resolve(inputs.demand, inputs.coefficients, period);
    out             = report::ResultAggregator::FromResolution(context, resolution);
    report::ResultAggregator::Stamp(out, started);

    NORMBALANCE_LOG_INFO("period converged", {StringField("period", period), IntField("iterations", resolution.iterations),
                                              DoubleField("max_delta", resolution.max_delta),
                                              IntField("warnings", static_cast<std::int64_t>(resolution.warnings.size())),
                                              DoubleField("elapsed_ms", out.elapsed_ms())});
    LogWarnings(out);
  } catch (const util::ValidationError&) {
    throw;
  } catch (const util::ResolutionError& e) {
    out = report::ResultAggregator::FromFailure(context, e);
    report::ResultAggregator::Stamp(out, started);

    NORMBALANCE_LOG_ERROR("period not resolved", {StringField("period", period),
                                                  StringField("status", report::v1::ResolutionStatus_Name(out.status())),
                                                  StringField("error", e.what())});
  }

  return out;
}

std::vector<model::Period> ResolutionService::Periods() {
  return ctx_.source->ListPeriods();
}

} // namespace normbalance::service
