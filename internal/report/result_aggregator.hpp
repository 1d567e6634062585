#pragma once

#include <chrono>
#include <string>

#include "internal/core/resolution.hpp"
#include "internal/graph/norms_graph.hpp"
#include "internal/model/period_inputs.hpp"
#include "normbalance/report/v1/report.pb.h"

namespace normbalance::util {
class ResolutionError;
}

namespace normbalance::report {

namespace v1 = normbalance::report::v1;

/*
  Inputs shared by every report of one period.

  All references are borrowed for the duration of the call.
*/
struct ReportContext {
  const graph::NormsGraph&   graph;
  const model::DemandMap&    demand;
  const model::BenchmarkMap& benchmarks;
  model::PeriodId            period;
};

/*
  Turns solver results into BalanceReport messages.

  Per utility: process, fixed, resolved and derived (resolved - process -
  fixed) quantities, with the benchmark deviation when a non-zero reference
  exists. Per edge: the induced flow and the derived norm (flow / consumer
  quantity). Utilities and flows keep graph order so two reports of the same
  inputs are byte-identical apart from timestamps.
*/
class ResultAggregator {
 public:
  static v1::BalanceReport FromResolution(const ReportContext& context, const core::Resolution& resolution);

  /*
    Non-authoritative report for a failed resolution. Convergence, capacity
    and supply failures carry their best-known vector; anything else only
    carries the message.
  */
  static v1::BalanceReport FromFailure(const ReportContext& context, const util::ResolutionError& error);

  // Stamps generated_at and elapsed_ms.
  static void Stamp(v1::BalanceReport& report, std::chrono::steady_clock::time_point started);

  static std::string ToJson(const v1::BalanceReport& report, bool pretty = true);

  // Compact table for terminals.
  static std::string ToText(const v1::BalanceReport& report);
};

} // namespace normbalance::report
