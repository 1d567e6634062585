#include "internal/graph/norms_graph.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "internal/formula/formula_evaluator.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/plant_fixture.hpp"

namespace {

using normbalance::graph::NormsGraph;
using normbalance::graph::NormsSnapshot;
using normbalance::model::NormType;
using namespace normbalance::testing;

bool Near(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps;
}

std::size_t IssueCount(NormsSnapshot snapshot, normbalance::graph::ValidationOptions options = {}) {
  try {
    NormsGraph graph(std::move(snapshot), options);
  } catch (const normbalance::util::ValidationError& e) {
    return e.Issues().size();
  }
  return 0;
}

double ShareOf(const NormsGraph& graph, const std::string& consumer, const std::string& supplier) {
  const auto c = graph.RequireIndex(consumer);
  const auto s = graph.RequireIndex(supplier);
  for (const auto& ref : graph.SuppliersOf(c)) {
    if (ref.supplier == s) return ref.share;
  }
  assert(false && "edge not found");
  return 0.0;
}

void TestResidualShareIsDerived() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("LP_DIS", true), MakeUtility("PRDS"), MakeUtility("STG")};
  snapshot.norms     = {Distribution("LP_DIS", "PRDS", 0.3866), Residual("LP_DIS", "STG")};

  NormsGraph graph(std::move(snapshot));
  assert(Near(ShareOf(graph, "LP_DIS", "PRDS"), 0.3866));
  assert(Near(ShareOf(graph, "LP_DIS", "STG"), 0.6134, 1e-12));
  assert(graph.HasDistribution(graph.RequireIndex("LP_DIS")));
  assert(graph.ZeroResiduals().empty());
}

void TestResidualDerivingToZeroIsRecorded() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("SHP_DIS", true), MakeUtility("HRSG1"), MakeUtility("HRSG2"), MakeUtility("HRSG3")};
  snapshot.norms     = {Residual("SHP_DIS", "HRSG1"), Distribution("SHP_DIS", "HRSG2", 0.4934), Distribution("SHP_DIS", "HRSG3", 0.5066)};

  NormsGraph graph(std::move(snapshot));
  assert(ShareOf(graph, "SHP_DIS", "HRSG1") == 0.0);
  assert(graph.ZeroResiduals().size() == 1);
  assert(graph.ZeroResiduals().front().supplier == graph.RequireIndex("HRSG1"));
}

void TestDistributionSumMustBeOne() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("D", true), MakeUtility("A"), MakeUtility("B")};
  snapshot.norms     = {Distribution("D", "A", 0.3), Distribution("D", "B", 0.3)};
  assert(IssueCount(snapshot) == 1);

  // within epsilon is accepted
  snapshot.norms = {Distribution("D", "A", 0.5), Distribution("D", "B", 0.5000001)};
  assert(IssueCount(snapshot) == 0);
}

void TestKnownSharesAboveOneWithResidualRejected() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("D", true), MakeUtility("A"), MakeUtility("B"), MakeUtility("C")};
  snapshot.norms     = {Distribution("D", "A", 0.7), Distribution("D", "B", 0.4), Residual("D", "C")};
  assert(IssueCount(snapshot) == 1);
}

void TestAtMostOneResidual() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("D", true), MakeUtility("A"), MakeUtility("B")};
  snapshot.norms     = {Residual("D", "A"), Residual("D", "B")};
  assert(IssueCount(snapshot) == 1);
}

void TestAllIssuesAreCollected() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("D", true), MakeUtility("A"), MakeUtility("A"), MakeUtility("X")};
  snapshot.norms     = {Distribution("D", "GHOST", 1.0), Distribution("X", "A", -0.5), Residual("A", "X")};
  snapshot.norms[2].type = NormType::kConversion;

  // duplicate id, unknown supplier, negative share, conversion without factor
  assert(IssueCount(snapshot) == 4);
}

void TestInactiveEdgesAreIgnored() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("A"), MakeUtility("B")};
  auto broken        = Conversion("A", "NOWHERE", 1.0);
  broken.active      = false;
  snapshot.norms     = {broken, Conversion("A", "B", 2.0)};

  NormsGraph graph(std::move(snapshot));
  assert(graph.Edges().size() == 1);
  assert(graph.SuppliersOf(graph.RequireIndex("A")).size() == 1);
}

void TestCyclesAreAccepted() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("A"), MakeUtility("B")};
  snapshot.norms     = {Conversion("A", "B", 0.5), Conversion("B", "A", 0.5)};

  NormsGraph graph(std::move(snapshot));
  assert(graph.Size() == 2);
}

void TestFormulaEdgesNeedKnownFormula() {
  auto formulas = normbalance::formula::FormulaEvaluator::WithBuiltins();

  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("PP2"), MakeUtility("NG")};
  snapshot.norms     = {Formula("PP2", "NG", "gas_turbine_net_fuel", "GT2", 0.0101)};

  normbalance::graph::ValidationOptions options;
  options.formulas = &formulas;

  NormsGraph graph(snapshot, options);
  const auto pp2 = graph.RequireIndex("PP2");
  assert(graph.IsFormulaDriven(pp2));
  assert(graph.SuppliersOf(pp2).front().IsFormula());
  assert(Near(graph.SuppliersOf(pp2).front().share, 0.0101));

  snapshot.norms = {Formula("PP2", "NG", "steam_turbine_magic", "GT2", std::nullopt)};
  assert(IssueCount(snapshot, options) == 1);

  // a formula can never drive a distribution share
  snapshot.norms         = {Formula("PP2", "NG", "gas_turbine_net_fuel", "GT2", std::nullopt)};
  snapshot.norms[0].type = NormType::kDistribution;
  assert(IssueCount(snapshot, options) >= 1);
}

void TestLookupByUnknownIdThrows() {
  NormsSnapshot snapshot;
  snapshot.utilities = {MakeUtility("A")};
  NormsGraph graph(std::move(snapshot));

  assert(!graph.IndexOf("B").has_value());
  bool threw = false;
  try {
    (void)graph.RequireIndex("B");
  } catch (const normbalance::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestResidualShareIsDerived();
  TestResidualDerivingToZeroIsRecorded();
  TestDistributionSumMustBeOne();
  TestKnownSharesAboveOneWithResidualRejected();
  TestAtMostOneResidual();
  TestAllIssuesAreCollected();
  TestInactiveEdgesAreIgnored();
  TestCyclesAreAccepted();
  TestFormulaEdgesNeedKnownFormula();
  TestLookupByUnknownIdThrows();

  std::cout << "normbalance_unit_norms_graph: pass\n";
  return 0;
}
