#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_snapshot_source.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/db/sqlite/sqlite_snapshot_source.hpp"
#include "internal/formula/formula_evaluator.hpp"
#include "internal/observability/logging.hpp"

namespace normbalance::factory {

using namespace normbalance;

namespace {

std::shared_ptr<db::SnapshotSource> BuildSource(const normbalance::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }

    const auto mode      = sqlite.read_only() ? db::sqlite::OpenMode::kReadOnly : db::sqlite::OpenMode::kReadWrite;
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), mode);
    if (!sqlite_db->IsReadOnly()) {
      db::sqlite::BootstrapSchema(*sqlite_db);
    }

    NORMBALANCE_LOG_INFO("snapshot source opened", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path()),
                                                    observability::BoolField("read_only", sqlite_db->IsReadOnly())});
    return std::make_shared<db::sqlite::SqliteSnapshotSource>(std::move(sqlite_db));
  }

  NORMBALANCE_LOG_WARN("no database configured; using empty in-memory snapshot source");
  return std::make_shared<db::memory::MemorySnapshotSource>();
}

} // namespace

service::ServiceContext BuildServiceContext(const normbalance::runtime::config::RuntimeConfig& config,
                                            std::shared_ptr<db::SnapshotSource> source) {
  const auto& solver = config.solver();

  service::ServiceContext ctx;
  ctx.source   = std::move(source);
  ctx.formulas = std::make_shared<const formula::FormulaEvaluator>(formula::FormulaEvaluator::WithBuiltins());

  ctx.solver.tolerance            = solver.tolerance();
  ctx.solver.max_iterations       = solver.max_iterations();
  ctx.solver.allow_negative_carry = solver.allow_negative_carry();
  ctx.solver.check_capacity       = !solver.skip_capacity_check();

  ctx.distribution_epsilon = solver.distribution_epsilon();
  ctx.default_hours        = config.availability().default_hours();
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const normbalance::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildSource(config));
}

Application Build(const normbalance::runtime::config::RuntimeConfig& config, std::shared_ptr<db::SnapshotSource> source) {
  Application app;
  app.source = source;

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.resolution_service = std::make_shared<service::ResolutionService>(BuildServiceContext(config, std::move(source)));

  // ------------------------------------------------------------------
  // Batch workers
  // ------------------------------------------------------------------
  app.batch_runner = std::make_shared<batch::PeriodBatchRunner>(app.resolution_service, config.workers().threads());

  return app;
}

void InitDatabase(const normbalance::runtime::config::RuntimeConfig& config, const std::string& seed_path) {
  if (!config.database().has_sqlite() || config.database().sqlite().path().empty()) {
    throw std::runtime_error("init-db requires database.sqlite.path");
  }

  const auto& path      = config.database().sqlite().path();
  auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, db::sqlite::OpenMode::kReadWrite);
  db::sqlite::BootstrapSchema(*sqlite_db);
  NORMBALANCE_LOG_INFO("schema ready", {observability::StringField("path", path)});

  if (!seed_path.empty()) {
    db::sqlite::RunScript(sqlite_db, seed_path);
    NORMBALANCE_LOG_INFO("seed applied", {observability::StringField("script", seed_path)});
  }
}

} // namespace normbalance::factory
