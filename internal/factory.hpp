#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/batch/period_batch_runner.hpp"
#include "internal/db/api/snapshot_source.hpp"
#include "internal/service/resolution_service.hpp"

namespace normbalance::factory {

/*
  Application

  Owns all long-lived objects used by one CLI invocation.
*/
struct Application {
  std::shared_ptr<db::SnapshotSource> source;

  std::shared_ptr<service::ResolutionService> resolution_service;
  std::shared_ptr<batch::PeriodBatchRunner> batch_runner;
};

/*
  Build

  Constructs the engine based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
  Without a database section the engine runs on an empty in-memory source.
*/
Application Build(const normbalance::runtime::config::RuntimeConfig& config);

// Same wiring over a caller-provided source (tests, embedding).
Application Build(const normbalance::runtime::config::RuntimeConfig& config, std::shared_ptr<db::SnapshotSource> source);

service::ServiceContext BuildServiceContext(const normbalance::runtime::config::RuntimeConfig& config,
                                            std::shared_ptr<db::SnapshotSource> source);

/*
  Creates the schema in the configured SQLite database and optionally runs a
  seed script. Ignores sqlite.read_only.
*/
void InitDatabase(const normbalance::runtime::config::RuntimeConfig& config, const std::string& seed_path);

}
