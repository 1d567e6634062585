#include "period_batch_runner.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/service/resolution_service.hpp"
#include "period_queue.hpp"
#include "period_worker.hpp"

namespace normbalance::batch {

using observability::IntField;
using observability::StringField;

PeriodBatchRunner::PeriodBatchRunner(std::shared_ptr<service::ResolutionService> service, std::uint32_t threads)
    : service_(std::move(service)), threads_(std::max<std::uint32_t>(threads, 1)) {
  if (!service_) {
    throw std::invalid_argument("PeriodBatchRunner requires a resolution service");
  }
}

std::vector<BatchResult> PeriodBatchRunner::Run(const std::vector<model::PeriodId>& periods) {
  if (periods.empty()) {
    return {};
  }

  auto handle = [this](const PeriodTask& task) {
    BatchResult result;
    result.period = task.period;
    try {
      result.report = service_->Resolve(task.period);
    } catch (const std::exception& e) {
      result.error = e.what();
      NORMBALANCE_LOG_ERROR("batch period failed", {StringField("period", task.period), StringField("error", e.what())});
    }
    return result;
  };

  auto       queue        = std::make_shared<PeriodQueue>(periods);
  const auto worker_count = std::min<std::size_t>(threads_, periods.size());
  NORMBALANCE_LOG_INFO("batch started", {IntField("periods", static_cast<std::int64_t>(periods.size())),
                                         IntField("workers", static_cast<std::int64_t>(worker_count))});

  std::vector<std::unique_ptr<PeriodWorker>> workers;
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.push_back(std::make_unique<PeriodWorker>(queue, handle));
    workers.back()->Start();
  }
  for (auto& worker : workers) {
    worker->Join();
  }

  auto       results = queue->TakeResults();
  const auto failed  = std::count_if(results.begin(), results.end(), [](const BatchResult& r) { return !r.Ok(); });
  NORMBALANCE_LOG_INFO("batch finished", {IntField("periods", static_cast<std::int64_t>(results.size())), IntField("failed", failed)});
  return results;
}

std::vector<BatchResult> PeriodBatchRunner::RunAll() {
  std::vector<model::PeriodId> ids;
  for (const auto& period : service_->Periods()) {
    ids.push_back(period.id);
  }
  return Run(ids);
}

} // namespace normbalance::batch
