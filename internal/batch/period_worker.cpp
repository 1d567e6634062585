#include "period_worker.hpp"

namespace normbalance::batch {

PeriodWorker::PeriodWorker(std::shared_ptr<PeriodQueue> queue, Handler handler)
    : queue_(std::move(queue)), handler_(std::move(handler)) {
}

PeriodWorker::~PeriodWorker() {
  Join();
}

void PeriodWorker::Start() {
  thread_ = std::thread(&PeriodWorker::Run, this);
}

void PeriodWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void PeriodWorker::Run() {
  while (auto task = queue_->Next()) {
    queue_->Complete(task->slot, handler_(*task));
  }
}

} // namespace normbalance::batch
