#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "period_queue.hpp"

namespace normbalance::batch {

/*
  Worker thread that claims periods from a PeriodQueue until none are left
  and files each result under the task's slot.

  The handler must not throw; PeriodBatchRunner turns failures into results.
*/
class PeriodWorker {
 public:
  using Handler = std::function<BatchResult(const PeriodTask&)>;

  PeriodWorker(std::shared_ptr<PeriodQueue> queue, Handler handler);
  ~PeriodWorker();

  PeriodWorker(const PeriodWorker&)            = delete;
  PeriodWorker& operator=(const PeriodWorker&) = delete;

  void Start();
  void Join();

 private:
  void Run();

  std::shared_ptr<PeriodQueue> queue_;
  Handler                      handler_;
  std::thread                  thread_;
};

} // namespace normbalance::batch
