#pragma once

#include <memory>

#include "jobkeep_core/async/id_generator.hpp"
#include "jobkeep_core/async/job_runner.hpp"
#include "jobkeep_core/async/worker_pool.hpp"
#include "jobkeep_core/config.hpp"
#include "jobkeep_core/store/job_store.hpp"

namespace jobkeep_core {

// Builds the runtime pieces a Config describes.
class RuntimeFactory {
 public:
  // Opens the backend named by config.store_backend. Throws StoreError when
  // the backend cannot be opened.
  static std::shared_ptr<JobStore> create_store(const Config& config);

  static std::shared_ptr<JobIdGenerator> create_id_generator(const Config& config);

  // Not started; the caller owns start() and stop().
  static std::shared_ptr<async::WorkerPool> create_worker_pool(const Config& config);

  static std::unique_ptr<JobRunner> create_runner(const Config& config,
                                                  std::shared_ptr<JobStore> store,
                                                  std::shared_ptr<async::JobExecutor> executor);
};

}  // namespace jobkeep_core
