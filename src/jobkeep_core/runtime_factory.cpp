#include "jobkeep_core/runtime_factory.hpp"

#include <filesystem>
#include <stdexcept>

#include "jobkeep_core/db/database_manager.hpp"
#include "jobkeep_core/db/sqlite_error_utils.hpp"
#include "jobkeep_core/db/sqlite_job_store.hpp"
#include "jobkeep_core/store/fs_job_store.hpp"
#include "jobkeep_core/store/memory_job_store.hpp"

namespace jobkeep_core {

std::shared_ptr<JobStore> RuntimeFactory::create_store(const Config& config) {
  if (config.store_backend == "memory") {
    return std::make_shared<MemoryJobStore>();
  }
  if (config.store_backend == "filesystem") {
    return std::make_shared<FsJobStore>(config.job_directory);
  }
  if (config.store_backend == "sqlite") {
    auto db_manager = std::make_shared<DatabaseManager>();
    try {
      db_manager->initialize(config.database_path, config.db_pool_size);
    } catch (const sqlite::sqlite_exception& e) {
      throw to_store_error("open database " + config.database_path, e);
    } catch (const std::filesystem::filesystem_error& e) {
      throw StoreError(StoreErrorKind::IO_FAILURE,
                       std::string("Failed to create database directory: ") + e.what());
    }
    return std::make_shared<SqliteJobStore>(db_manager);
  }
  throw std::runtime_error("Unknown store_backend: " + config.store_backend);
}

std::shared_ptr<JobIdGenerator> RuntimeFactory::create_id_generator(const Config& config) {
  if (config.id_generator == "uuid") {
    return std::make_shared<UuidJobIdGenerator>();
  }
  if (config.id_generator == "sequential") {
    return std::make_shared<SequentialJobIdGenerator>();
  }
  throw std::runtime_error("Unknown id_generator: " + config.id_generator);
}

std::shared_ptr<async::WorkerPool> RuntimeFactory::create_worker_pool(const Config& config) {
  return std::make_shared<async::WorkerPool>(static_cast<size_t>(config.num_workers));
}

std::unique_ptr<JobRunner> RuntimeFactory::create_runner(const Config& config,
                                                         std::shared_ptr<JobStore> store,
                                                         std::shared_ptr<async::JobExecutor> executor) {
  return std::make_unique<JobRunner>(std::move(store), std::move(executor),
                                     create_id_generator(config), config.to_runner_options());
}

}  // namespace jobkeep_core
