#pragma once

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "jobkeep_core/async/job_runner.hpp"

namespace jobkeep_core {

class Config {
 public:
  // memory | filesystem | sqlite
  std::string store_backend;
  std::string job_directory;
  std::string database_path;
  int db_pool_size;
  int num_workers;

  // uuid | sequential
  std::string id_generator;
  int terminal_save_attempts;
  int terminal_save_retry_ms;
  bool verify_unique_ids;
  bool recover_interrupted_on_start;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }
    Config config;

    // Apply defaults when keys are missing
    try {
      config.store_backend = json_config.value("store_backend", std::string("filesystem"));
      config.job_directory = json_config.value("job_directory", std::string("./data/jobs"));
      config.database_path = json_config.value("database_path", std::string("./data/jobs.db"));
      config.db_pool_size = json_config.value("db_pool_size", 4);
      config.num_workers = json_config.value("num_workers", 4);

      config.id_generator = json_config.value("id_generator", std::string("uuid"));
      config.terminal_save_attempts = json_config.value("terminal_save_attempts", 3);
      config.terminal_save_retry_ms = json_config.value("terminal_save_retry_ms", 50);
      config.verify_unique_ids = json_config.value("verify_unique_ids", true);
      config.recover_interrupted_on_start = json_config.value("recover_interrupted_on_start", false);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  RunnerOptions to_runner_options() const {
    RunnerOptions options;
    options.terminal_save_attempts = terminal_save_attempts;
    options.terminal_save_retry_delay = std::chrono::milliseconds(terminal_save_retry_ms);
    options.verify_unique_ids = verify_unique_ids;
    options.recover_interrupted_on_start = recover_interrupted_on_start;
    return options;
  }

 private:
  void validate() const {
    if (store_backend != "memory" && store_backend != "filesystem" && store_backend != "sqlite") {
      throw std::runtime_error("store_backend must be one of memory, filesystem, sqlite (got '" +
                               store_backend + "')");
    }
    if (store_backend == "filesystem" && job_directory.empty()) {
      throw std::runtime_error("job_directory cannot be empty when store_backend is filesystem");
    }
    if (store_backend == "sqlite" && database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty when store_backend is sqlite");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (id_generator != "uuid" && id_generator != "sequential") {
      throw std::runtime_error("id_generator must be uuid or sequential (got '" + id_generator + "')");
    }
    if (terminal_save_attempts < 2) {
      throw std::runtime_error("terminal_save_attempts must be at least 2");
    }
    if (terminal_save_retry_ms < 0) {
      throw std::runtime_error("terminal_save_retry_ms cannot be negative");
    }
  }
};

}  // namespace jobkeep_core
