#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "jobkeep_core/store/job_store.hpp"

namespace jobkeep_cli
{

  enum class Command
  {
    Show,
    Progress,
    Wait,
    List,
    Recover,
    Clear,
    Help
  };

  // Exit codes returned by execute_command (errors are thrown and exit 1)
  constexpr int kExitOk = 0;
  constexpr int kExitTimedOut = 2;

  struct CliOptions
  {
    Command command = Command::Help;
    std::string job_id;
    std::string state;
    int timeout_ms = 30000;
    int older_than_days = 7;
    bool json_output = false;
    std::string config_path;  // empty: $JOBKEEP_CONFIG, then jobkeeprc.json
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    // store may be null for commands that do not touch it (help)
    explicit CliHandler(std::shared_ptr<jobkeep_core::JobStore> store, std::ostream &out = std::cout);

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments. Throws CliError on bad usage.
    static CliOptions parse_arguments(int argc, char *argv[]);

    // --config, else $JOBKEEP_CONFIG, else jobkeeprc.json
    static std::string resolve_config_path(const CliOptions &options);

    // Execute command. Returns the exit code; failures throw.
    int execute_command(const CliOptions &options);

    static void print_help(std::ostream &out);

  private:
    std::shared_ptr<jobkeep_core::JobStore> store_;
    std::ostream &out_;

    // Command handlers
    int handle_show_command(const CliOptions &options);
    int handle_progress_command(const CliOptions &options);
    int handle_wait_command(const CliOptions &options);
    int handle_list_command(const CliOptions &options);
    int handle_recover_command(const CliOptions &options);
    int handle_clear_command(const CliOptions &options);

    // Helper methods
    jobkeep_core::JobStore &require_store();
    void print_json_response(const nlohmann::json &response);
    void print_record(const jobkeep_core::JobRecord &record);
  };

}
