#include "jobkeep_cli/cli_handler.hpp"
#include "jobkeep_core/config.hpp"
#include "jobkeep_core/runtime_factory.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
  try
  {
    // Parse command line arguments
    jobkeep_cli::CliOptions options = jobkeep_cli::CliHandler::parse_arguments(argc, argv);

    if (options.command == jobkeep_cli::Command::Help)
    {
      jobkeep_cli::CliHandler::print_help(std::cout);
      return jobkeep_cli::kExitOk;
    }

    // Open the store the config describes
    std::string config_path = jobkeep_cli::CliHandler::resolve_config_path(options);
    jobkeep_core::Config config = jobkeep_core::Config::from_file(config_path);
    auto store = jobkeep_core::RuntimeFactory::create_store(config);

    // Create CLI handler and execute the command
    jobkeep_cli::CliHandler handler(store);
    return handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
