#include "jobkeep_cli/cli_handler.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <vector>

#include "jobkeep_core/async/job_store_ops.hpp"
#include "jobkeep_core/db/sqlite_job_store.hpp"

namespace jobkeep_cli {

namespace {

int parse_int_flag(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Invalid value for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw CliError("Invalid value for " + flag + ": " + value);
    }
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

CliHandler::CliHandler(std::shared_ptr<jobkeep_core::JobStore> store, std::ostream& out)
    : store_(std::move(store)), out_(out) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    // Global flags may appear anywhere; everything else is positional
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json" || arg == "-j") {
            options.json_output = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                throw CliError("--config requires a path");
            }
            options.config_path = argv[++i];
        } else if (arg == "--timeout-ms" || arg == "-t") {
            if (i + 1 >= argc) {
                throw CliError("--timeout-ms requires a value");
            }
            options.timeout_ms = parse_int_flag(arg, argv[++i]);
            if (options.timeout_ms < 0) {
                throw CliError("--timeout-ms cannot be negative");
            }
        } else if (arg == "--days" || arg == "-d") {
            if (i + 1 >= argc) {
                throw CliError("--days requires a value");
            }
            options.older_than_days = parse_int_flag(arg, argv[++i]);
            if (options.older_than_days < 0) {
                throw CliError("--days cannot be negative");
            }
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        options.command = Command::Help;
        return options;
    }

    const std::string& command = positional[0];
    auto require_argument = [&](const std::string& usage) -> std::string {
        if (positional.size() < 2) {
            throw CliError("Missing argument. Usage: " + usage);
        }
        return positional[1];
    };

    if (command == "show" || command == "s") {
        options.command = Command::Show;
        options.job_id = require_argument("show <job_id>");
    } else if (command == "progress" || command == "p") {
        options.command = Command::Progress;
        options.job_id = require_argument("progress <job_id>");
    } else if (command == "wait" || command == "w") {
        options.command = Command::Wait;
        options.job_id = require_argument("wait <job_id> [--timeout-ms N]");
    } else if (command == "list" || command == "l") {
        options.command = Command::List;
        options.state = to_upper(require_argument("list <pending|running|succeeded|failed>"));
        try {
            jobkeep_core::job_state_from_string(options.state);
        } catch (const std::invalid_argument&) {
            throw CliError("Unknown state: " + positional[1]);
        }
    } else if (command == "recover") {
        options.command = Command::Recover;
    } else if (command == "clear") {
        options.command = Command::Clear;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

std::string CliHandler::resolve_config_path(const CliOptions& options) {
    if (!options.config_path.empty()) {
        return options.config_path;
    }
    const char* env_path = std::getenv("JOBKEEP_CONFIG");
    if (env_path && *env_path) {
        return env_path;
    }
    return "jobkeeprc.json";
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Show:
            return handle_show_command(options);
        case Command::Progress:
            return handle_progress_command(options);
        case Command::Wait:
            return handle_wait_command(options);
        case Command::List:
            return handle_list_command(options);
        case Command::Recover:
            return handle_recover_command(options);
        case Command::Clear:
            return handle_clear_command(options);
        case Command::Help:
            print_help(out_);
            return kExitOk;
    }
    return kExitOk;
}

int CliHandler::handle_show_command(const CliOptions& options) {
    jobkeep_core::JobRecord record =
        jobkeep_core::load_job(require_store(), jobkeep_core::JobId(options.job_id));
    if (options.json_output) {
        print_json_response(record);
    } else {
        print_record(record);
    }
    return kExitOk;
}

int CliHandler::handle_progress_command(const CliOptions& options) {
    jobkeep_core::JobId id(options.job_id);
    jobkeep_core::JobStore& store = require_store();
    // Unknown jobs are an error; a known job may simply not have reported yet
    jobkeep_core::load_job(store, id);

    std::optional<jobkeep_core::JobProgress> progress = store.load_progress(id);
    if (options.json_output) {
        print_json_response(progress ? nlohmann::json(*progress) : nlohmann::json(nullptr));
        return kExitOk;
    }
    if (!progress) {
        out_ << "No progress reported for job " << id << std::endl;
        return kExitOk;
    }
    out_ << "Job " << id << ": " << std::fixed << std::setprecision(1)
         << progress->progress_percent * 100.0f << "% " << progress->status_message
         << " (updated " << jobkeep_core::time_point_to_string(progress->updated_at) << ")"
         << std::endl;
    return kExitOk;
}

int CliHandler::handle_wait_command(const CliOptions& options) {
    jobkeep_core::JobId id(options.job_id);
    std::optional<jobkeep_core::JobRecord> record = jobkeep_core::wait_for_terminal(
        require_store(), id, std::chrono::milliseconds(options.timeout_ms));
    if (!record) {
        if (options.json_output) {
            print_json_response(nullptr);
        } else {
            out_ << "Timed out after " << options.timeout_ms << " ms waiting for job " << id
                 << std::endl;
        }
        return kExitTimedOut;
    }
    if (options.json_output) {
        print_json_response(*record);
    } else {
        print_record(*record);
    }
    return kExitOk;
}

int CliHandler::handle_list_command(const CliOptions& options) {
    jobkeep_core::JobState state = jobkeep_core::job_state_from_string(options.state);
    std::vector<jobkeep_core::JobRecord> records = require_store().list_by_state(state);

    if (options.json_output) {
        print_json_response(records);
        return kExitOk;
    }

    out_ << "\n=== " << options.state << " jobs ===" << std::endl;
    if (records.empty()) {
        out_ << "No jobs found." << std::endl;
        return kExitOk;
    }
    for (const auto& record : records) {
        out_ << "  " << record.id << "  updated "
             << jobkeep_core::time_point_to_string(record.updated_at) << std::endl;
    }
    out_ << records.size() << " job(s)" << std::endl;
    return kExitOk;
}

int CliHandler::handle_recover_command(const CliOptions& options) {
    size_t count = jobkeep_core::fail_interrupted_jobs(require_store());
    if (options.json_output) {
        print_json_response({{"recovered", count}});
    } else {
        out_ << "Marked " << count << " interrupted job(s) as FAILED" << std::endl;
    }
    return kExitOk;
}

int CliHandler::handle_clear_command(const CliOptions& options) {
    auto sqlite_store = std::dynamic_pointer_cast<jobkeep_core::SqliteJobStore>(store_);
    if (!sqlite_store) {
        throw CliError("clear is only supported by the sqlite store backend");
    }
    size_t removed = sqlite_store->clear_terminal_records(options.older_than_days);
    if (options.json_output) {
        print_json_response({{"removed", removed}, {"older_than_days", options.older_than_days}});
    } else {
        out_ << "Removed " << removed << " finished job(s) older than " << options.older_than_days
             << " days" << std::endl;
    }
    return kExitOk;
}

jobkeep_core::JobStore& CliHandler::require_store() {
    if (!store_) {
        throw CliError("No job store configured");
    }
    return *store_;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    out_ << response.dump(2) << std::endl;
}

void CliHandler::print_record(const jobkeep_core::JobRecord& record) {
    out_ << "Job:      " << record.id << std::endl;
    out_ << "State:    " << jobkeep_core::to_string(record.status.state());
    if (record.status.is_abnormal()) {
        out_ << " (abnormal)";
    }
    out_ << std::endl;
    if (record.status.state() == jobkeep_core::JobState::SUCCEEDED) {
        out_ << "Result:   " << record.status.payload().dump() << std::endl;
    } else if (record.status.state() == jobkeep_core::JobState::FAILED) {
        out_ << "Error:    " << record.status.payload().dump() << std::endl;
    }
    if (!record.metadata.is_null()) {
        out_ << "Metadata: " << record.metadata.dump() << std::endl;
    }
    out_ << "Created:  " << jobkeep_core::time_point_to_string(record.created_at) << std::endl;
    out_ << "Updated:  " << jobkeep_core::time_point_to_string(record.updated_at) << std::endl;
}

void CliHandler::print_help(std::ostream& out) {
    out << R"(
jobkeep CLI - Inspect persisted jobs

Usage: jobkeep_cli [--config <path>] [--json] <command> [options]

Commands:
  show, s <job_id>          Show the stored record of a job
  progress, p <job_id>      Show the last progress a job reported
  wait, w <job_id>          Block until the job reaches a terminal state
    --timeout-ms, -t <ms>   Give up after this long (default: 30000, exit code 2)
  list, l <state>           List jobs in a state (pending, running, succeeded, failed)
  recover                   Mark PENDING/RUNNING jobs as FAILED after a crash.
                            Only run it while no process is executing jobs.
  clear                     Delete finished jobs (sqlite backend only)
    --days, -d <num>        Only jobs last updated more than this many days ago (default: 7)
  help, h                   Show this help message

Global options:
  --config, -c <path>       Config file (default: $JOBKEEP_CONFIG, then jobkeeprc.json)
  --json, -j                Print raw JSON
)" << std::endl;
}

} // namespace jobkeep_cli
