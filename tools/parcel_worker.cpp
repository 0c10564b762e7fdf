#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <arrow/result.h>
#include <arrow/status.h>

#include "parcel/common/config.h"
#include "parcel/common/status.h"
#include "parcel/engine/duckdb_engine.h"
#include "parcel/execution/statement_executor.h"
#include "parcel/ledger/json_file_ledger.h"
#include "parcel/storage/filesystem_object_store.h"

using namespace parcel;

namespace {

struct WorkerOptions {
    std::string config_path;
    std::string ledger_dir = "./parcel_ledger";
    std::string store_uri;                   // Defaults to <cwd>/parcel_store
    std::string database_path = ":memory:";  // DuckDB database the SQL runs against
    std::vector<std::string> positional;
};

void PrintUsage(const char* program) {
    std::cout << "Parcel statement worker" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <command> <args>" << std::endl;
    std::cout << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  submit HANDLE SQL    Queue a job in the ledger" << std::endl;
    std::cout << "  run HANDLE           Execute a queued job and write its results" << std::endl;
    std::cout << "  status HANDLE        Print the ledger record of a job" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE        Executor config (JSON)" << std::endl;
    std::cout << "  --ledger-dir DIR     Ledger directory (default: ./parcel_ledger)" << std::endl;
    std::cout << "  --store-uri URI      Result store root (default: ./parcel_store)" << std::endl;
    std::cout << "  --database PATH      DuckDB database file (default: in-memory)" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
}

arrow::Result<WorkerOptions> ParseCommandLine(int argc, char* argv[]) {
    WorkerOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--ledger-dir" && i + 1 < argc) {
            options.ledger_dir = argv[++i];
        } else if (arg == "--store-uri" && i + 1 < argc) {
            options.store_uri = argv[++i];
        } else if (arg == "--database" && i + 1 < argc) {
            options.database_path = argv[++i];
        } else if (arg.rfind("--", 0) == 0) {
            return arrow::Status::Invalid("Unknown or incomplete option: ", arg);
        } else {
            options.positional.push_back(std::move(arg));
        }
    }

    if (options.store_uri.empty()) {
        options.store_uri = (std::filesystem::current_path() / "parcel_store").string();
    }
    return options;
}

arrow::Status Submit(const WorkerOptions& options, const std::string& handle,
                     const std::string& sql) {
    ARROW_ASSIGN_OR_RAISE(auto ledger, ledger::JsonFileLedger::Open(options.ledger_dir));

    ledger::JobRecord record;
    record.handle = handle;
    record.sql_text = sql;
    record.status = ledger::JobStatus::kQueued;
    record.submitted_by = "parcel_worker";
    ARROW_RETURN_NOT_OK(ledger->CreateJob(record));

    std::cout << "Queued " << handle << std::endl;
    return arrow::Status::OK();
}

arrow::Status Run(const WorkerOptions& options, const std::string& handle) {
    ExecutorConfig config;
    if (!options.config_path.empty()) {
        ARROW_ASSIGN_OR_RAISE(config, LoadExecutorConfig(options.config_path));
    }

    ARROW_ASSIGN_OR_RAISE(auto ledger, ledger::JsonFileLedger::Open(options.ledger_dir));

    engine::DuckDBEngineConfig engine_config;
    engine_config.database_path = options.database_path;
    ARROW_ASSIGN_OR_RAISE(auto engine, engine::DuckDBQueryEngine::Create(engine_config));

    ARROW_ASSIGN_OR_RAISE(auto store, storage::FileSystemObjectStore::FromUri(options.store_uri));

    ARROW_ASSIGN_OR_RAISE(auto executor,
                          execution::StatementExecutor::Create(ledger, engine, store, config));
    ARROW_ASSIGN_OR_RAISE(auto summary, executor->Execute(handle));

    std::cout << handle << ": " << ledger::JobStatusToString(summary.status) << std::endl;
    if (summary.error) {
        std::cout << "  error: " << *summary.error << std::endl;
        return arrow::Status::OK();
    }
    std::cout << "  rows: " << summary.total_rows << std::endl;
    std::cout << "  parts: " << summary.total_parts << std::endl;
    std::cout << "  size estimate: " << summary.total_size_estimate << " bytes" << std::endl;
    std::cout << "  manifest: " << summary.manifest_path << std::endl;
    for (const auto& [key, value] : summary.telemetry) {
        std::cout << "  " << key << ": " << value << std::endl;
    }
    return arrow::Status::OK();
}

arrow::Status PrintStatus(const WorkerOptions& options, const std::string& handle) {
    ARROW_ASSIGN_OR_RAISE(auto ledger, ledger::JsonFileLedger::Open(options.ledger_dir));
    ARROW_ASSIGN_OR_RAISE(auto record, ledger->GetJob(handle));
    std::cout << ledger::JobRecordToJson(record).dump(2) << std::endl;
    return arrow::Status::OK();
}

arrow::Status Dispatch(const WorkerOptions& options) {
    const auto& args = options.positional;
    if (args.empty()) {
        return arrow::Status::Invalid("No command given (expected submit, run or status)");
    }

    const std::string& command = args[0];
    if (command == "submit" && args.size() == 3) {
        return Submit(options, args[1], args[2]);
    }
    if (command == "run" && args.size() == 2) {
        return Run(options, args[1]);
    }
    if (command == "status" && args.size() == 2) {
        return PrintStatus(options, args[1]);
    }
    return arrow::Status::Invalid("Unknown command or wrong number of arguments: ", command);
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }
    }

    auto options = ParseCommandLine(argc, argv);
    if (!options.ok()) {
        std::cerr << options.status().message() << std::endl;
        PrintUsage(argv[0]);
        return 2;
    }

    auto status = Dispatch(*options);
    if (!status.ok()) {
        auto kind = GetJobErrorKind(status);
        std::cerr << "Error";
        if (kind) {
            std::cerr << " (" << JobErrorKindToString(*kind) << ")";
        }
        std::cerr << ": " << status.ToString() << std::endl;
        return 1;
    }
    return 0;
}
