#include "core/database_config.h"
#include "core/load_config.h"
#include "core/logger.h"
#include "load/error_classifier.h"
#include "load/local_load_file_downloader.h"
#include "load/manifest_upload_job.h"
#include "load/pg_executor.h"
#include "load/postgres_warehouse.h"
#include "utils/string_utils.h"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_UNKNOWN_ERROR = 5;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;

// Cancelled from the signal handler; every load step checks it.
LoadContext g_context;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_context.cancel();
  }
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (...) {
  }
}

struct CommandLine {
  std::string configPath = "config.json";
  std::string jobPath;
  std::string objectStoreRoot = ".";
  std::string workDir;
  bool sweepOnly = false;
};

void printUsage() {
  std::cerr << "Usage: warehouse_loader [--config config.json] --job job.json\n"
               "                        [--object-store DIR] [--work-dir DIR]\n"
               "       warehouse_loader [--config config.json] --sweep-only\n";
}

bool parseCommandLine(int argc, char *argv[], CommandLine &cmd) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&](std::string &target) {
      if (i + 1 >= argc)
        return false;
      target = argv[++i];
      return true;
    };

    if (arg == "--config") {
      if (!value(cmd.configPath))
        return false;
    } else if (arg == "--job") {
      if (!value(cmd.jobPath))
        return false;
    } else if (arg == "--object-store") {
      if (!value(cmd.objectStoreRoot))
        return false;
    } else if (arg == "--work-dir") {
      if (!value(cmd.workDir))
        return false;
    } else if (arg == "--sweep-only") {
      cmd.sweepOnly = true;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      return false;
    }
  }
  return cmd.sweepOnly || !cmd.jobPath.empty();
}

void reportFailure(const std::string &tableName, const std::string &stage,
                   const std::string &message) {
  JobErrorType kind = ErrorClassifier::classify(message);
  std::cout << tableName << ": FAILED at " << stage << " ("
            << ErrorClassifier::typeToString(kind) << "): " << message
            << std::endl;
}

// Creates missing tables and adds missing columns so the warehouse schema
// covers the upload schema, then records the result on the job.
void migrateSchema(PostgresWarehouse &warehouse, ManifestUploadJob &job) {
  warehouse.createSchema(g_context);

  FetchedSchema existing = warehouse.fetchSchema(g_context);
  for (const auto &tableName : job.tableNames()) {
    TableSchema upload = job.getTableSchemaInUpload(tableName);
    auto it = existing.schema.find(tableName);
    if (it == existing.schema.end()) {
      warehouse.createTable(g_context, tableName, upload);
      continue;
    }

    std::vector<ColumnInfo> missing;
    for (const auto &[column, type] : upload) {
      if (!it->second.count(column) &&
          !existing.unrecognized[tableName].count(column))
        missing.push_back(ColumnInfo{column, type});
    }
    warehouse.addColumns(g_context, tableName, missing);
  }

  job.setWarehouseSchema(warehouse.fetchSchema(g_context).schema);
}

bool loadTables(PostgresWarehouse &warehouse, const ManifestUploadJob &job) {
  bool allLoaded = true;
  std::vector<std::string> tables = job.tableNames();
  bool hasIdentifies = StringUtils::contains(
      tables, WarehouseDefaults::IDENTIFIES_TABLE);

  if (hasIdentifies) {
    for (const auto &[tableName, outcome] : warehouse.loadUserTables(g_context)) {
      if (outcome.success) {
        std::cout << tableName << ": ok" << std::endl;
      } else {
        allLoaded = false;
        reportFailure(tableName, outcome.stage, outcome.errorMessage);
      }
    }
  }

  for (const auto &tableName : tables) {
    if (hasIdentifies && (tableName == WarehouseDefaults::IDENTIFIES_TABLE ||
                          tableName == WarehouseDefaults::USERS_TABLE))
      continue;

    try {
      warehouse.loadTable(g_context, tableName);
      std::cout << tableName << ": ok" << std::endl;
    } catch (const LoadError &e) {
      allLoaded = false;
      reportFailure(tableName, e.stageName(), e.what());
    }
  }
  return allLoaded;
}
} // namespace

int main(int argc, char *argv[]) {
  CommandLine cmd;
  if (!parseCommandLine(argc, argv, cmd)) {
    printUsage();
    return EXIT_CONFIG_ERROR;
  }

  try {
    DatabaseConfig::loadFromFile(cmd.configPath);
    if (!DatabaseConfig::isInitialized()) {
      std::cerr << "Error: Database configuration failed to initialize. "
                   "Please check "
                << cmd.configPath << " or environment variables." << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    WarehouseLoadConfig config;
    try {
      config = WarehouseLoadConfig::loadFromFile(cmd.configPath);
    } catch (const std::invalid_argument &e) {
      std::cerr << "Configuration error: " << e.what() << std::endl;
      return EXIT_CONFIG_ERROR;
    }
    if (config.schemaNamespace.empty()) {
      std::cerr << "Configuration error: warehouse.namespace is required"
                << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    Logger::initialize(config.logFile);
    Logger::setLogLevel(config.logLevel);
    if (const char *envLevel = std::getenv("WAREHOUSE_LOG_LEVEL"))
      Logger::setLogLevel(envLevel);
    Logger::setShowThreadId(config.showThreadId);

    if (std::signal(SIGINT, signalHandler) == SIG_ERR ||
        std::signal(SIGTERM, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register signal handlers" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }

    Logger::info(LogCategory::SYSTEM, "main",
                 "warehouse_loader started for namespace " +
                     config.schemaNamespace + " (" +
                     DatabaseConfig::getPostgresConnectionStringForLogging() +
                     ")");

    ManifestUploadJob job =
        cmd.sweepOnly
            ? ManifestUploadJob::fromJson(
                  nlohmann::json{{"tables", nlohmann::json::object()}})
            : ManifestUploadJob::loadFromFile(cmd.jobPath);
    LocalLoadFileDownloader downloader(job, cmd.objectStoreRoot, cmd.workDir);
    PgConnection connection(
        DatabaseConfig::getPostgresConnectionString(),
        std::chrono::duration_cast<std::chrono::milliseconds>(
            config.slowQueryThreshold));
    PostgresWarehouse warehouse(config, connection, job, downloader);

    try {
      warehouse.testConnection(g_context);
    } catch (const std::exception &e) {
      JobErrorType kind = ErrorClassifier::classify(e.what());
      Logger::error(LogCategory::DATABASE, "main",
                    "Connection test failed (" +
                        ErrorClassifier::typeToString(kind) +
                        "): " + std::string(e.what()));
      std::cerr << "Initialization error: " << e.what() << std::endl;
      cleanupLogger();
      return EXIT_INIT_ERROR;
    }

    if (!warehouse.crashRecover(g_context)) {
      Logger::warning(LogCategory::RECOVERY, "main",
                      "Some dangling staging tables could not be dropped");
    }

    if (cmd.sweepOnly) {
      connection.close();
      cleanupLogger();
      return EXIT_SUCCESS_CODE;
    }

    bool allLoaded = false;
    try {
      migrateSchema(warehouse, job);
      allLoaded = loadTables(warehouse, job);
    } catch (const std::exception &e) {
      Logger::error(LogCategory::SYSTEM, "main",
                    "Exception during load: " + std::string(e.what()));
      std::cerr << "Execution error: " << e.what() << std::endl;
    }

    warehouse.cleanup(LoadContext());
    Logger::info(LogCategory::SYSTEM, "main",
                 allLoaded ? "warehouse_loader completed successfully"
                           : "warehouse_loader completed with failures");
    cleanupLogger();
    return allLoaded ? EXIT_SUCCESS_CODE : EXIT_EXECUTION_ERROR;

  } catch (const std::invalid_argument &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CONFIG_ERROR;
  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CRITICAL_ERROR;
  } catch (...) {
    std::cerr << "Unknown critical error in main" << std::endl;
    cleanupLogger();
    return EXIT_UNKNOWN_ERROR;
  }
}
