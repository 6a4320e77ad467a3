#ifndef LOAD_CONFIG_H
#define LOAD_CONFIG_H

#include "core/warehouse_defaults.h"
#include "load/dedup_key_registry.h"
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Per-destination load settings. Unlike DatabaseConfig this is a value that
// is handed to the warehouse facade, so tests can build one inline.
struct WarehouseLoadConfig {
  std::string schemaNamespace;
  std::string workspaceId;
  std::string destinationId;

  bool skipComputingUserLatestTraits = false;
  std::vector<std::string> skipComputingUserLatestTraitsWorkspaceIds;

  bool enableSqlStatementExecutionPlan = false;
  std::vector<std::string> enableSqlStatementExecutionPlanWorkspaceIds;

  bool enableDeleteByJobs = false;

  std::chrono::seconds txnRollbackTimeout{
      WarehouseDefaults::DEFAULT_TXN_ROLLBACK_TIMEOUT_SECONDS};
  std::chrono::seconds slowQueryThreshold{
      WarehouseDefaults::DEFAULT_SLOW_QUERY_THRESHOLD_SECONDS};

  std::string recencyColumn = WarehouseDefaults::RECENCY_COLUMN;
  DedupKeyRegistry dedupKeys = DedupKeyRegistry::withDefaults();

  std::string logLevel = "INFO";
  std::string logFile;
  bool showThreadId = false;

  bool shouldSkipComputingUserLatestTraits() const;
  bool shouldExplainStatements() const;

  // Throws std::invalid_argument outside [1, 3600] seconds.
  void setTxnRollbackTimeout(int seconds);

  // Reads the "warehouse" and "logging" objects. Throws
  // std::invalid_argument when a value is present but invalid.
  static WarehouseLoadConfig fromJson(const nlohmann::json &config);
  static WarehouseLoadConfig loadFromFile(const std::string &configPath);
};

#endif
