#include "core/load_config.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
std::vector<std::string> readStringList(const json &section,
                                        const std::string &key) {
  std::vector<std::string> values;
  if (!section.contains(key))
    return values;
  const auto &list = section[key];
  if (!list.is_array())
    throw std::invalid_argument("warehouse." + key + " must be an array");
  for (const auto &item : list) {
    if (!item.is_string())
      throw std::invalid_argument("warehouse." + key + " must hold strings");
    values.push_back(item.get<std::string>());
  }
  return values;
}

template <typename T>
T readValue(const json &section, const std::string &key, const T &fallback) {
  if (!section.contains(key))
    return fallback;
  try {
    return section[key].get<T>();
  } catch (const json::exception &e) {
    throw std::invalid_argument("warehouse." + key +
                                " has the wrong type: " + e.what());
  }
}
} // namespace

bool WarehouseLoadConfig::shouldSkipComputingUserLatestTraits() const {
  return skipComputingUserLatestTraits ||
         StringUtils::contains(skipComputingUserLatestTraitsWorkspaceIds,
                               workspaceId);
}

bool WarehouseLoadConfig::shouldExplainStatements() const {
  return enableSqlStatementExecutionPlan ||
         StringUtils::contains(enableSqlStatementExecutionPlanWorkspaceIds,
                               workspaceId);
}

void WarehouseLoadConfig::setTxnRollbackTimeout(int seconds) {
  if (seconds < WarehouseDefaults::MIN_TXN_ROLLBACK_TIMEOUT_SECONDS ||
      seconds > WarehouseDefaults::MAX_TXN_ROLLBACK_TIMEOUT_SECONDS) {
    throw std::invalid_argument(
        "txn_rollback_timeout_seconds must be between " +
        std::to_string(WarehouseDefaults::MIN_TXN_ROLLBACK_TIMEOUT_SECONDS) +
        " and " +
        std::to_string(WarehouseDefaults::MAX_TXN_ROLLBACK_TIMEOUT_SECONDS) +
        ", got " + std::to_string(seconds));
  }
  txnRollbackTimeout = std::chrono::seconds(seconds);
}

WarehouseLoadConfig WarehouseLoadConfig::fromJson(const json &config) {
  WarehouseLoadConfig result;

  if (config.contains("warehouse")) {
    const auto &wh = config["warehouse"];
    if (!wh.is_object())
      throw std::invalid_argument("warehouse must be an object");

    result.schemaNamespace =
        readValue<std::string>(wh, "namespace", result.schemaNamespace);
    result.workspaceId =
        readValue<std::string>(wh, "workspace_id", result.workspaceId);
    result.destinationId =
        readValue<std::string>(wh, "destination_id", result.destinationId);

    result.skipComputingUserLatestTraits =
        readValue<bool>(wh, "skip_computing_user_latest_traits", false);
    result.skipComputingUserLatestTraitsWorkspaceIds = readStringList(
        wh, "skip_computing_user_latest_traits_workspace_ids");

    result.enableSqlStatementExecutionPlan =
        readValue<bool>(wh, "enable_sql_statement_execution_plan", false);
    result.enableSqlStatementExecutionPlanWorkspaceIds = readStringList(
        wh, "enable_sql_statement_execution_plan_workspace_ids");

    result.enableDeleteByJobs =
        readValue<bool>(wh, "enable_delete_by_jobs", false);

    result.setTxnRollbackTimeout(readValue<int>(
        wh, "txn_rollback_timeout_seconds",
        WarehouseDefaults::DEFAULT_TXN_ROLLBACK_TIMEOUT_SECONDS));

    int slowQuerySeconds =
        readValue<int>(wh, "slow_query_threshold_seconds",
                       WarehouseDefaults::DEFAULT_SLOW_QUERY_THRESHOLD_SECONDS);
    if (slowQuerySeconds <= 0) {
      throw std::invalid_argument(
          "slow_query_threshold_seconds must be positive");
    }
    result.slowQueryThreshold = std::chrono::seconds(slowQuerySeconds);

    result.recencyColumn =
        readValue<std::string>(wh, "recency_column", result.recencyColumn);
    if (result.recencyColumn.empty())
      throw std::invalid_argument("recency_column must not be empty");

    if (wh.contains("dedup_keys"))
      result.dedupKeys = DedupKeyRegistry::fromJson(wh["dedup_keys"]);
  }

  if (config.contains("logging") && config["logging"].is_object()) {
    const auto &logging = config["logging"];
    if (logging.contains("level") && logging["level"].is_string())
      result.logLevel = logging["level"].get<std::string>();
    if (logging.contains("file") && logging["file"].is_string())
      result.logFile = logging["file"].get<std::string>();
    if (logging.contains("show_thread_id") &&
        logging["show_thread_id"].is_boolean())
      result.showThreadId = logging["show_thread_id"].get<bool>();
  }

  return result;
}

WarehouseLoadConfig
WarehouseLoadConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    throw std::invalid_argument("Could not open config file: " + configPath);
  }

  json config;
  try {
    configFile >> config;
  } catch (const json::parse_error &e) {
    throw std::invalid_argument("Malformed config file " + configPath + ": " +
                                e.what());
  }

  WarehouseLoadConfig result = fromJson(config);
  Logger::info(LogCategory::CONFIG, "WarehouseLoadConfig",
               "Loaded warehouse config for namespace '" +
                   result.schemaNamespace + "' (workspace " +
                   result.workspaceId + ", rollback timeout " +
                   std::to_string(result.txnRollbackTimeout.count()) + "s)");
  return result;
}
