#include "load/postgres_warehouse.h"
#include "core/logger.h"
#include "load/data_type_mapper.h"
#include "load/load_stats.h"
#include "load/staging_table_name.h"
#include "utils/string_utils.h"
#include <stdexcept>

PostgresWarehouse::PostgresWarehouse(const WarehouseLoadConfig &config,
                                     IWarehouseConnection &connection,
                                     const IUploadJob &uploadJob,
                                     ILoadFileDownloader &downloader)
    : config_(config), connection_(connection), uploadJob_(uploadJob),
      supervisor_(std::chrono::duration_cast<std::chrono::milliseconds>(
          config.txnRollbackTimeout)),
      loader_(connection, downloader, supervisor_, config.schemaNamespace,
              baseTags()),
      mergeEngine_(config.dedupKeys, config.schemaNamespace,
                   config.recencyColumn, config.shouldExplainStatements()) {}

LoadTags PostgresWarehouse::baseTags() const {
  LoadTags tags;
  tags.workspaceId = config_.workspaceId;
  tags.schemaNamespace = config_.schemaNamespace;
  tags.destinationId = config_.destinationId;
  return tags;
}

bool PostgresWarehouse::schemaExists(const LoadContext &ctx) {
  SqlRows rows = connection_.query(
      ctx,
      "SELECT EXISTS (SELECT 1 FROM pg_catalog.pg_namespace WHERE nspname = "
      "$1)",
      {config_.schemaNamespace});
  return !rows.empty() && !rows[0].empty() && rows[0][0] &&
         (*rows[0][0] == "t" || *rows[0][0] == "true");
}

void PostgresWarehouse::createSchema(const LoadContext &ctx) {
  try {
    if (schemaExists(ctx)) {
      Logger::info(LogCategory::DATABASE, "createSchema",
                   "Skipping creating schema " + config_.schemaNamespace +
                       " since it already exists");
      return;
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "createSchema",
                  "Error checking if schema " + config_.schemaNamespace +
                      " exists: " + std::string(e.what()));
    throw;
  }

  std::string sql = "CREATE SCHEMA IF NOT EXISTS " +
                    StringUtils::quoteIdentifier(config_.schemaNamespace);
  Logger::info(LogCategory::DATABASE, "createSchema",
               "Creating schema for destination " + config_.destinationId +
                   ": " + sql);
  connection_.exec(ctx, sql);
}

void PostgresWarehouse::createTable(const LoadContext &ctx,
                                    const std::string &tableName,
                                    const TableSchema &columns) {
  std::string sql =
      "CREATE TABLE IF NOT EXISTS " +
      StringUtils::qualifiedName(config_.schemaNamespace, tableName) + " ( " +
      DataTypeMapper::columnsWithDataTypes(columns) + " )";
  Logger::info(LogCategory::DATABASE, "createTable",
               "Creating table for destination " + config_.destinationId +
                   ": " + sql);
  connection_.exec(ctx, sql);
}

void PostgresWarehouse::addColumns(const LoadContext &ctx,
                                   const std::string &tableName,
                                   const std::vector<ColumnInfo> &columns) {
  if (columns.empty())
    return;

  std::vector<std::string> clauses;
  for (const auto &column : columns) {
    auto pgType = DataTypeMapper::toPostgres(column.type);
    if (!pgType) {
      throw std::invalid_argument("No Postgres type for column '" +
                                  column.name + "' of type '" + column.type +
                                  "'");
    }
    clauses.push_back(" ADD COLUMN IF NOT EXISTS " +
                      StringUtils::quoteIdentifier(column.name) + " " +
                      *pgType);
  }

  std::string sql =
      "ALTER TABLE " +
      StringUtils::qualifiedName(config_.schemaNamespace, tableName) +
      StringUtils::join(clauses, ",");
  Logger::info(LogCategory::DATABASE, "addColumns",
               "Adding columns for destination " + config_.destinationId +
                   ", table " + tableName + ": " + sql);
  connection_.exec(ctx, sql);
}

void PostgresWarehouse::dropTable(const LoadContext &ctx,
                                  const std::string &tableName) {
  std::string sql =
      "DROP TABLE " +
      StringUtils::qualifiedName(config_.schemaNamespace, tableName);
  Logger::info(LogCategory::DATABASE, "dropTable",
               "Dropping table for destination " + config_.destinationId +
                   ": " + sql);
  connection_.exec(ctx, sql);
}

FetchedSchema PostgresWarehouse::fetchSchema(const LoadContext &ctx) {
  FetchedSchema fetched;
  SqlRows rows;
  try {
    rows = connection_.query(
        ctx,
        "SELECT table_name, column_name, data_type "
        "FROM INFORMATION_SCHEMA.COLUMNS "
        "WHERE table_schema = $1 AND table_name NOT LIKE $2",
        {config_.schemaNamespace,
         StringUtils::escapeLikePattern(
             StagingTableName::prefix(WarehouseDefaults::PROVIDER)) +
             "%"});
  } catch (const ContextDoneError &) {
    throw;
  } catch (const std::exception &e) {
    throw std::runtime_error("fetching schema: " + std::string(e.what()));
  }

  for (const auto &row : rows) {
    if (row.size() < 3 || !row[0] || !row[1] || !row[2])
      continue;
    const std::string &tableName = *row[0];
    const std::string &columnName = *row[1];
    const std::string &columnType = *row[2];

    auto &tableSchema = fetched.schema[tableName];
    if (auto canonical = DataTypeMapper::toCanonical(columnType)) {
      tableSchema[columnName] = *canonical;
    } else {
      fetched.unrecognized[tableName][columnName] =
          WarehouseDefaults::MISSING_DATATYPE;
      auto tags = baseTags().toMap();
      tags["datatype"] = columnType;
      LoadStats::count("warehouse_missing_datatype", tags);
    }
  }
  return fetched;
}

long long PostgresWarehouse::getTotalCountInTable(const LoadContext &ctx,
                                                  const std::string &tableName) {
  SqlRows rows = connection_.query(
      ctx, "SELECT count(*) FROM " +
               StringUtils::qualifiedName(config_.schemaNamespace, tableName));
  if (rows.empty() || rows[0].empty() || !rows[0][0])
    return 0;
  return std::stoll(*rows[0][0]);
}

void PostgresWarehouse::testConnection(const LoadContext &ctx) {
  try {
    connection_.ping(ctx);
  } catch (const ContextDoneError &e) {
    if (ctx.deadlineExceeded())
      throw std::runtime_error("connection timeout: " + std::string(e.what()));
    throw std::runtime_error("pinging: " + std::string(e.what()));
  } catch (const std::exception &e) {
    throw std::runtime_error("pinging: " + std::string(e.what()));
  }
}

void PostgresWarehouse::loadTable(const LoadContext &ctx,
                                  const std::string &tableName) {
  LoadTags tags = baseTags();
  tags.tableName = tableName;
  try {
    StagedLoad staged = loader_.stage(
        ctx, tableName, uploadJob_.getTableSchemaInUpload(tableName));
    mergeEngine_.merge(ctx, staged);
  } catch (const LoadError &e) {
    tags.stage = e.stageName();
    LoadStats::count("load_table_failure", tags.toMap());
    throw;
  }
  LoadStats::count("load_table_success", tags.toMap());
}

std::map<std::string, TableLoadOutcome>
PostgresWarehouse::loadUserTables(const LoadContext &ctx) {
  IdentityResolutionMerger merger(
      connection_, loader_, mergeEngine_, uploadJob_, supervisor_,
      config_.schemaNamespace, config_.recencyColumn,
      config_.shouldSkipComputingUserLatestTraits(), baseTags());
  auto outcomes = merger.loadUserTables(ctx);

  for (const auto &[tableName, outcome] : outcomes) {
    LoadTags tags = baseTags();
    tags.tableName = tableName;
    if (outcome.success) {
      LoadStats::count("load_table_success", tags.toMap());
    } else {
      tags.stage = outcome.stage;
      LoadStats::count("load_table_failure", tags.toMap());
    }
  }
  return outcomes;
}

void PostgresWarehouse::deleteBy(const LoadContext &ctx,
                                 const std::vector<std::string> &tables,
                                 const DeleteByParams &params) {
  Logger::info(LogCategory::DATABASE, "deleteBy",
               "Cleaning up tables " + StringUtils::join(tables, ", ") +
                   " for source " + params.sourceId);
  if (!config_.enableDeleteByJobs)
    return;

  for (const auto &table : tables) {
    std::string sql =
        "DELETE FROM " +
        StringUtils::qualifiedName(config_.schemaNamespace, table) +
        " WHERE context_sources_job_run_id <> $1 AND "
        "context_sources_task_run_id <> $2 AND context_source_id = $3 AND " +
        StringUtils::quoteIdentifier(config_.recencyColumn) + " < $4";
    try {
      long long deleted =
          connection_.exec(ctx, sql,
                           {params.jobRunId, params.taskRunId, params.sourceId,
                            params.startTime});
      Logger::info(LogCategory::DATABASE, "deleteBy",
                   "Deleted " + std::to_string(deleted) + " rows from " +
                       table + " for destination " + config_.destinationId);
    } catch (const std::exception &e) {
      Logger::error(LogCategory::DATABASE, "deleteBy",
                    "Error deleting from " + table + ": " +
                        std::string(e.what()));
      throw;
    }
  }
}

bool PostgresWarehouse::crashRecover(const LoadContext &ctx) {
  CrashRecoverySweeper sweeper(connection_, config_.schemaNamespace);
  return sweeper.sweep(ctx);
}

void PostgresWarehouse::cleanup(const LoadContext &ctx) {
  crashRecover(ctx);
  connection_.close();
}
