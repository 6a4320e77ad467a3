#include "load/dedup_merge_engine.h"
#include "core/logger.h"
#include "utils/string_utils.h"

DedupMergeEngine::DedupMergeEngine(const DedupKeyRegistry &dedupKeys,
                                   std::string schemaNamespace,
                                   std::string recencyColumn,
                                   bool explainStatements)
    : dedupKeys_(dedupKeys), schemaNamespace_(std::move(schemaNamespace)),
      recencyColumn_(std::move(recencyColumn)),
      explainStatements_(explainStatements) {}

std::string DedupMergeEngine::buildDeleteStatement(
    const std::string &tableName, const std::string &stagingTableName) const {
  DedupKey key = dedupKeys_.lookup(tableName);
  std::string target = StringUtils::qualifiedName(schemaNamespace_, tableName);

  auto match = [&](const std::string &column) {
    std::string quoted = StringUtils::quoteIdentifier(column);
    return "_source." + quoted + " = " + target + "." + quoted;
  };

  std::string condition = match(key.primaryKey);
  for (const auto &column : key.partitionKey) {
    if (column != key.primaryKey)
      condition += " AND " + match(column);
  }

  return "DELETE FROM " + target + " USING " +
         StringUtils::qualifiedName(schemaNamespace_, stagingTableName) +
         " AS _source WHERE (" + condition + ")";
}

std::string DedupMergeEngine::buildInsertStatement(
    const std::string &tableName, const std::string &stagingTableName,
    const std::vector<std::string> &columns) const {
  DedupKey key = dedupKeys_.lookup(tableName);
  std::string quotedColumns = StringUtils::quoteAndJoin(columns);

  return "INSERT INTO " +
         StringUtils::qualifiedName(schemaNamespace_, tableName) + " (" +
         quotedColumns + ") SELECT " + quotedColumns +
         " FROM (SELECT *, row_number() OVER (PARTITION BY " +
         StringUtils::quoteAndJoin(key.partitionKey) + " ORDER BY " +
         StringUtils::quoteIdentifier(recencyColumn_) +
         " DESC) AS _staging_row_number FROM " +
         StringUtils::qualifiedName(schemaNamespace_, stagingTableName) +
         ") AS _ WHERE _staging_row_number = 1";
}

long long DedupMergeEngine::execWithOptionalPlan(const LoadContext &ctx,
                                                 ISqlExecutor &executor,
                                                 const std::string &sql) const {
  if (explainStatements_) {
    SqlRows plan = executor.query(ctx, "EXPLAIN " + sql);
    std::string planText;
    for (const auto &line : plan) {
      if (!line.empty() && line[0])
        planText += "\n" + *line[0];
    }
    Logger::info(LogCategory::MERGE, "execWithOptionalPlan",
                 "Execution plan for " + sql + ":" + planText);
  }
  return executor.exec(ctx, sql);
}

void DedupMergeEngine::merge(const LoadContext &ctx, StagedLoad &staged) const {
  const std::string &tableName = staged.tableName();
  ITransaction &transaction = staged.transaction();

  std::string deleteSql =
      buildDeleteStatement(tableName, staged.stagingTableName());
  Logger::info(LogCategory::MERGE, "DedupMergeEngine",
               "Deduplicating records for table " + tableName + ": " +
                   deleteSql);
  try {
    long long deleted = execWithOptionalPlan(ctx, transaction, deleteSql);
    Logger::debug(LogCategory::MERGE, "DedupMergeEngine",
                  "Deleted " + std::to_string(deleted) +
                      " superseded rows from " + tableName);
  } catch (const std::exception &e) {
    LoadError error = staged.failure(LoadStage::DELETE_DEDUP, e.what());
    staged.abort(LoadStage::DELETE_DEDUP);
    throw error;
  }

  std::string insertSql = buildInsertStatement(
      tableName, staged.stagingTableName(), staged.columns());
  Logger::info(LogCategory::MERGE, "DedupMergeEngine",
               "Inserting records for table " + tableName + ": " + insertSql);
  try {
    execWithOptionalPlan(ctx, transaction, insertSql);
  } catch (const std::exception &e) {
    LoadError error = staged.failure(LoadStage::INSERT_DEDUP, e.what());
    staged.abort(LoadStage::INSERT_DEDUP);
    throw error;
  }

  try {
    ctx.throwIfDone();
    transaction.commit();
  } catch (const std::exception &e) {
    LoadError error = staged.failure(LoadStage::DEDUP_STAGE, e.what());
    staged.abort(LoadStage::DEDUP_STAGE);
    throw error;
  }

  Logger::info(LogCategory::MERGE, "DedupMergeEngine",
               "Completed load for table " + tableName);
}
