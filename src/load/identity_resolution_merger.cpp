#include "load/identity_resolution_merger.h"
#include "core/logger.h"
#include "core/warehouse_defaults.h"
#include "load/staging_table_name.h"
#include "utils/string_utils.h"

namespace {
TableLoadOutcome failedOutcome(const LoadError &e) {
  TableLoadOutcome outcome;
  outcome.success = false;
  outcome.stage = e.stageName();
  outcome.errorMessage = e.what();
  return outcome;
}

TableLoadOutcome failedOutcome(LoadStage stage, const std::string &message) {
  TableLoadOutcome outcome;
  outcome.success = false;
  outcome.stage = loadStageToString(stage);
  outcome.errorMessage = message;
  return outcome;
}
} // namespace

IdentityResolutionMerger::IdentityResolutionMerger(
    IWarehouseConnection &connection, StagingTableLoader &loader,
    const DedupMergeEngine &mergeEngine, const IUploadJob &uploadJob,
    const RollbackSupervisor &supervisor, std::string schemaNamespace,
    std::string recencyColumn, bool skipComputingUserLatestTraits,
    LoadTags baseTags)
    : connection_(connection), loader_(loader), mergeEngine_(mergeEngine),
      uploadJob_(uploadJob), supervisor_(supervisor),
      schemaNamespace_(std::move(schemaNamespace)),
      recencyColumn_(std::move(recencyColumn)),
      skipComputingUserLatestTraits_(skipComputingUserLatestTraits),
      baseTags_(std::move(baseTags)) {}

std::string IdentityResolutionMerger::buildUnionStatement(
    const std::string &identifyStagingTable,
    const std::string &unionStagingTable,
    const std::vector<std::string> &userColumns) const {
  const std::string userId =
      StringUtils::quoteIdentifier(WarehouseDefaults::IDENTIFY_USER_ID_COLUMN);
  const std::string identifies =
      StringUtils::qualifiedName(schemaNamespace_, identifyStagingTable);
  std::string attributes;
  for (const auto &column : userColumns)
    attributes += ", " + StringUtils::quoteIdentifier(column);

  return "CREATE TABLE " +
         StringUtils::qualifiedName(schemaNamespace_, unionStagingTable) +
         " AS ((SELECT \"id\"" + attributes + " FROM " +
         StringUtils::qualifiedName(schemaNamespace_,
                                    WarehouseDefaults::USERS_TABLE) +
         " WHERE \"id\" IN (SELECT " + userId + " FROM " + identifies +
         " WHERE " + userId + " IS NOT NULL)) UNION (SELECT " + userId +
         attributes + " FROM " + identifies + " WHERE " + userId +
         " IS NOT NULL))";
}

std::string IdentityResolutionMerger::buildLatestTraitsStatement(
    const std::string &unionStagingTable, const std::string &usersStagingTable,
    const std::vector<std::string> &userColumns) const {
  const std::string unionTable =
      StringUtils::qualifiedName(schemaNamespace_, unionStagingTable);
  const std::string recency = StringUtils::quoteIdentifier(recencyColumn_);

  std::string projections = "x.\"id\"";
  for (const auto &column : userColumns) {
    std::string quoted = StringUtils::quoteIdentifier(column);
    projections += ", (SELECT " + quoted + " FROM " + unionTable +
                   " AS staging_table WHERE x.\"id\" = staging_table.\"id\""
                   " AND " + quoted + " IS NOT NULL ORDER BY " + recency +
                   " DESC LIMIT 1) AS " + quoted;
  }

  return "CREATE TABLE " +
         StringUtils::qualifiedName(schemaNamespace_, usersStagingTable) +
         " AS (SELECT DISTINCT * FROM (SELECT " + projections + " FROM " +
         unionTable + " AS x) AS xyz)";
}

std::map<std::string, TableLoadOutcome>
IdentityResolutionMerger::loadUserTables(const LoadContext &ctx) {
  std::map<std::string, TableLoadOutcome> outcomes;
  outcomes[WarehouseDefaults::IDENTIFIES_TABLE] = TableLoadOutcome{};

  Logger::info(LogCategory::MERGE, "IdentityResolutionMerger",
               "Starting load for identifies and users tables in " +
                   schemaNamespace_);

  // Declared first so the identify staging table outlives the users merge
  // that reads it and is dropped last.
  ScopedStagingTable identifyStaging;
  try {
    StagedLoad staged = loader_.stage(
        ctx, WarehouseDefaults::IDENTIFIES_TABLE,
        uploadJob_.getTableSchemaInUpload(WarehouseDefaults::IDENTIFIES_TABLE),
        true);
    identifyStaging = ScopedStagingTable(connection_, schemaNamespace_,
                                         staged.stagingTableName());
    mergeEngine_.merge(ctx, staged);
  } catch (const LoadError &e) {
    outcomes[WarehouseDefaults::IDENTIFIES_TABLE] = failedOutcome(e);
    return outcomes;
  }

  TableSchema usersUpload =
      uploadJob_.getTableSchemaInUpload(WarehouseDefaults::USERS_TABLE);
  if (usersUpload.empty())
    return outcomes;

  if (skipComputingUserLatestTraits_) {
    Logger::info(LogCategory::MERGE, "IdentityResolutionMerger",
                 "Skipping latest user traits computation for " +
                     schemaNamespace_ + ", loading users directly");
    try {
      StagedLoad staged =
          loader_.stage(ctx, WarehouseDefaults::USERS_TABLE, usersUpload);
      mergeEngine_.merge(ctx, staged);
      outcomes[WarehouseDefaults::USERS_TABLE] = TableLoadOutcome{};
    } catch (const LoadError &e) {
      outcomes[WarehouseDefaults::USERS_TABLE] = failedOutcome(e);
    }
    return outcomes;
  }

  outcomes[WarehouseDefaults::USERS_TABLE] =
      mergeUsers(ctx, identifyStaging.name());
  return outcomes;
}

TableLoadOutcome
IdentityResolutionMerger::mergeUsers(const LoadContext &ctx,
                                     const std::string &identifyStagingTable) {
  LoadTags tags = baseTags_;
  tags.schemaNamespace = schemaNamespace_;
  tags.tableName = WarehouseDefaults::USERS_TABLE;

  std::vector<std::string> userColumns;
  for (const auto &[column, type] :
       uploadJob_.getTableSchemaInWarehouse(WarehouseDefaults::USERS_TABLE)) {
    if (column != "id")
      userColumns.push_back(column);
  }

  const std::string unionStagingTable = StagingTableName::generate(
      WarehouseDefaults::PROVIDER, WarehouseDefaults::USERS_IDENTIFIES_UNION);
  const std::string usersStagingTable = StagingTableName::generate(
      WarehouseDefaults::PROVIDER, WarehouseDefaults::USERS_TABLE);
  ScopedStagingTable usersStaging(connection_, schemaNamespace_,
                                  usersStagingTable);
  ScopedStagingTable unionStaging(connection_, schemaNamespace_,
                                  unionStagingTable);

  std::string sql = buildUnionStatement(identifyStagingTable,
                                        unionStagingTable, userColumns);
  Logger::info(LogCategory::MERGE, "IdentityResolutionMerger",
               "Creating union of users table with identify staging table: " +
                   sql);
  try {
    connection_.exec(ctx, sql);
  } catch (const std::exception &e) {
    return failedOutcome(LoadStage::CREATE_USERS_UNION_TABLE, e.what());
  }

  sql = buildLatestTraitsStatement(unionStagingTable, usersStagingTable,
                                   userColumns);
  Logger::debug(LogCategory::MERGE, "IdentityResolutionMerger",
                "Creating staging table for users: " + sql);
  try {
    connection_.exec(ctx, sql);
  } catch (const std::exception &e) {
    return failedOutcome(LoadStage::CREATE_USERS_STAGING_TABLE, e.what());
  }

  std::shared_ptr<ITransaction> transaction;
  try {
    transaction = connection_.begin(ctx);
  } catch (const std::exception &e) {
    return failedOutcome(LoadStage::BEGIN_TRANSACTION, e.what());
  }

  std::vector<std::string> columns = {"id"};
  columns.insert(columns.end(), userColumns.begin(), userColumns.end());
  StagedLoad staged(std::move(transaction), WarehouseDefaults::USERS_TABLE,
                    usersStagingTable, columns, supervisor_, tags);

  auto fail = [&](LoadStage stage, const std::string &message) {
    LoadError error = staged.failure(stage, message);
    staged.abort(stage);
    return failedOutcome(error);
  };

  sql = mergeEngine_.buildDeleteStatement(WarehouseDefaults::USERS_TABLE,
                                          usersStagingTable);
  Logger::info(LogCategory::MERGE, "IdentityResolutionMerger",
               "Dedup records for table users using staging table: " + sql);
  try {
    mergeEngine_.execWithOptionalPlan(ctx, staged.transaction(), sql);
  } catch (const std::exception &e) {
    return fail(LoadStage::DELETE_DEDUP, e.what());
  }

  const std::string quotedColumns = StringUtils::quoteAndJoin(columns);
  sql = "INSERT INTO " +
        StringUtils::qualifiedName(schemaNamespace_,
                                   WarehouseDefaults::USERS_TABLE) +
        " (" + quotedColumns + ") SELECT " + quotedColumns + " FROM " +
        StringUtils::qualifiedName(schemaNamespace_, usersStagingTable);
  Logger::info(LogCategory::MERGE, "IdentityResolutionMerger",
               "Inserting records for table users using staging table: " +
                   sql);
  try {
    mergeEngine_.execWithOptionalPlan(ctx, staged.transaction(), sql);
  } catch (const std::exception &e) {
    return fail(LoadStage::INSERT_DEDUP, e.what());
  }

  try {
    ctx.throwIfDone();
    staged.transaction().commit();
  } catch (const std::exception &e) {
    return fail(LoadStage::DEDUP_STAGE, e.what());
  }

  Logger::info(LogCategory::MERGE, "IdentityResolutionMerger",
               "Completed load for users table in " + schemaNamespace_);
  return TableLoadOutcome{};
}
