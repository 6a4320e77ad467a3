#include "load/crash_recovery_sweeper.h"
#include "core/logger.h"
#include "load/staging_table_name.h"
#include "utils/string_utils.h"

CrashRecoverySweeper::CrashRecoverySweeper(IWarehouseConnection &connection,
                                           std::string schemaNamespace,
                                           std::string provider)
    : connection_(connection), schemaNamespace_(std::move(schemaNamespace)),
      provider_(std::move(provider)) {}

std::vector<std::string>
CrashRecoverySweeper::findDanglingStagingTables(const LoadContext &ctx) {
  std::string pattern =
      StringUtils::escapeLikePattern(StagingTableName::prefix(provider_)) +
      "%";
  SqlRows rows = connection_.query(
      ctx,
      "SELECT table_name FROM information_schema.tables "
      "WHERE table_schema = $1 AND table_name LIKE $2",
      {schemaNamespace_, pattern});

  std::vector<std::string> tables;
  for (const auto &row : rows) {
    if (row.empty() || !row[0])
      continue;
    if (StagingTableName::isStagingTable(provider_, *row[0]))
      tables.push_back(*row[0]);
  }
  return tables;
}

bool CrashRecoverySweeper::sweep(const LoadContext &ctx) {
  std::vector<std::string> tables;
  try {
    tables = findDanglingStagingTables(ctx);
  } catch (const std::exception &e) {
    Logger::error(LogCategory::RECOVERY, "CrashRecoverySweeper",
                  "Error fetching dangling staging tables in " +
                      schemaNamespace_ + ": " + std::string(e.what()));
    return false;
  }

  if (tables.empty()) {
    Logger::debug(LogCategory::RECOVERY, "CrashRecoverySweeper",
                  "No dangling staging tables in " + schemaNamespace_);
    return true;
  }

  Logger::info(LogCategory::RECOVERY, "CrashRecoverySweeper",
               "Dropping " + std::to_string(tables.size()) +
                   " dangling staging tables in " + schemaNamespace_ + ": " +
                   StringUtils::join(tables, ", "));

  bool allDropped = true;
  for (const auto &table : tables) {
    try {
      connection_.exec(ctx,
                       "DROP TABLE " +
                           StringUtils::qualifiedName(schemaNamespace_, table));
    } catch (const std::exception &e) {
      Logger::error(LogCategory::RECOVERY, "CrashRecoverySweeper",
                    "Error dropping dangling staging table " + table + ": " +
                        std::string(e.what()));
      allDropped = false;
    }
  }
  return allDropped;
}
