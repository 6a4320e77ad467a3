#ifndef POSTGRES_WAREHOUSE_H
#define POSTGRES_WAREHOUSE_H

#include "core/load_config.h"
#include "load/crash_recovery_sweeper.h"
#include "load/dedup_merge_engine.h"
#include "load/error_classifier.h"
#include "load/identity_resolution_merger.h"
#include "load/load_file_source.h"
#include "load/rollback_supervisor.h"
#include "load/staging_table_loader.h"
#include "load/table_schema.h"
#include <map>
#include <string>
#include <vector>

struct ColumnInfo {
  std::string name;
  std::string type;
};

struct DeleteByParams {
  std::string jobRunId;
  std::string taskRunId;
  std::string sourceId;
  // Timestamp literal accepted by Postgres, e.g. 2024-01-01T00:00:00Z.
  std::string startTime;
};

struct FetchedSchema {
  Schema schema;
  // Columns whose Postgres type has no canonical mapping, typed
  // <missing_datatype>.
  Schema unrecognized;
};

// Postgres destination for one namespace: schema management plus the table
// load paths. Statements outside a load run on the bare connection.
class PostgresWarehouse {
public:
  PostgresWarehouse(const WarehouseLoadConfig &config,
                    IWarehouseConnection &connection,
                    const IUploadJob &uploadJob,
                    ILoadFileDownloader &downloader);

  PostgresWarehouse(const PostgresWarehouse &) = delete;
  PostgresWarehouse &operator=(const PostgresWarehouse &) = delete;

  void createSchema(const LoadContext &ctx);
  void createTable(const LoadContext &ctx, const std::string &tableName,
                   const TableSchema &columns);
  void addColumns(const LoadContext &ctx, const std::string &tableName,
                  const std::vector<ColumnInfo> &columns);
  void dropTable(const LoadContext &ctx, const std::string &tableName);
  FetchedSchema fetchSchema(const LoadContext &ctx);
  long long getTotalCountInTable(const LoadContext &ctx,
                                 const std::string &tableName);
  void testConnection(const LoadContext &ctx);

  // Throws LoadError.
  void loadTable(const LoadContext &ctx, const std::string &tableName);
  std::map<std::string, TableLoadOutcome>
  loadUserTables(const LoadContext &ctx);

  // Retention delete. A no-op unless enable_delete_by_jobs is set.
  void deleteBy(const LoadContext &ctx, const std::vector<std::string> &tables,
                const DeleteByParams &params);

  bool crashRecover(const LoadContext &ctx);
  // Sweeps staging tables, then closes the connection.
  void cleanup(const LoadContext &ctx);

  static const std::vector<JobError> &errorMappings() {
    return ErrorClassifier::errorMappings();
  }

  const WarehouseLoadConfig &config() const { return config_; }

private:
  LoadTags baseTags() const;
  bool schemaExists(const LoadContext &ctx);

  const WarehouseLoadConfig &config_;
  IWarehouseConnection &connection_;
  const IUploadJob &uploadJob_;
  RollbackSupervisor supervisor_;
  StagingTableLoader loader_;
  DedupMergeEngine mergeEngine_;
};

#endif
