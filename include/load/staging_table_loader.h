#ifndef STAGING_TABLE_LOADER_H
#define STAGING_TABLE_LOADER_H

#include "load/load_error.h"
#include "load/load_file_source.h"
#include "load/load_tags.h"
#include "load/rollback_supervisor.h"
#include "load/sql_executor.h"
#include "load/table_schema.h"
#include <memory>
#include <string>
#include <vector>

// Local copies of downloaded load files, removed on destruction.
class LocalFileSet {
  std::vector<std::string> paths_;

public:
  LocalFileSet() = default;
  explicit LocalFileSet(std::vector<std::string> paths)
      : paths_(std::move(paths)) {}
  ~LocalFileSet();

  LocalFileSet(const LocalFileSet &) = delete;
  LocalFileSet &operator=(const LocalFileSet &) = delete;

  const std::vector<std::string> &paths() const { return paths_; }
};

// Drops a staging table through the bare connection when it goes out of
// scope, whether the load committed or not. release() hands the drop over to
// the caller.
class ScopedStagingTable {
  IWarehouseConnection *connection_ = nullptr;
  std::string schemaNamespace_;
  std::string name_;

public:
  ScopedStagingTable() = default;
  ScopedStagingTable(IWarehouseConnection &connection,
                     std::string schemaNamespace, std::string name);
  ~ScopedStagingTable();

  ScopedStagingTable(ScopedStagingTable &&other) noexcept;
  ScopedStagingTable &operator=(ScopedStagingTable &&other) noexcept;
  ScopedStagingTable(const ScopedStagingTable &) = delete;
  ScopedStagingTable &operator=(const ScopedStagingTable &) = delete;

  const std::string &name() const { return name_; }
  bool armed() const { return connection_ != nullptr && !name_.empty(); }

  // Drops now. Failures are logged, never thrown.
  void drop();
  std::string release();
};

// A populated staging table plus the still-open transaction it was loaded
// in. Whoever holds it either commits through it or lets it go: destruction
// first rolls back an open transaction through the supervisor, then drops
// the staging table unless cleanup was deferred.
class StagedLoad {
public:
  StagedLoad(std::shared_ptr<ITransaction> transaction, std::string tableName,
             std::string stagingTableName, std::vector<std::string> columns,
             const RollbackSupervisor &supervisor, LoadTags tags);
  ~StagedLoad();

  StagedLoad(StagedLoad &&) noexcept = default;
  StagedLoad &operator=(StagedLoad &&) = delete;
  StagedLoad(const StagedLoad &) = delete;
  StagedLoad &operator=(const StagedLoad &) = delete;

  ITransaction &transaction() { return *transaction_; }
  const std::string &tableName() const { return tableName_; }
  const std::string &stagingTableName() const { return stagingTableName_; }
  const std::vector<std::string> &columns() const { return columns_; }
  const LoadTags &tags() const { return tags_; }

  void scheduleDrop(ScopedStagingTable stagingTable) {
    stagingTable_ = std::move(stagingTable);
  }

  // Tags the failure stage and rolls back through the supervisor.
  RollbackSupervisor::Outcome abort(LoadStage stage);
  LoadError failure(LoadStage stage, const std::string &message);

private:
  std::shared_ptr<ITransaction> transaction_;
  std::string tableName_;
  std::string stagingTableName_;
  std::vector<std::string> columns_;
  ScopedStagingTable stagingTable_;
  const RollbackSupervisor *supervisor_;
  LoadTags tags_;
};

// Creates a staging table shaped like the destination table and streams
// every load file of the table into it over one bulk-copy channel. Never
// commits; see DedupMergeEngine.
class StagingTableLoader {
public:
  StagingTableLoader(IWarehouseConnection &connection,
                     ILoadFileDownloader &downloader,
                     const RollbackSupervisor &supervisor,
                     std::string schemaNamespace, LoadTags baseTags);

  StagedLoad stage(const LoadContext &ctx, const std::string &tableName,
                   const TableSchema &uploadSchema, bool skipCleanup = false);

private:
  std::vector<std::string> downloadLoadFiles(const LoadContext &ctx,
                                             const std::string &tableName,
                                             LoadTags &tags);
  void copyLoadFiles(const LoadContext &ctx, StagedLoad &staged,
                     const std::vector<std::string> &files);

  IWarehouseConnection &connection_;
  ILoadFileDownloader &downloader_;
  const RollbackSupervisor &supervisor_;
  std::string schemaNamespace_;
  LoadTags baseTags_;
};

#endif
