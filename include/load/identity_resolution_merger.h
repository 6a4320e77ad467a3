#ifndef IDENTITY_RESOLUTION_MERGER_H
#define IDENTITY_RESOLUTION_MERGER_H

#include "load/dedup_merge_engine.h"
#include "load/load_file_source.h"
#include "load/staging_table_loader.h"
#include <map>
#include <string>
#include <vector>

struct TableLoadOutcome {
  bool success = true;
  std::string stage;
  std::string errorMessage;
};

// Loads identifies and rebuilds the users snapshot from it. Every users
// attribute takes the newest non-null value seen for the user across the
// existing users row and the new identify events.
class IdentityResolutionMerger {
public:
  IdentityResolutionMerger(IWarehouseConnection &connection,
                           StagingTableLoader &loader,
                           const DedupMergeEngine &mergeEngine,
                           const IUploadJob &uploadJob,
                           const RollbackSupervisor &supervisor,
                           std::string schemaNamespace,
                           std::string recencyColumn,
                           bool skipComputingUserLatestTraits,
                           LoadTags baseTags);

  // Keys are identifies and, when the upload carries users columns, users.
  std::map<std::string, TableLoadOutcome>
  loadUserTables(const LoadContext &ctx);

  std::string
  buildUnionStatement(const std::string &identifyStagingTable,
                      const std::string &unionStagingTable,
                      const std::vector<std::string> &userColumns) const;

  // One correlated subquery per attribute column.
  std::string
  buildLatestTraitsStatement(const std::string &unionStagingTable,
                             const std::string &usersStagingTable,
                             const std::vector<std::string> &userColumns) const;

private:
  TableLoadOutcome mergeUsers(const LoadContext &ctx,
                              const std::string &identifyStagingTable);

  IWarehouseConnection &connection_;
  StagingTableLoader &loader_;
  const DedupMergeEngine &mergeEngine_;
  const IUploadJob &uploadJob_;
  const RollbackSupervisor &supervisor_;
  std::string schemaNamespace_;
  std::string recencyColumn_;
  bool skipComputingUserLatestTraits_;
  LoadTags baseTags_;
};

#endif
