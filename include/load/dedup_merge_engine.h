#ifndef DEDUP_MERGE_ENGINE_H
#define DEDUP_MERGE_ENGINE_H

#include "load/dedup_key_registry.h"
#include "load/staging_table_loader.h"
#include <string>
#include <vector>

// Replaces superseded destination rows with the latest staged version of
// each logical row, in the transaction the staging table was loaded in.
class DedupMergeEngine {
public:
  DedupMergeEngine(const DedupKeyRegistry &dedupKeys,
                   std::string schemaNamespace, std::string recencyColumn,
                   bool explainStatements);

  // DELETE joined on the primary key plus every other partition column.
  std::string buildDeleteStatement(const std::string &tableName,
                                   const std::string &stagingTableName) const;

  // INSERT of rank-1 rows per partition, newest recency column first.
  std::string
  buildInsertStatement(const std::string &tableName,
                       const std::string &stagingTableName,
                       const std::vector<std::string> &columns) const;

  // Logs the EXPLAIN plan first when plans are enabled. A failing EXPLAIN
  // fails the statement.
  long long execWithOptionalPlan(const LoadContext &ctx, ISqlExecutor &executor,
                                 const std::string &sql) const;

  // Delete, insert, commit. Any failure rolls the transaction back through
  // the supervisor and throws a LoadError staged dedup_deletion,
  // dedup_insertion or dedup_stage.
  void merge(const LoadContext &ctx, StagedLoad &staged) const;

  bool explainStatements() const { return explainStatements_; }

private:
  const DedupKeyRegistry &dedupKeys_;
  std::string schemaNamespace_;
  std::string recencyColumn_;
  bool explainStatements_;
};

#endif
