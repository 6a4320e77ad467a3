#ifndef DEDUP_KEY_REGISTRY_H
#define DEDUP_KEY_REGISTRY_H

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

// Logical row identity for merge: the join column used to delete superseded
// destination rows and the partition columns used to pick the latest row.
struct DedupKey {
  std::string primaryKey;
  std::vector<std::string> partitionKey;
};

class DedupKeyRegistry {
private:
  std::map<std::string, DedupKey> keys_;

public:
  DedupKeyRegistry() = default;

  // users and identifies keyed by id, discards by row_id partitioned on
  // (row_id, column_name, table_name).
  static DedupKeyRegistry withDefaults();

  // Entries override the defaults; missing partition_key falls back to the
  // primary key. Throws std::invalid_argument on malformed entries.
  static DedupKeyRegistry fromJson(const nlohmann::json &json);

  void registerTable(const std::string &tableName, DedupKey key);
  DedupKey lookup(const std::string &tableName) const;
  bool contains(const std::string &tableName) const;
};

#endif
