#include "load/dedup_key_registry.h"
#include "core/warehouse_defaults.h"
#include <stdexcept>

DedupKeyRegistry DedupKeyRegistry::withDefaults() {
  DedupKeyRegistry registry;
  registry.registerTable(WarehouseDefaults::USERS_TABLE, {"id", {"id"}});
  registry.registerTable(WarehouseDefaults::IDENTIFIES_TABLE, {"id", {"id"}});
  registry.registerTable(WarehouseDefaults::DISCARDS_TABLE,
                         {"row_id", {"row_id", "column_name", "table_name"}});
  return registry;
}

DedupKeyRegistry DedupKeyRegistry::fromJson(const nlohmann::json &json) {
  DedupKeyRegistry registry = withDefaults();
  if (json.is_null())
    return registry;
  if (!json.is_object())
    throw std::invalid_argument("dedup_keys must be an object");

  for (auto it = json.begin(); it != json.end(); ++it) {
    const auto &entry = it.value();
    if (!entry.is_object() || !entry.contains("primary_key") ||
        !entry["primary_key"].is_string()) {
      throw std::invalid_argument("dedup_keys." + it.key() +
                                  " requires a string primary_key");
    }

    DedupKey key;
    key.primaryKey = entry["primary_key"].get<std::string>();
    if (key.primaryKey.empty()) {
      throw std::invalid_argument("dedup_keys." + it.key() +
                                  ".primary_key is empty");
    }

    if (entry.contains("partition_key")) {
      const auto &partition = entry["partition_key"];
      if (partition.is_string()) {
        key.partitionKey.push_back(partition.get<std::string>());
      } else if (partition.is_array()) {
        for (const auto &column : partition) {
          if (!column.is_string()) {
            throw std::invalid_argument("dedup_keys." + it.key() +
                                        ".partition_key must hold strings");
          }
          key.partitionKey.push_back(column.get<std::string>());
        }
      } else {
        throw std::invalid_argument("dedup_keys." + it.key() +
                                    ".partition_key must be a string or array");
      }
    }
    if (key.partitionKey.empty())
      key.partitionKey.push_back(key.primaryKey);

    registry.registerTable(it.key(), std::move(key));
  }
  return registry;
}

void DedupKeyRegistry::registerTable(const std::string &tableName,
                                     DedupKey key) {
  keys_[tableName] = std::move(key);
}

DedupKey DedupKeyRegistry::lookup(const std::string &tableName) const {
  auto it = keys_.find(tableName);
  if (it != keys_.end())
    return it->second;
  return DedupKey{WarehouseDefaults::DEFAULT_PRIMARY_KEY,
                  {WarehouseDefaults::DEFAULT_PRIMARY_KEY}};
}

bool DedupKeyRegistry::contains(const std::string &tableName) const {
  return keys_.count(tableName) > 0;
}
