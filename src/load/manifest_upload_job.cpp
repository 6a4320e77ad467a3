#include "load/manifest_upload_job.h"
#include "core/logger.h"
#include "core/warehouse_defaults.h"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
TableSchema parseTableSchema(const std::string &tableName, const json &node) {
  if (!node.is_object()) {
    throw std::invalid_argument("schema of table " + tableName +
                                " must be an object");
  }
  TableSchema schema;
  for (auto it = node.begin(); it != node.end(); ++it) {
    if (!it.value().is_string()) {
      throw std::invalid_argument("column " + tableName + "." + it.key() +
                                  " must have a string type");
    }
    schema[it.key()] = it.value().get<std::string>();
  }
  return schema;
}
} // namespace

ManifestUploadJob ManifestUploadJob::fromJson(const json &manifest) {
  ManifestUploadJob job;
  if (!manifest.contains("tables") || !manifest["tables"].is_object()) {
    throw std::invalid_argument("job manifest requires a \"tables\" object");
  }

  const auto &tables = manifest["tables"];
  for (auto it = tables.begin(); it != tables.end(); ++it) {
    const std::string &tableName = it.key();
    const auto &table = it.value();
    if (!table.contains("schema")) {
      throw std::invalid_argument("table " + tableName + " has no schema");
    }
    job.uploadSchema_[tableName] = parseTableSchema(tableName, table["schema"]);

    auto &refs = job.loadFiles_[tableName];
    if (table.contains("load_files")) {
      for (const auto &location : table["load_files"]) {
        if (!location.is_string()) {
          throw std::invalid_argument("load_files of table " + tableName +
                                      " must hold strings");
        }
        refs.push_back(LoadFileRef{location.get<std::string>(), tableName});
      }
    }
  }

  if (manifest.contains("warehouse_schema") &&
      manifest["warehouse_schema"].is_object()) {
    const auto &existing = manifest["warehouse_schema"];
    for (auto it = existing.begin(); it != existing.end(); ++it) {
      job.warehouseSchema_[it.key()] = parseTableSchema(it.key(), it.value());
    }
  }
  return job;
}

ManifestUploadJob
ManifestUploadJob::loadFromFile(const std::string &manifestPath) {
  std::ifstream file(manifestPath);
  if (!file.is_open()) {
    throw std::invalid_argument("Could not open job manifest: " +
                                manifestPath);
  }
  json manifest;
  try {
    file >> manifest;
  } catch (const json::parse_error &e) {
    throw std::invalid_argument("Malformed job manifest " + manifestPath +
                                ": " + e.what());
  }

  ManifestUploadJob job = fromJson(manifest);
  Logger::info(LogCategory::CONFIG, "ManifestUploadJob",
               "Loaded job manifest " + manifestPath + " with " +
                   std::to_string(job.uploadSchema_.size()) + " tables");
  return job;
}

std::vector<std::string> ManifestUploadJob::tableNames() const {
  std::vector<std::string> names;
  for (const char *first : {WarehouseDefaults::IDENTIFIES_TABLE,
                            WarehouseDefaults::USERS_TABLE}) {
    if (uploadSchema_.count(first))
      names.push_back(first);
  }
  for (const auto &[name, schema] : uploadSchema_) {
    if (name != WarehouseDefaults::IDENTIFIES_TABLE &&
        name != WarehouseDefaults::USERS_TABLE)
      names.push_back(name);
  }
  return names;
}

std::vector<LoadFileRef>
ManifestUploadJob::getLoadFiles(const std::string &tableName) const {
  auto it = loadFiles_.find(tableName);
  if (it == loadFiles_.end())
    return {};
  return it->second;
}

TableSchema
ManifestUploadJob::getTableSchemaInUpload(const std::string &tableName) const {
  auto it = uploadSchema_.find(tableName);
  if (it == uploadSchema_.end())
    return {};
  return it->second;
}

TableSchema ManifestUploadJob::getTableSchemaInWarehouse(
    const std::string &tableName) const {
  auto it = warehouseSchema_.find(tableName);
  if (it == warehouseSchema_.end())
    return {};
  return it->second;
}
