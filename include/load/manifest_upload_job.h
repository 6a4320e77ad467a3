#ifndef MANIFEST_UPLOAD_JOB_H
#define MANIFEST_UPLOAD_JOB_H

#include "load/load_file_source.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Upload catalog read from a JSON job manifest:
//
//   {"tables": {"tracks": {"schema": {"id": "string", ...},
//                          "load_files": ["tracks/0001.csv.gz"]}},
//    "warehouse_schema": {"tracks": {"id": "string"}}}
//
// Tables are returned sorted by name except that identifies and users
// always come first, since the user-table merge reads both together.
class ManifestUploadJob : public IUploadJob {
public:
  static ManifestUploadJob fromJson(const nlohmann::json &manifest);
  static ManifestUploadJob loadFromFile(const std::string &manifestPath);

  std::vector<std::string> tableNames() const override;
  std::vector<LoadFileRef>
  getLoadFiles(const std::string &tableName) const override;
  TableSchema getTableSchemaInUpload(const std::string &tableName) const override;
  TableSchema
  getTableSchemaInWarehouse(const std::string &tableName) const override;

  void setWarehouseSchema(const Schema &schema) { warehouseSchema_ = schema; }
  const Schema &uploadSchema() const { return uploadSchema_; }

private:
  Schema uploadSchema_;
  Schema warehouseSchema_;
  std::map<std::string, std::vector<LoadFileRef>> loadFiles_;
};

#endif
