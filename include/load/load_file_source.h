#ifndef LOAD_FILE_SOURCE_H
#define LOAD_FILE_SOURCE_H

#include "load/load_context.h"
#include "load/table_schema.h"
#include <string>
#include <vector>

// Reference to one compressed row file in object storage. Columns in the
// file follow sortedColumnNames() of the table's upload schema.
struct LoadFileRef {
  std::string location;
  std::string tableName;
};

// The upload catalog: which files belong to a table, and the column schema
// the upload was produced with versus the one already in the warehouse.
class IUploadJob {
public:
  virtual ~IUploadJob() = default;

  virtual std::vector<std::string> tableNames() const = 0;
  virtual std::vector<LoadFileRef>
  getLoadFiles(const std::string &tableName) const = 0;
  virtual TableSchema
  getTableSchemaInUpload(const std::string &tableName) const = 0;
  virtual TableSchema
  getTableSchemaInWarehouse(const std::string &tableName) const = 0;
};

// Materializes a table's load files on local disk. Returned paths are owned
// by the caller, who removes them once the load finishes.
class ILoadFileDownloader {
public:
  virtual ~ILoadFileDownloader() = default;

  virtual std::vector<std::string> download(const LoadContext &ctx,
                                            const std::string &tableName) = 0;
};

#endif
