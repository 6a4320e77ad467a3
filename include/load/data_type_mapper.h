#ifndef DATA_TYPE_MAPPER_H
#define DATA_TYPE_MAPPER_H

#include "load/table_schema.h"
#include <optional>
#include <string>

class DataTypeMapper {
public:
  static std::optional<std::string>
  toPostgres(const std::string &canonicalType);
  static std::optional<std::string>
  toCanonical(const std::string &postgresType);

  // "name" type pairs for CREATE TABLE / ALTER TABLE. Throws
  // std::invalid_argument on a canonical type with no Postgres mapping.
  static std::string columnsWithDataTypes(const TableSchema &columns,
                                          const std::string &prefix = "");
};

#endif
