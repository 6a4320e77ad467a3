#ifndef TABLE_SCHEMA_H
#define TABLE_SCHEMA_H

#include <map>
#include <string>
#include <vector>

// Column name -> canonical type (int, float, string, datetime, boolean,
// json). std::map keeps names sorted, which is the row file column order.
using TableSchema = std::map<std::string, std::string>;
using Schema = std::map<std::string, TableSchema>;

inline std::vector<std::string> sortedColumnNames(const TableSchema &schema) {
  std::vector<std::string> names;
  names.reserve(schema.size());
  for (const auto &[name, type] : schema) {
    names.push_back(name);
  }
  return names;
}

#endif
