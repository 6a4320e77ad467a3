#include "load/data_type_mapper.h"
#include "utils/string_utils.h"
#include <stdexcept>
#include <unordered_map>

namespace {
const std::unordered_map<std::string, std::string> canonicalToPostgres = {
    {"int", "bigint"},         {"float", "numeric"},
    {"string", "text"},        {"datetime", "timestamptz"},
    {"boolean", "boolean"},    {"json", "jsonb"}};

// Keys are what information_schema.columns.data_type reports, plus the short
// aliases.
const std::unordered_map<std::string, std::string> postgresToCanonical = {
    {"integer", "int"},
    {"smallint", "int"},
    {"bigint", "int"},
    {"double precision", "float"},
    {"numeric", "float"},
    {"real", "float"},
    {"text", "string"},
    {"varchar", "string"},
    {"character varying", "string"},
    {"char", "string"},
    {"character", "string"},
    {"timestamptz", "datetime"},
    {"timestamp with time zone", "datetime"},
    {"timestamp", "datetime"},
    {"timestamp without time zone", "datetime"},
    {"boolean", "boolean"},
    {"jsonb", "json"}};
} // namespace

std::optional<std::string>
DataTypeMapper::toPostgres(const std::string &canonicalType) {
  auto it = canonicalToPostgres.find(canonicalType);
  if (it == canonicalToPostgres.end())
    return std::nullopt;
  return it->second;
}

std::optional<std::string>
DataTypeMapper::toCanonical(const std::string &postgresType) {
  auto it = postgresToCanonical.find(StringUtils::toLower(postgresType));
  if (it == postgresToCanonical.end())
    return std::nullopt;
  return it->second;
}

std::string DataTypeMapper::columnsWithDataTypes(const TableSchema &columns,
                                                 const std::string &prefix) {
  std::vector<std::string> definitions;
  definitions.reserve(columns.size());
  for (const auto &[name, type] : columns) {
    auto pgType = toPostgres(type);
    if (!pgType) {
      throw std::invalid_argument("No Postgres type for column '" + name +
                                  "' of type '" + type + "'");
    }
    definitions.push_back(StringUtils::quoteIdentifier(prefix + name) + " " +
                          *pgType);
  }
  return StringUtils::join(definitions, ",");
}
