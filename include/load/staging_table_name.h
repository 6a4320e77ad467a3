#ifndef STAGING_TABLE_NAME_H
#define STAGING_TABLE_NAME_H

#include "core/warehouse_defaults.h"
#include <cstddef>
#include <string>

namespace StagingTableName {

// Shared by every staging table of a provider; the crash recovery sweep
// matches on it.
std::string prefix(const std::string &provider);

// prefix + table name (truncated to fit) + "_" + random hex suffix. The
// suffix is never truncated, so the result is at most `limit` characters and
// still unique per call.
std::string generate(const std::string &provider, const std::string &tableName,
                     size_t limit = WarehouseDefaults::TABLE_NAME_LIMIT);

bool isStagingTable(const std::string &provider, const std::string &name);

} // namespace StagingTableName

#endif
