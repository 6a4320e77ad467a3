#ifndef CRASH_RECOVERY_SWEEPER_H
#define CRASH_RECOVERY_SWEEPER_H

#include "core/warehouse_defaults.h"
#include "load/sql_executor.h"
#include <string>
#include <vector>

// Drops every staging table of the provider left in the namespace. Staging
// tables never survive a restart, so age and owner are not considered.
class CrashRecoverySweeper {
public:
  CrashRecoverySweeper(IWarehouseConnection &connection,
                       std::string schemaNamespace,
                       std::string provider = WarehouseDefaults::PROVIDER);

  // Throws on query failure.
  std::vector<std::string> findDanglingStagingTables(const LoadContext &ctx);

  // Returns true only if the listing and every drop succeeded. A failed drop
  // is logged and the sweep continues with the next table.
  bool sweep(const LoadContext &ctx);

private:
  IWarehouseConnection &connection_;
  std::string schemaNamespace_;
  std::string provider_;
};

#endif
