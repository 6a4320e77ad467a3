#ifndef WAREHOUSE_DEFAULTS_H
#define WAREHOUSE_DEFAULTS_H

#include <cstddef>

namespace WarehouseDefaults {
constexpr const char *PROVIDER = "postgres";
constexpr const char *STAGING_TABLE_PREFIX = "wh_staging_";

// Postgres truncates identifiers beyond NAMEDATALEN - 1 bytes.
constexpr size_t TABLE_NAME_LIMIT = 63;
constexpr size_t STAGING_SUFFIX_LENGTH = 16;

constexpr const char *RECENCY_COLUMN = "received_at";
constexpr const char *DEFAULT_PRIMARY_KEY = "id";

constexpr const char *USERS_TABLE = "users";
constexpr const char *IDENTIFIES_TABLE = "identifies";
constexpr const char *DISCARDS_TABLE = "discards";
constexpr const char *USERS_IDENTIFIES_UNION = "users_identifies_union";
constexpr const char *IDENTIFY_USER_ID_COLUMN = "user_id";

constexpr const char *MISSING_DATATYPE = "<missing_datatype>";

constexpr int DEFAULT_TXN_ROLLBACK_TIMEOUT_SECONDS = 30;
constexpr int MIN_TXN_ROLLBACK_TIMEOUT_SECONDS = 1;
constexpr int MAX_TXN_ROLLBACK_TIMEOUT_SECONDS = 3600;
constexpr int DEFAULT_SLOW_QUERY_THRESHOLD_SECONDS = 300;
constexpr int STATEMENT_CANCEL_POLL_INTERVAL_MS = 50;
} // namespace WarehouseDefaults

#endif
