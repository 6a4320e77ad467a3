#include "load/load_error.h"

std::string loadStageToString(LoadStage stage) {
  switch (stage) {
  case LoadStage::DOWNLOAD_LOAD_FILES:
    return "load_files_download";
  case LoadStage::BEGIN_TRANSACTION:
    return "transaction_begin";
  case LoadStage::CREATE_STAGING_TABLE:
    return "staging_table_creation";
  case LoadStage::COPY_IN_STAGING_TABLE:
    return "staging_table_copy_in_schema";
  case LoadStage::OPEN_LOAD_FILES:
    return "load_files_opening";
  case LoadStage::READ_GZIP_LOAD_FILES:
    return "load_files_gzip_reading";
  case LoadStage::READ_CSV_LOAD_FILES:
    return "load_files_csv_reading";
  case LoadStage::CSV_COLUMN_COUNT_MISMATCH:
    return "csv_column_count_mismatch";
  case LoadStage::LOAD_STAGING_TABLE:
    return "staging_table_loading";
  case LoadStage::STAGING_TABLE_LOAD_STAGE:
    return "staging_table_load_stage";
  case LoadStage::DELETE_DEDUP:
    return "dedup_deletion";
  case LoadStage::INSERT_DEDUP:
    return "dedup_insertion";
  case LoadStage::DEDUP_STAGE:
    return "dedup_stage";
  case LoadStage::CREATE_USERS_UNION_TABLE:
    return "users_union_table_creation";
  case LoadStage::CREATE_USERS_STAGING_TABLE:
    return "users_staging_table_creation";
  }
  return "unknown";
}
