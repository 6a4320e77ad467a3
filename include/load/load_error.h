#ifndef LOAD_ERROR_H
#define LOAD_ERROR_H

#include "load/load_tags.h"
#include <stdexcept>
#include <string>
#include <utility>

enum class LoadStage {
  DOWNLOAD_LOAD_FILES,
  BEGIN_TRANSACTION,
  CREATE_STAGING_TABLE,
  COPY_IN_STAGING_TABLE,
  OPEN_LOAD_FILES,
  READ_GZIP_LOAD_FILES,
  READ_CSV_LOAD_FILES,
  CSV_COLUMN_COUNT_MISMATCH,
  LOAD_STAGING_TABLE,
  STAGING_TABLE_LOAD_STAGE,
  DELETE_DEDUP,
  INSERT_DEDUP,
  DEDUP_STAGE,
  CREATE_USERS_UNION_TABLE,
  CREATE_USERS_STAGING_TABLE
};

std::string loadStageToString(LoadStage stage);

// Failure of a load attempt. The stage names the step that failed; by the
// time a LoadError reaches the caller the enclosing transaction has already
// been handed to the rollback supervisor.
class LoadError : public std::runtime_error {
public:
  LoadError(LoadStage stage, const std::string &message)
      : std::runtime_error(message), stage_(stage) {}
  LoadError(LoadStage stage, const std::string &message, LoadTags tags)
      : std::runtime_error(message), stage_(stage), tags_(std::move(tags)) {}

  LoadStage stage() const { return stage_; }
  std::string stageName() const { return loadStageToString(stage_); }
  const LoadTags &tags() const { return tags_; }

private:
  LoadStage stage_;
  LoadTags tags_;
};

#endif
