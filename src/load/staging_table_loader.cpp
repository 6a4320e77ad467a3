#include "load/staging_table_loader.h"
#include "core/logger.h"
#include "core/warehouse_defaults.h"
#include "load/row_stream_decoder.h"
#include "load/staging_table_name.h"
#include "utils/string_utils.h"
#include <filesystem>
#include <set>

// Removes the files, then every directory that held them once it is empty.
LocalFileSet::~LocalFileSet() {
  std::set<std::filesystem::path> directories;
  for (const auto &path : paths_) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
      Logger::warning(LogCategory::LOAD, "LocalFileSet",
                      "Could not remove local load file " + path + ": " +
                          ec.message());
    }
    directories.insert(std::filesystem::path(path).parent_path());
  }
  for (const auto &dir : directories) {
    std::error_code ec;
    if (dir.empty() || !std::filesystem::is_empty(dir, ec) || ec)
      continue;
    std::filesystem::remove(dir, ec);
    if (ec) {
      Logger::warning(LogCategory::LOAD, "LocalFileSet",
                      "Could not remove download directory " + dir.string() +
                          ": " + ec.message());
    }
  }
}

ScopedStagingTable::ScopedStagingTable(IWarehouseConnection &connection,
                                       std::string schemaNamespace,
                                       std::string name)
    : connection_(&connection), schemaNamespace_(std::move(schemaNamespace)),
      name_(std::move(name)) {}

ScopedStagingTable::~ScopedStagingTable() { drop(); }

ScopedStagingTable::ScopedStagingTable(ScopedStagingTable &&other) noexcept
    : connection_(other.connection_),
      schemaNamespace_(std::move(other.schemaNamespace_)),
      name_(std::move(other.name_)) {
  other.connection_ = nullptr;
  other.name_.clear();
}

ScopedStagingTable &
ScopedStagingTable::operator=(ScopedStagingTable &&other) noexcept {
  if (this != &other) {
    drop();
    connection_ = other.connection_;
    schemaNamespace_ = std::move(other.schemaNamespace_);
    name_ = std::move(other.name_);
    other.connection_ = nullptr;
    other.name_.clear();
  }
  return *this;
}

// Runs with its own context: the caller's may already be cancelled, and the
// table still has to go.
void ScopedStagingTable::drop() {
  if (!armed())
    return;

  std::string sql = "DROP TABLE IF EXISTS " +
                    StringUtils::qualifiedName(schemaNamespace_, name_);
  try {
    connection_->exec(LoadContext(), sql);
    Logger::debug(LogCategory::LOAD, "ScopedStagingTable",
                  "Dropped staging table " + name_);
  } catch (const std::exception &e) {
    Logger::error(LogCategory::LOAD, "ScopedStagingTable",
                  "Error dropping staging table " + name_ + ": " +
                      std::string(e.what()));
  }
  connection_ = nullptr;
  name_.clear();
}

std::string ScopedStagingTable::release() {
  std::string name = std::move(name_);
  connection_ = nullptr;
  name_.clear();
  return name;
}

StagedLoad::StagedLoad(std::shared_ptr<ITransaction> transaction,
                       std::string tableName, std::string stagingTableName,
                       std::vector<std::string> columns,
                       const RollbackSupervisor &supervisor, LoadTags tags)
    : transaction_(std::move(transaction)), tableName_(std::move(tableName)),
      stagingTableName_(std::move(stagingTableName)),
      columns_(std::move(columns)), supervisor_(&supervisor),
      tags_(std::move(tags)) {}

// stagingTable_ is destroyed after this body runs, so the drop always
// follows the rollback.
StagedLoad::~StagedLoad() {
  if (transaction_ && transaction_->isOpen() && supervisor_) {
    supervisor_->rollback(transaction_, tags_);
  }
}

RollbackSupervisor::Outcome StagedLoad::abort(LoadStage stage) {
  tags_.stage = loadStageToString(stage);
  return supervisor_->rollback(transaction_, tags_);
}

LoadError StagedLoad::failure(LoadStage stage, const std::string &message) {
  tags_.stage = loadStageToString(stage);
  Logger::error(LogCategory::LOAD, "StagedLoad",
                "Load of table " + tableName_ + " failed at stage " +
                    tags_.stage + " (staging table " + stagingTableName_ +
                    "): " + message);
  return LoadError(stage, message, tags_);
}

StagingTableLoader::StagingTableLoader(IWarehouseConnection &connection,
                                       ILoadFileDownloader &downloader,
                                       const RollbackSupervisor &supervisor,
                                       std::string schemaNamespace,
                                       LoadTags baseTags)
    : connection_(connection), downloader_(downloader),
      supervisor_(supervisor), schemaNamespace_(std::move(schemaNamespace)),
      baseTags_(std::move(baseTags)) {}

std::vector<std::string>
StagingTableLoader::downloadLoadFiles(const LoadContext &ctx,
                                      const std::string &tableName,
                                      LoadTags &tags) {
  try {
    return downloader_.download(ctx, tableName);
  } catch (const LoadError &e) {
    tags.stage = e.stageName();
    throw LoadError(e.stage(), e.what(), tags);
  } catch (const std::exception &e) {
    tags.stage = loadStageToString(LoadStage::DOWNLOAD_LOAD_FILES);
    throw LoadError(LoadStage::DOWNLOAD_LOAD_FILES,
                    "Error downloading load files for table " + tableName +
                        ": " + e.what(),
                    tags);
  }
}

// Every file goes through one channel so rows reach the staging table as a
// single ordered stream. The channel is destroyed before the caller rolls
// back on failure.
void StagingTableLoader::copyLoadFiles(const LoadContext &ctx,
                                       StagedLoad &staged,
                                       const std::vector<std::string> &files) {
  std::unique_ptr<IBulkCopyChannel> channel;
  try {
    channel = staged.transaction().openBulkCopy(
        ctx, schemaNamespace_, staged.stagingTableName(), staged.columns());
  } catch (const std::exception &e) {
    throw LoadError(LoadStage::COPY_IN_STAGING_TABLE, e.what());
  }

  SqlRow row;
  for (const auto &file : files) {
    RowStreamDecoder decoder(file, staged.columns().size(),
                             staged.tableName());
    while (decoder.next(row)) {
      try {
        ctx.throwIfDone();
        channel->writeRow(row);
      } catch (const std::exception &e) {
        throw LoadError(LoadStage::LOAD_STAGING_TABLE,
                        "Error loading staging table " +
                            staged.stagingTableName() + ": " + e.what());
      }
    }
    Logger::debug(LogCategory::LOAD, "StagingTableLoader",
                  "Read " + std::to_string(decoder.rowsProcessed()) +
                      " rows from " + file + " into staging table " +
                      staged.stagingTableName());
  }

  try {
    channel->complete();
  } catch (const std::exception &e) {
    throw LoadError(LoadStage::STAGING_TABLE_LOAD_STAGE, e.what());
  }
}

StagedLoad StagingTableLoader::stage(const LoadContext &ctx,
                                     const std::string &tableName,
                                     const TableSchema &uploadSchema,
                                     bool skipCleanup) {
  LoadTags tags = baseTags_;
  tags.schemaNamespace = schemaNamespace_;
  tags.tableName = tableName;

  std::vector<std::string> columns = sortedColumnNames(uploadSchema);
  Logger::info(LogCategory::LOAD, "StagingTableLoader",
               "Starting load for table " + tableName + " with " +
                   std::to_string(columns.size()) + " columns");

  LocalFileSet files(downloadLoadFiles(ctx, tableName, tags));

  std::shared_ptr<ITransaction> transaction;
  try {
    transaction = connection_.begin(ctx);
  } catch (const std::exception &e) {
    tags.stage = loadStageToString(LoadStage::BEGIN_TRANSACTION);
    Logger::error(LogCategory::LOAD, "StagingTableLoader",
                  "Error beginning transaction for table " + tableName +
                      ": " + std::string(e.what()));
    throw LoadError(LoadStage::BEGIN_TRANSACTION, e.what(), tags);
  }

  std::string stagingTableName =
      StagingTableName::generate(WarehouseDefaults::PROVIDER, tableName);
  StagedLoad staged(std::move(transaction), tableName, stagingTableName,
                    columns, supervisor_, tags);

  std::string searchPathSql =
      "SET LOCAL search_path TO " +
      StringUtils::quoteIdentifier(schemaNamespace_);
  try {
    staged.transaction().exec(ctx, searchPathSql);
  } catch (const std::exception &e) {
    throw staged.failure(LoadStage::BEGIN_TRANSACTION, e.what());
  }
  Logger::debug(LogCategory::LOAD, "StagingTableLoader",
                "Updated search_path to " + schemaNamespace_ + " for table " +
                    tableName);

  std::string createSql =
      "CREATE TABLE " +
      StringUtils::qualifiedName(schemaNamespace_, stagingTableName) +
      " (LIKE " + StringUtils::qualifiedName(schemaNamespace_, tableName) +
      ")";
  Logger::debug(LogCategory::LOAD, "StagingTableLoader",
                "Creating staging table for " + tableName + ": " + createSql);
  try {
    staged.transaction().exec(ctx, createSql);
  } catch (const std::exception &e) {
    throw staged.failure(LoadStage::CREATE_STAGING_TABLE, e.what());
  }

  if (!skipCleanup) {
    staged.scheduleDrop(
        ScopedStagingTable(connection_, schemaNamespace_, stagingTableName));
  }

  try {
    copyLoadFiles(ctx, staged, files.paths());
  } catch (const LoadError &e) {
    throw staged.failure(e.stage(), e.what());
  }

  Logger::info(LogCategory::LOAD, "StagingTableLoader",
               "Loaded staging table " + stagingTableName + " for table " +
                   tableName + " from " +
                   std::to_string(files.paths().size()) + " files");
  return staged;
}
