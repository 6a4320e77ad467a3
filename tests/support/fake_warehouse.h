#ifndef FAKE_WAREHOUSE_H
#define FAKE_WAREHOUSE_H

#include "load/load_file_source.h"
#include "load/sql_executor.h"
#include "load/statement_canceller.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <zlib.h>

// Shared state behind the fake connection and its transactions. Records every
// statement, keeps the set of committed tables and the rows copied into each,
// fails statements whose text contains a configured substring, and holds
// statements matching blockOn until they are cancelled.
struct FakeDatabase {
  std::mutex mutex;
  std::vector<std::string> statements;
  std::set<std::string> tables;
  std::map<std::string, std::vector<SqlRow>> copiedRows;
  std::vector<std::pair<std::string, SqlRows>> queryResults;
  std::vector<std::string> failOn;
  std::vector<std::string> blockOn;
  std::condition_variable blockCV;
  int blockedStatements = 0;
  int cancelledStatements = 0;
  bool cancelRequested = false;

  int begins = 0;
  int commits = 0;
  int rollbacks = 0;
  bool failBegin = false;
  bool failCommit = false;
  bool failRollback = false;
  bool failBulkOpen = false;
  bool failBulkComplete = false;
  std::chrono::milliseconds rollbackDelay{0};

  void record(const std::string &sql) {
    std::lock_guard<std::mutex> lock(mutex);
    statements.push_back(sql);
  }

  void checkFailure(const std::string &sql) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &pattern : failOn) {
      if (sql.find(pattern) != std::string::npos)
        throw std::runtime_error("ERROR: injected failure for: " + pattern);
    }
  }

  void blockIfConfigured(const std::string &sql) {
    std::unique_lock<std::mutex> lock(mutex);
    bool matches = false;
    for (const auto &pattern : blockOn) {
      if (sql.find(pattern) != std::string::npos)
        matches = true;
    }
    if (!matches)
      return;
    blockedStatements++;
    bool cancelled = blockCV.wait_for(lock, std::chrono::seconds(10),
                                      [this] { return cancelRequested; });
    blockedStatements--;
    cancelRequested = false;
    if (cancelled) {
      cancelledStatements++;
      throw std::runtime_error(
          "ERROR: canceling statement due to user request");
    }
  }

  // Server-side cancel: only affects a statement that is currently running.
  void cancelRunning() {
    std::lock_guard<std::mutex> lock(mutex);
    if (blockedStatements > 0) {
      cancelRequested = true;
      blockCV.notify_all();
    }
  }

  bool hasBlockedStatement() {
    std::lock_guard<std::mutex> lock(mutex);
    return blockedStatements > 0;
  }

  SqlRows resultFor(const std::string &sql) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto &[pattern, rows] : queryResults) {
      if (sql.find(pattern) != std::string::npos)
        return rows;
    }
    return {};
  }

  std::vector<std::string> statementsContaining(const std::string &needle) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> matches;
    for (const auto &sql : statements) {
      if (sql.find(needle) != std::string::npos)
        matches.push_back(sql);
    }
    return matches;
  }

  bool hasTable(const std::string &schemaNamespace, const std::string &table) {
    std::lock_guard<std::mutex> lock(mutex);
    return tables.count(schemaNamespace + "." + table) > 0;
  }

  std::vector<std::string> tablesWithPrefix(const std::string &prefix) {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> matches;
    for (const auto &table : tables) {
      auto dot = table.find('.');
      if (table.compare(dot + 1, prefix.size(), prefix) == 0)
        matches.push_back(table);
    }
    return matches;
  }
};

// Applies CREATE TABLE / DROP TABLE statements to a table set.
inline void applyDdl(const std::string &sql, std::set<std::string> &created,
                     std::set<std::string> &dropped) {
  static const std::regex createRe(
      R"re(^CREATE TABLE (?:IF NOT EXISTS )?"([^"]+)"\."([^"]+)")re");
  static const std::regex dropRe(
      R"re(^DROP TABLE (?:IF EXISTS )?"([^"]+)"\."([^"]+)")re");
  std::smatch match;
  if (std::regex_search(sql, match, createRe)) {
    created.insert(match[1].str() + "." + match[2].str());
  } else if (std::regex_search(sql, match, dropRe)) {
    dropped.insert(match[1].str() + "." + match[2].str());
  }
}

class FakeBulkCopyChannel : public IBulkCopyChannel {
  std::shared_ptr<FakeDatabase> db_;
  std::string table_;
  std::vector<SqlRow> &pending_;

public:
  FakeBulkCopyChannel(std::shared_ptr<FakeDatabase> db, std::string table,
                      std::vector<SqlRow> &pending)
      : db_(std::move(db)), table_(std::move(table)), pending_(pending) {}

  void writeRow(const SqlRow &row) override {
    db_->checkFailure("COPY ROW " + table_);
    pending_.push_back(row);
  }

  void complete() override {
    if (db_->failBulkComplete)
      throw std::runtime_error("ERROR: injected failure completing COPY");
  }
};

class FakeTransaction : public ITransaction {
  std::shared_ptr<FakeDatabase> db_;
  std::atomic<bool> open_{true};
  std::set<std::string> created_;
  std::set<std::string> dropped_;
  std::map<std::string, std::vector<SqlRow>> pendingRows_;

public:
  explicit FakeTransaction(std::shared_ptr<FakeDatabase> db)
      : db_(std::move(db)) {}

  long long exec(const LoadContext &ctx, const std::string &sql,
                 const std::vector<SqlValue> &params = {}) override {
    return runCancellable(ctx, [db = db_]() { db->cancelRunning(); }, [&]() {
      db_->record(sql);
      db_->checkFailure(sql);
      db_->blockIfConfigured(sql);
      applyDdl(sql, created_, dropped_);
      return 1LL;
    });
  }

  SqlRows query(const LoadContext &ctx, const std::string &sql,
                const std::vector<SqlValue> &params = {}) override {
    return runCancellable(ctx, [db = db_]() { db->cancelRunning(); }, [&]() {
      db_->record(sql);
      db_->checkFailure(sql);
      db_->blockIfConfigured(sql);
      return db_->resultFor(sql);
    });
  }

  std::unique_ptr<IBulkCopyChannel>
  openBulkCopy(const LoadContext &ctx, const std::string &schemaNamespace,
               const std::string &table,
               const std::vector<std::string> &columns) override {
    ctx.throwIfDone();
    std::string key = schemaNamespace + "." + table;
    db_->record("COPY " + key);
    if (db_->failBulkOpen)
      throw std::runtime_error("ERROR: injected failure opening COPY");
    return std::make_unique<FakeBulkCopyChannel>(db_, key, pendingRows_[key]);
  }

  void commit() override {
    if (!open_.exchange(false))
      throw std::logic_error("commit on a transaction that is not open");
    std::lock_guard<std::mutex> lock(db_->mutex);
    if (db_->failCommit)
      throw std::runtime_error("ERROR: injected failure on COMMIT");
    db_->commits++;
    for (const auto &table : created_)
      db_->tables.insert(table);
    for (const auto &table : dropped_)
      db_->tables.erase(table);
    for (auto &[table, rows] : pendingRows_) {
      auto &target = db_->copiedRows[table];
      target.insert(target.end(), rows.begin(), rows.end());
    }
  }

  void rollback() override {
    if (!open_.exchange(false))
      return;
    if (db_->rollbackDelay.count() > 0)
      std::this_thread::sleep_for(db_->rollbackDelay);
    std::lock_guard<std::mutex> lock(db_->mutex);
    db_->rollbacks++;
    if (db_->failRollback)
      throw std::runtime_error("ERROR: injected failure on ROLLBACK");
  }

  bool isOpen() const override { return open_.load(); }
};

class FakeConnection : public IWarehouseConnection {
  std::shared_ptr<FakeDatabase> db_;

public:
  explicit FakeConnection(std::shared_ptr<FakeDatabase> db)
      : db_(std::move(db)) {}

  long long exec(const LoadContext &ctx, const std::string &sql,
                 const std::vector<SqlValue> &params = {}) override {
    return runCancellable(ctx, [db = db_]() { db->cancelRunning(); }, [&]() {
      db_->record(sql);
      db_->checkFailure(sql);
      db_->blockIfConfigured(sql);
      std::set<std::string> created;
      std::set<std::string> dropped;
      applyDdl(sql, created, dropped);
      std::lock_guard<std::mutex> lock(db_->mutex);
      for (const auto &table : created)
        db_->tables.insert(table);
      for (const auto &table : dropped)
        db_->tables.erase(table);
      return 1LL;
    });
  }

  SqlRows query(const LoadContext &ctx, const std::string &sql,
                const std::vector<SqlValue> &params = {}) override {
    return runCancellable(ctx, [db = db_]() { db->cancelRunning(); }, [&]() {
      db_->record(sql);
      db_->checkFailure(sql);
      db_->blockIfConfigured(sql);
      return db_->resultFor(sql);
    });
  }

  std::shared_ptr<ITransaction> begin(const LoadContext &ctx) override {
    ctx.throwIfDone();
    std::lock_guard<std::mutex> lock(db_->mutex);
    if (db_->failBegin)
      throw std::runtime_error("ERROR: injected failure on BEGIN");
    db_->begins++;
    return std::make_shared<FakeTransaction>(db_);
  }

  void ping(const LoadContext &ctx) override { query(ctx, "SELECT 1"); }

  void close() override {}
};

inline void writeGzipFile(const std::string &path, const std::string &content) {
  gzFile file = gzopen(path.c_str(), "wb");
  if (!file)
    throw std::runtime_error("cannot create " + path);
  if (!content.empty())
    gzwrite(file, content.data(), static_cast<unsigned>(content.size()));
  gzclose(file);
}

// Writes each table's CSV payloads as fresh gzip files on every download, so
// the loader can remove them afterwards like real downloads.
class FakeDownloader : public ILoadFileDownloader {
  std::string workDir_;
  std::map<std::string, std::vector<std::string>> payloads_;
  int sequence_ = 0;

public:
  explicit FakeDownloader(std::string workDir) : workDir_(std::move(workDir)) {
    std::filesystem::create_directories(workDir_);
  }

  void addFile(const std::string &tableName, const std::string &csv) {
    payloads_[tableName].push_back(csv);
  }

  std::vector<std::string> lastPaths;

  std::vector<std::string> download(const LoadContext &ctx,
                                    const std::string &tableName) override {
    ctx.throwIfDone();
    std::filesystem::create_directories(workDir_);
    lastPaths.clear();
    for (const auto &csv : payloads_[tableName]) {
      std::string path = workDir_ + "/" + tableName + "_" +
                         std::to_string(sequence_++) + ".csv.gz";
      writeGzipFile(path, csv);
      lastPaths.push_back(path);
    }
    return lastPaths;
  }
};

#endif
