#ifndef PG_EXECUTOR_H
#define PG_EXECUTOR_H

#include "load/sql_executor.h"
#include "load/statement_canceller.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Cancels the COPY on the server if the load context ends while rows are
// still being streamed.
class PgBulkCopyChannel : public IBulkCopyChannel {
  LoadContext ctx_;
  pqxx::stream_to stream_;
  bool completed_;
  std::unique_ptr<StatementCanceller> canceller_;

  template <typename Step> void guarded(Step &&step);

public:
  PgBulkCopyChannel(const LoadContext &ctx, pqxx::connection &conn,
                    pqxx::work &work, const std::string &quotedTablePath,
                    const std::string &quotedColumns);

  void writeRow(const SqlRow &row) override;
  void complete() override;
};

class PgTransaction : public ITransaction {
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> work_;
  std::chrono::milliseconds slowQueryThreshold_;
  std::atomic<bool> open_;

public:
  PgTransaction(std::shared_ptr<pqxx::connection> conn,
                std::chrono::milliseconds slowQueryThreshold);
  ~PgTransaction() override;

  long long exec(const LoadContext &ctx, const std::string &sql,
                 const std::vector<SqlValue> &params = {}) override;
  SqlRows query(const LoadContext &ctx, const std::string &sql,
                const std::vector<SqlValue> &params = {}) override;
  std::unique_ptr<IBulkCopyChannel>
  openBulkCopy(const LoadContext &ctx, const std::string &schemaNamespace,
               const std::string &table,
               const std::vector<std::string> &columns) override;
  void commit() override;
  void rollback() override;
  bool isOpen() const override;
};

class PgConnection : public IWarehouseConnection {
  std::string connectionString_;
  std::chrono::milliseconds slowQueryThreshold_;
  std::unique_ptr<pqxx::connection> conn_;
  std::mutex mutex_;

  pqxx::connection &connectionUnlocked();
  pqxx::result run(const LoadContext &ctx, const std::string &sql,
                   const std::vector<SqlValue> &params);

public:
  PgConnection(std::string connectionString,
               std::chrono::milliseconds slowQueryThreshold);
  ~PgConnection() override;

  long long exec(const LoadContext &ctx, const std::string &sql,
                 const std::vector<SqlValue> &params = {}) override;
  SqlRows query(const LoadContext &ctx, const std::string &sql,
                const std::vector<SqlValue> &params = {}) override;
  std::shared_ptr<ITransaction> begin(const LoadContext &ctx) override;
  void ping(const LoadContext &ctx) override;
  void close() override;
};

#endif
