#include "load/pg_executor.h"
#include "core/logger.h"
#include "utils/string_utils.h"

namespace {
pqxx::params toParams(const std::vector<SqlValue> &values) {
  pqxx::params params;
  for (const auto &value : values) {
    if (value) {
      params.append(*value);
    } else {
      params.append();
    }
  }
  return params;
}

SqlRows toRows(const pqxx::result &result) {
  SqlRows rows;
  rows.reserve(result.size());
  for (const auto &row : result) {
    SqlRow out;
    out.reserve(row.size());
    for (const auto &field : row) {
      if (field.is_null()) {
        out.emplace_back(std::nullopt);
      } else {
        out.emplace_back(std::string(field.c_str(), field.size()));
      }
    }
    rows.push_back(std::move(out));
  }
  return rows;
}

// Runs one statement and reports it when it exceeds the slow query threshold.
pqxx::result runStatement(pqxx::transaction_base &tx, const std::string &sql,
                          const std::vector<SqlValue> &params,
                          std::chrono::milliseconds slowQueryThreshold) {
  auto start = std::chrono::steady_clock::now();
  pqxx::result result =
      params.empty() ? tx.exec(sql) : tx.exec_params(sql, toParams(params));
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  if (slowQueryThreshold.count() > 0 && elapsed >= slowQueryThreshold) {
    Logger::warning(LogCategory::DATABASE, "runStatement",
                    "Slow query took " + std::to_string(elapsed.count()) +
                        "ms: " + sql);
  }
  return result;
}
} // namespace

PgBulkCopyChannel::PgBulkCopyChannel(const LoadContext &ctx,
                                     pqxx::connection &conn, pqxx::work &work,
                                     const std::string &quotedTablePath,
                                     const std::string &quotedColumns)
    : ctx_(ctx),
      stream_(pqxx::stream_to::raw_table(work, quotedTablePath, quotedColumns)),
      completed_(false),
      canceller_(std::make_unique<StatementCanceller>(
          ctx, [&conn]() { conn.cancel_query(); })) {}

template <typename Step> void PgBulkCopyChannel::guarded(Step &&step) {
  try {
    step();
  } catch (const std::exception &) {
    if (ctx_.isDone())
      ctx_.throwIfDone();
    throw;
  }
}

void PgBulkCopyChannel::writeRow(const SqlRow &row) {
  ctx_.throwIfDone();
  guarded([&]() { stream_.write_row(row); });
}

void PgBulkCopyChannel::complete() {
  if (completed_)
    return;
  completed_ = true;
  guarded([&]() { stream_.complete(); });
  canceller_.reset();
}

PgTransaction::PgTransaction(std::shared_ptr<pqxx::connection> conn,
                             std::chrono::milliseconds slowQueryThreshold)
    : conn_(std::move(conn)), work_(std::make_unique<pqxx::work>(*conn_)),
      slowQueryThreshold_(slowQueryThreshold), open_(true) {}

// The work object must go before the connection it runs on.
PgTransaction::~PgTransaction() { work_.reset(); }

long long PgTransaction::exec(const LoadContext &ctx, const std::string &sql,
                              const std::vector<SqlValue> &params) {
  return runCancellable(ctx, [conn = conn_]() { conn->cancel_query(); },
                        [&]() {
                          return runStatement(*work_, sql, params,
                                              slowQueryThreshold_)
                              .affected_rows();
                        });
}

SqlRows PgTransaction::query(const LoadContext &ctx, const std::string &sql,
                             const std::vector<SqlValue> &params) {
  return runCancellable(ctx, [conn = conn_]() { conn->cancel_query(); },
                        [&]() {
                          return toRows(runStatement(*work_, sql, params,
                                                     slowQueryThreshold_));
                        });
}

std::unique_ptr<IBulkCopyChannel>
PgTransaction::openBulkCopy(const LoadContext &ctx,
                            const std::string &schemaNamespace,
                            const std::string &table,
                            const std::vector<std::string> &columns) {
  ctx.throwIfDone();
  return std::make_unique<PgBulkCopyChannel>(
      ctx, *conn_, *work_, StringUtils::qualifiedName(schemaNamespace, table),
      StringUtils::quoteAndJoin(columns));
}

// A failed COMMIT has already been rolled back by the server, so the
// transaction counts as closed either way.
void PgTransaction::commit() {
  if (!open_.exchange(false)) {
    throw std::logic_error("commit on a transaction that is not open");
  }
  work_->commit();
}

void PgTransaction::rollback() {
  if (!open_.exchange(false))
    return;
  work_->abort();
}

bool PgTransaction::isOpen() const { return open_.load(); }

PgConnection::PgConnection(std::string connectionString,
                           std::chrono::milliseconds slowQueryThreshold)
    : connectionString_(std::move(connectionString)),
      slowQueryThreshold_(slowQueryThreshold) {}

PgConnection::~PgConnection() { close(); }

pqxx::connection &PgConnection::connectionUnlocked() {
  if (!conn_ || !conn_->is_open()) {
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
  }
  return *conn_;
}

pqxx::result PgConnection::run(const LoadContext &ctx, const std::string &sql,
                               const std::vector<SqlValue> &params) {
  ctx.throwIfDone();
  std::lock_guard<std::mutex> lock(mutex_);
  pqxx::connection &conn = connectionUnlocked();
  return runCancellable(ctx, [&conn]() { conn.cancel_query(); }, [&]() {
    pqxx::nontransaction ntx(conn);
    auto result = runStatement(ntx, sql, params, slowQueryThreshold_);
    ntx.commit();
    return result;
  });
}

long long PgConnection::exec(const LoadContext &ctx, const std::string &sql,
                             const std::vector<SqlValue> &params) {
  return run(ctx, sql, params).affected_rows();
}

SqlRows PgConnection::query(const LoadContext &ctx, const std::string &sql,
                            const std::vector<SqlValue> &params) {
  return toRows(run(ctx, sql, params));
}

std::shared_ptr<ITransaction> PgConnection::begin(const LoadContext &ctx) {
  ctx.throwIfDone();
  auto conn = std::make_shared<pqxx::connection>(connectionString_);
  return std::make_shared<PgTransaction>(std::move(conn), slowQueryThreshold_);
}

void PgConnection::ping(const LoadContext &ctx) { query(ctx, "SELECT 1"); }

void PgConnection::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
}
