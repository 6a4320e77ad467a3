#ifndef SQL_EXECUTOR_H
#define SQL_EXECUTOR_H

#include "load/load_context.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// A nullopt value is SQL NULL.
using SqlValue = std::optional<std::string>;
using SqlRow = std::vector<SqlValue>;
using SqlRows = std::vector<SqlRow>;

// Anything that can run statements: a live transaction or a bare connection.
class ISqlExecutor {
public:
  virtual ~ISqlExecutor() = default;

  // Returns the number of affected rows.
  virtual long long exec(const LoadContext &ctx, const std::string &sql,
                         const std::vector<SqlValue> &params = {}) = 0;
  virtual SqlRows query(const LoadContext &ctx, const std::string &sql,
                        const std::vector<SqlValue> &params = {}) = 0;
};

// Streaming ingest path into one table. Rows must match the column list the
// channel was opened with.
class IBulkCopyChannel {
public:
  virtual ~IBulkCopyChannel() = default;

  virtual void writeRow(const SqlRow &row) = 0;
  virtual void complete() = 0;
};

class ITransaction : public ISqlExecutor {
public:
  virtual std::unique_ptr<IBulkCopyChannel>
  openBulkCopy(const LoadContext &ctx, const std::string &schemaNamespace,
               const std::string &table,
               const std::vector<std::string> &columns) = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;
  virtual bool isOpen() const = 0;
};

// Non-transactional executor. Every transaction it begins runs on its own
// session so an abandoned rollback never shares a session with later work.
class IWarehouseConnection : public ISqlExecutor {
public:
  virtual std::shared_ptr<ITransaction> begin(const LoadContext &ctx) = 0;
  virtual void ping(const LoadContext &ctx) = 0;
  virtual void close() = 0;
};

#endif
