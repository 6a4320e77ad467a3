#ifndef ROLLBACK_SUPERVISOR_H
#define ROLLBACK_SUPERVISOR_H

#include "load/load_tags.h"
#include "load/sql_executor.h"
#include <chrono>
#include <functional>
#include <memory>

// Races a rollback against a timeout. The rollback runs on its own detached
// thread; when the timer wins the thread is abandoned, never joined, and the
// transaction it holds is released whenever the rollback eventually returns.
class RollbackSupervisor {
public:
  enum class Outcome { COMPLETED, FAILED, TIMED_OUT };
  using TimeoutHandler = std::function<void(const LoadTags &)>;

  explicit RollbackSupervisor(std::chrono::milliseconds timeout,
                              TimeoutHandler onTimeout = nullptr);

  Outcome run(std::function<void()> rollback, const LoadTags &tags) const;

  // Rolls back a still-open transaction. Closed transactions are a no-op
  // reported as COMPLETED.
  Outcome rollback(std::shared_ptr<ITransaction> transaction,
                   const LoadTags &tags) const;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
  TimeoutHandler onTimeout_;
};

#endif
