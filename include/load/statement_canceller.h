#ifndef STATEMENT_CANCELLER_H
#define STATEMENT_CANCELLER_H

#include "load/load_context.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

// Watches a LoadContext while a statement is in flight and calls the cancel
// callback once, from its own thread, as soon as the context is cancelled or
// its deadline passes. Stops watching when destroyed.
class StatementCanceller {
public:
  StatementCanceller(const LoadContext &ctx, std::function<void()> cancel,
                     std::chrono::milliseconds pollInterval);
  StatementCanceller(const LoadContext &ctx, std::function<void()> cancel);
  ~StatementCanceller();

  StatementCanceller(const StatementCanceller &) = delete;
  StatementCanceller &operator=(const StatementCanceller &) = delete;

  bool fired() const { return fired_.load(); }

private:
  void watch();

  LoadContext ctx_;
  std::function<void()> cancel_;
  std::chrono::milliseconds pollInterval_;
  std::atomic<bool> fired_{false};
  bool stopping_ = false;
  std::mutex mutex_;
  std::condition_variable stopCV_;
  std::thread watcher_;
};

// Runs a statement under a StatementCanceller. A failure raised after the
// context ended is reported as the context error rather than the driver's
// cancellation message.
template <typename Statement>
auto runCancellable(const LoadContext &ctx, std::function<void()> cancel,
                    Statement &&statement) -> decltype(statement()) {
  ctx.throwIfDone();
  StatementCanceller canceller(ctx, std::move(cancel));
  try {
    return statement();
  } catch (const std::exception &) {
    if (ctx.isDone())
      ctx.throwIfDone();
    throw;
  }
}

#endif
