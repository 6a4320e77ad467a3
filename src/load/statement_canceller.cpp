#include "load/statement_canceller.h"
#include "core/logger.h"
#include "core/warehouse_defaults.h"

StatementCanceller::StatementCanceller(const LoadContext &ctx,
                                       std::function<void()> cancel,
                                       std::chrono::milliseconds pollInterval)
    : ctx_(ctx), cancel_(std::move(cancel)), pollInterval_(pollInterval) {
  watcher_ = std::thread(&StatementCanceller::watch, this);
}

StatementCanceller::StatementCanceller(const LoadContext &ctx,
                                       std::function<void()> cancel)
    : StatementCanceller(
          ctx, std::move(cancel),
          std::chrono::milliseconds(
              WarehouseDefaults::STATEMENT_CANCEL_POLL_INTERVAL_MS)) {}

StatementCanceller::~StatementCanceller() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  stopCV_.notify_all();
  if (watcher_.joinable())
    watcher_.join();
}

void StatementCanceller::watch() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (ctx_.isDone()) {
      lock.unlock();
      fired_.store(true);
      try {
        cancel_();
      } catch (const std::exception &e) {
        Logger::error(LogCategory::DATABASE, "StatementCanceller",
                      "Failed to cancel running statement: " +
                          std::string(e.what()));
      }
      return;
    }
    stopCV_.wait_for(lock, pollInterval_, [this] { return stopping_; });
  }
}
