#include "load/rollback_supervisor.h"
#include "core/logger.h"
#include "load/load_stats.h"
#include <future>
#include <thread>

RollbackSupervisor::RollbackSupervisor(std::chrono::milliseconds timeout,
                                       TimeoutHandler onTimeout)
    : timeout_(timeout), onTimeout_(std::move(onTimeout)) {
  if (!onTimeout_) {
    onTimeout_ = [](const LoadTags &tags) {
      LoadStats::count("pg_rollback_timeout", tags.toMap());
    };
  }
}

RollbackSupervisor::Outcome
RollbackSupervisor::run(std::function<void()> rollback,
                        const LoadTags &tags) const {
  auto done = std::make_shared<std::promise<void>>();
  std::future<void> result = done->get_future();

  std::thread([done, rollback = std::move(rollback)]() {
    try {
      rollback();
      done->set_value();
    } catch (...) {
      done->set_exception(std::current_exception());
    }
  }).detach();

  if (result.wait_for(timeout_) != std::future_status::ready) {
    onTimeout_(tags);
    Logger::warning(LogCategory::DATABASE, "RollbackSupervisor",
                    "Rollback timed out after " +
                        std::to_string(timeout_.count()) + "ms, abandoning " +
                        tags.toString());
    return Outcome::TIMED_OUT;
  }

  try {
    result.get();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "RollbackSupervisor",
                  "Rollback failed for " + tags.toString() + ": " +
                      std::string(e.what()));
    return Outcome::FAILED;
  } catch (...) {
    Logger::error(LogCategory::DATABASE, "RollbackSupervisor",
                  "Rollback failed for " + tags.toString() +
                      ": unknown exception");
    return Outcome::FAILED;
  }
  return Outcome::COMPLETED;
}

RollbackSupervisor::Outcome
RollbackSupervisor::rollback(std::shared_ptr<ITransaction> transaction,
                             const LoadTags &tags) const {
  if (!transaction || !transaction->isOpen())
    return Outcome::COMPLETED;
  return run([transaction]() { transaction->rollback(); }, tags);
}
