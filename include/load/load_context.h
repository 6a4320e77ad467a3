#ifndef LOAD_CONTEXT_H
#define LOAD_CONTEXT_H

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

class ContextDoneError : public std::runtime_error {
public:
  explicit ContextDoneError(const std::string &message)
      : std::runtime_error(message) {}
};

// Caller-side deadline and cancellation flag. Copies share the same flag, so
// cancelling any copy stops every operation that was handed one.
class LoadContext {
private:
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  std::shared_ptr<std::atomic<bool>> cancelled_ =
      std::make_shared<std::atomic<bool>>(false);

public:
  LoadContext() = default;

  static LoadContext withTimeout(std::chrono::milliseconds timeout) {
    LoadContext ctx;
    ctx.deadline_ = std::chrono::steady_clock::now() + timeout;
    return ctx;
  }

  void cancel() { cancelled_->store(true); }

  bool isCancelled() const { return cancelled_->load(); }

  bool deadlineExceeded() const {
    return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
  }

  bool isDone() const { return isCancelled() || deadlineExceeded(); }

  void throwIfDone() const {
    if (isCancelled())
      throw ContextDoneError("context canceled");
    if (deadlineExceeded())
      throw ContextDoneError("context deadline exceeded");
  }
};

#endif
