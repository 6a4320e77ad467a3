#include "core/logger.h"
#include "load/statement_canceller.h"
#include "support/test_runner.h"
#include <atomic>
#include <thread>

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::CRITICAL);

  std::cout << "\n========================================" << std::endl;
  std::cout << "STATEMENT CANCELLER TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  const std::chrono::milliseconds poll(10);

  runner.runTest("Cancel from another thread fires the callback", [&]() {
    LoadContext ctx;
    std::atomic<int> calls{0};
    {
      StatementCanceller canceller(ctx, [&]() { calls++; }, poll);
      std::thread([ctx]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        ctx.cancel();
      }).join();
      auto waitUntil =
          std::chrono::steady_clock::now() + std::chrono::seconds(2);
      while (!canceller.fired() && std::chrono::steady_clock::now() < waitUntil)
        std::this_thread::sleep_for(poll);
      runner.assertTrue(canceller.fired(), "Watcher saw the cancellation");
    }
    runner.assertEquals(1, calls.load(), "Callback runs once");
  });

  runner.runTest("Finished statement never cancels", [&]() {
    LoadContext ctx;
    std::atomic<int> calls{0};
    {
      StatementCanceller canceller(ctx, [&]() { calls++; }, poll);
    }
    ctx.cancel();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    runner.assertEquals(0, calls.load(), "Watcher stopped with its scope");
  });

  runner.runTest("Deadline fires the callback", [&]() {
    LoadContext ctx = LoadContext::withTimeout(std::chrono::milliseconds(20));
    std::atomic<bool> called{false};
    StatementCanceller canceller(ctx, [&]() { called = true; }, poll);
    auto waitUntil = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!called && std::chrono::steady_clock::now() < waitUntil)
      std::this_thread::sleep_for(poll);
    runner.assertTrue(called.load(), "Deadline reached while running");
  });

  runner.runTest("Throwing cancel callback is contained", [&]() {
    LoadContext ctx;
    ctx.cancel();
    StatementCanceller canceller(
        ctx, []() { throw std::runtime_error("no connection"); }, poll);
    auto waitUntil = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!canceller.fired() && std::chrono::steady_clock::now() < waitUntil)
      std::this_thread::sleep_for(poll);
    runner.assertTrue(canceller.fired(), "Fired despite the failure");
  });

  runner.runTest("Interrupted statement reports the context error", [&]() {
    LoadContext ctx;
    std::atomic<bool> interrupted{false};
    std::thread canceller([ctx]() mutable {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      ctx.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    try {
      runCancellable(
          ctx, [&]() { interrupted = true; },
          [&]() {
            auto giveUp =
                std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!interrupted && std::chrono::steady_clock::now() < giveUp)
              std::this_thread::sleep_for(std::chrono::milliseconds(5));
            throw std::runtime_error(
                "ERROR: canceling statement due to user request");
            return 0;
          });
      runner.assertTrue(false, "Statement should fail");
    } catch (const ContextDoneError &e) {
      runner.assertEquals("context canceled", std::string(e.what()),
                          "Context error replaces the driver error");
    }
    canceller.join();
    auto elapsed = std::chrono::steady_clock::now() - start;
    runner.assertTrue(elapsed < std::chrono::seconds(5),
                      "Unwound before the statement finished on its own");
  });

  runner.runTest("Failure with a live context is passed through", [&]() {
    LoadContext ctx;
    try {
      runCancellable(ctx, []() {}, []() -> int {
        throw std::runtime_error("ERROR: relation does not exist");
      });
      runner.assertTrue(false, "Statement should fail");
    } catch (const ContextDoneError &) {
      runner.assertTrue(false, "Not a context error");
    } catch (const std::runtime_error &e) {
      runner.assertContains(e.what(), "relation does not exist",
                            "Driver error kept");
    }
  });

  runner.runTest("Result is returned when the statement completes", [&]() {
    LoadContext ctx;
    int value = runCancellable(ctx, []() {}, []() { return 42; });
    runner.assertEquals(42, value, "Statement result");
  });

  runner.runTest("Already cancelled context never runs the statement", [&]() {
    LoadContext ctx;
    ctx.cancel();
    bool ran = false;
    try {
      runCancellable(ctx, []() {}, [&]() {
        ran = true;
        return 0;
      });
      runner.assertTrue(false, "Should not run");
    } catch (const ContextDoneError &e) {
      runner.assertContains(e.what(), "context canceled", "Context error");
    }
    runner.assertFalse(ran, "Statement skipped");
  });

  runner.printSummary();
  return 0;
}
