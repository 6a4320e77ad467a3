#include "core/logger.h"
#include "load/load_stats.h"
#include "load/rollback_supervisor.h"
#include "support/fake_warehouse.h"
#include "support/test_runner.h"

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::CRITICAL);

  std::cout << "\n========================================" << std::endl;
  std::cout << "ROLLBACK SUPERVISOR TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  LoadTags tags{"ws-1", "analytics", "dest-1", "tracks", "dedup_deletion"};

  runner.runTest("Rollback within timeout", [&]() {
    RollbackSupervisor supervisor(std::chrono::milliseconds(1000));
    bool ran = false;
    auto outcome = supervisor.run([&] { ran = true; }, tags);
    runner.assertTrue(outcome == RollbackSupervisor::Outcome::COMPLETED,
                      "Completed");
    runner.assertTrue(ran, "Rollback ran");
  });

  runner.runTest("Rollback error is logged, not raised", [&]() {
    RollbackSupervisor supervisor(std::chrono::milliseconds(1000));
    auto outcome = supervisor.run(
        [] { throw std::runtime_error("connection lost"); }, tags);
    runner.assertTrue(outcome == RollbackSupervisor::Outcome::FAILED,
                      "Failed outcome");
  });

  runner.runTest("Non-standard rollback error is contained", [&]() {
    RollbackSupervisor supervisor(std::chrono::milliseconds(1000));
    auto outcome = supervisor.run([] { throw 42; }, tags);
    runner.assertTrue(outcome == RollbackSupervisor::Outcome::FAILED,
                      "Failed outcome");
  });

  runner.runTest("Hung rollback times out and counts the metric", [&]() {
    LoadStats::reset();
    RollbackSupervisor supervisor(std::chrono::milliseconds(50));
    auto release = std::make_shared<std::atomic<bool>>(false);

    auto start = std::chrono::steady_clock::now();
    auto outcome = supervisor.run(
        [release] {
          while (!release->load())
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        },
        tags);
    auto elapsed = std::chrono::steady_clock::now() - start;
    release->store(true);

    runner.assertTrue(outcome == RollbackSupervisor::Outcome::TIMED_OUT,
                      "Timed out");
    runner.assertTrue(elapsed < std::chrono::milliseconds(1000),
                      "Caller was not blocked");
    runner.assertEquals(1, LoadStats::get("pg_rollback_timeout", tags.toMap()),
                        "Timeout metric tagged with the stage");
  });

  runner.runTest("Custom timeout handler", [&]() {
    int calls = 0;
    std::string seenStage;
    RollbackSupervisor supervisor(std::chrono::milliseconds(20),
                                  [&](const LoadTags &t) {
                                    calls++;
                                    seenStage = t.stage;
                                  });
    supervisor.run(
        [] { std::this_thread::sleep_for(std::chrono::milliseconds(200)); },
        tags);
    runner.assertEquals(1, calls, "Handler called once");
    runner.assertEquals("dedup_deletion", seenStage, "Handler sees tags");
  });

  runner.runTest("Transaction rollback", [&]() {
    auto db = std::make_shared<FakeDatabase>();
    FakeConnection connection(db);
    RollbackSupervisor supervisor(std::chrono::milliseconds(1000));

    auto transaction = connection.begin(LoadContext());
    auto outcome = supervisor.rollback(transaction, tags);
    runner.assertTrue(outcome == RollbackSupervisor::Outcome::COMPLETED,
                      "Completed");
    runner.assertFalse(transaction->isOpen(), "Transaction closed");
    runner.assertEquals(1, db->rollbacks, "One rollback");

    supervisor.rollback(transaction, tags);
    runner.assertEquals(1, db->rollbacks, "Closed transaction is skipped");
  });

  runner.runTest("Abandoned transaction stays valid", [&]() {
    auto db = std::make_shared<FakeDatabase>();
    db->rollbackDelay = std::chrono::milliseconds(200);
    RollbackSupervisor supervisor(std::chrono::milliseconds(20));
    {
      FakeConnection connection(db);
      auto transaction = connection.begin(LoadContext());
      auto outcome = supervisor.rollback(transaction, tags);
      runner.assertTrue(outcome == RollbackSupervisor::Outcome::TIMED_OUT,
                        "Timed out");
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    std::lock_guard<std::mutex> lock(db->mutex);
    runner.assertEquals(1, db->rollbacks,
                        "Rollback finished after the caller moved on");
  });

  runner.printSummary();
  return 0;
}
