#include "core/logger.h"
#include "load/dedup_merge_engine.h"
#include "load/staging_table_loader.h"
#include "support/fake_warehouse.h"
#include "support/test_runner.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace {
const std::string STAGING_PREFIX = "wh_staging_postgres_";

struct Harness {
  std::shared_ptr<FakeDatabase> db = std::make_shared<FakeDatabase>();
  FakeConnection connection{db};
  FakeDownloader downloader{(fs::temp_directory_path() /
                             "staging_table_loader_test")
                                .string()};
  RollbackSupervisor supervisor{std::chrono::milliseconds(1000)};
  StagingTableLoader loader{connection, downloader, supervisor, "analytics",
                            LoadTags{"ws-1", "", "dest-1", "", ""}};
  TableSchema schema = {{"id", "string"}, {"name", "string"},
                        {"received_at", "datetime"}};

  bool localFilesRemoved() const {
    for (const auto &path : downloader.lastPaths) {
      if (fs::exists(path))
        return false;
    }
    return true;
  }
};
} // namespace

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::CRITICAL);

  std::cout << "\n========================================" << std::endl;
  std::cout << "STAGING TABLE LOADER TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Staging table is created like the destination", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    StagedLoad staged = h.loader.stage(LoadContext(), "tracks", h.schema);

    runner.assertTrue(staged.stagingTableName().rfind(STAGING_PREFIX, 0) == 0,
                      "Provider staging prefix");
    auto creates = h.db->statementsContaining("(LIKE \"analytics\".\"tracks\")");
    runner.assertEquals(1, static_cast<long long>(creates.size()),
                        "CREATE TABLE ... (LIKE destination)");
    runner.assertEquals(3, static_cast<long long>(staged.columns().size()),
                        "Columns from the upload schema");
    runner.assertEquals("id", staged.columns()[0], "Columns sorted");
    runner.assertTrue(staged.transaction().isOpen(),
                      "Transaction left open for the merge");
    runner.assertTrue(h.localFilesRemoved(), "Local files removed");
  });

  runner.runTest("Namespace is selected before the staging table", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    StagedLoad staged = h.loader.stage(LoadContext(), "tracks", h.schema);

    long long searchPathAt = -1;
    long long createAt = -1;
    for (size_t i = 0; i < h.db->statements.size(); ++i) {
      const std::string &sql = h.db->statements[i];
      if (sql == "SET LOCAL search_path TO \"analytics\"")
        searchPathAt = static_cast<long long>(i);
      if (sql.rfind("CREATE TABLE", 0) == 0 && createAt < 0)
        createAt = static_cast<long long>(i);
    }
    runner.assertTrue(searchPathAt >= 0, "search_path set in the transaction");
    runner.assertTrue(searchPathAt < createAt, "Set before CREATE TABLE");
  });

  runner.runTest("search_path failure is a transaction_begin error", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    h.db->failOn.push_back("search_path");
    try {
      h.loader.stage(LoadContext(), "tracks", h.schema);
      runner.assertTrue(false, "Stage should fail");
    } catch (const LoadError &e) {
      runner.assertEquals("transaction_begin", e.stageName(), "Stage");
    }
    runner.assertEquals(1, h.db->rollbacks, "Rolled back");
    runner.assertTrue(h.db->statementsContaining("CREATE TABLE").empty(),
                      "No staging table created");
    runner.assertTrue(h.localFilesRemoved(), "Local files removed");
  });

  runner.runTest("Rows from every file go through one channel", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n2,b,2024-01-02\n");
    h.downloader.addFile("tracks", "3,c,2024-01-03\n");
    std::string stagingName;
    {
      StagedLoad staged = h.loader.stage(LoadContext(), "tracks", h.schema);
      stagingName = staged.stagingTableName();
      staged.transaction().commit();
    }
    runner.assertEquals(
        1, static_cast<long long>(h.db->statementsContaining("COPY ").size()),
        "One bulk copy channel");
    runner.assertEquals(
        3,
        static_cast<long long>(h.db->copiedRows["analytics." + stagingName].size()),
        "All rows copied");
  });

  runner.runTest("Blank fields are loaded as NULL", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,, \n");
    std::string stagingName;
    {
      StagedLoad staged = h.loader.stage(LoadContext(), "tracks", h.schema);
      stagingName = staged.stagingTableName();
      staged.transaction().commit();
    }
    const auto &rows = h.db->copiedRows["analytics." + stagingName];
    runner.assertEquals(1, static_cast<long long>(rows.size()), "One row");
    runner.assertEquals("1", rows[0][0].value_or("<null>"), "id");
    runner.assertFalse(rows[0][1].has_value(), "Empty field is NULL");
    runner.assertFalse(rows[0][2].has_value(), "Whitespace field is NULL");
  });

  runner.runTest("Staging table is dropped after the merge", [&]() {
    Harness h;
    DedupKeyRegistry keys = DedupKeyRegistry::withDefaults();
    DedupMergeEngine engine(keys, "analytics", "received_at", false);
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    {
      StagedLoad staged = h.loader.stage(LoadContext(), "tracks", h.schema);
      engine.merge(LoadContext(), staged);
      runner.assertEquals(
          1, static_cast<long long>(h.db->tablesWithPrefix(STAGING_PREFIX).size()),
          "Staging table exists until the load is released");
    }
    runner.assertTrue(h.db->tablesWithPrefix(STAGING_PREFIX).empty(),
                      "Staging table dropped");
    runner.assertEquals(
        1,
        static_cast<long long>(
            h.db->statementsContaining("DROP TABLE IF EXISTS").size()),
        "Dropped once");
  });

  runner.runTest("Skipped cleanup keeps the staging table", [&]() {
    Harness h;
    h.downloader.addFile("identifies", "1,a,2024-01-01\n");
    std::string stagingName;
    {
      StagedLoad staged =
          h.loader.stage(LoadContext(), "identifies", h.schema, true);
      stagingName = staged.stagingTableName();
      staged.transaction().commit();
    }
    runner.assertTrue(h.db->hasTable("analytics", stagingName),
                      "Staging table survives");
    runner.assertTrue(h.db->statementsContaining("DROP TABLE").empty(),
                      "No drop issued");
  });

  runner.runTest("Column count mismatch rolls back and cleans up", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    h.downloader.addFile("tracks", "1,a,2024-01-01\n2,b\n");
    try {
      h.loader.stage(LoadContext(), "tracks", h.schema);
      runner.assertTrue(false, "Stage should fail");
    } catch (const LoadError &e) {
      runner.assertEquals("csv_column_count_mismatch", e.stageName(), "Stage");
      runner.assertEquals("csv_column_count_mismatch", e.tags().stage,
                          "Tagged stage");
      runner.assertEquals("tracks", e.tags().tableName, "Tagged table");
      runner.assertContains(e.what(),
                            "Processed rows in csv file until mismatch: 1",
                            "Rows before mismatch");
    }
    runner.assertEquals(1, h.db->rollbacks, "Rolled back");
    runner.assertEquals(0, h.db->commits, "Not committed");
    runner.assertTrue(h.db->copiedRows.empty(), "Nothing reached the table");
    runner.assertTrue(h.db->tablesWithPrefix(STAGING_PREFIX).empty(),
                      "No staging table left behind");
    runner.assertEquals(
        1,
        static_cast<long long>(
            h.db->statementsContaining("DROP TABLE IF EXISTS").size()),
        "Drop still issued");
    runner.assertTrue(h.localFilesRemoved(), "Local files removed");
  });

  runner.runTest("Staging table creation failure", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    h.db->failOn.push_back("(LIKE");
    try {
      h.loader.stage(LoadContext(), "tracks", h.schema);
      runner.assertTrue(false, "Stage should fail");
    } catch (const LoadError &e) {
      runner.assertEquals("staging_table_creation", e.stageName(), "Stage");
    }
    runner.assertEquals(1, h.db->rollbacks, "Rolled back");
    runner.assertTrue(h.db->statementsContaining("DROP TABLE").empty(),
                      "Nothing to drop");
  });

  runner.runTest("Begin failure", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    h.db->failBegin = true;
    try {
      h.loader.stage(LoadContext(), "tracks", h.schema);
      runner.assertTrue(false, "Stage should fail");
    } catch (const LoadError &e) {
      runner.assertEquals("transaction_begin", e.stageName(), "Stage");
    }
    runner.assertTrue(h.db->statementsContaining("CREATE TABLE").empty(),
                      "No staging table");
    runner.assertTrue(h.localFilesRemoved(), "Local files removed");
  });

  runner.runTest("Bulk copy failures", [&]() {
    {
      Harness h;
      h.downloader.addFile("tracks", "1,a,2024-01-01\n");
      h.db->failBulkOpen = true;
      try {
        h.loader.stage(LoadContext(), "tracks", h.schema);
        runner.assertTrue(false, "Stage should fail");
      } catch (const LoadError &e) {
        runner.assertEquals("staging_table_copy_in_schema", e.stageName(),
                            "Open failure");
      }
    }
    {
      Harness h;
      h.downloader.addFile("tracks", "1,a,2024-01-01\n");
      h.db->failOn.push_back("COPY ROW");
      try {
        h.loader.stage(LoadContext(), "tracks", h.schema);
        runner.assertTrue(false, "Stage should fail");
      } catch (const LoadError &e) {
        runner.assertEquals("staging_table_loading", e.stageName(),
                            "Row failure");
      }
      runner.assertEquals(1, h.db->rollbacks, "Rolled back");
    }
    {
      Harness h;
      h.downloader.addFile("tracks", "1,a,2024-01-01\n");
      h.db->failBulkComplete = true;
      try {
        h.loader.stage(LoadContext(), "tracks", h.schema);
        runner.assertTrue(false, "Stage should fail");
      } catch (const LoadError &e) {
        runner.assertEquals("staging_table_load_stage", e.stageName(),
                            "Completion failure");
      }
    }
  });

  runner.runTest("Malformed quoting is a csv reading error", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,\"a,2024-01-01\n");
    try {
      h.loader.stage(LoadContext(), "tracks", h.schema);
      runner.assertTrue(false, "Stage should fail");
    } catch (const LoadError &e) {
      runner.assertEquals("load_files_csv_reading", e.stageName(), "Stage");
    }
    runner.assertEquals(1, h.db->rollbacks, "Rolled back");
  });

  runner.runTest("Cancelled context fails the download", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    LoadContext ctx;
    ctx.cancel();
    try {
      h.loader.stage(ctx, "tracks", h.schema);
      runner.assertTrue(false, "Stage should fail");
    } catch (const LoadError &e) {
      runner.assertEquals("load_files_download", e.stageName(), "Stage");
    }
    runner.assertEquals(0, h.db->begins, "No transaction begun");
  });

  runner.runTest("Deadline interrupts staging table creation", [&]() {
    Harness h;
    h.downloader.addFile("tracks", "1,a,2024-01-01\n");
    h.db->blockOn = {"(LIKE \"analytics\".\"tracks\")"};
    LoadContext ctx = LoadContext::withTimeout(std::chrono::milliseconds(500));

    auto start = std::chrono::steady_clock::now();
    try {
      h.loader.stage(ctx, "tracks", h.schema);
      runner.assertTrue(false, "Staging should fail");
    } catch (const LoadError &e) {
      runner.assertEquals("staging_table_creation", e.stageName(), "Stage");
      runner.assertContains(e.what(), "context deadline exceeded",
                            "Deadline error");
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    runner.assertTrue(elapsed < std::chrono::seconds(5),
                      "Returned long before the statement would finish");
    runner.assertEquals(1, h.db->cancelledStatements,
                        "Running statement was cancelled");
    runner.assertEquals(1, h.db->rollbacks, "Transaction rolled back");
    runner.assertTrue(h.localFilesRemoved(), "Local files removed");
  });

  runner.printSummary();
  return 0;
}
