#include <chrono>

#include <sqlite3.h>
#include <gtest/gtest.h>
#include <sqljudge/paths.h>
#include <sqljudge/sandbox.h>
#include <sqljudge/sandbox_exec.h>

#include "utils.h"
#include "example_problem.h"

namespace {

constexpr char kEndless[] =
    "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT count(*) FROM c";

class SandboxTest : public ExampleProblem {
 protected:
  SandboxOptions Options(const std::string& sql) {
    SandboxOptions opt;
    opt.sql = sql;
    opt.dataset = (ProblemPath(1) / "dataset.sql").string();
    opt.time_limit = 2'000'000;
    opt.memory_limit = 64 * 1024;
    opt.max_rows = 100;
    return opt;
  }
};

} // namespace

TEST_F(SandboxTest, Top3) {
  auto res = RunQuery(Options(kTop3Query));
  ASSERT_EQ(res.status, SandboxStatus::OK) << res.error;
  EXPECT_EQ(res.result.columns, (std::vector<std::string>{"id", "rev"}));
  EXPECT_EQ(res.result.rows, nlohmann::json({{1, 100}, {2, 90}, {3, 80}}));
  EXPECT_EQ(res.meta.tables_read, std::vector<std::string>{"sales"});
  EXPECT_EQ(res.meta.dataset_tables, std::vector<std::string>{"sales"});
  EXPECT_GT(res.meta.vm_steps, 0);
}

TEST_F(SandboxTest, HardcodedReadsNoTable) {
  auto res = RunQuery(Options(kTop3Hardcoded));
  ASSERT_EQ(res.status, SandboxStatus::OK) << res.error;
  EXPECT_EQ(res.result.rows.size(), 3u);
  EXPECT_TRUE(res.meta.tables_read.empty());
}

TEST_F(SandboxTest, ValueTypes) {
  auto res = RunQuery(Options("SELECT NULL, 1.5, 'x', X'0aff', 7"));
  ASSERT_EQ(res.status, SandboxStatus::OK) << res.error;
  EXPECT_EQ(res.result.rows[0], nlohmann::json({nullptr, 1.5, "x", "0aff", 7}));
}

TEST_F(SandboxTest, SyntaxError) {
  auto res = RunQuery(Options("SELEC id FROM sales"));
  EXPECT_EQ(res.status, SandboxStatus::QUERY_ERROR);
  EXPECT_NE(res.error.find("syntax error"), std::string::npos);
}

TEST_F(SandboxTest, UnknownTable) {
  EXPECT_EQ(RunQuery(Options("SELECT * FROM orders")).status, SandboxStatus::QUERY_ERROR);
}

TEST_F(SandboxTest, EmptyStatement) {
  EXPECT_EQ(RunQuery(Options("  -- nothing\n")).status, SandboxStatus::QUERY_ERROR);
}

class SandboxSecurityTest : public SandboxTest, public ::testing::WithParamInterface<const char*> {};

TEST_P(SandboxSecurityTest, Rejected) {
  auto res = RunQuery(Options(GetParam()));
  EXPECT_EQ(res.status, SandboxStatus::SECURITY) << res.error;
  EXPECT_TRUE(res.result.rows.empty());
}

INSTANTIATE_TEST_SUITE_P(Statements, SandboxSecurityTest, ::testing::Values(
    "DELETE FROM sales",
    "UPDATE sales SET rev = 0",
    "INSERT INTO sales VALUES (7, 'east', 1)",
    "DROP TABLE sales",
    "CREATE TABLE t (x)",
    "PRAGMA writable_schema = 1",
    "ATTACH DATABASE '/tmp/x.db' AS x",
    "BEGIN",
    "SELECT load_extension('/tmp/evil.so')",
    "SELECT 1; DELETE FROM sales",
    "SELECT 1; SELECT 2"));

TEST_F(SandboxTest, TrailingCommentAllowed) {
  EXPECT_EQ(RunQuery(Options("SELECT id FROM sales; -- done")).status, SandboxStatus::OK);
}

TEST_F(SandboxTest, RowLimit) {
  auto opt = Options("SELECT * FROM sales");
  opt.max_rows = 5;
  auto res = RunQuery(opt);
  EXPECT_EQ(res.status, SandboxStatus::ROW_LIMIT);
  opt.max_rows = 6;
  EXPECT_EQ(RunQuery(opt).status, SandboxStatus::OK);
}

TEST_F(SandboxTest, DeadlineInProcess) {
  auto opt = Options(kEndless);
  opt.time_limit = 200'000;
  auto start = std::chrono::steady_clock::now();
  auto res = RunQuery(opt);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(res.status, SandboxStatus::TIMEOUT);
  EXPECT_LT(elapsed, std::chrono::seconds(2));
}

TEST_F(SandboxTest, MissingDataset) {
  auto opt = Options(kTop3Query);
  opt.dataset = (root / "missing.sql").string();
  EXPECT_EQ(RunQuery(opt).status, SandboxStatus::INTERNAL);
}

TEST_F(SandboxTest, DatabaseFileDataset) {
  fs::path db_path = root / "sales.db";
  {
    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_path.c_str(), &db), SQLITE_OK);
    ASSERT_EQ(sqlite3_exec(db, kSalesDataset, nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);
  }
  auto opt = Options(kTop3Query);
  opt.dataset = db_path.string();
  auto res = RunQuery(opt);
  ASSERT_EQ(res.status, SandboxStatus::OK) << res.error;
  EXPECT_EQ(res.result.rows.size(), 3u);
  // the source file is copied, never written
  opt.sql = "SELECT count(*) FROM sales";
  EXPECT_EQ(RunQuery(opt).result.rows, nlohmann::json::array({nlohmann::json::array({6})}));
}

TEST_F(SandboxTest, OptionsTransport) {
  auto opt = Options(kTop3Query);
  auto back = SandboxOptions::Deserialize(opt.Serialize());
  EXPECT_EQ(back.sql, opt.sql);
  EXPECT_EQ(back.max_rows, opt.max_rows);
  EXPECT_THROW(SandboxOptions::Deserialize("{"), nlohmann::json::exception);
}

TEST_F(SandboxTest, ExecTop3) {
  auto res = SandboxExec(Options(kTop3Query));
  ASSERT_EQ(res.status, SandboxStatus::OK) << res.error;
  EXPECT_EQ(res.result.rows, nlohmann::json({{1, 100}, {2, 90}, {3, 80}}));
  EXPECT_EQ(res.meta.tables_read, std::vector<std::string>{"sales"});
}

TEST_F(SandboxTest, ExecWriteDenied) {
  EXPECT_EQ(SandboxExec(Options("DELETE FROM sales")).status, SandboxStatus::SECURITY);
}

TEST_F(SandboxTest, ExecSyntaxError) {
  auto res = SandboxExec(Options("SELECT FROM"));
  EXPECT_EQ(res.status, SandboxStatus::QUERY_ERROR);
  EXPECT_FALSE(res.error.empty());
}

TEST_F(SandboxTest, ExecTimeoutBounded) {
  auto opt = Options(kEndless);
  opt.time_limit = 300'000;
  auto start = std::chrono::steady_clock::now();
  auto res = SandboxExec(opt);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(res.status, SandboxStatus::TIMEOUT);
  EXPECT_LT(elapsed, std::chrono::microseconds(opt.time_limit + kSandboxGrace + 500'000));
}

TEST_F(SandboxTest, ExecMemoryLimit) {
  auto opt = Options("WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c LIMIT 5000000) "
                     "SELECT length(group_concat(x)) FROM c");
  opt.memory_limit = 8 * 1024;
  opt.time_limit = 10'000'000;
  EXPECT_EQ(SandboxExec(opt).status, SandboxStatus::MEMORY);
}

TEST_F(SandboxTest, ExecMissingHelper) {
  fs::path saved = internal::kDataDir;
  internal::kDataDir = root / "nowhere";
  auto res = SandboxExec(Options(kTop3Query));
  internal::kDataDir = saved;
  EXPECT_EQ(res.status, SandboxStatus::INTERNAL);
}
