#include <gtest/gtest.h>
#include <sqljudge/intake.h>

#include "utils.h"
#include "example_problem.h"

namespace {

using IntakeTest = ExampleService;

std::string SubmitBody(int problem, const std::string& sql) {
  return nlohmann::json{{"userId", 3}, {"problemId", problem}, {"sqlText", sql}}.dump();
}

} // namespace

TEST_F(IntakeTest, SubmitAndFetch) {
  auto resp = HandleSubmit(*dispatcher, SubmitBody(1, kTop3Query));
  ASSERT_EQ(resp.status, 201) << resp.body.dump();
  int64_t id = resp.body.at("submissionId").get<int64_t>();
  auto result = HandleResult(*dispatcher, std::to_string(id));
  EXPECT_EQ(result.status, 200);
  EXPECT_EQ(result.body["status"], "completed");
  EXPECT_EQ(result.body["pass"], true);
  EXPECT_TRUE(result.body["executionTimeMs"].is_number_integer());
  EXPECT_FALSE(result.body.contains("errorMessage"));
  EXPECT_EQ(result.body["passedTests"], 1);
  EXPECT_EQ(result.body["totalTests"], 1);
  EXPECT_DOUBLE_EQ(result.body["score"].get<double>(), 100);
}

TEST_F(IntakeTest, FailedResultCarriesMessage) {
  auto resp = HandleSubmit(*dispatcher, SubmitBody(1, "SELECT nope FROM sales"));
  ASSERT_EQ(resp.status, 201);
  auto result = HandleResult(*dispatcher, std::to_string(resp.body["submissionId"].get<int64_t>()));
  EXPECT_EQ(result.status, 200);
  EXPECT_EQ(result.body["status"], "failed");
  EXPECT_EQ(result.body["pass"], false);
  EXPECT_TRUE(result.body.contains("errorMessage"));
}

TEST_F(IntakeTest, Pending) {
  MakeLive();
  auto resp = HandleSubmit(*dispatcher, SubmitBody(1, kTop3Query));
  ASSERT_EQ(resp.status, 201);
  auto result = HandleResult(*dispatcher, std::to_string(resp.body["submissionId"].get<int64_t>()));
  EXPECT_EQ(result.status, 202);
  EXPECT_EQ(result.body["status"], "pending");
}

TEST_F(IntakeTest, Running) {
  MakeLive();
  auto resp = HandleSubmit(*dispatcher, SubmitBody(1, kTop3Query));
  ASSERT_EQ(resp.status, 201);
  int64_t id = resp.body["submissionId"].get<int64_t>();
  // a worker picked it up
  auto job = primary.Pop(std::chrono::milliseconds(10));
  ASSERT_TRUE(job);
  ASSERT_TRUE(primary.Claim(*job, "test:0"));
  auto result = HandleResult(*dispatcher, std::to_string(id));
  EXPECT_EQ(result.status, 202);
  EXPECT_EQ(result.body["status"], "running");

  // the same while an executor holds the lease
  primary.SetStatus(*job, JobStatus::PENDING);
  ASSERT_TRUE(store->AcquireLease(id, "test:0", UnixMicros() + 60'000'000));
  EXPECT_EQ(HandleResult(*dispatcher, std::to_string(id)).body["status"], "running");
  store->ReleaseLease(id, "test:0");
  EXPECT_EQ(HandleResult(*dispatcher, std::to_string(id)).body["status"], "pending");
}

TEST_F(IntakeTest, BadRequests) {
  EXPECT_EQ(HandleSubmit(*dispatcher, "{").status, 400);
  EXPECT_EQ(HandleSubmit(*dispatcher, "[]").status, 400);
  EXPECT_EQ(HandleSubmit(*dispatcher, R"({"userId": 1, "problemId": 1})").status, 400);
  EXPECT_EQ(HandleSubmit(*dispatcher, R"({"userId": "a", "problemId": 1, "sqlText": "SELECT 1"})").status, 400);
  auto resp = HandleSubmit(*dispatcher, SubmitBody(1, "   "));
  EXPECT_EQ(resp.status, 400);
  EXPECT_EQ(resp.body["error"], "InvalidInput");
  EXPECT_EQ(HandleSubmit(*dispatcher, SubmitBody(99, kTop3Query)).status, 400);
  // ids beyond the range of int are rejected, not truncated
  EXPECT_EQ(HandleSubmit(*dispatcher, R"({"userId": 1099511627776, "problemId": 1, "sqlText": "SELECT 1"})").status, 400);
  EXPECT_EQ(HandleSubmit(*dispatcher, R"({"userId": 1, "problemId": 4294967297, "sqlText": "SELECT 1"})").status, 400);
  EXPECT_EQ(HandleSubmit(*dispatcher, R"({"userId": -3000000000, "problemId": 1, "sqlText": "SELECT 1"})").status, 400);
  EXPECT_EQ(HandleSubmit(*dispatcher, R"({"userId": 18446744073709551615, "problemId": 1, "sqlText": "SELECT 1"})").status, 400);
  EXPECT_EQ(HandleResult(*dispatcher, "abc").status, 400);
  EXPECT_EQ(HandleResult(*dispatcher, "12x").status, 400);
}

TEST_F(IntakeTest, LargestUserIdAccepted) {
  auto resp = HandleSubmit(*dispatcher, R"({"userId": 2147483647, "problemId": 1, "sqlText": "SELECT 1"})");
  ASSERT_EQ(resp.status, 201);
  EXPECT_EQ(store->GetSubmission(resp.body["submissionId"].get<int64_t>())->user_id, 2147483647);
}

TEST_F(IntakeTest, TestQuery) {
  std::string body = nlohmann::json{{"problemId", 5}, {"sqlText", kTop3Query}}.dump();
  auto resp = HandleTestQuery(*dispatcher, body);
  ASSERT_EQ(resp.status, 200) << resp.body.dump();
  EXPECT_EQ(resp.body["status"], "OK");
  EXPECT_EQ(resp.body["columns"], nlohmann::json({"id", "rev"}));
  EXPECT_EQ(resp.body["rows"].size(), 3u);
  EXPECT_EQ(resp.body["rowsReturned"], 3);
  ASSERT_EQ(resp.body["testResults"].size(), 1u);
  EXPECT_EQ(resp.body["testResults"][0]["pass"], true);
  EXPECT_FALSE(resp.body.contains("errorMessage"));
  // nothing was stored or queued
  EXPECT_FALSE(store->GetSubmission(1));
  EXPECT_EQ(primary.Size(), 0u);
  EXPECT_EQ(reporter.started.load(), 0);
}

TEST_F(IntakeTest, TestQueryErrors) {
  auto resp = HandleTestQuery(*dispatcher, nlohmann::json{{"problemId", 1}, {"sqlText", "SELEC 1"}}.dump());
  ASSERT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["status"], "QUERY_ERROR");
  EXPECT_TRUE(resp.body.contains("errorMessage"));
  EXPECT_EQ(HandleTestQuery(*dispatcher, "{").status, 400);
  EXPECT_EQ(HandleTestQuery(*dispatcher, R"({"problemId": 1})").status, 400);
  EXPECT_EQ(HandleTestQuery(*dispatcher, R"({"problemId": 99, "sqlText": "SELECT 1"})").status, 400);
  EXPECT_EQ(HandleTestQuery(*dispatcher, R"({"problemId": 1, "sqlText": "  "})").status, 400);
}

TEST_F(IntakeTest, NotFound) {
  auto resp = HandleResult(*dispatcher, "424242");
  EXPECT_EQ(resp.status, 404);
  EXPECT_EQ(resp.body["error"], "NotFound");
}

TEST_F(IntakeTest, StorageUnavailable) {
  Store broken("/nonexistent/dir/judge.sqlite");
  FallbackQueue broken_fallback(broken);
  Judge broken_judge(broken, catalog);
  Dispatcher broken_dispatcher(broken, catalog, primary, broken_fallback, *liveness, broken_judge);
  auto resp = HandleSubmit(broken_dispatcher, SubmitBody(1, kTop3Query));
  EXPECT_EQ(resp.status, 503);
  EXPECT_EQ(resp.body["error"], "StorageUnavailable");
  EXPECT_EQ(HandleResult(broken_dispatcher, "1").status, 503);
}

TEST_F(IntakeTest, Health) {
  auto resp = HandleHealth(*dispatcher, *liveness);
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body["liveness"], "DEAD");
  EXPECT_EQ(resp.body["queue"], "memory");
  MakeLive();
  resp = HandleHealth(*dispatcher, *liveness);
  EXPECT_EQ(resp.body["liveness"], "LIVE");
  EXPECT_TRUE(resp.body.contains("heartbeatAgeMs"));
}
