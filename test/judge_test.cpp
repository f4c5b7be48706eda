#include <gtest/gtest.h>
#include <sqljudge/judge.h>
#include <sqljudge/utils.h>
#include <sqljudge/result_cache.h>

#include "utils.h"
#include "example_problem.h"

namespace {

using JudgeTest = ExampleService;

const char kSalesOnlyQuery[] = "SELECT id, rev FROM sales WHERE id <= 6 ORDER BY rev DESC LIMIT 3";

} // namespace

TEST_F(JudgeTest, AllCasesPass) {
  int64_t id = AddSubmission(5, kTop3Query);
  ASSERT_EQ(judge->Process(*judge->MakeJob(id, 5), nullptr), JudgeOutcome::WRITTEN);
  auto res = store->GetResult(id);
  ASSERT_TRUE(res);
  EXPECT_TRUE(res->pass);
  EXPECT_EQ(res->GetVerdict(), Verdict::AC);
  EXPECT_EQ(res->passed_cases, 2);
  EXPECT_EQ(res->total_cases, 2);
  EXPECT_DOUBLE_EQ(res->score, 100);
  auto details = nlohmann::json::parse(res->details);
  ASSERT_EQ(details["cases"].size(), 2u);
  EXPECT_EQ(details["cases"][1]["name"], "large");
}

TEST_F(JudgeTest, PartialScore) {
  int64_t id = AddSubmission(5, kSalesOnlyQuery);
  ASSERT_EQ(judge->Process(*judge->MakeJob(id, 5), nullptr), JudgeOutcome::WRITTEN);
  auto res = store->GetResult(id);
  EXPECT_FALSE(res->pass);
  EXPECT_EQ(res->Status(), JobStatus::COMPLETED);
  EXPECT_EQ(res->GetVerdict(), Verdict::WA);
  EXPECT_EQ(res->passed_cases, 1);
  EXPECT_EQ(res->total_cases, 2);
  EXPECT_DOUBLE_EQ(res->score, 50);
  // the failing case is hidden; nothing of its expected output leaks
  auto details = nlohmann::json::parse(res->details);
  EXPECT_FALSE(details["validation"].contains("mismatch"));
  EXPECT_EQ(details["validation"]["rule"], "wrong_answer");
  auto& hidden = details["cases"][1];
  EXPECT_EQ(hidden["hidden"], true);
  EXPECT_EQ(hidden["pass"], false);
  EXPECT_FALSE(hidden.contains("validation"));
  EXPECT_FALSE(hidden.contains("message"));
  EXPECT_TRUE(details["cases"][0].contains("validation"));
}

TEST_F(JudgeTest, SingleCaseProblem) {
  int64_t id = AddSubmission(1, "SELECT id, rev FROM sales ORDER BY rev LIMIT 3");
  ASSERT_EQ(judge->Process(*judge->MakeJob(id, 1), nullptr), JudgeOutcome::WRITTEN);
  auto res = store->GetResult(id);
  EXPECT_EQ(res->total_cases, 1);
  EXPECT_EQ(res->passed_cases, 0);
  EXPECT_DOUBLE_EQ(res->score, 0);
  auto details = nlohmann::json::parse(res->details);
  EXPECT_EQ(details["validation"]["mismatch"]["row"], 0);
}

TEST_F(JudgeTest, QueryErrorFailsEveryCase) {
  int64_t id = AddSubmission(5, "SELECT nope FROM sales");
  ASSERT_EQ(judge->Process(*judge->MakeJob(id, 5), nullptr), JudgeOutcome::WRITTEN);
  auto res = store->GetResult(id);
  EXPECT_EQ(res->Status(), JobStatus::FAILED);
  EXPECT_EQ(res->GetVerdict(), Verdict::RE);
  EXPECT_EQ(res->passed_cases, 0);
  EXPECT_FALSE(res->error_message.empty());
  auto details = nlohmann::json::parse(res->details);
  EXPECT_EQ(details["rule"], "execution_error");
}

TEST_F(JudgeTest, LeaseHeldElsewhere) {
  int64_t id = AddSubmission(1, kTop3Query);
  auto job = judge->MakeJob(id, 1);
  ASSERT_TRUE(store->AcquireLease(id, "other", UnixMicros() + 60'000'000));
  EXPECT_EQ(judge->Process(*job, nullptr), JudgeOutcome::BUSY);
  EXPECT_FALSE(store->HasResult(id));
  EXPECT_EQ(reporter.started.load(), 0);
  store->ReleaseLease(id, "other");
  EXPECT_EQ(judge->Process(*job, nullptr), JudgeOutcome::WRITTEN);
  // released once the result is written
  EXPECT_FALSE(store->HasActiveLease(id));
}

TEST_F(JudgeTest, CachedResultReused) {
  ResultCache cache;
  Judge cached_judge(*store, catalog, reporter.GetReporter(), &cache);
  int64_t first = AddSubmission(5, kSalesOnlyQuery, 1);
  int64_t second = AddSubmission(5, kSalesOnlyQuery, 2);
  ASSERT_EQ(cached_judge.Process(*cached_judge.MakeJob(first, 5), nullptr), JudgeOutcome::WRITTEN);
  EXPECT_EQ(cache.Size(), 1u);
  ASSERT_EQ(cached_judge.Process(*cached_judge.MakeJob(second, 5), nullptr), JudgeOutcome::WRITTEN);
  EXPECT_EQ(cache.Hits(), 1);
  EXPECT_EQ(reporter.started.load(), 1);
  EXPECT_EQ(reporter.written.load(), 2);

  auto res = store->GetResult(second);
  ASSERT_TRUE(res);
  EXPECT_EQ(res->submission_id, second);
  EXPECT_DOUBLE_EQ(res->score, 50);
  EXPECT_EQ(res->GetVerdict(), Verdict::WA);
  EXPECT_EQ(nlohmann::json::parse(res->details)["from_cache"], true);
  EXPECT_FALSE(nlohmann::json::parse(store->GetResult(first)->details).contains("from_cache"));
}

TEST_F(JudgeTest, TimeoutNotCached) {
  ResultCache cache;
  Judge cached_judge(*store, catalog, {}, &cache);
  int64_t id = AddSubmission(4,
      "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT count(*) FROM c");
  ASSERT_EQ(cached_judge.Process(*cached_judge.MakeJob(id, 4), nullptr), JudgeOutcome::WRITTEN);
  EXPECT_EQ(store->GetResult(id)->GetVerdict(), Verdict::TLE);
  EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(JudgeTest, DryRunShowsVisibleCasesOnly) {
  auto problem = catalog.Get(5);
  ASSERT_TRUE(problem);
  DryRunResult run = DryRun(*problem, kTop3Query);
  EXPECT_EQ(run.status, SandboxStatus::OK);
  EXPECT_EQ(run.preview.columns, (std::vector<std::string>{"id", "rev"}));
  EXPECT_EQ(run.preview.rows, nlohmann::json({{1, 100}, {2, 90}, {3, 80}}));
  EXPECT_EQ(run.rows_returned, 3);
  ASSERT_EQ(run.cases.size(), 1u);
  EXPECT_EQ(run.cases[0]["name"], "sample");
  EXPECT_EQ(run.cases[0]["pass"], true);
  // nothing is stored
  EXPECT_FALSE(store->GetSubmission(1));
}

TEST_F(JudgeTest, DryRunPreviewIsBounded) {
  auto problem = catalog.Get(1);
  size_t saved = kDryRunPreviewRows;
  kDryRunPreviewRows = 2;
  DryRunResult run = DryRun(*problem, "SELECT id FROM sales");
  kDryRunPreviewRows = saved;
  EXPECT_EQ(run.rows_returned, 6);
  EXPECT_EQ(run.preview.rows.size(), 2u);
  EXPECT_EQ(run.cases[0]["verdict"], "WA");
}

TEST_F(JudgeTest, DryRunQueryError) {
  auto problem = catalog.Get(1);
  DryRunResult run = DryRun(*problem, "SELEC 1");
  EXPECT_EQ(run.status, SandboxStatus::QUERY_ERROR);
  EXPECT_FALSE(run.error.empty());
  EXPECT_EQ(run.cases[0]["verdict"], "RE");
}
