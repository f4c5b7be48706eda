#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <sqljudge/utils.h>
#include <sqljudge/worker.h>

#include "utils.h"
#include "example_problem.h"

namespace {

using WorkerTest = ExampleService;

} // namespace

TEST_F(WorkerTest, ProcessesPrimaryJob) {
  int64_t id = AddSubmission(1, kTop3Query);
  auto job = judge->MakeJob(id, 1);
  ASSERT_TRUE(job);
  primary.Push(*job);
  EXPECT_TRUE(pool->RunOnce("test:0"));
  auto res = store->GetResult(id);
  ASSERT_TRUE(res);
  EXPECT_TRUE(res->pass);
  EXPECT_EQ(res->Status(), JobStatus::COMPLETED);
  EXPECT_EQ(res->rows_returned, 3);
  EXPECT_EQ(primary.GetStatus(job->job_id), JobStatus::COMPLETED);
  EXPECT_EQ(pool->Processed(), 1);
}

TEST_F(WorkerTest, IdleReturnsFalse) {
  EXPECT_FALSE(pool->RunOnce("test:0"));
}

TEST_F(WorkerTest, DuplicateDeliveryExecutesOnce) {
  int64_t id = AddSubmission(1, kTop3Query);
  auto job = judge->MakeJob(id, 1);
  primary.Push(*job);
  primary.Push(*job);
  EXPECT_TRUE(pool->RunOnce("test:0"));
  EXPECT_TRUE(pool->RunOnce("test:1"));
  EXPECT_EQ(reporter.started.load(), 1);
  EXPECT_EQ(reporter.written.load(), 1);
  // a redelivery after the claim is gone is caught by the result check
  EXPECT_EQ(judge->Process(*job, nullptr), JudgeOutcome::DUPLICATE);
  EXPECT_EQ(reporter.started.load(), 1);
}

TEST_F(WorkerTest, ConcurrentDeliveryPersistsOneResult) {
  int64_t id = AddSubmission(1, kTop3Query);
  auto job = judge->MakeJob(id, 1);
  std::atomic_int written = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([&]() {
      if (judge->Process(*job, nullptr) == JudgeOutcome::WRITTEN) written++;
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(written.load(), 1);
  EXPECT_EQ(reporter.written.load(), 1);
  EXPECT_TRUE(store->GetResult(id)->pass);
}

TEST_F(WorkerTest, MissingSubmission) {
  auto job = judge->MakeJob(9999, 1);
  primary.Push(*job);
  EXPECT_TRUE(pool->RunOnce("test:0"));
  EXPECT_FALSE(store->HasResult(9999));
  EXPECT_EQ(primary.GetStatus(job->job_id), JobStatus::FAILED);
}

TEST_F(WorkerTest, MissingProblemIsJudgeError) {
  int64_t id = AddSubmission(99, kTop3Query);
  auto job = judge->MakeJob(id, 1);
  EXPECT_EQ(judge->Process(*job, nullptr), JudgeOutcome::WRITTEN);
  auto res = store->GetResult(id);
  ASSERT_TRUE(res);
  EXPECT_FALSE(res->pass);
  EXPECT_EQ(res->GetVerdict(), Verdict::JE);
  EXPECT_EQ(res->Status(), JobStatus::FAILED);
}

TEST_F(WorkerTest, QueryErrors) {
  struct Case {
    int problem;
    const char* sql;
    JobStatus status;
    Verdict verdict;
  };
  std::vector<Case> cases = {
    {1, "SELEC 1", JobStatus::FAILED, Verdict::RE},
    {1, "DELETE FROM sales", JobStatus::FAILED, Verdict::SEC},
    {1, "SELECT id, rev FROM sales ORDER BY rev LIMIT 3", JobStatus::COMPLETED, Verdict::WA},
    {4, "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT count(*) FROM c",
     JobStatus::TIMED_OUT, Verdict::TLE},
  };
  for (auto& c : cases) {
    int64_t id = AddSubmission(c.problem, c.sql);
    auto job = judge->MakeJob(id, c.problem);
    ASSERT_EQ(judge->Process(*job, nullptr), JudgeOutcome::WRITTEN) << c.sql;
    auto res = store->GetResult(id);
    EXPECT_EQ(res->Status(), c.status) << c.sql;
    EXPECT_EQ(res->GetVerdict(), c.verdict) << c.sql;
    EXPECT_FALSE(res->pass) << c.sql;
    if (c.verdict != Verdict::WA) EXPECT_FALSE(res->error_message.empty()) << c.sql;
  }
}

TEST_F(WorkerTest, PollsFallbackWhenPrimaryDown) {
  int64_t id = AddSubmission(1, kTop3Query);
  auto job = judge->MakeJob(id, 1);
  int64_t rec = fallback->Push(*job);
  primary.SetReachable(false);
  EXPECT_TRUE(pool->RunOnce("test:0"));
  EXPECT_TRUE(store->HasResult(id));
  EXPECT_EQ(store->GetFallback(rec)->Status(), FallbackStatus::COMPLETED);
}

TEST_F(WorkerTest, StorageOutageReleasesJob) {
  Store broken("/nonexistent/dir/judge.sqlite");
  Judge broken_judge(broken, catalog);
  WorkerPool broken_pool(primary, *fallback, broken_judge, "broken");
  auto job = judge->MakeJob(1, 1);
  primary.Push(*job);
  EXPECT_TRUE(broken_pool.RunOnce("broken:0"));
  // back on the queue for another consumer
  EXPECT_EQ(primary.Size(), 1u);
  EXPECT_EQ(broken_pool.Processed(), 0);
}

TEST_F(WorkerTest, LoopSurvivesBadJobs) {
  primary.Push(*judge->MakeJob(9998, 1));
  int64_t bad = AddSubmission(1, "SELECT * FROM nowhere");
  primary.Push(*judge->MakeJob(bad, 1));
  int64_t good = AddSubmission(1, kTop3Query);
  primary.Push(*judge->MakeJob(good, 1));
  pool->Start(1);
  EXPECT_TRUE(WaitFor([&]() { return store->HasResult(good); }));
  pool->Stop();
  EXPECT_TRUE(store->GetResult(good)->pass);
  EXPECT_EQ(store->GetResult(bad)->GetVerdict(), Verdict::RE);
}

TEST_F(WorkerTest, HeartbeatsMakePoolLive) {
  EXPECT_FALSE(liveness->IsWorkerLive());
  EXPECT_TRUE(pool->SendHeartbeats());
  EXPECT_TRUE(liveness->IsWorkerLive());
  primary.SetReachable(false);
  EXPECT_FALSE(pool->SendHeartbeats());
}

TEST_F(WorkerTest, StartAnnouncesPool) {
  pool->Start(2);
  EXPECT_TRUE(liveness->IsWorkerLive());
  EXPECT_EQ(pool->WorkerId(1), "test:1");
  pool->Stop();
}
