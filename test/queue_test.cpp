#include <thread>

#include <gtest/gtest.h>
#include <sqljudge/queue.h>
#include <sqljudge/utils.h>

#include "utils.h"
#include "example_problem.h"

namespace {

Job MakeJob(int64_t sub_id) {
  Job job;
  job.job_id = JobIdFor(sub_id);
  job.submission_id = sub_id;
  job.problem_id = 1;
  job.enqueued_at = UnixMicros();
  return job;
}

using QueueTest = ExampleProblem;

} // namespace

TEST(MemoryQueueTest, FifoAndClaim) {
  MemoryQueue queue;
  queue.Push(MakeJob(1));
  queue.Push(MakeJob(2));
  EXPECT_EQ(queue.Size(), 2u);
  auto job = queue.Pop(std::chrono::milliseconds(10));
  ASSERT_TRUE(job);
  EXPECT_EQ(job->submission_id, 1);
  EXPECT_TRUE(queue.Claim(*job, "w1"));
  EXPECT_FALSE(queue.Claim(*job, "w2"));
  EXPECT_EQ(queue.GetStatus(job->job_id), JobStatus::RUNNING);
  queue.SetStatus(*job, JobStatus::COMPLETED);
  EXPECT_EQ(queue.GetStatus(job->job_id), JobStatus::COMPLETED);
  EXPECT_EQ(queue.GetStatus("job-missing"), std::nullopt);
}

TEST(MemoryQueueTest, PopTimesOut) {
  MemoryQueue queue;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.Pop(std::chrono::milliseconds(50)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

TEST(MemoryQueueTest, PopWakesOnPush) {
  MemoryQueue queue;
  std::thread producer([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.Push(MakeJob(3));
  });
  auto job = queue.Pop(std::chrono::seconds(5));
  producer.join();
  ASSERT_TRUE(job);
  EXPECT_EQ(job->submission_id, 3);
}

TEST(MemoryQueueTest, ReleaseRequeues) {
  MemoryQueue queue;
  queue.Push(MakeJob(1));
  auto job = queue.Pop(std::chrono::milliseconds(10));
  ASSERT_TRUE(queue.Claim(*job, "w1"));
  queue.Release(*job);
  auto again = queue.Pop(std::chrono::milliseconds(10));
  ASSERT_TRUE(again);
  EXPECT_TRUE(queue.Claim(*again, "w2"));
}

TEST(MemoryQueueTest, FinishedJobsForgotten) {
  MemoryQueue queue;
  for (int i = 0; i < 20; i++) {
    queue.Push(MakeJob(i));
    auto job = queue.Pop(std::chrono::milliseconds(10));
    ASSERT_TRUE(job);
    ASSERT_TRUE(queue.Claim(*job, "w1"));
    queue.SetStatus(*job, i % 2 ? JobStatus::COMPLETED : JobStatus::FAILED);
  }
  // claims end with the job; statuses stay until they expire
  EXPECT_EQ(queue.TrackedJobs(), 20u);

  long saved = kJobStatusTtlSec;
  kJobStatusTtlSec = 0;
  MemoryQueue short_lived;
  for (int i = 0; i < 20; i++) {
    short_lived.Push(MakeJob(i));
    auto job = short_lived.Pop(std::chrono::milliseconds(10));
    ASSERT_TRUE(short_lived.Claim(*job, "w1"));
    short_lived.SetStatus(*job, JobStatus::COMPLETED);
  }
  kJobStatusTtlSec = saved;
  EXPECT_EQ(short_lived.TrackedJobs(), 0u);
  EXPECT_EQ(short_lived.GetStatus(JobIdFor(3)), std::nullopt);
}

TEST(MemoryQueueTest, ExpiredClaimCanBeTaken) {
  MemoryQueue queue;
  long saved = kClaimSlackMs;
  kClaimSlackMs = 0;
  Job job = MakeJob(1);
  EXPECT_TRUE(queue.Claim(job, "w1"));
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  kClaimSlackMs = saved;
  // the first consumer is gone
  EXPECT_TRUE(queue.Claim(job, "w2"));
  EXPECT_FALSE(queue.Claim(job, "w3"));
}

TEST(MemoryQueueTest, Heartbeats) {
  MemoryQueue queue;
  EXPECT_FALSE(queue.LatestHeartbeat());
  int64_t before = UnixMicros();
  queue.Heartbeat("w1", std::chrono::milliseconds(1000));
  auto latest = queue.LatestHeartbeat();
  ASSERT_TRUE(latest);
  EXPECT_GE(*latest, before);
  queue.Heartbeat("w2", std::chrono::milliseconds(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  // expired heartbeats are ignored
  EXPECT_EQ(queue.LatestHeartbeat(), latest);
}

TEST(MemoryQueueTest, Unreachable) {
  MemoryQueue queue;
  queue.SetReachable(false);
  try {
    queue.Push(MakeJob(1));
    FAIL() << "expected a queue error";
  } catch (const JudgeError& err) {
    EXPECT_EQ(err.Code(), ErrorCode::QUEUE_UNAVAILABLE);
  }
  EXPECT_THROW(queue.LatestHeartbeat(), JudgeError);
  EXPECT_THROW(queue.Pop(std::chrono::milliseconds(1)), JudgeError);
  queue.SetReachable(true);
  EXPECT_NO_THROW(queue.Push(MakeJob(1)));
}

TEST_F(QueueTest, FallbackPopClaimsInOrder) {
  FallbackQueue queue(*store);
  int64_t first = queue.Push(MakeJob(1));
  queue.Push(MakeJob(2));
  // pushing the same job again keeps a single record
  EXPECT_EQ(queue.Push(MakeJob(1)), first);

  auto job = queue.Pop(std::chrono::milliseconds(0));
  ASSERT_TRUE(job);
  EXPECT_EQ(job->submission_id, 1);
  EXPECT_EQ(job->origin, JobOrigin::FALLBACK);
  EXPECT_EQ(job->fallback_id, first);
  EXPECT_TRUE(queue.Claim(*job, "w1"));
  EXPECT_EQ(store->GetFallback(first)->Status(), FallbackStatus::PROCESSING);

  queue.SetStatus(*job, JobStatus::RUNNING);
  EXPECT_EQ(store->GetFallback(first)->Status(), FallbackStatus::PROCESSING);
  queue.SetStatus(*job, JobStatus::TIMED_OUT);
  EXPECT_EQ(store->GetFallback(first)->Status(), FallbackStatus::COMPLETED);

  auto second = queue.Pop(std::chrono::milliseconds(0));
  ASSERT_TRUE(second);
  EXPECT_EQ(second->submission_id, 2);
  EXPECT_FALSE(queue.Pop(std::chrono::milliseconds(0)));
}

TEST_F(QueueTest, FallbackReleaseAndFailure) {
  FallbackQueue queue(*store);
  int64_t id = queue.Push(MakeJob(5));
  auto job = queue.Pop(std::chrono::milliseconds(0));
  ASSERT_TRUE(job);
  queue.Release(*job);
  EXPECT_EQ(store->GetFallback(id)->Status(), FallbackStatus::PENDING);

  job = queue.Pop(std::chrono::milliseconds(0));
  ASSERT_TRUE(job);
  // no result exists for submission 5
  queue.SetStatus(*job, JobStatus::FAILED);
  EXPECT_EQ(store->GetFallback(id)->Status(), FallbackStatus::FAILED);
}

TEST_F(QueueTest, FallbackSkipsUndecodable) {
  FallbackQueue queue(*store);
  int64_t bad = store->InsertFallback("job-broken", "{not json");
  queue.Push(MakeJob(6));
  auto job = queue.Pop(std::chrono::milliseconds(0));
  ASSERT_TRUE(job);
  EXPECT_EQ(job->submission_id, 6);
  EXPECT_EQ(store->GetFallback(bad)->Status(), FallbackStatus::FAILED);
}
