#ifndef INCLUDE_SQLJUDGE_REDIS_QUEUE_H_
#define INCLUDE_SQLJUDGE_REDIS_QUEUE_H_

#include <string>

#include <sw/redis++/redis++.h>

#include "queue.h"

// Primary queue on Redis.
//   <prefix>:queue             list; LPUSH by producers, BRPOP by workers
//   <prefix>:job:<job_id>      hash with the job status, expires after kJobStatusTtlSec
//   <prefix>:claim:<job_id>    SET NX by the consumer that owns the job
//   <prefix>:heartbeat:<id>    per-worker heartbeat with TTL
//   <prefix>:heartbeat         newest heartbeat of any worker, for a single GET liveness check
//   <prefix>:heartbeats        pub/sub channel carrying every heartbeat
class RedisQueue : public PrimaryQueue {
  std::string prefix_;
  sw::redis::Redis commands_; // bounded by kQueueTimeoutMs
  sw::redis::Redis blocking_; // BRPOP only

  std::string Key_(const std::string& suffix) const { return prefix_ + ":" + suffix; }
 public:
  // url: tcp://[[user]:password@]host[:port][/db]
  explicit RedisQueue(const std::string& url, std::string prefix = "sqljudge");
  const char* Name() const override { return "redis"; }
  int64_t Push(const Job&) override;
  std::optional<Job> Pop(std::chrono::milliseconds timeout) override;
  bool Claim(const Job&, const std::string& consumer) override;
  void SetStatus(const Job&, JobStatus) override;
  void Release(const Job&) override;
  void Heartbeat(const std::string& worker_id, std::chrono::milliseconds ttl) override;
  std::optional<int64_t> LatestHeartbeat() override;
  std::optional<JobStatus> GetStatus(const std::string& job_id) override;
};

#endif  // INCLUDE_SQLJUDGE_REDIS_QUEUE_H_
