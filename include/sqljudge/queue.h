#ifndef INCLUDE_SQLJUDGE_QUEUE_H_
#define INCLUDE_SQLJUDGE_QUEUE_H_

#include <map>
#include <deque>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string>
#include <optional>
#include <unordered_map>
#include <condition_variable>

#include "job.h"
#include "store.h"

// Bound on a single non-blocking primary queue operation
extern long kQueueTimeoutMs;
// Job status entries expire after this
extern long kJobStatusTtlSec;
// Claims outlive the job's own time limit by this much
extern long kClaimSlackMs;

// Where jobs wait for a worker. Backend failures are thrown as JudgeError:
// QUEUE_UNAVAILABLE for the primary queue, STORAGE_UNAVAILABLE for the
// fallback queue.
class JobQueue {
 public:
  virtual ~JobQueue() = default;
  virtual const char* Name() const = 0;

  // Returns a backend-specific id (fallback record id, 0 otherwise)
  virtual int64_t Push(const Job&) = 0;
  virtual std::optional<Job> Pop(std::chrono::milliseconds timeout) = 0;
  // Exclusive: true for exactly one consumer of a given job
  virtual bool Claim(const Job&, const std::string& consumer) = 0;
  // RUNNING is best-effort; a terminal status acknowledges the job and drops
  // its claim
  virtual void SetStatus(const Job&, JobStatus) = 0;
  // Give a claimed but unfinished job back to the queue
  virtual void Release(const Job&) = 0;
};

class PrimaryQueue : public JobQueue {
 public:
  virtual void Heartbeat(const std::string& worker_id, std::chrono::milliseconds ttl) = 0;
  // Newest unexpired heartbeat of any worker (UNIX microseconds)
  virtual std::optional<int64_t> LatestHeartbeat() = 0;
  virtual std::optional<JobStatus> GetStatus(const std::string& job_id) = 0;
};

// Durable queue on the fallback_jobs table. Pop claims the oldest pending
// record with an atomic conditional update, so Claim always succeeds for the
// consumer that popped it.
class FallbackQueue : public JobQueue {
  Store& store_;
 public:
  explicit FallbackQueue(Store& store) : store_(store) {}
  const char* Name() const override { return "fallback"; }
  int64_t Push(const Job&) override;
  std::optional<Job> Pop(std::chrono::milliseconds timeout) override;
  bool Claim(const Job&, const std::string& consumer) override;
  void SetStatus(const Job&, JobStatus) override;
  void Release(const Job&) override;
};

// In-process primary queue for single-process deployments and tests.
// SetReachable(false) makes every operation fail like a lost connection.
class MemoryQueue : public PrimaryQueue {
  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Job> queue_;
  std::unordered_map<std::string, int64_t> claims_; // job -> expiry
  std::unordered_map<std::string, std::pair<JobStatus, int64_t>> status_; // job -> (status, expiry)
  std::map<std::string, std::pair<int64_t, int64_t>> heartbeats_; // worker -> (timestamp, expiry)
  int64_t last_purge_;
  std::atomic_bool reachable_;

  void Check_() const;
  // drop expired claims and status entries; mtx_ must be held
  void Purge_(int64_t now);
  void SetStatus_(const std::string& job_id, JobStatus, int64_t now);
 public:
  MemoryQueue() : last_purge_(0), reachable_(true) {}
  const char* Name() const override { return "memory"; }
  int64_t Push(const Job&) override;
  std::optional<Job> Pop(std::chrono::milliseconds timeout) override;
  bool Claim(const Job&, const std::string& consumer) override;
  void SetStatus(const Job&, JobStatus) override;
  void Release(const Job&) override;
  void Heartbeat(const std::string& worker_id, std::chrono::milliseconds ttl) override;
  std::optional<int64_t> LatestHeartbeat() override;
  std::optional<JobStatus> GetStatus(const std::string& job_id) override;

  void SetReachable(bool);
  size_t Size();
  size_t TrackedJobs(); // claims plus status entries
};

#endif  // INCLUDE_SQLJUDGE_QUEUE_H_
