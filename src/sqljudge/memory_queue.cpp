#include <sqljudge/queue.h>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

long kQueueTimeoutMs = 500;
long kJobStatusTtlSec = 3600;
long kClaimSlackMs = 60'000;

namespace {

constexpr int64_t kPurgeInterval = 1'000'000; // us

bool IsTerminal(JobStatus status) {
  return status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::TIMED_OUT;
}

} // namespace

void MemoryQueue::Check_() const {
  if (!reachable_) throw JudgeError(ErrorCode::QUEUE_UNAVAILABLE, "memory queue unreachable");
}

void MemoryQueue::Purge_(int64_t now) {
  if (now - last_purge_ < kPurgeInterval) return;
  last_purge_ = now;
  std::erase_if(claims_, [now](const auto& item) { return item.second <= now; });
  std::erase_if(status_, [now](const auto& item) { return item.second.second <= now; });
}

void MemoryQueue::SetStatus_(const std::string& job_id, JobStatus status, int64_t now) {
  status_[job_id] = {status, now + kJobStatusTtlSec * 1'000'000};
}

int64_t MemoryQueue::Push(const Job& job) {
  Check_();
  {
    int64_t now = UnixMicros();
    std::lock_guard lck(mtx_);
    Purge_(now);
    queue_.push_back(job);
    SetStatus_(job.job_id, JobStatus::PENDING, now);
  }
  cv_.notify_one();
  return 0;
}

std::optional<Job> MemoryQueue::Pop(std::chrono::milliseconds timeout) {
  Check_();
  std::unique_lock lck(mtx_);
  if (!cv_.wait_for(lck, timeout, [this]() { return !queue_.empty() || !reachable_; })) {
    return std::nullopt;
  }
  Check_();
  Job job = std::move(queue_.front());
  queue_.pop_front();
  job.origin = JobOrigin::PRIMARY;
  return job;
}

bool MemoryQueue::Claim(const Job& job, const std::string& consumer) {
  Check_();
  int64_t now = UnixMicros();
  int64_t expiry = now + job.time_limit + kClaimSlackMs * 1000;
  std::lock_guard lck(mtx_);
  Purge_(now);
  auto [it, ok] = claims_.emplace(job.job_id, expiry);
  if (!ok && it->second <= now) {
    it->second = expiry;
    ok = true;
  }
  if (ok) SetStatus_(job.job_id, JobStatus::RUNNING, now);
  spdlog::debug("Claim: job_id={} consumer={} ok={}", job.job_id, consumer, ok);
  return ok;
}

void MemoryQueue::SetStatus(const Job& job, JobStatus status) {
  Check_();
  int64_t now = UnixMicros();
  std::lock_guard lck(mtx_);
  SetStatus_(job.job_id, status, now);
  if (IsTerminal(status)) claims_.erase(job.job_id);
}

void MemoryQueue::Release(const Job& job) {
  Check_();
  {
    int64_t now = UnixMicros();
    std::lock_guard lck(mtx_);
    claims_.erase(job.job_id);
    SetStatus_(job.job_id, JobStatus::PENDING, now);
    queue_.push_front(job);
  }
  cv_.notify_one();
}

void MemoryQueue::Heartbeat(const std::string& worker_id, std::chrono::milliseconds ttl) {
  Check_();
  int64_t now = UnixMicros();
  std::lock_guard lck(mtx_);
  heartbeats_[worker_id] = {now, now + ttl.count() * 1000};
}

std::optional<int64_t> MemoryQueue::LatestHeartbeat() {
  Check_();
  int64_t now = UnixMicros();
  std::lock_guard lck(mtx_);
  std::optional<int64_t> ret;
  for (auto it = heartbeats_.begin(); it != heartbeats_.end();) {
    if (it->second.second <= now) {
      it = heartbeats_.erase(it);
      continue;
    }
    if (!ret || *ret < it->second.first) ret = it->second.first;
    ++it;
  }
  return ret;
}

std::optional<JobStatus> MemoryQueue::GetStatus(const std::string& job_id) {
  Check_();
  int64_t now = UnixMicros();
  std::lock_guard lck(mtx_);
  if (auto it = status_.find(job_id); it != status_.end() && it->second.second > now) return it->second.first;
  return std::nullopt;
}

void MemoryQueue::SetReachable(bool reachable) {
  {
    std::lock_guard lck(mtx_);
    reachable_ = reachable;
  }
  cv_.notify_all();
  spdlog::info("Memory queue reachable={}", reachable);
}

size_t MemoryQueue::Size() {
  std::lock_guard lck(mtx_);
  return queue_.size();
}

size_t MemoryQueue::TrackedJobs() {
  std::lock_guard lck(mtx_);
  last_purge_ = 0;
  Purge_(UnixMicros());
  return claims_.size() + status_.size();
}
