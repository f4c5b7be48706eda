#include <sqljudge/queue.h>

#include <thread>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

int64_t FallbackQueue::Push(const Job& job) {
  int64_t id = store_.InsertFallback(job.job_id, job.Serialize());
  spdlog::info("Fallback record created: job_id={} sub_id={} fallback_id={}",
               job.job_id, job.submission_id, id);
  return id;
}

std::optional<Job> FallbackQueue::Pop(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (auto rec = store_.ClaimNextFallback()) {
      try {
        Job job = Job::Deserialize(rec->payload);
        job.origin = JobOrigin::FALLBACK;
        job.fallback_id = rec->id;
        return job;
      } catch (nlohmann::json::exception& err) {
        spdlog::error("Undecodable fallback record: fallback_id={} job_id={} error={}",
                      rec->id, rec->job_id, err.what());
        store_.FinishFallback(rec->id, FallbackStatus::FAILED);
        continue;
      }
    }
    if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
    // table polling; no notification channel
    std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(
        timeout, std::chrono::milliseconds(100)));
  }
}

bool FallbackQueue::Claim(const Job& job, const std::string& consumer) {
  spdlog::debug("Fallback job claimed at pop: job_id={} consumer={}", job.job_id, consumer);
  return true;
}

void FallbackQueue::SetStatus(const Job& job, JobStatus status) {
  if (status == JobStatus::PENDING || status == JobStatus::RUNNING) return;
  // the record failed only if its job could not produce a result at all
  bool has_result = status != JobStatus::FAILED || store_.HasResult(job.submission_id);
  store_.FinishFallback(job.fallback_id, has_result ? FallbackStatus::COMPLETED : FallbackStatus::FAILED);
}

void FallbackQueue::Release(const Job& job) {
  if (!store_.ReleaseFallback(job.fallback_id)) {
    spdlog::warn("Fallback release found no claimed record: fallback_id={}", job.fallback_id);
  }
}
