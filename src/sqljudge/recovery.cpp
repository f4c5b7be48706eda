#include <sqljudge/recovery.h>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

long kSweepIntervalMs = 30'000;
long kStaleClaimMs = 600'000;
long kOrphanAfterMs = 600'000;

namespace {

constexpr size_t kDrainBatch = 64;

} // namespace

// Records handed back to the primary queue stay processing until a worker has
// persisted their result.
int RecoverySweeper::CompleteRequeued_() {
  int completed = 0;
  for (auto& rec : store_.ProcessingFallback(kDrainBatch * 4)) {
    int64_t sub_id;
    try {
      sub_id = Job::Deserialize(rec.payload).submission_id;
    } catch (nlohmann::json::exception&) {
      store_.FinishFallback(rec.id, FallbackStatus::FAILED);
      continue;
    }
    if (store_.HasResult(sub_id)) {
      store_.FinishFallback(rec.id, FallbackStatus::COMPLETED);
      completed++;
    }
  }
  return completed;
}

bool RecoverySweeper::InFlight_(const Job& job, bool live) {
  if (store_.HasActiveLease(job.submission_id)) return true;
  if (!live) return false;
  try {
    // RUNNING without a lease means its consumer died
    return primary_.GetStatus(job.job_id) == JobStatus::PENDING;
  } catch (const JudgeError&) {
    return false;
  }
}

int RecoverySweeper::AdoptOrphans_(bool live) {
  int adopted = 0;
  int64_t created_before = UnixMicros() - kOrphanAfterMs * 1000;
  int64_t after_id = 0;
  while (true) {
    auto batch = store_.UnresolvedSubmissions(created_before, after_id, kDrainBatch);
    for (auto& sub : batch) {
      after_id = sub.id;
      std::optional<Job> job = judge_.MakeJob(sub.id, sub.problem_id);
      if (!job) {
        // the judge records the missing problem as an internal error
        job.emplace();
        job->job_id = JobIdFor(sub.id);
        job->submission_id = sub.id;
        job->problem_id = sub.problem_id;
      }
      if (InFlight_(*job, live)) continue;
      if (store_.AdoptFallback(job->job_id, job->Serialize())) {
        spdlog::warn("Orphaned submission adopted: sub_id={} job_id={} age_ms={}",
                     sub.id, job->job_id, (UnixMicros() - sub.created_at) / 1000);
        adopted++;
      }
    }
    if (batch.size() < kDrainBatch) break;
  }
  return adopted;
}

// The record is already claimed by this sweeper
bool RecoverySweeper::Recover_(const FallbackRecord& rec, bool live) {
  Job job;
  try {
    job = Job::Deserialize(rec.payload);
  } catch (nlohmann::json::exception& err) {
    spdlog::error("Undecodable fallback record: fallback_id={} job_id={} error={}",
                  rec.id, rec.job_id, err.what());
    store_.FinishFallback(rec.id, FallbackStatus::FAILED);
    return true;
  }
  job.origin = JobOrigin::FALLBACK;
  job.fallback_id = rec.id;
  if (store_.HasResult(job.submission_id)) {
    store_.FinishFallback(rec.id, FallbackStatus::COMPLETED);
    return true;
  }
  if (InFlight_(job, live)) {
    // finished by CompleteRequeued_ once the result is durable
    spdlog::debug("Fallback job already in flight: fallback_id={} job_id={}", rec.id, job.job_id);
    return true;
  }
  if (live) {
    try {
      std::optional<JobStatus> status = primary_.GetStatus(job.job_id);
      if (status == JobStatus::RUNNING) {
        // drop the dead consumer's claim along with requeueing
        primary_.Release(job);
      } else {
        primary_.Push(job);
      }
      spdlog::info("Fallback job requeued: fallback_id={} job_id={}", rec.id, job.job_id);
      return true;
    } catch (const JudgeError& err) {
      spdlog::debug("Primary queue still unavailable: error={}", err.what());
    }
  }
  // nobody would pop it; run it here
  try {
    JudgeOutcome outcome = judge_.Process(job, &fallback_);
    spdlog::info("Fallback job executed by sweeper: fallback_id={} job_id={} outcome={}",
                 rec.id, job.job_id, JudgeOutcomeName(outcome));
    return true;
  } catch (const JudgeError&) {
    fallback_.Release(job);
    throw;
  }
}

int RecoverySweeper::DrainFallback() {
  std::lock_guard lck(drain_mtx_);
  int recovered = 0;
  try {
    bool live = liveness_.IsWorkerLive();
    int completed = CompleteRequeued_();
    int reclaimed = store_.ReclaimStaleFallback(UnixMicros() - kStaleClaimMs * 1000);
    int adopted = AdoptOrphans_(live);
    if (completed || reclaimed || adopted) {
      spdlog::info("Fallback housekeeping: completed={} reclaimed={} adopted={}", completed, reclaimed, adopted);
    }
    while (true) {
      auto batch = store_.PendingFallback(kDrainBatch);
      bool progressed = false;
      for (auto& rec : batch) {
        // a worker polling the table may have taken it
        if (!store_.ClaimFallback(rec.id)) continue;
        progressed = true;
        if (Recover_(rec, live)) recovered++;
      }
      if (!progressed) break;
    }
  } catch (const JudgeError& err) {
    spdlog::warn("Fallback drain interrupted: recovered={} error={}", recovered, err.what());
  }
  if (recovered) spdlog::info("Fallback drained: recovered={}", recovered);
  return recovered;
}

void RecoverySweeper::Loop_() {
  std::unique_lock lck(mtx_);
  while (!stop_) {
    cv_.wait_for(lck, std::chrono::milliseconds(kSweepIntervalMs),
                 [this]{ return stop_ || triggered_; });
    if (stop_) break;
    triggered_ = false;
    lck.unlock();
    DrainFallback();
    lck.lock();
  }
}

void RecoverySweeper::Start() {
  if (thread_.joinable()) return;
  stop_ = false;
  thread_ = std::thread(&RecoverySweeper::Loop_, this);
}

void RecoverySweeper::Stop() {
  {
    std::lock_guard lck(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RecoverySweeper::Trigger() {
  {
    std::lock_guard lck(mtx_);
    triggered_ = true;
  }
  cv_.notify_all();
}
