#include <sqljudge/worker.h>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>
#include <sqljudge/liveness.h>

long kHeartbeatIntervalMs = 5'000;
long kPollIntervalMs = 1'000;

WorkerPool::WorkerPool(PrimaryQueue& primary, FallbackQueue& fallback, Judge& judge, std::string name) :
    primary_(primary), fallback_(fallback), judge_(judge),
    name_(name.empty() ? ProcessName() : std::move(name)),
    workers_(0), stop_(false), processed_(0) {}

std::string WorkerPool::WorkerId(int index) const {
  return fmt::format("{}:{}", name_, index);
}

void WorkerPool::Start(int workers) {
  if (threads_.size()) return;
  stop_ = false;
  workers_ = workers;
  // announce before the first job so dispatchers see a live pool immediately
  SendHeartbeats();
  heartbeat_thread_ = std::thread(&WorkerPool::HeartbeatLoop_, this);
  for (int i = 0; i < workers; i++) threads_.emplace_back(&WorkerPool::WorkLoop_, this, i);
  spdlog::info("Worker pool started: name={} workers={}", name_, workers);
}

void WorkerPool::Stop() {
  {
    std::lock_guard lck(mtx_);
    if (stop_ && threads_.empty()) return;
    stop_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) t.join();
  threads_.clear();
  if (heartbeat_thread_.joinable()) heartbeat_thread_.join();
  std::lock_guard lck(held_mtx_);
  if (held_.size()) {
    spdlog::error("Worker pool stopped with unfinished jobs: count={}", held_.size());
  }
}

void WorkerPool::Wait() {
  std::unique_lock lck(mtx_);
  cv_.wait(lck, [this]{ return stop_.load(); });
}

bool WorkerPool::SendHeartbeats() {
  // heartbeats outlive one missed tick
  auto ttl = std::chrono::milliseconds(std::max(kLivenessWindowMs, kHeartbeatIntervalMs * 2));
  try {
    for (int i = 0; i < std::max(workers_, 1); i++) primary_.Heartbeat(WorkerId(i), ttl);
    return true;
  } catch (const JudgeError& err) {
    spdlog::warn("Failed to send heartbeat: name={} error={}", name_, err.what());
    return false;
  }
}

void WorkerPool::HeartbeatLoop_() {
  std::unique_lock lck(mtx_);
  while (!stop_) {
    cv_.wait_for(lck, std::chrono::milliseconds(kHeartbeatIntervalMs), [this]{ return stop_.load(); });
    if (stop_) break;
    lck.unlock();
    SendHeartbeats();
    lck.lock();
  }
}

void WorkerPool::Handle_(Job&& job, JobQueue* source, const std::string& worker_id) {
  try {
    JudgeOutcome outcome = judge_.Process(job, source);
    processed_++;
    spdlog::debug("Job handled: worker={} job_id={} outcome={}",
                  worker_id, job.job_id, JudgeOutcomeName(outcome));
    return;
  } catch (const JudgeError& err) {
    spdlog::error("Job could not be finished: worker={} job_id={} error={}",
                  worker_id, job.job_id, err.what());
  }
  if (source) {
    try {
      source->Release(job);
      return;
    } catch (const JudgeError& err) {
      spdlog::error("Failed to release job: job_id={} queue={} error={}",
                    job.job_id, source->Name(), err.what());
    }
  }
  // keep it in this process until the store is back
  std::lock_guard lck(held_mtx_);
  held_.push_back(std::move(job));
}

bool WorkerPool::RunOnce(const std::string& worker_id) {
  {
    std::unique_lock lck(held_mtx_);
    if (held_.size()) {
      Job job = std::move(held_.front());
      held_.pop_front();
      lck.unlock();
      Handle_(std::move(job), nullptr, worker_id);
      return true;
    }
  }

  std::optional<Job> job;
  JobQueue* source = &primary_;
  bool primary_down = false;
  try {
    job = primary_.Pop(std::chrono::milliseconds(kPollIntervalMs));
  } catch (const JudgeError& err) {
    primary_down = true;
    spdlog::debug("Primary queue pop failed: worker={} error={}", worker_id, err.what());
  }
  if (!job) {
    source = &fallback_;
    try {
      job = fallback_.Pop(std::chrono::milliseconds(0));
    } catch (const JudgeError& err) {
      spdlog::warn("Fallback queue pop failed: worker={} error={}", worker_id, err.what());
    }
  }
  if (!job) {
    // Pop did not block if the primary queue is down
    if (primary_down) {
      std::unique_lock lck(mtx_);
      cv_.wait_for(lck, std::chrono::milliseconds(kPollIntervalMs), [this]{ return stop_.load(); });
    }
    return false;
  }

  bool claimed = false;
  try {
    claimed = source->Claim(*job, worker_id);
  } catch (const JudgeError& err) {
    // the job left the primary queue; make sure it is not lost
    spdlog::warn("Claim failed, moving job to fallback: job_id={} error={}", job->job_id, err.what());
    try {
      fallback_.Push(*job);
    } catch (const JudgeError& err2) {
      spdlog::error("Failed to move job to fallback: job_id={} error={}", job->job_id, err2.what());
      std::lock_guard lck(held_mtx_);
      held_.push_back(std::move(*job));
    }
    return true;
  }
  if (!claimed) {
    spdlog::info("Job already claimed: worker={} job_id={}", worker_id, job->job_id);
    return true;
  }
  Handle_(std::move(*job), source, worker_id);
  return true;
}

void WorkerPool::WorkLoop_(int index) {
  std::string worker_id = WorkerId(index);
  spdlog::info("Worker started: worker={}", worker_id);
  while (!stop_) {
    try {
      RunOnce(worker_id);
    } catch (const std::exception& err) {
      spdlog::error("Worker iteration failed: worker={} error={}", worker_id, err.what());
      std::unique_lock lck(mtx_);
      cv_.wait_for(lck, std::chrono::milliseconds(kPollIntervalMs), [this]{ return stop_.load(); });
    }
  }
  spdlog::info("Worker stopped: worker={}", worker_id);
}
