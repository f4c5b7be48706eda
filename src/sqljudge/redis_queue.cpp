#include <sqljudge/redis_queue.h>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

namespace {

sw::redis::ConnectionOptions MakeOptions(const std::string& url, std::chrono::milliseconds socket_timeout) {
  sw::redis::ConnectionOptions opts(url);
  opts.connect_timeout = std::chrono::milliseconds(kQueueTimeoutMs);
  opts.socket_timeout = socket_timeout;
  return opts;
}

template <class Func>
auto Guard(const char* op, Func&& func) -> decltype(func()) {
  try {
    return func();
  } catch (const sw::redis::Error& err) {
    spdlog::warn("Redis error: op={} error={}", op, err.what());
    throw JudgeError(ErrorCode::QUEUE_UNAVAILABLE, std::string(op) + ": " + err.what());
  }
}

} // namespace

RedisQueue::RedisQueue(const std::string& url, std::string prefix) :
    prefix_(std::move(prefix)),
    commands_(MakeOptions(url, std::chrono::milliseconds(kQueueTimeoutMs))),
    // no socket timeout; BRPOP bounds itself
    blocking_(MakeOptions(url, std::chrono::milliseconds(0))) {}

int64_t RedisQueue::Push(const Job& job) {
  return Guard("push", [&]() -> int64_t {
    std::string status_key = Key_("job:" + job.job_id);
    commands_.hset(status_key, "status", JobStatusName(JobStatus::PENDING));
    commands_.expire(status_key, std::chrono::seconds(kJobStatusTtlSec));
    commands_.lpush(Key_("queue"), job.Serialize());
    return 0;
  });
}

std::optional<Job> RedisQueue::Pop(std::chrono::milliseconds timeout) {
  // BRPOP takes whole seconds and 0 means forever
  auto secs = std::max<long>(1, std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
  auto item = Guard("pop", [&]() {
    return blocking_.brpop(Key_("queue"), std::chrono::seconds(secs));
  });
  if (!item) return std::nullopt;
  try {
    Job job = Job::Deserialize(item->second);
    job.origin = JobOrigin::PRIMARY;
    return job;
  } catch (nlohmann::json::exception& err) {
    spdlog::error("Undecodable job dropped from primary queue: error={} payload={}", err.what(), item->second);
    return std::nullopt;
  }
}

bool RedisQueue::Claim(const Job& job, const std::string& consumer) {
  return Guard("claim", [&]() {
    auto ttl = std::chrono::milliseconds(job.time_limit / 1000 + kClaimSlackMs);
    if (!commands_.set(Key_("claim:" + job.job_id), consumer, ttl, sw::redis::UpdateType::NOT_EXIST)) {
      return false;
    }
    std::string status_key = Key_("job:" + job.job_id);
    commands_.hset(status_key, "status", JobStatusName(JobStatus::RUNNING));
    commands_.expire(status_key, std::chrono::seconds(kJobStatusTtlSec));
    return true;
  });
}

void RedisQueue::SetStatus(const Job& job, JobStatus status) {
  Guard("set_status", [&]() {
    std::string status_key = Key_("job:" + job.job_id);
    commands_.hset(status_key, "status", JobStatusName(status));
    commands_.expire(status_key, std::chrono::seconds(kJobStatusTtlSec));
    if (status != JobStatus::PENDING && status != JobStatus::RUNNING) {
      commands_.del(Key_("claim:" + job.job_id));
    }
  });
}

void RedisQueue::Release(const Job& job) {
  Guard("release", [&]() {
    commands_.del(Key_("claim:" + job.job_id));
    commands_.hset(Key_("job:" + job.job_id), "status", JobStatusName(JobStatus::PENDING));
    // the consumer end of the list, so it is picked up next
    commands_.rpush(Key_("queue"), job.Serialize());
  });
}

void RedisQueue::Heartbeat(const std::string& worker_id, std::chrono::milliseconds ttl) {
  Guard("heartbeat", [&]() {
    std::string ts = std::to_string(UnixMicros());
    commands_.set(Key_("heartbeat:" + worker_id), ts, ttl);
    commands_.set(Key_("heartbeat"), ts, ttl);
    commands_.publish(Key_("heartbeats"), nlohmann::json{{"worker", worker_id}, {"ts", ts}}.dump());
  });
}

std::optional<int64_t> RedisQueue::LatestHeartbeat() {
  auto val = Guard("latest_heartbeat", [&]() { return commands_.get(Key_("heartbeat")); });
  if (!val) return std::nullopt;
  try {
    return std::stoll(*val);
  } catch (const std::logic_error&) {
    spdlog::warn("Malformed heartbeat value: {}", *val);
    return std::nullopt;
  }
}

std::optional<JobStatus> RedisQueue::GetStatus(const std::string& job_id) {
  auto val = Guard("get_status", [&]() { return commands_.hget(Key_("job:" + job_id), "status"); });
  if (!val) return std::nullopt;
  return ParseJobStatus(*val);
}
