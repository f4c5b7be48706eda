#include <sqljudge/dispatcher.h>

#include <cctype>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

size_t kMaxQueryLength = 10'000;

namespace {

bool IsBlank(const std::string& str) {
  return std::all_of(str.begin(), str.end(), [](unsigned char c){ return std::isspace(c); });
}

} // namespace

const char* DispatchRouteName(DispatchRoute route) {
  switch (route) {
#define X(name, str) case DispatchRoute::name: return str;
    ENUM_DISPATCH_ROUTE_
#undef X
  }
  __builtin_unreachable();
}

void Dispatcher::PrimaryRecovered_() {
  if (primary_degraded_.exchange(false)) {
    spdlog::info("Primary queue recovered: queue={}", primary_.Name());
    if (sweeper_) sweeper_->Trigger();
  }
}

std::shared_ptr<const Problem> Dispatcher::CheckQuery_(int problem_id, const std::string& sql_text) const {
  if (IsBlank(sql_text)) throw JudgeError(ErrorCode::INVALID_INPUT, "Query text is empty");
  if (sql_text.size() > kMaxQueryLength) {
    throw JudgeError(ErrorCode::INVALID_INPUT,
                     fmt::format("Query text exceeds {} characters", kMaxQueryLength));
  }
  auto problem = catalog_.Get(problem_id);
  if (!problem) {
    throw JudgeError(ErrorCode::INVALID_INPUT, fmt::format("Unknown problem {}", problem_id));
  }
  return problem;
}

SubmitReceipt Dispatcher::Dispatch(int user_id, int problem_id, const std::string& sql_text) {
  CheckQuery_(problem_id, sql_text);

  Submission sub{0, user_id, problem_id, sql_text, UnixMicros()};
  int64_t sub_id = store_.InsertSubmission(sub);
  auto job = judge_.MakeJob(sub_id, problem_id);
  if (!job) {
    // problem removed after the check above
    store_.RemoveSubmission(sub_id);
    throw JudgeError(ErrorCode::INVALID_INPUT, fmt::format("Unknown problem {}", problem_id));
  }

  std::optional<int64_t> age;
  Liveness liveness = liveness_.Check(&age);
  if (liveness == Liveness::UNKNOWN) primary_degraded_ = true;
  if (liveness != Liveness::LIVE) {
    spdlog::info("No live worker, executing inline: sub_id={} liveness={} heartbeat_age={}",
                 sub_id, LivenessName(liveness), age ? *age : -1);
    job->origin = JobOrigin::INLINE;
    try {
      judge_.Process(*job, nullptr);
      return {sub_id, DispatchRoute::INLINE};
    } catch (const JudgeError& err) {
      spdlog::warn("Inline execution could not be persisted: sub_id={} error={}", sub_id, err.what());
    }
  } else {
    try {
      primary_.Push(*job);
      PrimaryRecovered_();
      spdlog::info("Submission queued: sub_id={} job_id={}", sub_id, job->job_id);
      return {sub_id, DispatchRoute::PRIMARY};
    } catch (const JudgeError& err) {
      primary_degraded_ = true;
      spdlog::warn("Primary queue unavailable, using fallback: sub_id={} error={}", sub_id, err.what());
    }
  }

  try {
    fallback_.Push(*job);
    return {sub_id, DispatchRoute::FALLBACK};
  } catch (const JudgeError& err) {
    spdlog::error("No durable path for submission: sub_id={} error={}", sub_id, err.what());
  }
  try {
    store_.RemoveSubmission(sub_id);
  } catch (const JudgeError& err) {
    spdlog::error("Failed to remove orphaned submission: sub_id={} error={}", sub_id, err.what());
  }
  throw JudgeError(ErrorCode::STORAGE_UNAVAILABLE, "Submission could not be stored");
}

ResultView Dispatcher::GetResult(int64_t submission_id) {
  auto res = store_.GetResult(submission_id);
  if (!res) {
    if (!store_.GetSubmission(submission_id)) {
      throw JudgeError(ErrorCode::NOT_FOUND, fmt::format("Submission {} not found", submission_id));
    }
    throw JudgeError(ErrorCode::PENDING, fmt::format("Submission {} is pending", submission_id));
  }
  ResultView view;
  view.status = res->Status();
  view.pass = res->pass;
  view.verdict = res->GetVerdict();
  view.execution_time_ms = res->execution_time / 1000;
  view.rows_returned = res->rows_returned;
  view.score = res->score;
  view.passed_cases = res->passed_cases;
  view.total_cases = res->total_cases;
  view.error_message = res->error_message;
  view.details = nlohmann::json::parse(res->details, nullptr, false);
  if (view.details.is_discarded()) view.details = nlohmann::json::object();
  return view;
}

JobStatus Dispatcher::JobState(int64_t submission_id) {
  if (store_.HasActiveLease(submission_id)) return JobStatus::RUNNING;
  try {
    if (primary_.GetStatus(JobIdFor(submission_id)) == JobStatus::RUNNING) return JobStatus::RUNNING;
  } catch (const JudgeError& err) {
    spdlog::debug("Job status unavailable: sub_id={} error={}", submission_id, err.what());
  }
  return JobStatus::PENDING;
}

DryRunResult Dispatcher::TestQuery(int problem_id, const std::string& sql_text) {
  auto problem = CheckQuery_(problem_id, sql_text);
  return DryRun(*problem, sql_text);
}
