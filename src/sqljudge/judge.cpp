#include <sqljudge/judge.h>

#include <atomic>
#include <cmath>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>
#include <sqljudge/validator.h>
#include <sqljudge/sandbox_exec.h>

size_t kDryRunPreviewRows = 100;

namespace {

struct StatusVerdict {
  JobStatus status;
  Verdict verdict;
};

StatusVerdict MapSandboxStatus(SandboxStatus status) {
  switch (status) {
    case SandboxStatus::OK: return {JobStatus::COMPLETED, Verdict::NUL};
    case SandboxStatus::QUERY_ERROR: return {JobStatus::FAILED, Verdict::RE};
    case SandboxStatus::SECURITY: return {JobStatus::FAILED, Verdict::SEC};
    case SandboxStatus::TIMEOUT: return {JobStatus::TIMED_OUT, Verdict::TLE};
    case SandboxStatus::MEMORY: return {JobStatus::FAILED, Verdict::MLE};
    case SandboxStatus::ROW_LIMIT: return {JobStatus::FAILED, Verdict::OLE};
    case SandboxStatus::INTERNAL: return {JobStatus::FAILED, Verdict::JE};
  }
  __builtin_unreachable();
}

struct CaseRun {
  size_t index = 0;
  SandboxStatus sandbox = SandboxStatus::INTERNAL;
  JobStatus status = JobStatus::FAILED;
  Verdict verdict = Verdict::JE;
  bool pass = false;
  int64_t time = 0; // us
  int64_t rows = 0;
  std::string message;
  std::string rule; // set when the query did not complete
  nlohmann::json sandbox_details;
  nlohmann::json validation; // null unless validated
};

// the remaining cases would only hit the same limit again
bool IsFatal(SandboxStatus status) {
  return status == SandboxStatus::TIMEOUT || status == SandboxStatus::MEMORY;
}

CaseRun RunCase(SandboxOptions opt, const std::string& dataset, const std::string& sql,
                const Problem& problem, const TestCase& tc) {
  opt.dataset = dataset;
  SandboxResult sr = SandboxExec(opt);

  CaseRun run;
  run.index = &tc - problem.cases.data();
  run.sandbox = sr.status;
  run.time = sr.time;
  run.rows = sr.result.rows.size();
  run.sandbox_details = {
    {"status", SandboxStatusName(sr.status)},
    {"tables_read", sr.meta.tables_read},
    {"fullscan_steps", sr.meta.fullscan_steps},
    {"vm_steps", sr.meta.vm_steps},
  };
  StatusVerdict sv = MapSandboxStatus(sr.status);
  run.status = sv.status;
  if (sr.status == SandboxStatus::OK) {
    ValidationOutcome v = Validate(sr.result, sr.meta, sql, problem, tc.expected);
    run.pass = v.pass;
    run.verdict = v.verdict;
    run.message = v.message;
    run.validation = std::move(v.details);
  } else {
    run.verdict = sv.verdict;
    run.message = sr.error;
    run.rule = sr.status == SandboxStatus::TIMEOUT ? "timeout" : "execution_error";
  }
  return run;
}

// keep only what reveals nothing about the expected output
nlohmann::json Redact(const nlohmann::json& validation) {
  nlohmann::json ret = nlohmann::json::object();
  if (validation.contains("rule")) ret["rule"] = validation["rule"];
  return ret;
}

nlohmann::json CaseSummary(const CaseRun& run, const TestCase& tc) {
  nlohmann::json ret = {
    {"name", tc.name},
    {"hidden", tc.hidden},
    {"status", SandboxStatusName(run.sandbox)},
    {"verdict", VerdictToAbr(run.verdict)},
    {"pass", run.pass},
    {"time", run.time},
    {"rows", run.rows},
  };
  if (!tc.hidden) {
    ret["message"] = run.message;
    if (!run.validation.is_null()) ret["validation"] = run.validation;
  }
  return ret;
}

// owner token of one execution attempt
std::string LeaseOwner() {
  static std::atomic_long counter = 0;
  static const std::string process = ProcessName();
  return fmt::format("{}:{}", process, ++counter);
}

bool IsCacheable(Verdict verdict) {
  // timeouts and internal errors may not repeat
  return verdict == Verdict::AC || verdict == Verdict::WA || verdict == Verdict::HC ||
      verdict == Verdict::RE || verdict == Verdict::SEC || verdict == Verdict::OLE;
}

ExecutionResult InternalError(const Job& job, const std::string& message) {
  ExecutionResult res{};
  res.submission_id = job.submission_id;
  res.status = (int)JobStatus::FAILED;
  res.verdict = (int)Verdict::JE;
  res.pass = false;
  res.error_message = message;
  res.details = nlohmann::json{{"rule", "internal_error"}}.dump();
  res.finished_at = UnixMicros();
  return res;
}

// Queue acknowledgements are observability for the primary queue and
// recoverable through stale reclaim for the fallback queue.
void Acknowledge(JobQueue* queue, const Job& job, JobStatus status) {
  if (!queue) return;
  try {
    queue->SetStatus(job, status);
  } catch (const JudgeError& err) {
    spdlog::warn("Failed to acknowledge job: job_id={} queue={} status={} error={}",
                 job.job_id, queue->Name(), JobStatusName(status), err.what());
  }
}

// the lease expires on its own if this fails
void ReleaseLease(Store& store, const Job& job, const std::string& owner) {
  try {
    store.ReleaseLease(job.submission_id, owner);
  } catch (const JudgeError& err) {
    spdlog::warn("Failed to release lease: job_id={} sub_id={} error={}", job.job_id, job.submission_id, err.what());
  }
}

} // namespace

const char* JudgeOutcomeName(JudgeOutcome outcome) {
  switch (outcome) {
#define X(name) case JudgeOutcome::name: return #name;
    ENUM_JUDGE_OUTCOME_
#undef X
  }
  __builtin_unreachable();
}

ExecutionResult Evaluate(const Job& job, const Submission& sub, const Problem& problem) {
  SandboxOptions opt;
  opt.sql = sub.sql_text;
  opt.time_limit = job.time_limit ? job.time_limit : problem.time_limit;
  opt.memory_limit = job.memory_limit ? job.memory_limit : problem.memory_limit;
  opt.max_rows = job.max_rows ? job.max_rows : problem.max_rows;

  std::vector<CaseRun> runs;
  nlohmann::json cases = nlohmann::json::array();
  int passed = 0;
  for (size_t i = 0; i < problem.cases.size(); i++) {
    const TestCase& tc = problem.cases[i];
    if (runs.size() && IsFatal(runs.back().sandbox)) {
      cases.push_back({{"name", tc.name}, {"hidden", tc.hidden}, {"skipped", true}});
      continue;
    }
    // the job pins the first dataset at dispatch time
    std::string dataset = i == 0 && job.dataset.size() ? job.dataset : tc.dataset.string();
    runs.push_back(RunCase(opt, dataset, sub.sql_text, problem, tc));
    if (runs.back().pass) passed++;
    cases.push_back(CaseSummary(runs.back(), tc));
  }

  ExecutionResult res{};
  res.submission_id = sub.id;
  res.total_cases = problem.cases.size();
  res.passed_cases = passed;
  res.pass = res.total_cases > 0 && passed == res.total_cases;
  res.score = res.total_cases ? std::round(10000.0 * passed / res.total_cases) / 100 : 0;
  if (runs.empty()) {
    res.status = (int)JobStatus::FAILED;
    res.verdict = (int)Verdict::JE;
    res.error_message = "Problem has no test cases";
    res.details = nlohmann::json{{"rule", "internal_error"}}.dump();
    res.finished_at = UnixMicros();
    return res;
  }
  // status, verdict and message all come from the first failing case
  size_t rep = 0;
  while (rep < runs.size() && runs[rep].pass) rep++;
  if (rep == runs.size()) rep = 0;
  const CaseRun& reported = runs[rep];
  const TestCase& reported_case = problem.cases[reported.index];
  res.status = (int)reported.status;
  res.verdict = (int)(res.pass ? Verdict::AC : reported.verdict);
  res.error_message = res.pass ? std::string() : reported.message;
  res.rows_returned = runs[0].rows;
  for (auto& run : runs) res.execution_time = std::max(res.execution_time, run.time);

  nlohmann::json details = {{"sandbox", reported.sandbox_details}};
  if (reported.validation.is_null()) {
    details["rule"] = reported.rule;
  } else {
    details["validation"] = reported_case.hidden ? Redact(reported.validation) : reported.validation;
  }
  details["cases"] = std::move(cases);
  res.details = details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res.finished_at = UnixMicros();
  spdlog::info("Job evaluated: job_id={} sub_id={} status={} verdict={} passed={}/{} time={} rows={}",
               job.job_id, sub.id, JobStatusName(res.Status()), VerdictToAbr(res.GetVerdict()),
               passed, res.total_cases, res.execution_time, res.rows_returned);
  return res;
}

DryRunResult DryRun(const Problem& problem, const std::string& sql) {
  SandboxOptions opt;
  opt.sql = sql;
  opt.time_limit = problem.time_limit;
  opt.memory_limit = problem.memory_limit;
  opt.max_rows = problem.max_rows;

  DryRunResult ret;
  bool previewed = false;
  for (size_t i = 0; i < problem.cases.size(); i++) {
    const TestCase& tc = problem.cases[i];
    if (tc.hidden) continue;
    opt.dataset = tc.dataset.string();
    SandboxResult sr = SandboxExec(opt);
    if (!previewed) {
      previewed = true;
      ret.status = sr.status;
      ret.error = sr.error;
      ret.rows_returned = sr.result.rows.size();
      ret.execution_time = sr.time;
      ret.preview.columns = sr.result.columns;
      for (size_t r = 0; r < sr.result.rows.size() && r < kDryRunPreviewRows; r++) {
        ret.preview.rows.push_back(sr.result.rows[r]);
      }
    }
    nlohmann::json entry = {{"name", tc.name}, {"status", SandboxStatusName(sr.status)}};
    if (sr.status == SandboxStatus::OK) {
      ValidationOutcome v = Validate(sr.result, sr.meta, sql, problem, tc.expected);
      entry["pass"] = v.pass;
      entry["verdict"] = VerdictToAbr(v.verdict);
      entry["message"] = v.message;
    } else {
      entry["pass"] = false;
      entry["verdict"] = VerdictToAbr(MapSandboxStatus(sr.status).verdict);
      entry["message"] = sr.error;
    }
    ret.cases.push_back(std::move(entry));
    if (IsFatal(sr.status)) break;
  }
  if (!previewed) {
    ret.status = SandboxStatus::INTERNAL;
    ret.error = "Problem has no visible test cases";
  }
  spdlog::info("Dry run: prob_id={} status={} rows={} time={} cases={}",
               problem.id, SandboxStatusName(ret.status), ret.rows_returned,
               ret.execution_time, ret.cases.size());
  return ret;
}

std::optional<Job> Judge::MakeJob(int64_t submission_id, int problem_id) const {
  auto problem = catalog_.Get(problem_id);
  if (!problem) return std::nullopt;
  Job job;
  job.job_id = JobIdFor(submission_id);
  job.submission_id = submission_id;
  job.problem_id = problem_id;
  job.dataset = problem->dataset.string();
  job.time_limit = problem->time_limit;
  job.memory_limit = problem->memory_limit;
  job.max_rows = problem->max_rows;
  job.enqueued_at = UnixMicros();
  return job;
}

JudgeOutcome Judge::Process(const Job& job, JobQueue* queue) {
  if (auto existing = store_.GetResult(job.submission_id)) {
    spdlog::info("Result exists, skipping: job_id={} sub_id={} origin={}",
                 job.job_id, job.submission_id, JobOriginName(job.origin));
    Acknowledge(queue, job, existing->Status());
    return JudgeOutcome::DUPLICATE;
  }
  auto sub = store_.GetSubmission(job.submission_id);
  if (!sub) {
    spdlog::error("Job references unknown submission: job_id={} sub_id={}", job.job_id, job.submission_id);
    Acknowledge(queue, job, JobStatus::FAILED);
    return JudgeOutcome::MISSING;
  }

  // long enough for every test case plus the sandbox grace
  auto problem = catalog_.Get(sub->problem_id);
  int64_t cases = problem ? problem->cases.size() : 1;
  int64_t time_limit = job.time_limit ? job.time_limit : problem ? problem->time_limit : kDefaultTimeLimit;
  int64_t expires_at = UnixMicros() + cases * (time_limit + kSandboxGrace) + kClaimSlackMs * 1000;
  std::string owner = LeaseOwner();
  if (!store_.AcquireLease(job.submission_id, owner, expires_at)) {
    spdlog::info("Submission is executing elsewhere: job_id={} sub_id={} origin={}",
                 job.job_id, job.submission_id, JobOriginName(job.origin));
    return JudgeOutcome::BUSY;
  }
  JudgeOutcome outcome;
  try {
    outcome = Execute_(job, *sub, queue);
  } catch (const JudgeError&) {
    ReleaseLease(store_, job, owner);
    throw;
  }
  ReleaseLease(store_, job, owner);
  return outcome;
}

JudgeOutcome Judge::Execute_(const Job& job, const Submission& sub, JobQueue* queue) {
  // the previous lease holder may have finished in between
  if (auto existing = store_.GetResult(job.submission_id)) {
    Acknowledge(queue, job, existing->Status());
    return JudgeOutcome::DUPLICATE;
  }
  if (queue) {
    try {
      queue->SetStatus(job, JobStatus::RUNNING);
    } catch (const JudgeError& err) {
      spdlog::debug("Failed to mark job running: job_id={} error={}", job.job_id, err.what());
    }
  }

  std::optional<ExecutionResult> cached;
  if (cache_) cached = cache_->Get(sub.problem_id, sub.sql_text);
  ExecutionResult res;
  if (cached) {
    res = std::move(*cached);
    res.id = 0;
    res.submission_id = sub.id;
    res.finished_at = UnixMicros();
    auto details = nlohmann::json::parse(res.details, nullptr, false);
    if (details.is_object()) {
      details["from_cache"] = true;
      res.details = details.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    spdlog::info("Result cache hit: job_id={} sub_id={} prob_id={}", job.job_id, sub.id, sub.problem_id);
  } else {
    if (reporter_.ReportStarted) reporter_.ReportStarted(job);
    try {
      auto problem = catalog_.Get(sub.problem_id);
      if (problem) {
        res = Evaluate(job, sub, *problem);
      } else {
        spdlog::error("Problem not found: job_id={} prob_id={}", job.job_id, sub.problem_id);
        res = InternalError(job, "Problem not found");
      }
    } catch (const std::exception& err) {
      // one bad job must not take the consumer down
      spdlog::error("Unexpected error while judging: job_id={} error={}", job.job_id, err.what());
      res = InternalError(job, "Internal error while executing the query");
    }
    if (cache_ && IsCacheable(res.GetVerdict())) cache_->Put(sub.problem_id, sub.sql_text, res);
  }

  if (!store_.WriteResult(res)) {
    Acknowledge(queue, job, res.Status());
    return JudgeOutcome::DUPLICATE;
  }
  Acknowledge(queue, job, res.Status());
  if (reporter_.ReportResult) reporter_.ReportResult(job, res);
  return JudgeOutcome::WRITTEN;
}
