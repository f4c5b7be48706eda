#include <sqljudge/intake.h>

#include <limits>
#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

namespace {

IntakeResponse ErrorResponse(const JudgeError& err) {
  return {HttpStatusFor(err.Code()),
          {{"error", ErrorCodeName(err.Code())}, {"message", err.what()}}};
}

IntakeResponse InvalidInput(const std::string& message) {
  return ErrorResponse(JudgeError(ErrorCode::INVALID_INPUT, message));
}

// nullopt unless the value is an integer within the range of int
std::optional<int> GetInt(const nlohmann::json& val) {
  if (!val.is_number_integer()) return std::nullopt;
  if (val.is_number_unsigned()) {
    uint64_t num = val.get<uint64_t>();
    if (num > (uint64_t)std::numeric_limits<int>::max()) return std::nullopt;
    return (int)num;
  }
  int64_t num = val.get<int64_t>();
  if (num < std::numeric_limits<int>::min() || num > std::numeric_limits<int>::max()) return std::nullopt;
  return (int)num;
}

struct QueryRequest {
  int problem_id;
  std::string sql_text;
};

// Shared by submit and test-query; fills err on failure
std::optional<QueryRequest> ParseQueryRequest(const nlohmann::json& req, IntakeResponse& err) {
  auto problem = req.find("problemId");
  auto sql = req.find("sqlText");
  std::optional<int> problem_id;
  if (problem != req.end()) problem_id = GetInt(*problem);
  if (!problem_id) {
    err = InvalidInput("problemId must be an integer");
    return std::nullopt;
  }
  if (sql == req.end() || !sql->is_string()) {
    err = InvalidInput("sqlText must be a string");
    return std::nullopt;
  }
  return QueryRequest{*problem_id, sql->get<std::string>()};
}

} // namespace

int HttpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::INVALID_INPUT: return 400;
    case ErrorCode::NOT_FOUND: return 404;
    case ErrorCode::PENDING: return 202;
    case ErrorCode::STORAGE_UNAVAILABLE: [[fallthrough]];
    case ErrorCode::QUEUE_UNAVAILABLE: return 503;
    default: return 500;
  }
}

IntakeResponse HandleSubmit(Dispatcher& dispatcher, const std::string& body) {
  using nlohmann::json;
  json req = json::parse(body, nullptr, false);
  if (req.is_discarded() || !req.is_object()) return InvalidInput("Request body is not a JSON object");
  auto user = req.find("userId");
  std::optional<int> user_id;
  if (user != req.end()) user_id = GetInt(*user);
  if (!user_id) return InvalidInput("userId must be an integer");
  IntakeResponse rejected;
  auto query = ParseQueryRequest(req, rejected);
  if (!query) return rejected;
  try {
    SubmitReceipt receipt = dispatcher.Dispatch(*user_id, query->problem_id, query->sql_text);
    return {201, {{"submissionId", receipt.submission_id}}};
  } catch (const JudgeError& err) {
    spdlog::info("Submission rejected: error={} message={}", ErrorCodeName(err.Code()), err.what());
    return ErrorResponse(err);
  }
}

IntakeResponse HandleResult(Dispatcher& dispatcher, const std::string& submission_id) {
  int64_t id;
  try {
    size_t pos;
    id = std::stoll(submission_id, &pos);
    if (pos != submission_id.size()) throw std::invalid_argument("trailing characters");
  } catch (const std::logic_error&) {
    return InvalidInput("Invalid submission id");
  }
  try {
    ResultView view = dispatcher.GetResult(id);
    nlohmann::json body = {
      {"status", JobStatusName(view.status)},
      {"pass", view.pass},
      {"verdict", VerdictToAbr(view.verdict)},
      {"executionTimeMs", view.execution_time_ms},
      {"rowsReturned", view.rows_returned},
      {"score", view.score},
      {"passedTests", view.passed_cases},
      {"totalTests", view.total_cases},
      {"details", std::move(view.details)},
    };
    if (view.error_message.size()) body["errorMessage"] = view.error_message;
    return {200, std::move(body)};
  } catch (const JudgeError& err) {
    if (err.Code() == ErrorCode::PENDING) {
      JobStatus state = JobStatus::PENDING;
      try {
        state = dispatcher.JobState(id);
      } catch (const JudgeError& err2) {
        spdlog::debug("Job state unavailable: sub_id={} error={}", id, err2.what());
      }
      return {202, {{"status", JobStatusName(state)}}};
    }
    return ErrorResponse(err);
  }
}

IntakeResponse HandleTestQuery(Dispatcher& dispatcher, const std::string& body) {
  using nlohmann::json;
  json req = json::parse(body, nullptr, false);
  if (req.is_discarded() || !req.is_object()) return InvalidInput("Request body is not a JSON object");
  IntakeResponse rejected;
  auto query = ParseQueryRequest(req, rejected);
  if (!query) return rejected;
  try {
    DryRunResult run = dispatcher.TestQuery(query->problem_id, query->sql_text);
    json resp = {
      {"status", SandboxStatusName(run.status)},
      {"columns", run.preview.columns},
      {"rows", std::move(run.preview.rows)},
      {"rowsReturned", run.rows_returned},
      {"executionTimeMs", run.execution_time / 1000},
      {"testResults", std::move(run.cases)},
    };
    if (run.error.size()) resp["errorMessage"] = run.error;
    return {200, std::move(resp)};
  } catch (const JudgeError& err) {
    spdlog::info("Test query rejected: error={} message={}", ErrorCodeName(err.Code()), err.what());
    return ErrorResponse(err);
  }
}

IntakeResponse HandleHealth(Dispatcher& dispatcher, const LivenessMonitor& liveness) {
  std::optional<int64_t> age;
  Liveness state = liveness.Check(&age);
  nlohmann::json body = {
    {"liveness", LivenessName(state)},
    {"queue", dispatcher.QueueName()},
    {"degraded", dispatcher.PrimaryDegraded()},
  };
  if (age) body["heartbeatAgeMs"] = *age / 1000;
  return {200, std::move(body)};
}
