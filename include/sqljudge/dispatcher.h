#ifndef INCLUDE_SQLJUDGE_DISPATCHER_H_
#define INCLUDE_SQLJUDGE_DISPATCHER_H_

#include <atomic>
#include <memory>
#include <string>
#include <cstdint>

#include <nlohmann/json.hpp>

#include "judge.h"
#include "queue.h"
#include "store.h"
#include "problem.h"
#include "liveness.h"
#include "recovery.h"

extern size_t kMaxQueryLength;

#define ENUM_DISPATCH_ROUTE_ \
  X(PRIMARY, "primary") \
  X(FALLBACK, "fallback") \
  X(INLINE, "inline")
enum class DispatchRoute {
#define X(name, str) name,
  ENUM_DISPATCH_ROUTE_
#undef X
};

const char* DispatchRouteName(DispatchRoute);

struct SubmitReceipt {
  int64_t submission_id;
  DispatchRoute route;
};

struct ResultView {
  JobStatus status;
  bool pass;
  Verdict verdict;
  int64_t execution_time_ms;
  int64_t rows_returned;
  double score;
  int passed_cases;
  int total_cases;
  std::string error_message;
  nlohmann::json details;
};

class Dispatcher {
  Store& store_;
  const ProblemCatalog& catalog_;
  PrimaryQueue& primary_;
  FallbackQueue& fallback_;
  const LivenessMonitor& liveness_;
  Judge& judge_;
  RecoverySweeper* sweeper_;
  std::atomic_bool primary_degraded_;

  void PrimaryRecovered_();
  // throws INVALID_INPUT
  std::shared_ptr<const Problem> CheckQuery_(int problem_id, const std::string& sql_text) const;

 public:
  // sweeper may be nullptr; it is triggered when the primary queue recovers
  Dispatcher(Store& store, const ProblemCatalog& catalog, PrimaryQueue& primary,
             FallbackQueue& fallback, const LivenessMonitor& liveness, Judge& judge,
             RecoverySweeper* sweeper = nullptr) :
      store_(store), catalog_(catalog), primary_(primary), fallback_(fallback),
      liveness_(liveness), judge_(judge), sweeper_(sweeper), primary_degraded_(false) {}

  // Persist the submission and route it. Throws JudgeError:
  //   INVALID_INPUT if the query or problem is unusable (nothing stored),
  //   STORAGE_UNAVAILABLE if the submission could not be stored or no durable
  //   path accepted its job (nothing left behind).
  SubmitReceipt Dispatch(int user_id, int problem_id, const std::string& sql_text);
  int64_t Submit(int user_id, int problem_id, const std::string& sql_text) {
    return Dispatch(user_id, problem_id, sql_text).submission_id;
  }

  // Throws JudgeError NOT_FOUND / PENDING
  ResultView GetResult(int64_t submission_id);
  // PENDING or RUNNING for a submission without a result
  JobStatus JobState(int64_t submission_id);

  // Execute against the visible test cases without storing anything.
  // Same input checks as Dispatch.
  DryRunResult TestQuery(int problem_id, const std::string& sql_text);

  bool PrimaryDegraded() const { return primary_degraded_; }
  const char* QueueName() const { return primary_.Name(); }
};

#endif  // INCLUDE_SQLJUDGE_DISPATCHER_H_
