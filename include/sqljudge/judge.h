#ifndef INCLUDE_SQLJUDGE_JUDGE_H_
#define INCLUDE_SQLJUDGE_JUDGE_H_

#include <optional>
#include <functional>

#include "job.h"
#include "queue.h"
#include "store.h"
#include "problem.h"
#include "sandbox.h"
#include "submission.h"
#include "result_cache.h"

// rows of the first visible test case returned by a dry run
extern size_t kDryRunPreviewRows;

#define ENUM_JUDGE_OUTCOME_ \
  X(WRITTEN) /* this call persisted the result */ \
  X(DUPLICATE) /* a result already existed; nothing executed or written */ \
  X(MISSING) /* the submission does not exist */ \
  X(BUSY) /* another executor holds the execution lease */
enum class JudgeOutcome {
#define X(name) name,
  ENUM_JUDGE_OUTCOME_
#undef X
};

const char* JudgeOutcomeName(JudgeOutcome);

// Run the sandbox and the validator on every test case of the problem;
// never throws for problems with the query itself.
// After a timeout or a memory limit the remaining cases are skipped.
ExecutionResult Evaluate(const Job&, const Submission&, const Problem&);

struct DryRunResult {
  SandboxStatus status = SandboxStatus::INTERNAL;
  std::string error;
  ResultSet preview; // at most kDryRunPreviewRows rows
  int64_t rows_returned = 0;
  int64_t execution_time = 0; // us
  nlohmann::json cases = nlohmann::json::array(); // visible test cases only
};

// Execute and grade without persisting anything. Hidden test cases are not
// run, and their datasets are never previewed.
DryRunResult DryRun(const Problem&, const std::string& sql);

// The execution path shared by workers, the recovery sweeper and inline
// dispatch.
class Judge {
 public:
  struct Reporter {
    // these functions should not block
    std::function<void(const Job&)> ReportStarted;
    std::function<void(const Job&, const ExecutionResult&)> ReportResult;
  };

 private:
  Store& store_;
  const ProblemCatalog& catalog_;
  Reporter reporter_;
  ResultCache* cache_;

  JudgeOutcome Execute_(const Job&, const Submission&, JobQueue* queue);
 public:
  Judge(Store& store, const ProblemCatalog& catalog, Reporter reporter = {},
        ResultCache* cache = nullptr) :
      store_(store), catalog_(catalog), reporter_(std::move(reporter)), cache_(cache) {}

  // nullopt if the problem is unknown
  std::optional<Job> MakeJob(int64_t submission_id, int problem_id) const;

  // Check-before-execute, take the execution lease, run, persist exactly
  // once, then acknowledge the job on its queue (nullptr for inline runs).
  // Returns BUSY without touching the queue if another executor holds the
  // lease.
  // Throws JudgeError(STORAGE_UNAVAILABLE) if the store cannot be read or
  // written; the job is then still unfinished and should be released.
  JudgeOutcome Process(const Job&, JobQueue* queue);
};

#endif  // INCLUDE_SQLJUDGE_JUDGE_H_
