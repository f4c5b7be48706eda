#ifndef INCLUDE_SQLJUDGE_STORE_H_
#define INCLUDE_SQLJUDGE_STORE_H_

#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <sqlite_orm/sqlite_orm.h>

#include "job.h"
#include "error.h"
#include "submission.h"

struct FallbackRecord {
  int64_t id; // creation order
  std::string job_id; // unique
  std::string payload; // serialized Job
  int status; // FallbackStatus
  int64_t created_at; // UNIX timestamp, microseconds
  int64_t processed_at; // last status change; 0 if never claimed

  FallbackStatus Status() const { return (FallbackStatus)status; }
};

// Held by whoever is executing a submission, whichever queue delivered it
struct JobLease {
  int64_t id;
  int64_t submission_id; // unique
  std::string owner;
  int64_t expires_at; // UNIX timestamp, microseconds
};

namespace internal {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_unique_index("idx_results_submission", &ExecutionResult::submission_id),
      make_unique_index("idx_fallback_job", &FallbackRecord::job_id),
      make_index("idx_fallback_status", &FallbackRecord::status, &FallbackRecord::id),
      make_unique_index("idx_lease_submission", &JobLease::submission_id),
      make_table("submissions",
                 make_column("id", &Submission::id, primary_key()),
                 make_column("user_id", &Submission::user_id),
                 make_column("problem_id", &Submission::problem_id),
                 make_column("sql_text", &Submission::sql_text),
                 make_column("created_at", &Submission::created_at)),
      make_table("execution_results",
                 make_column("id", &ExecutionResult::id, primary_key()),
                 make_column("submission_id", &ExecutionResult::submission_id),
                 make_column("status", &ExecutionResult::status),
                 make_column("verdict", &ExecutionResult::verdict),
                 make_column("pass", &ExecutionResult::pass),
                 make_column("execution_time", &ExecutionResult::execution_time),
                 make_column("rows_returned", &ExecutionResult::rows_returned),
                 make_column("score", &ExecutionResult::score, default_value(0.0)),
                 make_column("passed_cases", &ExecutionResult::passed_cases, default_value(0)),
                 make_column("total_cases", &ExecutionResult::total_cases, default_value(0)),
                 make_column("error_message", &ExecutionResult::error_message),
                 make_column("details", &ExecutionResult::details),
                 make_column("finished_at", &ExecutionResult::finished_at)),
      make_table("fallback_jobs",
                 make_column("id", &FallbackRecord::id, primary_key()),
                 make_column("job_id", &FallbackRecord::job_id),
                 make_column("payload", &FallbackRecord::payload),
                 make_column("status", &FallbackRecord::status),
                 make_column("created_at", &FallbackRecord::created_at),
                 make_column("processed_at", &FallbackRecord::processed_at, default_value(0))),
      make_table("job_leases",
                 make_column("id", &JobLease::id, primary_key()),
                 make_column("submission_id", &JobLease::submission_id),
                 make_column("owner", &JobLease::owner),
                 make_column("expires_at", &JobLease::expires_at)));
  storage.sync_schema(true);
  return storage;
}

} // namespace internal

// System of record. All methods are thread-safe and throw
// JudgeError(STORAGE_UNAVAILABLE) when the database cannot be used.
class Store {
 public:
  using Storage = decltype(internal::InitStorage(""));

 private:
  std::string path_;
  std::unique_ptr<Storage> db_;
  std::mutex mtx_;

  void Init();
  template <class Func> auto Run_(const char* op, Func&& func) -> decltype(func());

 public:
  explicit Store(std::string path) : path_(std::move(path)) {}

  // returns the generated submission id
  int64_t InsertSubmission(const Submission&);
  std::optional<Submission> GetSubmission(int64_t id);
  void RemoveSubmission(int64_t id);
  // Submissions without a result created before the given time, id > after_id
  std::vector<Submission> UnresolvedSubmissions(int64_t created_before, int64_t after_id, size_t limit);

  // Write-once; returns false if the submission already has a result
  bool WriteResult(const ExecutionResult&);
  std::optional<ExecutionResult> GetResult(int64_t submission_id);
  bool HasResult(int64_t submission_id);

  // Returns the record id; an existing record with the same job_id is reused
  int64_t InsertFallback(const std::string& job_id, const std::string& payload);
  std::optional<FallbackRecord> GetFallback(int64_t id);
  // pending records in creation order
  std::vector<FallbackRecord> PendingFallback(size_t limit);
  std::vector<FallbackRecord> ProcessingFallback(size_t limit);
  // Atomic pending -> processing; false if another consumer got it first
  bool ClaimFallback(int64_t id);
  // Claim the oldest pending record
  std::optional<FallbackRecord> ClaimNextFallback();
  // processing -> completed / failed
  void FinishFallback(int64_t id, FallbackStatus status);
  // processing -> pending
  bool ReleaseFallback(int64_t id);
  // processing records claimed before the given time go back to pending
  int ReclaimStaleFallback(int64_t claimed_before);
  int CountFallback(FallbackStatus status);
  std::optional<FallbackRecord> FallbackByJob(const std::string& job_id);
  // Ensure a pending or processing record exists for the job; a finished
  // record is reopened with the new payload. False if one was already open.
  bool AdoptFallback(const std::string& job_id, const std::string& payload);

  // Exclusive until expires_at or release; an expired lease can be taken over
  bool AcquireLease(int64_t submission_id, const std::string& owner, int64_t expires_at);
  void ReleaseLease(int64_t submission_id, const std::string& owner);
  bool HasActiveLease(int64_t submission_id);
};

#endif  // INCLUDE_SQLJUDGE_STORE_H_
