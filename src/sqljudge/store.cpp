#include <sqljudge/store.h>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

namespace {

constexpr int kBusyTimeout = 5000; // ms
constexpr size_t kClaimBatch = 16;

bool IsConstraintError(const std::system_error& err) {
  return err.code().category() == sqlite_orm::get_sqlite_error_category() &&
         (err.code().value() & 0xff) == SQLITE_CONSTRAINT;
}

} // namespace

void Store::Init() {
  if (db_) return;
  auto db = std::make_unique<Storage>(internal::InitStorage(path_));
  db->open_forever();
  db->busy_timeout(kBusyTimeout);
  db_ = std::move(db);
  spdlog::info("Database opened: path={}", path_);
}

template <class Func>
auto Store::Run_(const char* op, Func&& func) -> decltype(func()) {
  std::lock_guard lck(mtx_);
  try {
    Init();
    return func();
  } catch (const std::system_error& err) {
    spdlog::warn("Storage error: op={} error={}", op, err.what());
    throw JudgeError(ErrorCode::STORAGE_UNAVAILABLE, std::string(op) + ": " + err.what());
  }
}

int64_t Store::InsertSubmission(const Submission& sub) {
  return Run_("insert_submission", [&]() {
    return (int64_t)db_->insert(sub);
  });
}

std::optional<Submission> Store::GetSubmission(int64_t id) {
  return Run_("get_submission", [&]() -> std::optional<Submission> {
    if (auto ptr = db_->get_pointer<Submission>(id)) return *ptr;
    return std::nullopt;
  });
}

void Store::RemoveSubmission(int64_t id) {
  Run_("remove_submission", [&]() {
    db_->remove<Submission>(id);
  });
}

std::vector<Submission> Store::UnresolvedSubmissions(int64_t created_before, int64_t after_id, size_t max_count) {
  using namespace sqlite_orm;
  return Run_("unresolved_submissions", [&]() {
    return db_->get_all<Submission>(
        where(c(&Submission::id) > after_id && c(&Submission::created_at) < created_before &&
              not_in(&Submission::id, select(&ExecutionResult::submission_id))),
        order_by(&Submission::id), limit((int)max_count));
  });
}

bool Store::WriteResult(const ExecutionResult& res) {
  return Run_("write_result", [&]() {
    try {
      db_->insert(res);
    } catch (const std::system_error& err) {
      if (!IsConstraintError(err)) throw;
      spdlog::info("Result already written: sub_id={}", res.submission_id);
      return false;
    }
    return true;
  });
}

std::optional<ExecutionResult> Store::GetResult(int64_t submission_id) {
  using namespace sqlite_orm;
  return Run_("get_result", [&]() -> std::optional<ExecutionResult> {
    auto rows = db_->get_all<ExecutionResult>(
        where(c(&ExecutionResult::submission_id) == submission_id), limit(1));
    if (rows.empty()) return std::nullopt;
    return std::move(rows[0]);
  });
}

bool Store::HasResult(int64_t submission_id) {
  using namespace sqlite_orm;
  return Run_("has_result", [&]() {
    return db_->count<ExecutionResult>(where(c(&ExecutionResult::submission_id) == submission_id)) > 0;
  });
}

int64_t Store::InsertFallback(const std::string& job_id, const std::string& payload) {
  using namespace sqlite_orm;
  return Run_("insert_fallback", [&]() -> int64_t {
    FallbackRecord rec{0, job_id, payload, (int)FallbackStatus::PENDING, UnixMicros(), 0};
    try {
      return db_->insert(rec);
    } catch (const std::system_error& err) {
      if (!IsConstraintError(err)) throw;
    }
    auto ids = db_->select(&FallbackRecord::id, where(c(&FallbackRecord::job_id) == job_id));
    if (ids.empty()) {
      throw std::system_error(std::error_code(SQLITE_CONSTRAINT, sqlite_orm::get_sqlite_error_category()),
                              "fallback record vanished");
    }
    spdlog::info("Fallback record reused: job_id={} fallback_id={}", job_id, ids[0]);
    return ids[0];
  });
}

std::optional<FallbackRecord> Store::GetFallback(int64_t id) {
  return Run_("get_fallback", [&]() -> std::optional<FallbackRecord> {
    if (auto ptr = db_->get_pointer<FallbackRecord>(id)) return *ptr;
    return std::nullopt;
  });
}

std::vector<FallbackRecord> Store::PendingFallback(size_t max_count) {
  using namespace sqlite_orm;
  return Run_("pending_fallback", [&]() {
    return db_->get_all<FallbackRecord>(
        where(c(&FallbackRecord::status) == (int)FallbackStatus::PENDING),
        order_by(&FallbackRecord::id), limit((int)max_count));
  });
}

std::vector<FallbackRecord> Store::ProcessingFallback(size_t max_count) {
  using namespace sqlite_orm;
  return Run_("processing_fallback", [&]() {
    return db_->get_all<FallbackRecord>(
        where(c(&FallbackRecord::status) == (int)FallbackStatus::PROCESSING),
        order_by(&FallbackRecord::id), limit((int)max_count));
  });
}

bool Store::ClaimFallback(int64_t id) {
  using namespace sqlite_orm;
  return Run_("claim_fallback", [&]() {
    db_->update_all(
        set(c(&FallbackRecord::status) = (int)FallbackStatus::PROCESSING,
            c(&FallbackRecord::processed_at) = UnixMicros()),
        where(c(&FallbackRecord::id) == id &&
              c(&FallbackRecord::status) == (int)FallbackStatus::PENDING));
    return db_->changes() == 1;
  });
}

std::optional<FallbackRecord> Store::ClaimNextFallback() {
  // lost races move on to the next candidate
  while (true) {
    auto batch = PendingFallback(kClaimBatch);
    if (batch.empty()) return std::nullopt;
    for (auto& rec : batch) {
      if (ClaimFallback(rec.id)) {
        rec.status = (int)FallbackStatus::PROCESSING;
        return rec;
      }
    }
  }
}

void Store::FinishFallback(int64_t id, FallbackStatus status) {
  using namespace sqlite_orm;
  Run_("finish_fallback", [&]() {
    db_->update_all(
        set(c(&FallbackRecord::status) = (int)status,
            c(&FallbackRecord::processed_at) = UnixMicros()),
        where(c(&FallbackRecord::id) == id));
  });
}

bool Store::ReleaseFallback(int64_t id) {
  using namespace sqlite_orm;
  return Run_("release_fallback", [&]() {
    db_->update_all(
        set(c(&FallbackRecord::status) = (int)FallbackStatus::PENDING),
        where(c(&FallbackRecord::id) == id &&
              c(&FallbackRecord::status) == (int)FallbackStatus::PROCESSING));
    return db_->changes() == 1;
  });
}

int Store::ReclaimStaleFallback(int64_t claimed_before) {
  using namespace sqlite_orm;
  return Run_("reclaim_fallback", [&]() {
    db_->update_all(
        set(c(&FallbackRecord::status) = (int)FallbackStatus::PENDING),
        where(c(&FallbackRecord::status) == (int)FallbackStatus::PROCESSING &&
              c(&FallbackRecord::processed_at) < claimed_before));
    return db_->changes();
  });
}

int Store::CountFallback(FallbackStatus status) {
  using namespace sqlite_orm;
  return Run_("count_fallback", [&]() {
    return db_->count<FallbackRecord>(where(c(&FallbackRecord::status) == (int)status));
  });
}

std::optional<FallbackRecord> Store::FallbackByJob(const std::string& job_id) {
  using namespace sqlite_orm;
  return Run_("fallback_by_job", [&]() -> std::optional<FallbackRecord> {
    auto rows = db_->get_all<FallbackRecord>(where(c(&FallbackRecord::job_id) == job_id), limit(1));
    if (rows.empty()) return std::nullopt;
    return std::move(rows[0]);
  });
}

bool Store::AdoptFallback(const std::string& job_id, const std::string& payload) {
  using namespace sqlite_orm;
  return Run_("adopt_fallback", [&]() {
    FallbackRecord rec{0, job_id, payload, (int)FallbackStatus::PENDING, UnixMicros(), 0};
    try {
      db_->insert(rec);
      return true;
    } catch (const std::system_error& err) {
      if (!IsConstraintError(err)) throw;
    }
    db_->update_all(
        set(c(&FallbackRecord::status) = (int)FallbackStatus::PENDING,
            c(&FallbackRecord::payload) = payload,
            c(&FallbackRecord::processed_at) = UnixMicros()),
        where(c(&FallbackRecord::job_id) == job_id &&
              (c(&FallbackRecord::status) == (int)FallbackStatus::COMPLETED ||
               c(&FallbackRecord::status) == (int)FallbackStatus::FAILED)));
    return db_->changes() == 1;
  });
}

bool Store::AcquireLease(int64_t submission_id, const std::string& owner, int64_t expires_at) {
  using namespace sqlite_orm;
  return Run_("acquire_lease", [&]() {
    JobLease lease{0, submission_id, owner, expires_at};
    try {
      db_->insert(lease);
      return true;
    } catch (const std::system_error& err) {
      if (!IsConstraintError(err)) throw;
    }
    // the previous holder ran out of time
    db_->update_all(
        set(c(&JobLease::owner) = owner, c(&JobLease::expires_at) = expires_at),
        where(c(&JobLease::submission_id) == submission_id && c(&JobLease::expires_at) < UnixMicros()));
    bool taken = db_->changes() == 1;
    if (taken) spdlog::info("Expired lease taken over: sub_id={} owner={}", submission_id, owner);
    return taken;
  });
}

void Store::ReleaseLease(int64_t submission_id, const std::string& owner) {
  using namespace sqlite_orm;
  Run_("release_lease", [&]() {
    db_->remove_all<JobLease>(
        where(c(&JobLease::submission_id) == submission_id && c(&JobLease::owner) == owner));
  });
}

bool Store::HasActiveLease(int64_t submission_id) {
  using namespace sqlite_orm;
  return Run_("has_lease", [&]() {
    return db_->count<JobLease>(
        where(c(&JobLease::submission_id) == submission_id && c(&JobLease::expires_at) >= UnixMicros())) > 0;
  });
}
