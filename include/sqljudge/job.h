#ifndef INCLUDE_SQLJUDGE_JOB_H_
#define INCLUDE_SQLJUDGE_JOB_H_

#include <string>
#include <cstdint>

#include <nlohmann/json.hpp>

#define ENUM_JOB_STATUS_ \
  X(PENDING, "pending") \
  X(RUNNING, "running") \
  X(COMPLETED, "completed") \
  X(FAILED, "failed") \
  X(TIMED_OUT, "timed_out")
enum class JobStatus {
#define X(name, str) name,
  ENUM_JOB_STATUS_
#undef X
};

// which path delivered the job to its consumer
#define ENUM_JOB_ORIGIN_ \
  X(PRIMARY) \
  X(FALLBACK) \
  X(INLINE)
enum class JobOrigin {
#define X(name) name,
  ENUM_JOB_ORIGIN_
#undef X
};

#define ENUM_FALLBACK_STATUS_ \
  X(PENDING, "pending") \
  X(PROCESSING, "processing") \
  X(COMPLETED, "completed") \
  X(FAILED, "failed")
enum class FallbackStatus {
#define X(name, str) name,
  ENUM_FALLBACK_STATUS_
#undef X
};

#define ENUM_VERDICT_ \
  X(NUL, "", "nil") \
  X(AC, "AC", "Accepted") \
  X(WA, "WA", "Wrong Answer") \
  X(HC, "HC", "Suspected Hardcoded Output") \
  X(TLE, "TLE", "Time Limit Exceeded") \
  X(MLE, "MLE", "Memory Limit Exceeded") \
  X(OLE, "OLE", "Output Limit Exceeded") \
  X(RE, "RE", "Query Error") \
  X(SEC, "SEC", "Disallowed Statement") \
  X(JE, "JE", "Judge Error")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

class Job {
 public:
  std::string job_id;
  int64_t submission_id;
  int problem_id;
  // dataset handle resolved by the catalog at dispatch time
  std::string dataset;
  // limits
  int64_t time_limit; // us
  int64_t memory_limit; // KiB
  int64_t max_rows;
  int64_t enqueued_at; // UNIX timestamp, microseconds

  JobOrigin origin;
  int64_t fallback_id; // only valid if origin == FALLBACK

  Job() :
      submission_id(0),
      problem_id(0),
      time_limit(0),
      memory_limit(0),
      max_rows(0),
      enqueued_at(0),
      origin(JobOrigin::PRIMARY),
      fallback_id(0) {}

  // origin and fallback_id are not part of the payload
  std::string Serialize() const;
  static Job Deserialize(const std::string&); // throws nlohmann::json::exception
};

void to_json(nlohmann::json&, const Job&);
void from_json(const nlohmann::json&, Job&);

#endif  // INCLUDE_SQLJUDGE_JOB_H_
