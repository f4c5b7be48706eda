#ifndef INCLUDE_SQLJUDGE_SUBMISSION_H_
#define INCLUDE_SQLJUDGE_SUBMISSION_H_

#include <string>
#include <cstdint>

#include "job.h"

// Rows of the persistent store. Enums are stored as their integer values.

struct Submission {
  int64_t id;
  int user_id;
  int problem_id;
  std::string sql_text;
  int64_t created_at; // UNIX timestamp, microseconds
};

struct ExecutionResult {
  int64_t id;
  int64_t submission_id; // unique
  int status; // JobStatus
  int verdict; // Verdict
  bool pass;
  int64_t execution_time; // us
  int64_t rows_returned;
  double score; // 0-100, share of passed test cases
  int passed_cases;
  int total_cases;
  std::string error_message;
  std::string details; // JSON object
  int64_t finished_at; // UNIX timestamp, microseconds

  JobStatus Status() const { return (JobStatus)status; }
  Verdict GetVerdict() const { return (Verdict)verdict; }
};

#endif  // INCLUDE_SQLJUDGE_SUBMISSION_H_
