#ifndef INCLUDE_SQLJUDGE_UTILS_H_
#define INCLUDE_SQLJUDGE_UTILS_H_

#include <string>
#include <optional>
#include <cstdint>

#include "job.h"
#include "error.h"

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);
Verdict AbrToVerdict(const std::string&);

const char* JobStatusName(JobStatus);
std::optional<JobStatus> ParseJobStatus(const std::string&);
const char* FallbackStatusName(FallbackStatus);
// logging
const char* JobOriginName(JobOrigin);

// UNIX timestamp, microseconds
int64_t UnixMicros();
std::string JobIdFor(int64_t submission_id);
// "host:pid"
std::string ProcessName();

#endif  // INCLUDE_SQLJUDGE_UTILS_H_
