#ifndef INCLUDE_SQLJUDGE_ERROR_H_
#define INCLUDE_SQLJUDGE_ERROR_H_

#include <string>
#include <stdexcept>

#define ENUM_ERROR_CODE_ \
  X(INVALID_INPUT, "InvalidInput") \
  X(STORAGE_UNAVAILABLE, "StorageUnavailable") \
  X(QUEUE_UNAVAILABLE, "QueueUnavailable") \
  X(EXECUTION_TIMEOUT, "ExecutionTimeout") \
  X(EXECUTION_ERROR, "ExecutionError") \
  X(VALIDATION_MISMATCH, "ValidationMismatch") \
  X(NOT_FOUND, "NotFound") \
  X(PENDING, "Pending")
enum class ErrorCode {
#define X(name, str) name,
  ENUM_ERROR_CODE_
#undef X
};

const char* ErrorCodeName(ErrorCode);

class JudgeError : public std::runtime_error {
  ErrorCode code_;
 public:
  JudgeError(ErrorCode code, const std::string& msg) :
      std::runtime_error(msg), code_(code) {}
  ErrorCode Code() const { return code_; }
};

#endif  // INCLUDE_SQLJUDGE_ERROR_H_
