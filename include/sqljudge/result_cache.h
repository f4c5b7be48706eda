#ifndef INCLUDE_SQLJUDGE_RESULT_CACHE_H_
#define INCLUDE_SQLJUDGE_RESULT_CACHE_H_

#include <mutex>
#include <string>
#include <cstdint>
#include <optional>
#include <unordered_map>

#include "submission.h"

// 0 disables the cache
extern long kResultCacheTtlSec;
extern size_t kResultCacheSize;

// Graded results of identical (problem, query) pairs, kept in process. Only
// deterministic outcomes should be stored.
class ResultCache {
  struct Entry {
    ExecutionResult result;
    int64_t stored_at; // UNIX timestamp, microseconds
  };
  std::mutex mtx_;
  std::unordered_map<std::string, Entry> entries_;
  long hits_;

  static std::string Key_(int problem_id, const std::string& sql);
 public:
  ResultCache() : hits_(0) {}

  std::optional<ExecutionResult> Get(int problem_id, const std::string& sql);
  // evicts the oldest entry when full
  void Put(int problem_id, const std::string& sql, const ExecutionResult&);
  void Clear();
  size_t Size();
  long Hits();
};

#endif  // INCLUDE_SQLJUDGE_RESULT_CACHE_H_
