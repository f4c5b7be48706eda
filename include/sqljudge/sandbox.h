#ifndef INCLUDE_SQLJUDGE_SANDBOX_H_
#define INCLUDE_SQLJUDGE_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <nlohmann/json.hpp>

#define ENUM_SANDBOX_STATUS_ \
  X(OK) \
  X(QUERY_ERROR) /* syntax or runtime error reported by the engine */ \
  X(SECURITY) /* statement rejected by the authorizer */ \
  X(TIMEOUT) \
  X(MEMORY) \
  X(ROW_LIMIT) \
  X(INTERNAL)
enum class SandboxStatus {
#define X(name) name,
  ENUM_SANDBOX_STATUS_
#undef X
};

const char* SandboxStatusName(SandboxStatus);

struct ResultSet {
  std::vector<std::string> columns;
  nlohmann::json rows = nlohmann::json::array(); // array of arrays
};

struct ExecutionMeta {
  std::vector<std::string> tables_read; // lower-case, from the authorizer
  std::vector<std::string> dataset_tables; // lower-case
  int64_t fullscan_steps = 0;
  int64_t vm_steps = 0;
};

class SandboxOptions {
 public:
  std::string sql;
  std::string dataset; // .sql seed script or SQLite database file
  int64_t time_limit; // us
  int64_t memory_limit; // KiB; 0 = unlimited
  int64_t max_rows; // 0 = unlimited

  SandboxOptions() : time_limit(0), memory_limit(0), max_rows(0) {}

  std::string Serialize() const;
  static SandboxOptions Deserialize(const std::string&); // throws nlohmann::json::exception
};

struct SandboxResult {
  SandboxStatus status = SandboxStatus::INTERNAL;
  std::string error;
  ResultSet result;
  ExecutionMeta meta;
  int64_t time = 0; // us

  std::string Serialize() const;
  static SandboxResult Deserialize(const std::string&); // throws nlohmann::json::exception
};

// Execute the query inside the current process. The dataset is copied into a
// private in-memory database, so nothing the query does is persisted.
SandboxResult RunQuery(const SandboxOptions&);

#endif  // INCLUDE_SQLJUDGE_SANDBOX_H_
