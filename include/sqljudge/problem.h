#ifndef INCLUDE_SQLJUDGE_PROBLEM_H_
#define INCLUDE_SQLJUDGE_PROBLEM_H_

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>
#include <unordered_map>

#include <nlohmann/json.hpp>

// used when problem.json omits a limit
extern int64_t kDefaultTimeLimit; // us
extern int64_t kDefaultMemoryLimit; // KiB
extern int64_t kDefaultMaxRows;

struct ValidationConfig {
  bool order_sensitive = true;
  double float_tolerance = 1e-6;
  bool column_case_sensitive = false;
  bool anti_hardcode = true;
};

struct ExpectedOutput {
  bool by_hash = false;
  // value mode; columns may be empty, then columns are compared by position
  std::vector<std::string> columns;
  nlohmann::json rows = nlohmann::json::array(); // array of arrays
  // hash mode
  std::string hash;
  int64_t row_count = 0;
};

struct TestCase {
  std::string name;
  bool hidden = false; // expected values are never reported
  std::filesystem::path dataset;
  ExpectedOutput expected;
};

struct Problem {
  int id = 0;
  // the first test case's dataset and expected output
  std::filesystem::path dataset; // .sql seed script or SQLite database
  ExpectedOutput expected;
  // never empty; a problem without "test_cases" has a single one
  std::vector<TestCase> cases;
  // declared table -> columns; lower-case
  std::map<std::string, std::vector<std::string>> tables;
  int64_t time_limit = 0; // us
  int64_t memory_limit = 0; // KiB
  int64_t max_rows = 0;
  ValidationConfig validation;
};

// throws nlohmann::json::exception on malformed input
Problem ParseProblem(int id, const nlohmann::json&, const std::filesystem::path& dir);

// Read-only view of the problem directory. Loaded problems are cached.
class ProblemCatalog {
  mutable std::mutex mtx_;
  mutable std::unordered_map<int, std::shared_ptr<const Problem>> cache_;
 public:
  // nullptr if the problem does not exist or cannot be parsed
  std::shared_ptr<const Problem> Get(int id) const;
  void Invalidate(int id);
};

#endif  // INCLUDE_SQLJUDGE_PROBLEM_H_
