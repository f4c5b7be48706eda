#ifndef INCLUDE_SQLJUDGE_VALIDATOR_H_
#define INCLUDE_SQLJUDGE_VALIDATOR_H_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "job.h"
#include "problem.h"
#include "sandbox.h"

// share of output cells that must come from query literals to flag hardcoding
extern double kHardcodeCoverage;

struct ValidationOutcome {
  bool pass = false;
  Verdict verdict = Verdict::NUL; // AC, WA or HC
  std::string message;
  nlohmann::json details = nlohmann::json::object();
};

// Literal values written in the query text. Comments, quoted identifiers and
// keywords are skipped; a unary minus is folded into the number.
struct SqlLiterals {
  std::vector<std::string> strings;
  std::vector<double> numbers;
  size_t Count() const { return strings.size() + numbers.size(); }
};
SqlLiterals ExtractLiterals(const std::string& sql);

// SHA-256 (hex) of the canonical rendering of rows; rows are sorted first
// unless order matters. Reals are rounded to 6 decimals and integral reals
// render as integers.
std::string ResultHash(const nlohmann::json& rows, bool order_sensitive);

// against the problem's first test case
ValidationOutcome Validate(const ResultSet& actual, const ExecutionMeta& meta,
                           const std::string& sql, const Problem& problem);
ValidationOutcome Validate(const ResultSet& actual, const ExecutionMeta& meta, const std::string& sql,
                           const Problem& problem, const ExpectedOutput& expected);

#endif  // INCLUDE_SQLJUDGE_VALIDATOR_H_
