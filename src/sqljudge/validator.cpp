#include <sqljudge/validator.h>

#include <set>
#include <cmath>
#include <cctype>
#include <cstring>
#include <optional>
#include <algorithm>
#include <unordered_map>

#include <openssl/evp.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

double kHardcodeCoverage = 0.5;

namespace {

using nlohmann::json;

// after these keywords a '-' starts a negative number
const std::set<std::string> kOperatorKeywords = {
  "SELECT", "WHERE", "AND", "OR", "NOT", "CASE", "WHEN", "THEN", "ELSE", "BY", "VALUES",
  "ON", "HAVING", "LIMIT", "OFFSET", "UNION", "ALL", "IN", "IS", "BETWEEN", "LIKE", "AS",
};

bool NameEquals(const std::string& a, const std::string& b, bool case_sensitive) {
  if (case_sensitive) return a == b;
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

bool ValuesEqual(const json& e, const json& a, double tol) {
  if (e.is_null() || a.is_null()) return e.is_null() && a.is_null();
  if (e.is_boolean()) return a.is_number() && a.get<double>() == (e.get<bool>() ? 1.0 : 0.0);
  if (e.is_number() && a.is_number()) {
    if (e.is_number_integer() && a.is_number_integer()) return e.get<int64_t>() == a.get<int64_t>();
    return std::fabs(e.get<double>() - a.get<double>()) <= tol;
  }
  if (e.is_string() && a.is_string()) return e.get_ref<const std::string&>() == a.get_ref<const std::string&>();
  return false;
}

bool RowsEqual(const json& e, const json& a, double tol) {
  if (e.size() != a.size()) return false;
  for (size_t i = 0; i < e.size(); i++) {
    if (!ValuesEqual(e[i], a[i], tol)) return false;
  }
  return true;
}

json CanonicalValue(const json& v) {
  if (v.is_number_float()) {
    double r = std::round(v.get<double>() * 1e6) / 1e6;
    if (std::isfinite(r) && r == std::trunc(r) && std::fabs(r) < 9e15) return (int64_t)r;
    return r;
  }
  if (v.is_boolean()) return v.get<bool>() ? 1 : 0;
  return v;
}

std::string CanonicalRow(const json& row) {
  json r = json::array();
  for (auto& v : row) r.push_back(CanonicalValue(v));
  return r.dump(-1, ' ', false, json::error_handler_t::replace);
}

int ValueRank(const json& v) {
  if (v.is_null()) return 0;
  if (v.is_number() || v.is_boolean()) return 1;
  if (v.is_string()) return 2;
  return 3;
}

double AsNumber(const json& v) {
  if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
  return v.get<double>();
}

bool RowLess(const json& a, const json& b) {
  size_t n = std::min(a.size(), b.size());
  for (size_t i = 0; i < n; i++) {
    int ra = ValueRank(a[i]), rb = ValueRank(b[i]);
    if (ra != rb) return ra < rb;
    if (ra == 1) {
      double x = AsNumber(a[i]), y = AsNumber(b[i]);
      if (x != y) return x < y;
    } else if (ra == 2) {
      int cmp = a[i].get_ref<const std::string&>().compare(b[i].get_ref<const std::string&>());
      if (cmp) return cmp < 0;
    } else if (ra == 3) {
      std::string x = a[i].dump(), y = b[i].dump();
      if (x != y) return x < y;
    }
  }
  return a.size() < b.size();
}

// Perfect matching search between expected and actual rows that are equal
// within tolerance, by augmenting paths.
class RowMatcher {
  std::vector<std::vector<size_t>> adj_; // expected -> compatible actual rows
  std::vector<long> match_; // actual -> expected, -1 if free
  std::vector<char> seen_;

  bool Augment_(size_t e) {
    for (size_t a : adj_[e]) {
      if (seen_[a]) continue;
      seen_[a] = 1;
      if (match_[a] < 0 || Augment_(match_[a])) {
        match_[a] = e;
        return true;
      }
    }
    return false;
  }

 public:
  RowMatcher(const std::vector<const json*>& exp, const std::vector<const json*>& act, double tol) :
      adj_(exp.size()), match_(act.size(), -1), seen_(act.size()) {
    for (size_t i = 0; i < exp.size(); i++) {
      for (size_t j = 0; j < act.size(); j++) {
        if (RowsEqual(*exp[i], *act[j], tol)) adj_[i].push_back(j);
      }
    }
  }

  // first expected row that cannot be matched
  std::optional<size_t> Unmatched() {
    for (size_t e = 0; e < adj_.size(); e++) {
      std::fill(seen_.begin(), seen_.end(), 0);
      if (!Augment_(e)) return e;
    }
    return std::nullopt;
  }
};

// full matching beyond this many rows is too slow; the sorted pairing decides
constexpr size_t kMaxMatchRows = 2000;

// Multiset comparison. Exactly equal rows are paired first, then the rest are
// paired in sorted order, then by a full matching.
std::string CompareUnordered(const json& expected, const std::vector<json>& actual, double tol,
                             json& details) {
  std::unordered_multimap<std::string, size_t> by_key;
  for (size_t j = 0; j < actual.size(); j++) by_key.emplace(CanonicalRow(actual[j]), j);
  std::vector<bool> used(actual.size());
  std::vector<size_t> exp_left;
  for (size_t i = 0; i < expected.size(); i++) {
    auto [first, last] = by_key.equal_range(CanonicalRow(expected[i]));
    bool found = false;
    for (auto it = first; it != last; ++it) {
      if (RowsEqual(expected[i], actual[it->second], tol)) {
        used[it->second] = true;
        by_key.erase(it);
        found = true;
        break;
      }
    }
    if (!found) exp_left.push_back(i);
  }
  if (exp_left.empty()) return "";

  std::vector<size_t> act_left;
  for (size_t j = 0; j < actual.size(); j++) {
    if (!used[j]) act_left.push_back(j);
  }
  std::sort(exp_left.begin(), exp_left.end(),
            [&](size_t x, size_t y) { return RowLess(expected[x], expected[y]); });
  std::sort(act_left.begin(), act_left.end(),
            [&](size_t x, size_t y) { return RowLess(actual[x], actual[y]); });
  std::optional<size_t> missing;
  for (size_t k = 0; k < exp_left.size(); k++) {
    if (!RowsEqual(expected[exp_left[k]], actual[act_left[k]], tol)) {
      missing = exp_left[k];
      break;
    }
  }
  if (missing && exp_left.size() <= kMaxMatchRows) {
    std::vector<const json*> e, a;
    for (size_t i : exp_left) e.push_back(&expected[i]);
    for (size_t j : act_left) a.push_back(&actual[j]);
    auto unmatched = RowMatcher(e, a, tol).Unmatched();
    missing = unmatched ? std::optional<size_t>(exp_left[*unmatched]) : std::nullopt;
  }
  if (!missing) return "";
  details["mismatch"] = {{"row", *missing}, {"expected", expected[*missing]}};
  return fmt::format("Expected row {} not found in result", expected[*missing].dump());
}

const char* TypeClass(const json& v) {
  if (v.is_number() || v.is_boolean()) return "number";
  if (v.is_string()) return "text";
  return "other";
}

// Informational only; values are still compared numerically or exactly
json ColumnTypeWarnings(const ExpectedOutput& exp, const std::vector<json>& rows) {
  json warnings = json::array();
  size_t width = rows.empty() ? 0 : rows[0].size();
  for (size_t k = 0; k < width; k++) {
    const json* e = nullptr;
    const json* a = nullptr;
    for (auto& row : exp.rows) {
      if (k < row.size() && !row[k].is_null()) { e = &row[k]; break; }
    }
    for (auto& row : rows) {
      if (!row[k].is_null()) { a = &row[k]; break; }
    }
    if (!e || !a || !strcmp(TypeClass(*e), TypeClass(*a))) continue;
    std::string name = k < exp.columns.size() ? exp.columns[k] : fmt::format("#{}", k + 1);
    warnings.push_back(fmt::format("Type mismatch in column {}: expected {}, got {}",
                                   name, TypeClass(*e), TypeClass(*a)));
  }
  return warnings;
}

std::string Sha256Hex(const std::string& data) {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr)) {
    spdlog::warn("EVP_Digest failed");
    return "";
  }
  static const char kHex[] = "0123456789abcdef";
  std::string ret;
  for (unsigned int i = 0; i < len; i++) {
    ret.push_back(kHex[md[i] >> 4]);
    ret.push_back(kHex[md[i] & 15]);
  }
  return ret;
}

// Returns an empty string when the result matches
std::string CompareValues(const ResultSet& actual, const Problem& problem, const ExpectedOutput& exp,
                          json& details) {
  auto& cfg = problem.validation;
  size_t width = exp.columns.size();
  if (!width && !exp.rows.empty()) width = exp.rows[0].size();
  if ((width || exp.columns.size()) && actual.columns.size() != width) {
    return fmt::format("Expected {} columns, got {}", width, actual.columns.size());
  }
  std::vector<size_t> mapping;
  if (exp.columns.size()) {
    for (auto& col : exp.columns) {
      auto it = std::find_if(actual.columns.begin(), actual.columns.end(), [&](const std::string& name) {
        return NameEquals(col, name, cfg.column_case_sensitive);
      });
      if (it == actual.columns.end()) {
        details["missing_column"] = col;
        return fmt::format("Missing column {}", col);
      }
      mapping.push_back(it - actual.columns.begin());
    }
  } else {
    for (size_t i = 0; i < width; i++) mapping.push_back(i);
  }
  std::vector<json> rows;
  for (auto& row : actual.rows) {
    json r = json::array();
    for (size_t idx : mapping) r.push_back(idx < row.size() ? row[idx] : json());
    rows.push_back(std::move(r));
  }
  if (auto warnings = ColumnTypeWarnings(exp, rows); warnings.size()) {
    details["type_warnings"] = std::move(warnings);
  }
  if (rows.size() != exp.rows.size()) {
    return fmt::format("Expected {} rows, got {}", exp.rows.size(), rows.size());
  }
  if (cfg.order_sensitive) {
    for (size_t i = 0; i < rows.size(); i++) {
      if (!RowsEqual(exp.rows[i], rows[i], cfg.float_tolerance)) {
        details["mismatch"] = {{"row", i}, {"expected", exp.rows[i]}, {"actual", rows[i]}};
        return fmt::format("Row {} differs from expected output", i + 1);
      }
    }
  } else {
    return CompareUnordered(exp.rows, rows, cfg.float_tolerance, details);
  }
  return "";
}

std::string CompareHash(const ResultSet& actual, const Problem& problem, const ExpectedOutput& exp,
                        json& details) {
  if ((int64_t)actual.rows.size() != exp.row_count) {
    return fmt::format("Expected {} rows, got {}", exp.row_count, actual.rows.size());
  }
  std::string hash = ResultHash(actual.rows, problem.validation.order_sensitive);
  details["hash"] = hash;
  if (hash != exp.hash) return "Result does not match expected output";
  return "";
}

struct HardcodeCheck {
  bool flagged = false;
  json details = json::object();
};

// Flags output that was produced without reading any problem table and whose
// values are mostly literals written in the query.
HardcodeCheck CheckHardcode(const std::string& sql, const ResultSet& actual,
                            const ExecutionMeta& meta, const Problem& problem) {
  HardcodeCheck ret;
  auto& d = ret.details;
  d["enabled"] = problem.validation.anti_hardcode;
  if (!problem.validation.anti_hardcode) return ret;
  std::set<std::string> declared;
  for (auto& [name, _] : problem.tables) declared.insert(name);
  if (declared.empty()) declared.insert(meta.dataset_tables.begin(), meta.dataset_tables.end());
  d["tables_read"] = meta.tables_read;
  d["fullscan_steps"] = meta.fullscan_steps;
  if (declared.empty() || actual.rows.empty()) {
    d["skipped"] = true;
    return ret;
  }
  bool references = std::any_of(meta.tables_read.begin(), meta.tables_read.end(),
                                [&](const std::string& t) { return declared.count(t); });
  d["references_tables"] = references;
  if (references) return ret;

  SqlLiterals lits = ExtractLiterals(sql);
  double tol = std::max(problem.validation.float_tolerance, 1e-9);
  std::vector<bool> used_num(lits.numbers.size()), used_str(lits.strings.size());
  size_t total = 0, covered = 0;
  for (auto& row : actual.rows) {
    for (auto& cell : row) {
      if (cell.is_null()) continue;
      total++;
      if (cell.is_number()) {
        double v = cell.get<double>();
        for (size_t i = 0; i < lits.numbers.size(); i++) {
          if (!used_num[i] && std::fabs(lits.numbers[i] - v) <= tol) {
            used_num[i] = true;
            covered++;
            break;
          }
        }
      } else if (cell.is_string()) {
        for (size_t i = 0; i < lits.strings.size(); i++) {
          if (!used_str[i] && lits.strings[i] == cell.get_ref<const std::string&>()) {
            used_str[i] = true;
            covered++;
            break;
          }
        }
      }
    }
  }
  double coverage = total ? (double)covered / total : 0.0;
  d["literal_count"] = lits.Count();
  d["literal_coverage"] = coverage;
  ret.flagged = total > 0 && coverage >= kHardcodeCoverage;
  if (ret.flagged) d["reasons"] = {"no_table_reference", "literal_output"};
  return ret;
}

} // namespace

SqlLiterals ExtractLiterals(const std::string& sql) {
  SqlLiterals ret;
  // whether the previous token can end an operand; decides if '-' is unary
  bool prev_operand = false;
  bool negate = false;
  size_t i = 0, n = sql.size();
  auto ReadQuoted = [&](char close) {
    std::string val;
    i++;
    while (i < n) {
      if (sql[i] == close) {
        if (i + 1 < n && sql[i + 1] == close) {
          val.push_back(close);
          i += 2;
          continue;
        }
        i++;
        break;
      }
      val.push_back(sql[i++]);
    }
    return val;
  };
  while (i < n) {
    unsigned char c = sql[i];
    if (std::isspace(c)) {
      i++;
    } else if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
      size_t end = sql.find('\n', i);
      i = end == std::string::npos ? n : end + 1;
    } else if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
      size_t end = sql.find("*/", i + 2);
      i = end == std::string::npos ? n : end + 2;
    } else if ((c == 'x' || c == 'X') && i + 1 < n && sql[i + 1] == '\'') {
      i++;
      std::string hex = ReadQuoted('\'');
      std::transform(hex.begin(), hex.end(), hex.begin(), [](unsigned char ch) { return std::tolower(ch); });
      ret.strings.push_back(std::move(hex));
      prev_operand = true;
      negate = false;
    } else if (c == '\'') {
      ret.strings.push_back(ReadQuoted('\''));
      prev_operand = true;
      negate = false;
    } else if (c == '"' || c == '`') {
      ReadQuoted(c);
      prev_operand = true;
      negate = false;
    } else if (c == '[') {
      size_t end = sql.find(']', i);
      i = end == std::string::npos ? n : end + 1;
      prev_operand = true;
      negate = false;
    } else if (std::isdigit(c) || (c == '.' && i + 1 < n && std::isdigit((unsigned char)sql[i + 1]))) {
      size_t start = i;
      double value;
      if (c == '0' && i + 1 < n && (sql[i + 1] == 'x' || sql[i + 1] == 'X')) {
        i += 2;
        while (i < n && std::isxdigit((unsigned char)sql[i])) i++;
        value = (double)std::strtoll(sql.substr(start + 2, i - start - 2).c_str(), nullptr, 16);
      } else {
        while (i < n && (std::isdigit((unsigned char)sql[i]) || sql[i] == '.')) i++;
        if (i < n && (sql[i] == 'e' || sql[i] == 'E')) {
          size_t j = i + 1;
          if (j < n && (sql[j] == '+' || sql[j] == '-')) j++;
          if (j < n && std::isdigit((unsigned char)sql[j])) {
            i = j;
            while (i < n && std::isdigit((unsigned char)sql[i])) i++;
          }
        }
        value = std::strtod(sql.substr(start, i - start).c_str(), nullptr);
      }
      ret.numbers.push_back(negate ? -value : value);
      prev_operand = true;
      negate = false;
    } else if (std::isalpha(c) || c == '_') {
      size_t start = i;
      while (i < n && (std::isalnum((unsigned char)sql[i]) || sql[i] == '_' || sql[i] == '$')) i++;
      std::string word = sql.substr(start, i - start);
      std::transform(word.begin(), word.end(), word.begin(), [](unsigned char ch) { return std::toupper(ch); });
      prev_operand = !kOperatorKeywords.count(word);
      negate = false;
    } else if (c == '-') {
      if (!prev_operand) negate = !negate;
      prev_operand = false;
      i++;
    } else {
      prev_operand = c == ')';
      negate = false;
      i++;
    }
  }
  return ret;
}

std::string ResultHash(const nlohmann::json& rows, bool order_sensitive) {
  std::vector<std::string> rendered;
  for (auto& row : rows) rendered.push_back(CanonicalRow(row));
  if (!order_sensitive) std::sort(rendered.begin(), rendered.end());
  std::string canonical = "[";
  for (size_t i = 0; i < rendered.size(); i++) {
    if (i) canonical += ',';
    canonical += rendered[i];
  }
  canonical += ']';
  return Sha256Hex(canonical);
}

ValidationOutcome Validate(const ResultSet& actual, const ExecutionMeta& meta,
                           const std::string& sql, const Problem& problem) {
  return Validate(actual, meta, sql, problem, problem.expected);
}

ValidationOutcome Validate(const ResultSet& actual, const ExecutionMeta& meta, const std::string& sql,
                           const Problem& problem, const ExpectedOutput& exp) {
  ValidationOutcome ret;
  auto& details = ret.details;
  details["mode"] = exp.by_hash ? "hash" : "value";
  details["order_sensitive"] = problem.validation.order_sensitive;
  details["rows_expected"] = exp.row_count;
  details["rows_actual"] = actual.rows.size();

  std::string mismatch = exp.by_hash ?
      CompareHash(actual, problem, exp, details) : CompareValues(actual, problem, exp, details);
  HardcodeCheck hardcode = CheckHardcode(sql, actual, meta, problem);
  details["anti_hardcode"] = std::move(hardcode.details);
  if (hardcode.flagged) {
    // reported even if the literals are also wrong
    if (mismatch.size()) details["mismatch_message"] = mismatch;
    ret.verdict = Verdict::HC;
    ret.message = "Output appears to be hardcoded instead of computed from the problem tables";
    details["rule"] = "suspected_hardcode";
  } else if (mismatch.size()) {
    ret.verdict = Verdict::WA;
    ret.message = std::move(mismatch);
    details["rule"] = "wrong_answer";
  } else {
    ret.pass = true;
    ret.verdict = Verdict::AC;
    details["rule"] = "match";
  }
  spdlog::debug("Validated: prob_id={} verdict={} rule={}",
                problem.id, VerdictToAbr(ret.verdict), details["rule"].get<std::string>());
  return ret;
}
