#include <sqljudge/problem.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <sqljudge/paths.h>
#include "utils.h"

int64_t kDefaultTimeLimit = 5'000'000;
int64_t kDefaultMemoryLimit = 256 * 1024;
int64_t kDefaultMaxRows = 10000;

namespace {

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

void ParseExpected(const nlohmann::json& j, ExpectedOutput& out) {
  if (j.contains("hash")) {
    out.by_hash = true;
    out.hash = ToLower(j.at("hash").get<std::string>());
    out.row_count = j.at("row_count").get<int64_t>();
    return;
  }
  if (j.contains("columns")) out.columns = j.at("columns").get<std::vector<std::string>>();
  // rows given as objects are converted to arrays in column order
  for (auto& row : j.at("rows").get<std::vector<nlohmann::json>>()) {
    if (row.is_object()) {
      if (out.columns.empty()) {
        for (auto& [key, _] : row.items()) out.columns.push_back(key);
      }
      nlohmann::json arr = nlohmann::json::array();
      for (auto& col : out.columns) arr.push_back(row.at(col));
      out.rows.push_back(std::move(arr));
    } else {
      out.rows.push_back(row);
    }
  }
  out.row_count = out.rows.size();
}

} // namespace

Problem ParseProblem(int id, const nlohmann::json& j, const fs::path& dir) {
  Problem ret;
  ret.id = id;
  ret.dataset = dir / j.value("dataset", std::string("dataset.sql"));
  if (auto it = j.find("tables"); it != j.end()) {
    for (auto& [name, cols] : it->items()) {
      auto& vec = ret.tables[ToLower(name)];
      for (auto& col : cols) vec.push_back(ToLower(col.get<std::string>()));
    }
  }
  if (auto it = j.find("test_cases"); it != j.end() && it->size()) {
    for (auto& item : *it) {
      TestCase tc;
      tc.name = item.value("name", "case " + std::to_string(ret.cases.size() + 1));
      tc.hidden = item.value("hidden", false);
      tc.dataset = item.contains("dataset") ? dir / item.at("dataset").get<std::string>() : ret.dataset;
      ParseExpected(item.at("expected"), tc.expected);
      ret.cases.push_back(std::move(tc));
    }
    ret.dataset = ret.cases[0].dataset;
    ret.expected = ret.cases[0].expected;
  } else {
    ParseExpected(j.at("expected"), ret.expected);
    ret.cases.push_back({"default", false, ret.dataset, ret.expected});
  }
  auto limits = j.value("limits", nlohmann::json::object());
  ret.time_limit = limits.value("time_ms", kDefaultTimeLimit / 1000) * 1000;
  ret.memory_limit = limits.value("memory_mb", kDefaultMemoryLimit / 1024) * 1024;
  ret.max_rows = limits.value("max_rows", kDefaultMaxRows);
  auto validation = j.value("validation", nlohmann::json::object());
  ret.validation.order_sensitive = validation.value("order_sensitive", true);
  ret.validation.float_tolerance = validation.value("float_tolerance", 1e-6);
  ret.validation.column_case_sensitive = validation.value("column_case_sensitive", false);
  ret.validation.anti_hardcode = validation.value("anti_hardcode", true);
  return ret;
}

std::shared_ptr<const Problem> ProblemCatalog::Get(int id) const {
  {
    std::lock_guard lck(mtx_);
    if (auto it = cache_.find(id); it != cache_.end()) return it->second;
  }
  std::string content;
  fs::path meta = ProblemMetaPath(id);
  std::error_code ec;
  if (!fs::exists(meta, ec)) return nullptr;
  if (!ReadFile(meta, content)) return nullptr;
  std::shared_ptr<const Problem> ptr;
  try {
    ptr = std::make_shared<const Problem>(ParseProblem(id, nlohmann::json::parse(content), ProblemPath(id)));
  } catch (nlohmann::json::exception& err) {
    spdlog::warn("Invalid problem metadata: prob_id={} error={}", id, err.what());
    return nullptr;
  }
  spdlog::debug("Problem loaded: prob_id={} tables={} cases={} by_hash={}",
                id, ptr->tables.size(), ptr->cases.size(), ptr->expected.by_hash);
  std::lock_guard lck(mtx_);
  cache_[id] = ptr;
  return ptr;
}

void ProblemCatalog::Invalidate(int id) {
  std::lock_guard lck(mtx_);
  cache_.erase(id);
}
