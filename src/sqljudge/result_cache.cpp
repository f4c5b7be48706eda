#include <sqljudge/result_cache.h>

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

long kResultCacheTtlSec = 300;
size_t kResultCacheSize = 1000;

std::string ResultCache::Key_(int problem_id, const std::string& sql) {
  return fmt::format("{}:{}", problem_id, sql);
}

std::optional<ExecutionResult> ResultCache::Get(int problem_id, const std::string& sql) {
  if (!kResultCacheSize || kResultCacheTtlSec <= 0) return std::nullopt;
  int64_t now = UnixMicros();
  std::lock_guard lck(mtx_);
  auto it = entries_.find(Key_(problem_id, sql));
  if (it == entries_.end()) return std::nullopt;
  if (now - it->second.stored_at >= kResultCacheTtlSec * 1'000'000) {
    entries_.erase(it);
    return std::nullopt;
  }
  hits_++;
  return it->second.result;
}

void ResultCache::Put(int problem_id, const std::string& sql, const ExecutionResult& res) {
  if (!kResultCacheSize || kResultCacheTtlSec <= 0) return;
  int64_t now = UnixMicros();
  std::lock_guard lck(mtx_);
  std::string key = Key_(problem_id, sql);
  if (!entries_.count(key) && entries_.size() >= kResultCacheSize) {
    auto oldest = std::min_element(entries_.begin(), entries_.end(), [](const auto& a, const auto& b) {
      return a.second.stored_at < b.second.stored_at;
    });
    entries_.erase(oldest);
  }
  entries_[key] = {res, now};
  spdlog::debug("Result cached: prob_id={} size={}", problem_id, entries_.size());
}

void ResultCache::Clear() {
  std::lock_guard lck(mtx_);
  entries_.clear();
}

size_t ResultCache::Size() {
  std::lock_guard lck(mtx_);
  return entries_.size();
}

long ResultCache::Hits() {
  std::lock_guard lck(mtx_);
  return hits_;
}
