#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <atomic>
#include <string>
#include <filesystem>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sqljudge/judge.h>
#include <sqljudge/queue.h>
#include <sqljudge/problem.h>

extern const char kSalesDataset[];
extern const char kTop3Query[];
extern const char kTop3Hardcoded[];

void WriteProblem(const std::filesystem::path& root, int id, const nlohmann::json& meta,
                  const std::string& dataset_sql);

// In-memory problem for validator tests
Problem MakeProblem(const nlohmann::json& expected, ValidationConfig cfg = {});
// rows holding a single value
nlohmann::json Cell(const nlohmann::json& value);

// Counts what the judge did; shared by every judge built in a test
class CountingReporter {
 public:
  std::atomic_int started{0};
  std::atomic_int written{0};

  Judge::Reporter GetReporter() {
    Judge::Reporter reporter;
    reporter.ReportStarted = [this](const Job&) { started++; };
    reporter.ReportResult = [this](const Job&, const ExecutionResult&) { written++; };
    return reporter;
  }
};

// Primary queue whose pushes can fail while heartbeats keep working
class FlakyQueue : public MemoryQueue {
 public:
  std::atomic_bool fail_push{false};

  int64_t Push(const Job& job) override {
    if (fail_push) throw JudgeError(ErrorCode::QUEUE_UNAVAILABLE, "push rejected");
    return MemoryQueue::Push(job);
  }
};

#endif // TEST_UTILS_H_
