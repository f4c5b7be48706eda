#ifndef INCLUDE_SQLJUDGE_WORKER_H_
#define INCLUDE_SQLJUDGE_WORKER_H_

#include <deque>
#include <mutex>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <condition_variable>

#include "judge.h"
#include "queue.h"

extern long kHeartbeatIntervalMs;
// Longest a worker blocks on the primary queue before checking the fallback table
extern long kPollIntervalMs;

class WorkerPool {
  PrimaryQueue& primary_;
  FallbackQueue& fallback_;
  Judge& judge_;
  std::string name_;

  std::vector<std::thread> threads_;
  std::thread heartbeat_thread_;
  int workers_;
  std::atomic_bool stop_;
  std::mutex mtx_;
  std::condition_variable cv_;
  std::atomic_long processed_;

  // jobs that could neither be finished nor handed back to a queue
  std::mutex held_mtx_;
  std::deque<Job> held_;

  void WorkLoop_(int index);
  void HeartbeatLoop_();
  void Handle_(Job&& job, JobQueue* source, const std::string& worker_id);

 public:
  // name defaults to hostname:pid
  WorkerPool(PrimaryQueue& primary, FallbackQueue& fallback, Judge& judge, std::string name = "");
  ~WorkerPool() { Stop(); }

  void Start(int workers);
  void Stop();
  // Block until Stop() is called from another thread
  void Wait();

  // One consume iteration; returns false if there was nothing to do
  bool RunOnce(const std::string& worker_id);
  // One heartbeat tick for every worker
  bool SendHeartbeats();

  std::string WorkerId(int index) const;
  long Processed() const { return processed_; }
};

#endif  // INCLUDE_SQLJUDGE_WORKER_H_
