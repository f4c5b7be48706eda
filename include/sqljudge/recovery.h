#ifndef INCLUDE_SQLJUDGE_RECOVERY_H_
#define INCLUDE_SQLJUDGE_RECOVERY_H_

#include <mutex>
#include <thread>
#include <condition_variable>

#include "judge.h"
#include "queue.h"
#include "store.h"
#include "liveness.h"

extern long kSweepIntervalMs;
// processing records older than this are assumed abandoned
extern long kStaleClaimMs;
// submissions without a result for this long get a fallback record
extern long kOrphanAfterMs;

// Moves fallback records back into normal processing once the primary queue
// is usable again, or executes them directly while no worker is live.
// Submissions whose job was lost outside the fallback table (a consumer that
// crashed after popping it, a primary queue that lost its data) are adopted
// into the table first.
class RecoverySweeper {
  Store& store_;
  PrimaryQueue& primary_;
  FallbackQueue& fallback_;
  Judge& judge_;
  const LivenessMonitor& liveness_;

  std::thread thread_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_;
  bool triggered_;
  std::mutex drain_mtx_;

  int CompleteRequeued_();
  // an executor holds the lease, or a live worker will pop the queued copy
  bool InFlight_(const Job&, bool live);
  int AdoptOrphans_(bool live);
  bool Recover_(const FallbackRecord&, bool live);
  void Loop_();

 public:
  RecoverySweeper(Store& store, PrimaryQueue& primary, FallbackQueue& fallback, Judge& judge,
                  const LivenessMonitor& liveness) :
      store_(store), primary_(primary), fallback_(fallback), judge_(judge), liveness_(liveness),
      stop_(false), triggered_(false) {}
  ~RecoverySweeper() { Stop(); }

  // One pass over pending records in creation order; returns how many left
  // the pending state. Storage errors end the pass early.
  int DrainFallback();

  void Start();
  void Stop();
  // Run a pass as soon as possible
  void Trigger();
};

#endif  // INCLUDE_SQLJUDGE_RECOVERY_H_
