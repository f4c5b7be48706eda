#ifndef INCLUDE_SQLJUDGE_LIVENESS_H_
#define INCLUDE_SQLJUDGE_LIVENESS_H_

#include <chrono>
#include <cstdint>
#include <optional>

#include "queue.h"

// A worker is live if a heartbeat newer than this was seen
extern long kLivenessWindowMs;

#define ENUM_LIVENESS_ \
  X(LIVE) \
  X(DEAD) \
  X(UNKNOWN) /* primary queue unreachable */
enum class Liveness {
#define X(name) name,
  ENUM_LIVENESS_
#undef X
};

const char* LivenessName(Liveness);

// Reads the newest heartbeat from the primary queue with a single lookup.
class LivenessMonitor {
  PrimaryQueue& queue_;
  std::chrono::milliseconds window_;
 public:
  explicit LivenessMonitor(PrimaryQueue& queue) :
      queue_(queue), window_(kLivenessWindowMs) {}
  LivenessMonitor(PrimaryQueue& queue, std::chrono::milliseconds window) :
      queue_(queue), window_(window) {}

  // age_us receives the heartbeat age when one exists
  Liveness Check(std::optional<int64_t>* age_us = nullptr) const;
  // UNKNOWN counts as not live
  bool IsWorkerLive() const { return Check() == Liveness::LIVE; }
  std::chrono::milliseconds Window() const { return window_; }
};

#endif  // INCLUDE_SQLJUDGE_LIVENESS_H_
