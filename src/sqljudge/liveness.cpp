#include <sqljudge/liveness.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <sqljudge/utils.h>

long kLivenessWindowMs = 15'000;

const char* LivenessName(Liveness liveness) {
  switch (liveness) {
#define X(name) case Liveness::name: return #name;
    ENUM_LIVENESS_
#undef X
  }
  __builtin_unreachable();
}

Liveness LivenessMonitor::Check(std::optional<int64_t>* age_us) const {
  std::optional<int64_t> latest;
  try {
    latest = queue_.LatestHeartbeat();
  } catch (const JudgeError& err) {
    spdlog::debug("Liveness unknown: error={}", err.what());
    return Liveness::UNKNOWN;
  }
  if (!latest) return Liveness::DEAD;
  // heartbeats stamped slightly in the future (clock skew) count as fresh
  int64_t age = std::max<int64_t>(0, UnixMicros() - *latest);
  if (age_us) *age_us = age;
  return age <= window_.count() * 1000 ? Liveness::LIVE : Liveness::DEAD;
}
