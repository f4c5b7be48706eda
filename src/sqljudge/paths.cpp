#include <sqljudge/paths.h>

#include <string>

fs::path kProblemRoot = "/var/lib/sqljudge/problems";
fs::path kDatabasePath = "/var/lib/sqljudge/sqljudge.sqlite";

namespace internal {
fs::path kDataDir = fs::path(SQLJUDGE_DATA_DIR);
} // internal

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

} // namespace

fs::path ProblemPath(int id) {
  return kProblemRoot / PadInt(id, 4);
}
fs::path ProblemMetaPath(int id) {
  return ProblemPath(id) / "problem.json";
}

fs::path SandboxHelperPath() {
  return internal::kDataDir / "sqljudge-sandbox";
}
fs::path LockFilePath() {
  return internal::kDataDir / "lock";
}
