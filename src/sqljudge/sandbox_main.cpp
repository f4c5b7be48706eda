#include <errno.h>
#include <unistd.h>
#include <sys/resource.h>
#include <string>
#include <cstring>

#include <sqlite3.h>
#include <sqljudge/sandbox.h>

namespace {

// address space needed by the helper itself on top of the engine heap
constexpr rlim_t kAddressSpaceSlack = 128L * 1024 * 1024;

bool SetLimit(int resource, rlim_t value) {
  struct rlimit lim = {value, value};
  return setrlimit(resource, &lim) == 0;
}

bool ApplyLimits(const SandboxOptions& opt) {
  if (opt.memory_limit > 0) {
    rlim_t bytes = (rlim_t)opt.memory_limit * 1024;
    sqlite3_hard_heap_limit64(bytes);
    if (!SetLimit(RLIMIT_AS, bytes * 2 + kAddressSpaceSlack)) return false;
  }
  if (opt.time_limit > 0) {
    // CPU backstop in case the progress handler is never reached
    if (!SetLimit(RLIMIT_CPU, opt.time_limit / 1'000'000 + 2)) return false;
  }
  return SetLimit(RLIMIT_FSIZE, 0) && SetLimit(RLIMIT_CORE, 0);
}

bool ReadInput(std::string& out) {
  char buf[4096];
  while (true) {
    ssize_t ret = read(0, buf, sizeof(buf));
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (ret == 0) return true;
    out.append(buf, ret);
  }
}

bool WriteOutput(const std::string& str) {
  size_t pos = 0;
  while (pos < str.size()) {
    ssize_t ret = write(1, str.data() + pos, str.size() - pos);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    pos += ret;
  }
  return true;
}

} // namespace

int main() {
  std::string input;
  if (!ReadInput(input)) return 1;
  SandboxResult res;
  SandboxOptions opt;
  try {
    opt = SandboxOptions::Deserialize(input);
  } catch (nlohmann::json::exception& err) {
    res.status = SandboxStatus::INTERNAL;
    res.error = std::string("Malformed sandbox request: ") + err.what();
    return WriteOutput(res.Serialize()) ? 0 : 1;
  }
  if (!ApplyLimits(opt)) {
    res.status = SandboxStatus::INTERNAL;
    res.error = std::string("setrlimit failed: ") + strerror(errno);
    return WriteOutput(res.Serialize()) ? 0 : 1;
  }
  res = RunQuery(opt);
  return WriteOutput(res.Serialize()) ? 0 : 1;
}
