#include "utils.h"

#include <errno.h>
#include <unistd.h>
#include <chrono>
#include <climits>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

bool WriteAll(int fd, const std::string& buf) {
  size_t pos = 0;
  while (pos < buf.size()) {
    ssize_t ret = write(fd, buf.data() + pos, buf.size() - pos);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    pos += ret;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& out) {
  std::ifstream fin(path);
  if (!fin) {
    spdlog::warn("Failed to open {}", path.string());
    return false;
  }
  std::stringstream ss;
  ss << fin.rdbuf();
  out = ss.str();
  return true;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(Verdict, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* VerdictToDesc, Verdict, ENUM_VERDICT_)
#undef X

static const char* kVerdictAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_VERDICT_
#undef X
};

const char* VerdictToAbr(Verdict verdict) {
  return kVerdictAbrTable[(int)verdict];
}

Verdict AbrToVerdict(const std::string& str) {
  for (int i = (int)Verdict::AC; i <= (int)Verdict::JE; i++) {
    if (str == kVerdictAbrTable[i]) return (Verdict)i;
  }
  return Verdict::NUL;
}

#define X(...) X_RETURN_ARG2(JobStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JobStatusName, JobStatus, ENUM_JOB_STATUS_)
#undef X

std::optional<JobStatus> ParseJobStatus(const std::string& str) {
#define X(name, s) if (str == s) return JobStatus::name;
  ENUM_JOB_STATUS_
#undef X
  return std::nullopt;
}

#define X(...) X_RETURN_ARG2(FallbackStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* FallbackStatusName, FallbackStatus, ENUM_FALLBACK_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(JobOrigin, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JobOriginName, JobOrigin, ENUM_JOB_ORIGIN_)
#undef X

#define X(...) X_RETURN_ARG2(ErrorCode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorCodeName, ErrorCode, ENUM_ERROR_CODE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

int64_t UnixMicros() {
  using namespace std::chrono;
  return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

std::string JobIdFor(int64_t submission_id) {
  return fmt::format("job-{:08d}", submission_id);
}

std::string ProcessName() {
  char host[HOST_NAME_MAX + 1] = {};
  if (gethostname(host, sizeof(host) - 1) != 0) strcpy(host, "localhost");
  return fmt::format("{}:{}", host, getpid());
}
