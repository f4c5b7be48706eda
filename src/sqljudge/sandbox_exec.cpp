#include <sqljudge/sandbox_exec.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <cstring>

#include <spdlog/spdlog.h>
#include <sqljudge/paths.h>
#include "utils.h"

int64_t kSandboxGrace = 1'000'000;

namespace {

using Clock = std::chrono::steady_clock;

int64_t ElapsedUs(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
}

SandboxResult Error(SandboxStatus status, std::string msg, int64_t time = 0) {
  SandboxResult ret;
  ret.status = status;
  ret.error = std::move(msg);
  ret.time = time;
  return ret;
}

// Read until EOF or deadline; false on deadline
bool ReadUntil(int fd, Clock::time_point deadline, std::string& out, bool& io_error) {
  char buf[65536];
  io_error = false;
  while (true) {
    auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    if (remain <= 0) return false;
    struct pollfd pfd = {fd, POLLIN, 0};
    int ret = poll(&pfd, 1, (int)std::min<int64_t>(remain, 1000));
    if (ret < 0) {
      if (errno == EINTR) continue;
      io_error = true;
      return true;
    }
    if (ret == 0) continue;
    ssize_t sz = read(fd, buf, sizeof(buf));
    if (sz < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      io_error = true;
      return true;
    }
    if (sz == 0) return true;
    out.append(buf, sz);
  }
}

} // namespace

SandboxResult SandboxExec(const SandboxOptions& opt) {
  int inpipe[2], outpipe[2];
  // O_CLOEXEC: helpers forked concurrently by other workers must not hold our pipe ends
  if (pipe2(inpipe, O_CLOEXEC) < 0) {
    spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
    return Error(SandboxStatus::INTERNAL, "Failed to start sandbox");
  }
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
    close(inpipe[0]);
    close(inpipe[1]);
    return Error(SandboxStatus::INTERNAL, "Failed to start sandbox");
  }
  auto cmd = SandboxHelperPath();
  auto start = Clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
    for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) close(fd);
    return Error(SandboxStatus::INTERNAL, "Failed to start sandbox");
  }
  if (pid == 0) {
    dup2(outpipe[0], 0);
    dup2(inpipe[1], 1);
    int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) dup2(devnull, 2);
    CloseFrom(3);
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(127);
  }
  close(inpipe[1]);
  close(outpipe[0]);
  spdlog::debug("Sandbox started: pid={} childpid={} dataset={} time_limit={} memory_limit={}",
                getpid(), pid, opt.dataset, opt.time_limit, opt.memory_limit);
  bool written = WriteAll(outpipe[1], opt.Serialize());
  close(outpipe[1]);

  std::string output;
  bool io_error = false;
  auto deadline = start + std::chrono::microseconds(opt.time_limit + kSandboxGrace);
  bool finished = written && ReadUntil(inpipe[0], deadline, output, io_error);
  close(inpipe[0]);
  if (!finished) {
    kill(pid, SIGKILL);
    waitpid(pid, nullptr, 0);
    int64_t elapsed = ElapsedUs(start);
    if (!written) {
      spdlog::warn("Failed to send sandbox request: pid={}", pid);
      return Error(SandboxStatus::INTERNAL, "Failed to start sandbox", elapsed);
    }
    spdlog::info("Sandbox killed at deadline: pid={} elapsed={}", pid, elapsed);
    return Error(SandboxStatus::TIMEOUT, "Query exceeded time limit", elapsed);
  }
  int wstatus = 0;
  waitpid(pid, &wstatus, 0);
  int64_t elapsed = ElapsedUs(start);
  if (!io_error && output.size()) {
    try {
      return SandboxResult::Deserialize(output);
    } catch (nlohmann::json::exception& err) {
      spdlog::warn("Invalid sandbox output: pid={} error={}", pid, err.what());
    }
  }
  if (WIFSIGNALED(wstatus)) {
    int sig = WTERMSIG(wstatus);
    spdlog::info("Sandbox terminated by signal: pid={} signal={}", pid, sig);
    if (sig == SIGXCPU) return Error(SandboxStatus::TIMEOUT, "Query exceeded time limit", elapsed);
    return Error(SandboxStatus::MEMORY,
                 "Query terminated by signal " + std::to_string(sig) + ", likely exceeding the memory limit",
                 elapsed);
  }
  spdlog::warn("Sandbox failed: pid={} exit={}", pid, WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : -1);
  return Error(SandboxStatus::INTERNAL, "Sandbox exited abnormally", elapsed);
}
