#include <fcntl.h>
#include <csignal>
#include <unistd.h>
#include <thread>
#include <memory>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <sqljudge/judge.h>
#include <sqljudge/paths.h>
#include <sqljudge/queue.h>
#include <sqljudge/store.h>
#include <sqljudge/logger.h>
#include <sqljudge/worker.h>
#include <sqljudge/problem.h>
#include <sqljudge/liveness.h>
#include <sqljudge/recovery.h>
#include <sqljudge/dispatcher.h>
#include <sqljudge/redis_queue.h>
#include <sqljudge/result_cache.h>
#include "server_io.h"

namespace {

bool to_lock = true;
int num_workers = 2;
std::string role = "all";
std::string redis_url = "";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string database = ini[""]["database"] | "";
  std::string problem_root = ini[""]["problem_root"] | "";
  if (database.size()) kDatabasePath = database;
  if (problem_root.size()) kProblemRoot = problem_root;
  redis_url = ini[""]["redis_url"] | redis_url;
  kListenHost = ini[""]["listen_host"] | kListenHost;
  kListenPort = ini[""]["listen_port"] | kListenPort;
  num_workers = ini[""]["workers"] | num_workers;
  kHeartbeatIntervalMs = ini[""]["heartbeat_interval_ms"] | kHeartbeatIntervalMs;
  kLivenessWindowMs = ini[""]["liveness_window_ms"] | kLivenessWindowMs;
  kPollIntervalMs = ini[""]["poll_interval_ms"] | kPollIntervalMs;
  kQueueTimeoutMs = ini[""]["queue_timeout_ms"] | kQueueTimeoutMs;
  kSweepIntervalMs = ini[""]["sweep_interval_ms"] | kSweepIntervalMs;
  kStaleClaimMs = ini[""]["stale_claim_ms"] | kStaleClaimMs;
  kOrphanAfterMs = ini[""]["orphan_after_ms"] | kOrphanAfterMs;
  kResultCacheTtlSec = ini[""]["result_cache_ttl_sec"] | kResultCacheTtlSec;
  kResultCacheSize = ini[""]["result_cache_size"] | (long)kResultCacheSize;
  kMaxQueryLength = ini[""]["max_query_length"] | kMaxQueryLength;
  kDefaultTimeLimit = (ini[""]["default_time_limit_ms"] | (kDefaultTimeLimit / 1000)) * 1000;
  kDefaultMemoryLimit = (ini[""]["default_memory_limit_mb"] | (kDefaultMemoryLimit / 1024)) * 1024;
  kDefaultMaxRows = ini[""]["default_max_rows"] | kDefaultMaxRows;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "sqljudge");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/sqljudge.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-w", "--workers")
    .scan<'d', int>()
    .help("Number of worker threads");
  parser.add_argument("-r", "--role")
    .default_value(std::string("all"))
    .help("Components to run: all, intake or worker");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--workers")) {
    num_workers = val.value();
  }
  role = parser.get<std::string>("--role");
  if (role != "all" && role != "intake" && role != "worker") {
    spdlog::error("Unknown role {}", role);
    exit(1);
  }
  to_lock = parser["--no-lock"] == false;
}

bool LockFile() {
  fs::path lock_file = LockFilePath();
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

std::unique_ptr<PrimaryQueue> MakePrimaryQueue() {
  if (redis_url.empty()) {
    if (role != "all") spdlog::warn("In-process queue is not shared with other processes");
    return std::make_unique<MemoryQueue>();
  }
  return std::make_unique<RedisQueue>(redis_url);
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  // the sandbox helper may exit before reading its request
  signal(SIGPIPE, SIG_IGN);
  ParseArgs(argc, argv);
  if (to_lock && !LockFile()) {
    spdlog::error("Another sqljudge instance is running.");
    return 1;
  }
  if (access(SandboxHelperPath().c_str(), X_OK) != 0) {
    spdlog::error("Sandbox helper not found at {}", SandboxHelperPath().string());
    return 1;
  }

  Store store(kDatabasePath);
  ProblemCatalog catalog;
  std::unique_ptr<PrimaryQueue> primary;
  try {
    primary = MakePrimaryQueue();
  } catch (const std::exception& err) {
    spdlog::error("Failed to set up primary queue: {}", err.what());
    return 1;
  }
  FallbackQueue fallback(store);
  ResultCache cache;
  Judge judge(store, catalog, {}, &cache);
  LivenessMonitor liveness(*primary);
  RecoverySweeper sweeper(store, *primary, fallback, judge, liveness);
  Dispatcher dispatcher(store, catalog, *primary, fallback, liveness, judge, &sweeper);
  WorkerPool pool(*primary, fallback, judge);

  if (role != "intake") pool.Start(num_workers);
  if (role == "worker") {
    pool.Wait();
    return 0;
  }
  sweeper.Start();
  bool ok = ServerWorkLoop(dispatcher, liveness);
  sweeper.Stop();
  pool.Stop();
  return ok ? 0 : 1;
}
