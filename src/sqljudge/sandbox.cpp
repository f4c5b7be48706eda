#include <sqljudge/sandbox.h>

#include <set>
#include <chrono>
#include <cstring>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <strings.h>

#include <sqlite3.h>

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kProgressInterval = 1000; // VM instructions

std::string ToLower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

struct QueryContext {
  std::set<std::string> tables_read;
  Clock::time_point deadline;
  bool has_deadline = false;
  bool deadline_hit = false;
};

// Only plain reads are allowed once the dataset is loaded
int Authorizer(void* data, int action, const char* arg1, const char* arg2, const char* db, const char*) {
  auto ctx = static_cast<QueryContext*>(data);
  switch (action) {
    case SQLITE_SELECT: [[fallthrough]];
    case SQLITE_RECURSIVE: return SQLITE_OK;
    case SQLITE_READ:
      if (arg1 && db && !strcmp(db, "main") && strncasecmp(arg1, "sqlite_", 7)) {
        ctx->tables_read.insert(ToLower(arg1));
      }
      return SQLITE_OK;
    case SQLITE_FUNCTION:
      if (arg2 && !strcasecmp(arg2, "load_extension")) return SQLITE_DENY;
      return SQLITE_OK;
    default:
      return SQLITE_DENY;
  }
}

int ProgressHandler(void* data) {
  auto ctx = static_cast<QueryContext*>(data);
  if (ctx->has_deadline && Clock::now() >= ctx->deadline) {
    ctx->deadline_hit = true;
    return 1;
  }
  return 0;
}

class Connection { // RAII sqlite3 handle
  sqlite3* db_ = nullptr;
 public:
  Connection() = default;
  Connection(const Connection&) = delete;
  ~Connection() {
    if (db_) sqlite3_close_v2(db_);
  }
  sqlite3*& Get() { return db_; }
};

class Statement {
  sqlite3_stmt* stmt_ = nullptr;
 public:
  Statement() = default;
  Statement(const Statement&) = delete;
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }
  sqlite3_stmt*& Get() { return stmt_; }
};

SandboxStatus StatusFromCode(int rc) {
  switch (rc & 0xff) {
    case SQLITE_AUTH: return SandboxStatus::SECURITY;
    case SQLITE_NOMEM: return SandboxStatus::MEMORY;
    case SQLITE_INTERRUPT: return SandboxStatus::TIMEOUT;
    default: return SandboxStatus::QUERY_ERROR;
  }
}

std::string HexEncode(const void* data, int len) {
  static const char kHex[] = "0123456789abcdef";
  std::string ret;
  auto ptr = static_cast<const unsigned char*>(data);
  for (int i = 0; i < len; i++) {
    ret.push_back(kHex[ptr[i] >> 4]);
    ret.push_back(kHex[ptr[i] & 15]);
  }
  return ret;
}

nlohmann::json ColumnValue(sqlite3_stmt* stmt, int i) {
  switch (sqlite3_column_type(stmt, i)) {
    case SQLITE_INTEGER: return (int64_t)sqlite3_column_int64(stmt, i);
    case SQLITE_FLOAT: return sqlite3_column_double(stmt, i);
    case SQLITE_TEXT:
      return std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, i)),
                         sqlite3_column_bytes(stmt, i));
    case SQLITE_BLOB: {
      const void* blob = sqlite3_column_blob(stmt, i);
      return HexEncode(blob, sqlite3_column_bytes(stmt, i));
    }
    default: return nullptr;
  }
}

// Seed scripts are executed into the in-memory database; database files are
// copied with the backup API and never opened for writing.
bool LoadDataset(sqlite3* db, const std::string& dataset, std::string& error) {
  if (dataset.size() >= 4 && dataset.compare(dataset.size() - 4, 4, ".sql") == 0) {
    std::ifstream fin(dataset);
    if (!fin) {
      error = "Cannot open dataset " + dataset;
      return false;
    }
    std::stringstream ss;
    ss << fin.rdbuf();
    char* errmsg = nullptr;
    if (sqlite3_exec(db, ss.str().c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
      error = std::string("Dataset script failed: ") + (errmsg ? errmsg : "unknown error");
      sqlite3_free(errmsg);
      return false;
    }
    return true;
  }
  Connection src;
  if (sqlite3_open_v2(dataset.c_str(), &src.Get(), SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
    error = "Cannot open dataset " + dataset;
    return false;
  }
  sqlite3_backup* backup = sqlite3_backup_init(db, "main", src.Get(), "main");
  if (!backup) {
    error = std::string("Dataset copy failed: ") + sqlite3_errmsg(db);
    return false;
  }
  int rc = sqlite3_backup_step(backup, -1);
  sqlite3_backup_finish(backup);
  if (rc != SQLITE_DONE) {
    error = std::string("Dataset copy failed: ") + sqlite3_errstr(rc);
    return false;
  }
  return true;
}

std::vector<std::string> ListTables(sqlite3* db) {
  std::vector<std::string> ret;
  Statement stmt;
  if (sqlite3_prepare_v2(db,
        "SELECT name FROM sqlite_master WHERE type IN ('table', 'view') AND name NOT LIKE 'sqlite_%'",
        -1, &stmt.Get(), nullptr) != SQLITE_OK) {
    return ret;
  }
  while (sqlite3_step(stmt.Get()) == SQLITE_ROW) {
    ret.push_back(ToLower(reinterpret_cast<const char*>(sqlite3_column_text(stmt.Get(), 0))));
  }
  return ret;
}

SandboxResult Fail(SandboxResult&& res, SandboxStatus status, std::string error) {
  res.status = status;
  res.error = std::move(error);
  res.result = ResultSet();
  return std::move(res);
}

} // namespace

const char* SandboxStatusName(SandboxStatus status) {
  switch (status) {
#define X(name) case SandboxStatus::name: return #name;
    ENUM_SANDBOX_STATUS_
#undef X
  }
  __builtin_unreachable();
}

SandboxResult RunQuery(const SandboxOptions& opt) {
  SandboxResult res;
  Connection conn;
  if (sqlite3_open_v2(":memory:", &conn.Get(), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
    return Fail(std::move(res), SandboxStatus::INTERNAL, "Cannot open in-memory database");
  }
  sqlite3* db = conn.Get();
  sqlite3_db_config(db, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);
  std::string error;
  if (!LoadDataset(db, opt.dataset, error)) {
    return Fail(std::move(res), SandboxStatus::INTERNAL, error);
  }
  res.meta.dataset_tables = ListTables(db);

  QueryContext ctx;
  sqlite3_db_config(db, SQLITE_DBCONFIG_DEFENSIVE, 1, nullptr);
  sqlite3_limit(db, SQLITE_LIMIT_ATTACHED, 0);
  sqlite3_set_authorizer(db, Authorizer, &ctx);
  if (opt.time_limit > 0) {
    ctx.has_deadline = true;
    ctx.deadline = Clock::now() + std::chrono::microseconds(opt.time_limit);
    sqlite3_progress_handler(db, kProgressInterval, ProgressHandler, &ctx);
  }

  auto start = Clock::now();
  auto Elapsed = [&start]() {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
  };
  Statement stmt;
  const char* tail = nullptr;
  int rc = sqlite3_prepare_v2(db, opt.sql.c_str(), (int)opt.sql.size(), &stmt.Get(), &tail);
  if (rc != SQLITE_OK) {
    res.time = Elapsed();
    return Fail(std::move(res), StatusFromCode(rc), sqlite3_errmsg(db));
  }
  if (!stmt.Get()) {
    return Fail(std::move(res), SandboxStatus::QUERY_ERROR, "No statement to execute");
  }
  {
    // anything but whitespace and comments after the first statement
    Statement next;
    const char* end = opt.sql.c_str() + opt.sql.size();
    int next_rc = sqlite3_prepare_v2(db, tail, (int)(end - tail), &next.Get(), nullptr);
    if (next_rc != SQLITE_OK || next.Get()) {
      return Fail(std::move(res), SandboxStatus::SECURITY, "Only a single statement may be executed");
    }
  }
  if (!sqlite3_stmt_readonly(stmt.Get())) {
    return Fail(std::move(res), SandboxStatus::SECURITY, "Only read-only queries are allowed");
  }

  int cols = sqlite3_column_count(stmt.Get());
  for (int i = 0; i < cols; i++) {
    const char* name = sqlite3_column_name(stmt.Get(), i);
    res.result.columns.push_back(name ? name : "");
  }
  while ((rc = sqlite3_step(stmt.Get())) == SQLITE_ROW) {
    if (opt.max_rows > 0 && (int64_t)res.result.rows.size() >= opt.max_rows) {
      res.time = Elapsed();
      return Fail(std::move(res), SandboxStatus::ROW_LIMIT,
                  "Result exceeds " + std::to_string(opt.max_rows) + " rows");
    }
    nlohmann::json row = nlohmann::json::array();
    for (int i = 0; i < cols; i++) row.push_back(ColumnValue(stmt.Get(), i));
    res.result.rows.push_back(std::move(row));
  }
  res.time = Elapsed();
  res.meta.tables_read.assign(ctx.tables_read.begin(), ctx.tables_read.end());
  res.meta.fullscan_steps = sqlite3_stmt_status(stmt.Get(), SQLITE_STMTSTATUS_FULLSCAN_STEP, 0);
  res.meta.vm_steps = sqlite3_stmt_status(stmt.Get(), SQLITE_STMTSTATUS_VM_STEP, 0);
  if (rc != SQLITE_DONE) {
    if (ctx.deadline_hit) return Fail(std::move(res), SandboxStatus::TIMEOUT, "Query exceeded time limit");
    return Fail(std::move(res), StatusFromCode(rc), sqlite3_errmsg(db));
  }
  res.status = SandboxStatus::OK;
  return res;
}

std::string SandboxOptions::Serialize() const {
  return nlohmann::json{
    {"sql", sql},
    {"dataset", dataset},
    {"time_limit", time_limit},
    {"memory_limit", memory_limit},
    {"max_rows", max_rows},
  }.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

SandboxOptions SandboxOptions::Deserialize(const std::string& str) {
  auto j = nlohmann::json::parse(str);
  SandboxOptions ret;
  j.at("sql").get_to(ret.sql);
  j.at("dataset").get_to(ret.dataset);
  j.at("time_limit").get_to(ret.time_limit);
  j.at("memory_limit").get_to(ret.memory_limit);
  j.at("max_rows").get_to(ret.max_rows);
  return ret;
}

std::string SandboxResult::Serialize() const {
  return nlohmann::json{
    {"status", (int)status},
    {"error", error},
    {"columns", result.columns},
    {"rows", result.rows},
    {"tables_read", meta.tables_read},
    {"dataset_tables", meta.dataset_tables},
    {"fullscan_steps", meta.fullscan_steps},
    {"vm_steps", meta.vm_steps},
    {"time", time},
  }.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

SandboxResult SandboxResult::Deserialize(const std::string& str) {
  auto j = nlohmann::json::parse(str);
  SandboxResult ret;
  int status = j.at("status").get<int>();
  if (status < 0 || status > (int)SandboxStatus::INTERNAL) {
    ret.error = "Invalid sandbox status " + std::to_string(status);
    return ret;
  }
  ret.status = (SandboxStatus)status;
  j.at("error").get_to(ret.error);
  j.at("columns").get_to(ret.result.columns);
  ret.result.rows = j.at("rows");
  j.at("tables_read").get_to(ret.meta.tables_read);
  j.at("dataset_tables").get_to(ret.meta.dataset_tables);
  j.at("fullscan_steps").get_to(ret.meta.fullscan_steps);
  j.at("vm_steps").get_to(ret.meta.vm_steps);
  j.at("time").get_to(ret.time);
  return ret;
}
