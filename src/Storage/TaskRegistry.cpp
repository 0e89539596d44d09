#include "Storage/TaskRegistry.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <random>

#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace fs = std::filesystem;

namespace haul {

namespace {

constexpr fs::perms kOwnerOnly = fs::perms::owner_read | fs::perms::owner_write;

constexpr const char* kSelectColumns =
    "SELECT task_id, url, output_dir, status, percentage, downloaded, total, "
    "speed, eta, error, created_at, updated_at FROM tasks";

constexpr const char* kTerminalList = "('completed', 'failed', 'cancelled')";

int64_t toMillis(TaskInfo::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

TaskInfo::TimePoint fromMillis(int64_t ms) {
  return TaskInfo::TimePoint(std::chrono::milliseconds(ms));
}

// 预编译语句的 RAII 包装
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) !=
        SQLITE_OK) {
      throw RegistryError(std::string("Failed to prepare statement: ") +
                          sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.c_str(),
                            static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }
  void bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, value));
  }
  void bind(int index, double value) {
    check(sqlite3_bind_double(stmt_, index, value));
  }
  void bindNull(int index) { check(sqlite3_bind_null(stmt_, index)); }

  // True while rows remain.
  bool step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw RegistryError(std::string("SQLite step failed: ") +
                        sqlite3_errmsg(db_));
  }

  std::string text(int col) const {
    const unsigned char* p = sqlite3_column_text(stmt_, col);
    return p == nullptr ? std::string() : reinterpret_cast<const char*>(p);
  }
  int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
  double real(int col) const { return sqlite3_column_double(stmt_, col); }
  bool isNull(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

 private:
  void check(int rc) {
    if (rc != SQLITE_OK) {
      throw RegistryError(std::string("SQLite bind failed: ") +
                          sqlite3_errmsg(db_));
    }
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
};

// 仅限当前用户访问；失败只记录警告
void restrictToOwner(const fs::path& path) {
  std::error_code ec;
  fs::file_status st = fs::status(path, ec);
  if (ec || !fs::exists(st)) return;
  if ((st.permissions() & fs::perms::all) != kOwnerOnly) {
    fs::permissions(path, kOwnerOnly, fs::perm_options::replace, ec);
  }
  if (ec) {
    LOG(WARN) << "Cannot restrict permissions of " << path << ": "
              << ec.message();
  }
}

fs::path sidecar(const fs::path& db, const char* suffix) {
  return fs::path(db.string() + suffix);
}

TaskInfo rowToTask(const Statement& row) {
  TaskInfo info;
  info.taskId = row.text(0);
  info.url = row.text(1);
  info.outputDir = row.text(2);
  std::string status = row.text(3);
  auto parsed = parseTaskStatus(status);
  if (!parsed) {
    throw RegistryError("Unknown task status '" + status + "' for " +
                        info.taskId);
  }
  info.status = *parsed;
  info.progress.percentage = row.real(4);
  info.progress.downloaded = static_cast<uint64_t>(row.int64(5));
  info.progress.total = static_cast<uint64_t>(row.int64(6));
  info.progress.speed = row.real(7);
  info.progress.eta = row.real(8);
  if (!row.isNull(9)) info.error = row.text(9);
  info.createdAt = fromMillis(row.int64(10));
  info.updatedAt = fromMillis(row.int64(11));
  return info;
}

}  // namespace

const char* toString(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kExtracting:
      return "extracting";
    case TaskStatus::kDownloading:
      return "downloading";
    case TaskStatus::kCompleted:
      return "completed";
    case TaskStatus::kFailed:
      return "failed";
    case TaskStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::optional<TaskStatus> parseTaskStatus(const std::string& text) {
  for (TaskStatus s :
       {TaskStatus::kPending, TaskStatus::kExtracting, TaskStatus::kDownloading,
        TaskStatus::kCompleted, TaskStatus::kFailed, TaskStatus::kCancelled}) {
    if (text == toString(s)) return s;
  }
  return std::nullopt;
}

bool isTerminal(TaskStatus status) {
  return status == TaskStatus::kCompleted || status == TaskStatus::kFailed ||
         status == TaskStatus::kCancelled;
}

TaskRegistry::TaskRegistry(fs::path dbPath)
    : path_(std::move(dbPath)), db_(nullptr) {}

TaskRegistry::~TaskRegistry() { close(); }

fs::path TaskRegistry::defaultPath() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg != nullptr && xdg[0] != '\0') {
    return fs::path(xdg) / "haul" / "tasks.db";
  }
  const char* home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return fs::path(home) / ".config" / "haul" / "tasks.db";
  }
  return fs::path("tasks.db");
}

std::string TaskRegistry::generateTaskId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  unsigned char bytes[16];
  for (int i = 0; i < 16; i += 8) {
    uint64_t v = rng();
    for (int j = 0; j < 8; ++j) bytes[i + j] = static_cast<unsigned char>(v >> (j * 8));
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);  // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);  // RFC 4122
  char out[37];
  std::snprintf(out, sizeof(out),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  return std::string(out);
}

void TaskRegistry::connect() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) return;

  if (path_.has_parent_path()) fs::create_directories(path_.parent_path());

  // 先以 0600 创建，SQLite 的 -wal/-shm 文件沿用主库的权限
  int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd >= 0) {
    ::close(fd);
  } else if (errno != EEXIST) {
    throw RegistryError("Cannot create task database " + path_.string() +
                        ": " + std::strerror(errno));
  }

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path_.c_str(), &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db != nullptr ? sqlite3_errmsg(db)
                                        : sqlite3_errstr(rc);
    sqlite3_close(db);
    throw RegistryError("Cannot open task database " + path_.string() + ": " +
                        message);
  }
  db_ = db;

  try {
    restrictToOwner(path_);

    sqlite3_busy_timeout(db_, kBusyTimeoutMs);
    exec("PRAGMA journal_mode=WAL");
    // 旧版本留下的 -wal/-shm 可能仍是宽松权限
    restrictToOwner(sidecar(path_, "-wal"));
    restrictToOwner(sidecar(path_, "-shm"));
    exec("PRAGMA synchronous=NORMAL");
    exec("PRAGMA foreign_keys=ON");

    int version = userVersion();
    if (version > kSchemaVersion) {
      throw RegistryError("Task database " + path_.string() +
                          " has schema version " + std::to_string(version) +
                          ", newer than supported " +
                          std::to_string(kSchemaVersion));
    }

    exec(
        "CREATE TABLE IF NOT EXISTS tasks ("
        " task_id TEXT PRIMARY KEY,"
        " url TEXT NOT NULL,"
        " output_dir TEXT NOT NULL,"
        " status TEXT NOT NULL,"
        " percentage REAL NOT NULL DEFAULT 0,"
        " downloaded INTEGER NOT NULL DEFAULT 0,"
        " total INTEGER NOT NULL DEFAULT 0,"
        " speed REAL NOT NULL DEFAULT 0,"
        " eta REAL NOT NULL DEFAULT 0,"
        " error TEXT,"
        " created_at INTEGER NOT NULL,"
        " updated_at INTEGER NOT NULL)");
    exec("CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status)");
    exec("CREATE INDEX IF NOT EXISTS idx_tasks_url ON tasks(url)");
    exec(
        "CREATE INDEX IF NOT EXISTS idx_tasks_created_at ON tasks(created_at)");
    if (version < kSchemaVersion) {
      exec(("PRAGMA user_version = " + std::to_string(kSchemaVersion)).c_str());
    }
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  LOG(DEBUG) << "Task registry open at " << path_;
}

void TaskRegistry::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) return;
  sqlite3_close(db_);
  db_ = nullptr;
}

bool TaskRegistry::connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr;
}

sqlite3* TaskRegistry::handle() const {
  if (db_ == nullptr) throw RegistryError("Task registry is not connected");
  return db_;
}

void TaskRegistry::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(handle(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string message = err != nullptr ? err : "unknown error";
    sqlite3_free(err);
    throw RegistryError("SQLite error: " + message + " [" + sql + "]");
  }
}

int TaskRegistry::userVersion() {
  Statement stmt(handle(), "PRAGMA user_version");
  return stmt.step() ? static_cast<int>(stmt.int64(0)) : 0;
}

int TaskRegistry::schemaVersion() {
  std::lock_guard<std::mutex> lock(mutex_);
  return userVersion();
}

std::string TaskRegistry::createTask(const std::string& url,
                                     const fs::path& outputDir) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string taskId = generateTaskId();
  const int64_t now = toMillis(std::chrono::system_clock::now());

  Statement stmt(handle(),
                 "INSERT INTO tasks (task_id, url, output_dir, status, "
                 "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?)");
  stmt.bind(1, taskId);
  stmt.bind(2, url);
  stmt.bind(3, outputDir.string());
  stmt.bind(4, std::string(toString(TaskStatus::kPending)));
  stmt.bind(5, now);
  stmt.bind(6, now);
  stmt.step();
  return taskId;
}

bool TaskRegistry::updateTask(const std::string& taskId,
                              const TaskUpdate& update) {
  return this->update(taskId, update, false);
}

bool TaskRegistry::updateIfActive(const std::string& taskId,
                                  const TaskUpdate& update) {
  return this->update(taskId, update, true);
}

bool TaskRegistry::update(const std::string& taskId, const TaskUpdate& update,
                          bool activeOnly) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql = "UPDATE tasks SET ";
  if (update.status) sql += "status = ?, ";
  if (update.progress) {
    sql += "percentage = ?, downloaded = ?, total = ?, speed = ?, eta = ?, ";
  }
  if (update.error) sql += "error = ?, ";
  sql += "updated_at = ? WHERE task_id = ?";
  if (activeOnly) sql += std::string(" AND status NOT IN ") + kTerminalList;

  Statement stmt(handle(), sql);
  int i = 1;
  if (update.status) stmt.bind(i++, std::string(toString(*update.status)));
  if (update.progress) {
    const TaskProgress& p = *update.progress;
    stmt.bind(i++, p.percentage);
    stmt.bind(i++, static_cast<int64_t>(p.downloaded));
    stmt.bind(i++, static_cast<int64_t>(p.total));
    stmt.bind(i++, p.speed);
    stmt.bind(i++, p.eta);
  }
  if (update.error) {
    if (*update.error) {
      stmt.bind(i++, **update.error);
    } else {
      stmt.bindNull(i++);
    }
  }
  stmt.bind(i++, toMillis(std::chrono::system_clock::now()));
  stmt.bind(i++, taskId);
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

std::optional<TaskInfo> TaskRegistry::getTask(const std::string& taskId) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(handle(), std::string(kSelectColumns) + " WHERE task_id = ?");
  stmt.bind(1, taskId);
  if (!stmt.step()) return std::nullopt;
  return rowToTask(stmt);
}

std::vector<TaskInfo> TaskRegistry::query(const std::string& sql,
                                          int64_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(handle(), sql);
  if (limit >= 0) stmt.bind(1, limit);
  std::vector<TaskInfo> out;
  while (stmt.step()) out.push_back(rowToTask(stmt));
  return out;
}

std::vector<TaskInfo> TaskRegistry::listActive() {
  return query(std::string(kSelectColumns) + " WHERE status NOT IN " +
                   kTerminalList + " ORDER BY created_at ASC, rowid ASC",
               -1);
}

std::vector<TaskInfo> TaskRegistry::listRecent(size_t limit) {
  return query(std::string(kSelectColumns) +
                   " ORDER BY created_at DESC, rowid DESC LIMIT ?",
               static_cast<int64_t>(limit));
}

std::vector<TaskInfo> TaskRegistry::listByStatus(TaskStatus status,
                                                  size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(handle(), std::string(kSelectColumns) +
                               " WHERE status = ?"
                               " ORDER BY created_at DESC, rowid DESC LIMIT ?");
  stmt.bind(1, std::string(toString(status)));
  stmt.bind(2, static_cast<int64_t>(limit));
  std::vector<TaskInfo> out;
  while (stmt.step()) out.push_back(rowToTask(stmt));
  return out;
}

bool TaskRegistry::urlCompleted(const std::string& url) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(handle(),
                 "SELECT 1 FROM tasks WHERE url = ? AND status = ? LIMIT 1");
  stmt.bind(1, url);
  stmt.bind(2, std::string(toString(TaskStatus::kCompleted)));
  return stmt.step();
}

bool TaskRegistry::deleteTask(const std::string& taskId) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(handle(), "DELETE FROM tasks WHERE task_id = ?");
  stmt.bind(1, taskId);
  stmt.step();
  return sqlite3_changes(db_) > 0;
}

size_t TaskRegistry::pruneFinished(TaskInfo::TimePoint before) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(handle(), std::string("DELETE FROM tasks WHERE status IN ") +
                               kTerminalList + " AND updated_at < ?");
  stmt.bind(1, toMillis(before));
  stmt.step();
  size_t removed = static_cast<size_t>(sqlite3_changes(db_));
  if (removed > 0) LOG(INFO) << "Pruned " << removed << " finished tasks";
  return removed;
}

}  // namespace haul
