#ifndef HAUL_STORAGE_TASK_REGISTRY_HPP_
#define HAUL_STORAGE_TASK_REGISTRY_HPP_

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace haul {

enum class TaskStatus {
  kPending,
  kExtracting,
  kDownloading,
  kCompleted,
  kFailed,
  kCancelled,
};

const char* toString(TaskStatus status);
std::optional<TaskStatus> parseTaskStatus(const std::string& text);
bool isTerminal(TaskStatus status);

struct TaskProgress {
  double percentage = 0.0;
  uint64_t downloaded = 0;
  uint64_t total = 0;
  double speed = 0.0;
  double eta = 0.0;
};

struct TaskInfo {
  using TimePoint = std::chrono::system_clock::time_point;

  std::string taskId;
  std::string url;
  std::filesystem::path outputDir;
  TaskStatus status = TaskStatus::kPending;
  TaskProgress progress;
  std::optional<std::string> error;
  TimePoint createdAt;
  TimePoint updatedAt;
};

// Fields left empty are not touched. `error` set to nullopt-inside-optional
// clears the stored error.
struct TaskUpdate {
  std::optional<TaskStatus> status;
  std::optional<TaskProgress> progress;
  std::optional<std::optional<std::string>> error;
};

/**
 * @brief Durable task records shared between processes.
 *
 * One SQLite file (WAL, synchronous=NORMAL, 30s busy timeout, mode 0600).
 * A single connection is used per instance and every call is serialized,
 * so one registry can be shared by the worker threads of a process.
 * Throws RegistryError on storage failures.
 */
class TaskRegistry {
 public:
  static constexpr int kSchemaVersion = 1;
  static constexpr int kBusyTimeoutMs = 30000;

  explicit TaskRegistry(std::filesystem::path dbPath = defaultPath());
  ~TaskRegistry();
  TaskRegistry(const TaskRegistry&) = delete;
  TaskRegistry& operator=(const TaskRegistry&) = delete;

  void connect();
  void close();
  bool connected() const;

  // Returns the new UUIDv4 task id; status starts as pending.
  std::string createTask(const std::string& url,
                         const std::filesystem::path& outputDir);

  // False when no such task exists.
  bool updateTask(const std::string& taskId, const TaskUpdate& update);
  // Like updateTask, but leaves completed/failed/cancelled rows alone.
  bool updateIfActive(const std::string& taskId, const TaskUpdate& update);

  std::optional<TaskInfo> getTask(const std::string& taskId);
  // Non-terminal tasks, oldest first.
  std::vector<TaskInfo> listActive();
  // Newest first.
  std::vector<TaskInfo> listRecent(size_t limit);
  std::vector<TaskInfo> listByStatus(TaskStatus status, size_t limit);
  // True when some task for exactly this URL completed.
  bool urlCompleted(const std::string& url);

  bool deleteTask(const std::string& taskId);
  // Deletes terminal tasks last updated before `before`; returns the count.
  size_t pruneFinished(TaskInfo::TimePoint before);

  int schemaVersion();
  const std::filesystem::path& path() const { return path_; }

  // $XDG_CONFIG_HOME/haul/tasks.db, else ~/.config/haul/tasks.db
  static std::filesystem::path defaultPath();
  static std::string generateTaskId();

 private:
  bool update(const std::string& taskId, const TaskUpdate& update,
              bool activeOnly);
  void exec(const char* sql);
  int userVersion();
  std::vector<TaskInfo> query(const std::string& sql, int64_t limit);
  sqlite3* handle() const;

  std::filesystem::path path_;
  sqlite3* db_;
  mutable std::mutex mutex_;
};

}  // namespace haul

#endif  // HAUL_STORAGE_TASK_REGISTRY_HPP_
