#ifndef HAUL_SERVICE_DOWNLOAD_SERVICE_HPP_
#define HAUL_SERVICE_DOWNLOAD_SERVICE_HPP_

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Downloader/DownloadManager.hpp"
#include "Storage/TaskRegistry.hpp"
#include "utils/event_bus.hpp"
#include "utils/timer.hpp"

namespace haul {

// Topics published on DownloadService::events().
constexpr const char* kDownloadProgress = "download_progress";
constexpr const char* kDownloadComplete = "download_complete";
constexpr const char* kDownloadError = "download_error";

struct ServiceEvent {
  std::string taskId;      // registry task
  std::string fileTaskId;  // empty for task-level errors
  std::string filename;
  std::string url;
  std::optional<ProgressEvent> progress;  // download_progress only
  std::string error;                      // download_error only
};

using ServiceEventBus = utils::EventBus<ServiceEvent>;

/**
 * @brief Joins the in-process manager with the durable task registry.
 *
 * A registry task covers one URL, which may expand into several file tasks.
 * Cancellation written to the registry by any process reaches running file
 * tasks either on their next progress tick or on the periodic poll.
 */
class DownloadService {
 public:
  DownloadService(DownloadManager& manager, TaskRegistry& registry,
                  std::chrono::milliseconds cancelPollInterval =
                      std::chrono::milliseconds(1000));
  ~DownloadService();
  DownloadService(const DownloadService&) = delete;
  DownloadService& operator=(const DownloadService&) = delete;

  // Starts / stops the cancellation poll timer.
  void start();
  void stop();

  std::string createTask(const std::string& url,
                         const std::filesystem::path& outputDir);

  std::vector<DownloadResult> run(
      const std::string& taskId, const std::string& url,
      const std::filesystem::path& outputDir,
      const std::optional<std::string>& password = std::nullopt,
      const ProgressCallback& onProgress = nullptr);

  // createTask + run; returns the registry id.
  std::string download(const std::string& url,
                       const std::filesystem::path& outputDir,
                       const std::optional<std::string>& password = std::nullopt,
                       const ProgressCallback& onProgress = nullptr);

  std::optional<TaskInfo> getStatus(const std::string& taskId);
  std::vector<TaskInfo> listActive();
  std::vector<FileInfo> listFiles(
      const std::string& url,
      const std::optional<std::string>& password = std::nullopt);

  // False when the registry has no such task.
  bool cancel(const std::string& taskId);

  // Cancels local runs whose registry row another process marked cancelled.
  void pollCancellations();

  // Newest first; every status when `status` is empty.
  std::vector<TaskInfo> history(std::optional<TaskStatus> status,
                                size_t limit);
  bool alreadyDownloaded(const std::string& url);
  // Only finished tasks can be deleted; throws HaulError for active ones.
  bool deleteTask(const std::string& taskId);
  // Deletes finished tasks idle for longer than `age`.
  size_t prune(std::chrono::hours age);

  ServiceEventBus& events() { return events_; }

 private:
  struct RunState {
    std::set<std::string> fileTasks;
    bool cancelled = false;
  };

  void onFileProgress(const std::string& taskId, const ProgressEvent& event);
  void cancelRun(const std::string& taskId);
  void finish(const std::string& taskId,
              const std::vector<DownloadResult>& results);

  DownloadManager& manager_;
  TaskRegistry& registry_;
  std::chrono::milliseconds pollInterval_;

  utils::Timer timer_;
  std::optional<utils::Timer::TaskId> pollTask_;

  std::mutex runsMutex_;
  std::map<std::string, RunState> runs_;

  ServiceEventBus events_;
};

}  // namespace haul

#endif  // HAUL_SERVICE_DOWNLOAD_SERVICE_HPP_
