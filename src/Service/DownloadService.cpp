#include "Service/DownloadService.hpp"

#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace haul {

DownloadService::DownloadService(DownloadManager& manager,
                                 TaskRegistry& registry,
                                 std::chrono::milliseconds cancelPollInterval)
    : manager_(manager),
      registry_(registry),
      pollInterval_(cancelPollInterval) {}

DownloadService::~DownloadService() { stop(); }

void DownloadService::start() {
  if (pollTask_) return;
  pollTask_ = timer_.addPeriodicTask(pollInterval_, pollInterval_,
                                     [this]() { pollCancellations(); });
  timer_.start();
}

void DownloadService::stop() {
  if (pollTask_) {
    timer_.cancelTask(*pollTask_);
    pollTask_.reset();
  }
  timer_.stop();
}

std::string DownloadService::createTask(const std::string& url,
                                        const std::filesystem::path& outputDir) {
  std::string taskId = registry_.createTask(url, outputDir);
  LOG(INFO) << "Created task " << taskId << " for " << url;
  return taskId;
}

std::string DownloadService::download(
    const std::string& url, const std::filesystem::path& outputDir,
    const std::optional<std::string>& password,
    const ProgressCallback& onProgress) {
  std::string taskId = createTask(url, outputDir);
  run(taskId, url, outputDir, password, onProgress);
  return taskId;
}

std::vector<DownloadResult> DownloadService::run(
    const std::string& taskId, const std::string& url,
    const std::filesystem::path& outputDir,
    const std::optional<std::string>& password,
    const ProgressCallback& onProgress) {
  {
    std::lock_guard<std::mutex> lock(runsMutex_);
    runs_[taskId] = RunState();
  }
  TaskUpdate extracting;
  extracting.status = TaskStatus::kExtracting;
  registry_.updateIfActive(taskId, extracting);

  auto forward = [this, &taskId, &onProgress](const ProgressEvent& event) {
    onFileProgress(taskId, event);
    if (onProgress) onProgress(event);
  };

  std::vector<DownloadResult> results;
  try {
    results = manager_.downloadUrl(url, password, outputDir, forward);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Task " << taskId << " failed: " << e.what();
    TaskUpdate failed;
    failed.status = TaskStatus::kFailed;
    failed.error = std::optional<std::string>(e.what());
    registry_.updateIfActive(taskId, failed);
    {
      std::lock_guard<std::mutex> lock(runsMutex_);
      runs_.erase(taskId);
    }
    ServiceEvent event;
    event.taskId = taskId;
    event.url = url;
    event.error = e.what();
    events_.emit(kDownloadError, event);
    throw;
  }

  finish(taskId, results);
  std::lock_guard<std::mutex> lock(runsMutex_);
  runs_.erase(taskId);
  return results;
}

void DownloadService::finish(const std::string& taskId,
                             const std::vector<DownloadResult>& results) {
  std::string errors;
  bool anyFailed = false;
  bool anyCancelled = false;
  for (const auto& result : results) {
    if (result.kind == DownloadResult::Kind::kFailed) {
      anyFailed = true;
      if (!errors.empty()) errors += "; ";
      errors += result.error.empty() ? "Unknown" : result.error;
    } else if (result.kind == DownloadResult::Kind::kCancelled) {
      anyCancelled = true;
    }
  }

  TaskUpdate update;
  if (results.empty()) {
    update.status = TaskStatus::kFailed;
    update.error = std::optional<std::string>("No files found");
  } else if (anyFailed) {
    update.status = TaskStatus::kFailed;
    update.error = std::optional<std::string>(errors);
  } else if (anyCancelled) {
    update.status = TaskStatus::kCancelled;
  } else {
    update.status = TaskStatus::kCompleted;
    update.error = std::optional<std::string>();
  }
  registry_.updateIfActive(taskId, update);
  LOG(INFO) << "Task " << taskId << " finished: " << toString(*update.status);

  if (results.empty()) {
    ServiceEvent event;
    event.taskId = taskId;
    event.error = "No files found";
    events_.emit(kDownloadError, event);
  }
  for (const auto& result : results) {
    ServiceEvent event;
    event.taskId = taskId;
    event.fileTaskId = result.task->taskId;
    event.filename = result.task->fileInfo.filename;
    event.url = result.task->fileInfo.url;
    if (result.success) {
      events_.emit(kDownloadComplete, event);
    } else {
      event.error = result.error.empty() ? "Download failed" : result.error;
      events_.emit(kDownloadError, event);
    }
  }
}

void DownloadService::onFileProgress(const std::string& taskId,
                                     const ProgressEvent& event) {
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lock(runsMutex_);
    auto it = runs_.find(taskId);
    if (it != runs_.end()) {
      it->second.fileTasks.insert(event.taskId);
      cancelled = it->second.cancelled;
    }
  }
  if (cancelled) {
    manager_.cancel(event.taskId);
    return;
  }

  TaskUpdate update;
  TaskProgress progress;
  progress.percentage = event.percentage;
  progress.downloaded = event.downloaded;
  progress.total = event.total;
  progress.speed = event.speed;
  progress.eta = event.eta;
  update.progress = progress;
  if (event.status == toString(DownloadStatus::kDownloading)) {
    update.status = TaskStatus::kDownloading;
  }

  try {
    if (!registry_.updateIfActive(taskId, update)) {
      auto info = registry_.getTask(taskId);
      if (info && info->status == TaskStatus::kCancelled) {
        cancelRun(taskId);
        return;
      }
    }
  } catch (const RegistryError& e) {
    // 进度写入失败不影响传输
    LOG(WARN) << "Failed to persist progress of " << taskId << ": "
              << e.what();
  }

  if (update.status) {
    ServiceEvent out;
    out.taskId = taskId;
    out.fileTaskId = event.taskId;
    out.filename = event.filename;
    if (auto task = manager_.getTask(event.taskId)) {
      out.url = task->fileInfo.url;
    }
    out.progress = event;
    events_.emit(kDownloadProgress, out);
  }
}

void DownloadService::cancelRun(const std::string& taskId) {
  std::set<std::string> fileTasks;
  {
    std::lock_guard<std::mutex> lock(runsMutex_);
    auto it = runs_.find(taskId);
    if (it == runs_.end()) return;
    it->second.cancelled = true;
    fileTasks = it->second.fileTasks;
  }
  LOG(INFO) << "Cancelling task " << taskId << " (" << fileTasks.size()
            << " file tasks)";
  for (const auto& id : fileTasks) manager_.cancel(id);
}

bool DownloadService::cancel(const std::string& taskId) {
  auto info = registry_.getTask(taskId);
  if (!info) return false;
  TaskUpdate update;
  update.status = TaskStatus::kCancelled;
  registry_.updateIfActive(taskId, update);
  cancelRun(taskId);

  ServiceEvent event;
  event.taskId = taskId;
  event.url = info->url;
  event.error = "Cancelled";
  events_.emit(kDownloadError, event);
  return true;
}

void DownloadService::pollCancellations() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(runsMutex_);
    for (const auto& kv : runs_) {
      if (!kv.second.cancelled) ids.push_back(kv.first);
    }
  }
  for (const auto& id : ids) {
    try {
      auto info = registry_.getTask(id);
      if (info && info->status == TaskStatus::kCancelled) cancelRun(id);
    } catch (const RegistryError& e) {
      LOG(WARN) << "Cancellation poll failed for " << id << ": " << e.what();
    }
  }
}

std::optional<TaskInfo> DownloadService::getStatus(const std::string& taskId) {
  return registry_.getTask(taskId);
}

std::vector<TaskInfo> DownloadService::listActive() {
  return registry_.listActive();
}

std::vector<TaskInfo> DownloadService::history(
    std::optional<TaskStatus> status, size_t limit) {
  if (status) return registry_.listByStatus(*status, limit);
  return registry_.listRecent(limit);
}

bool DownloadService::alreadyDownloaded(const std::string& url) {
  return registry_.urlCompleted(url);
}

bool DownloadService::deleteTask(const std::string& taskId) {
  auto info = registry_.getTask(taskId);
  if (!info) return false;
  if (!isTerminal(info->status)) {
    throw HaulError("Task " + taskId + " is still " + toString(info->status) +
                    "; cancel it first");
  }
  return registry_.deleteTask(taskId);
}

size_t DownloadService::prune(std::chrono::hours age) {
  return registry_.pruneFinished(std::chrono::system_clock::now() - age);
}

std::vector<FileInfo> DownloadService::listFiles(
    const std::string& url, const std::optional<std::string>& password) {
  return manager_.extractFiles(url, password);
}

}  // namespace haul
