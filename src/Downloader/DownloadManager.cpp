#include "Downloader/DownloadManager.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include "utils/errors.hpp"
#include "utils/logger.hpp"
#include "utils/sanitize.hpp"
#include "utils/tbb_manager.hpp"

namespace fs = std::filesystem;

namespace haul {

namespace {

constexpr int kMaxNameCollisions = 100000;

void notifyQuietly(const DownloadTask& task,
                   const ProgressCallback& onProgress) {
  if (!onProgress) return;
  try {
    onProgress(task.snapshot());
  } catch (const std::exception& e) {
    LOG(WARN) << "Progress callback failed for " << task.taskId << ": "
              << e.what();
  }
}

// Cuts `stem` so that stem + suffix stays within the filename limit,
// without splitting a UTF-8 sequence.
std::string fitStem(std::string stem, size_t suffixLength) {
  if (stem.size() + suffixLength <= utils::kMaxFilenameLength) return stem;
  size_t cut = utils::kMaxFilenameLength > suffixLength
                   ? utils::kMaxFilenameLength - suffixLength
                   : 0;
  while (cut > 0 && (static_cast<unsigned char>(stem[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  stem.resize(cut);
  return stem;
}

}  // namespace

DownloadResult DownloadResult::succeeded(std::shared_ptr<DownloadTask> task) {
  DownloadResult r;
  r.task = std::move(task);
  r.success = true;
  r.kind = Kind::kSucceeded;
  return r;
}

DownloadResult DownloadResult::failed(std::shared_ptr<DownloadTask> task,
                                      std::string error) {
  DownloadResult r;
  r.task = std::move(task);
  r.error = std::move(error);
  r.kind = Kind::kFailed;
  return r;
}

DownloadResult DownloadResult::cancelled(std::shared_ptr<DownloadTask> task) {
  DownloadResult r;
  r.task = std::move(task);
  r.error = "Download cancelled";
  r.kind = Kind::kCancelled;
  return r;
}

DownloadManager::DownloadManager(Transport& transport,
                                 ExtractorRegistry& extractors,
                                 ManagerConfig config, utils::Sleeper sleeper)
    : transport_(transport),
      extractors_(extractors),
      config_(std::move(config)),
      sleeper_(std::move(sleeper)),
      slots_(static_cast<size_t>(std::max(config_.maxConcurrent, 1))) {
  config_.maxConcurrent = std::max(config_.maxConcurrent, 1);
  config_.maxRetries = std::max(config_.maxRetries, 0);
}

std::vector<FileInfo> DownloadManager::extractFiles(
    const std::string& url, const std::optional<std::string>& password) {
  Extractor* extractor = extractors_.forUrl(url);
  if (extractor == nullptr) {
    throw ExtractorError("No extractor found for URL: " + url);
  }
  LOG(INFO) << "Extracting " << url << " with " << extractor->name();
  return extractor->extract(url, password);
}

fs::path DownloadManager::allocateOutputPath(const fs::path& directory,
                                             const std::string& filename) {
  std::string safe = utils::sanitizeFilename(filename);
  if (safe.empty()) safe = "download";

  if (!directory.empty()) fs::create_directories(directory);

  const fs::path base(safe);
  const std::string stem = base.stem().string();
  const std::string ext = base.extension().string();

  // 进程内串行化；O_EXCL 保证跨进程唯一
  std::lock_guard<std::mutex> lock(pathMutex_);
  for (int n = 0; n < kMaxNameCollisions; ++n) {
    std::string name = safe;
    if (n > 0) {
      std::string suffix = "_" + std::to_string(n) + ext;
      name = fitStem(stem, suffix.size()) + suffix;
    }
    fs::path candidate = directory / name;
    int fd = ::open(candidate.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC,
                    0644);
    if (fd >= 0) {
      ::close(fd);
      return candidate;
    }
    if (errno != EEXIST) {
      throw HaulError("Cannot create " + candidate.string() + ": " +
                      std::strerror(errno));
    }
  }
  throw HaulError("No free filename for " + safe + " in " + directory.string());
}

std::shared_ptr<DownloadTask> DownloadManager::createTask(
    const FileInfo& fileInfo, const std::optional<fs::path>& outputDir,
    const std::string& taskId) {
  fs::path dir = outputDir.value_or(config_.outputDir);
  if (!fileInfo.parentFolder.empty()) {
    std::string folder = utils::sanitizeFilename(fileInfo.parentFolder);
    if (!folder.empty()) dir /= folder;
  }

  auto task = std::make_shared<DownloadTask>();
  task->taskId = taskId.empty() ? DownloadTask::generateId() : taskId;
  task->fileInfo = fileInfo;
  task->outputPath = allocateOutputPath(dir, fileInfo.filename);
  task->maxRetries = config_.maxRetries;
  task->progress.total = fileInfo.size;

  {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    tasks_[task->taskId] = task;
  }
  LOG(INFO) << "Task " << task->taskId << ": " << fileInfo.filename << " -> "
            << task->outputPath;
  return task;
}

bool DownloadManager::backoff(const DownloadTask& task, int attempt) {
  auto delay = std::chrono::milliseconds(1000LL << std::min(attempt, 20));
  LOG(INFO) << "Retrying " << task.taskId << " in " << delay.count() / 1000
            << "s (attempt " << attempt + 2 << "/" << task.maxRetries + 1
            << ")";
  if (sleeper_) {
    sleeper_(delay);
    return task.cancelled();
  }
  if (task.cancelToken) return task.cancelToken->waitFor(delay);
  std::this_thread::sleep_for(delay);
  return false;
}

DownloadResult DownloadManager::downloadTask(
    const std::shared_ptr<DownloadTask>& task,
    const ProgressCallback& onProgress) {
  DownloadResult result;
  try {
    result = runAttempts(task, onProgress);
  } catch (const std::exception&) {
    forget(task);
    throw;
  }
  forget(task);
  return result;
}

DownloadResult DownloadManager::runAttempts(
    const std::shared_ptr<DownloadTask>& task,
    const ProgressCallback& onProgress) {
  FileDownloader downloader(transport_, config_.downloader, sleeper_);

  for (int attempt = 0; attempt <= task->maxRetries; ++attempt) {
    task->retries = attempt;
    TransferOutcome outcome;
    {
      utils::SemaphoreGuard slot(slots_);
      outcome = downloader.download(*task, onProgress);
    }

    switch (outcome) {
      case TransferOutcome::kCompleted:
        return DownloadResult::succeeded(task);
      case TransferOutcome::kCancelled:
        return DownloadResult::cancelled(task);
      case TransferOutcome::kFatal:
        return DownloadResult::failed(task, task->progress.error);
      case TransferOutcome::kFailed:
        break;
    }

    if (attempt < task->maxRetries) {
      if (task->cancelled() || backoff(*task, attempt)) {
        task->progress.status = DownloadStatus::kCancelled;
        notifyQuietly(*task, onProgress);
        return DownloadResult::cancelled(task);
      }
      task->progress.status = DownloadStatus::kPending;
      task->progress.error.clear();
    }
  }

  const std::string error = task->progress.error.empty()
                                ? std::string("Max retries exceeded")
                                : task->progress.error;
  LOG(ERROR) << "Task " << task->taskId << " failed after "
             << task->maxRetries + 1 << " attempts: " << error;
  return DownloadResult::failed(task, error);
}

std::vector<DownloadResult> DownloadManager::downloadTasks(
    const std::vector<std::shared_ptr<DownloadTask>>& tasks,
    const ProgressCallback& onProgress) {
  std::vector<DownloadResult> results(tasks.size());
  utils::TBBManager::GetInstance().ParallelFor<size_t>(
      "download", 0, tasks.size(),
      [&](size_t i) {
        try {
          results[i] = downloadTask(tasks[i], onProgress);
        } catch (const std::exception& e) {
          tasks[i]->progress.status = DownloadStatus::kFailed;
          tasks[i]->progress.error = e.what();
          results[i] = DownloadResult::failed(tasks[i], e.what());
        }
      },
      config_.maxConcurrent);
  return results;
}

std::vector<DownloadResult> DownloadManager::downloadUrl(
    const std::string& url, const std::optional<std::string>& password,
    const std::optional<fs::path>& outputDir,
    const ProgressCallback& onProgress) {
  std::vector<FileInfo> files = extractFiles(url, password);
  std::vector<std::shared_ptr<DownloadTask>> batch;
  batch.reserve(files.size());
  for (const auto& file : files) batch.push_back(createTask(file, outputDir));
  return downloadTasks(batch, onProgress);
}

std::vector<DownloadResult> DownloadManager::downloadUrls(
    const std::vector<std::string>& urls,
    const std::optional<std::string>& password,
    const std::optional<fs::path>& outputDir,
    const ProgressCallback& onProgress) {
  std::vector<DownloadResult> all;
  for (const auto& url : urls) {
    try {
      auto results = downloadUrl(url, password, outputDir, onProgress);
      all.insert(all.end(), results.begin(), results.end());
    } catch (const std::exception& e) {
      LOG(ERROR) << "Failed to download " << url << ": " << e.what();
      auto placeholder = std::make_shared<DownloadTask>();
      placeholder->taskId = DownloadTask::generateId();
      placeholder->fileInfo.url = url;
      placeholder->fileInfo.filename = "error";
      placeholder->progress.status = DownloadStatus::kFailed;
      placeholder->progress.error = e.what();
      all.push_back(DownloadResult::failed(placeholder, e.what()));
    }
  }
  return all;
}

bool DownloadManager::cancel(const std::string& taskId) {
  auto task = getTask(taskId);
  if (!task) return false;
  task->cancelToken->cancel();
  LOG(INFO) << "Cancel requested for " << taskId;
  return true;
}

void DownloadManager::cancelAll() {
  for (const auto& task : tasks()) task->cancelToken->cancel();
}

void DownloadManager::forget(const std::shared_ptr<DownloadTask>& task) {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  auto it = tasks_.find(task->taskId);
  if (it != tasks_.end() && it->second == task) tasks_.erase(it);
}

std::shared_ptr<DownloadTask> DownloadManager::getTask(
    const std::string& taskId) const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  auto it = tasks_.find(taskId);
  return it == tasks_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<DownloadTask>> DownloadManager::tasks() const {
  std::lock_guard<std::mutex> lock(tasksMutex_);
  std::vector<std::shared_ptr<DownloadTask>> out;
  out.reserve(tasks_.size());
  for (const auto& kv : tasks_) out.push_back(kv.second);
  return out;
}

}  // namespace haul
