#ifndef HAUL_DOWNLOADER_DOWNLOAD_MANAGER_HPP_
#define HAUL_DOWNLOADER_DOWNLOAD_MANAGER_HPP_

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Downloader/DownloadTypes.hpp"
#include "Downloader/FileDownloader.hpp"
#include "Extractors/ExtractorRegistry.hpp"
#include "Transport/Transport.hpp"
#include "utils/semaphore.hpp"
#include "utils/sleeper.hpp"

namespace haul {

struct ManagerConfig {
  std::filesystem::path outputDir = "downloads";
  int maxConcurrent = 3;
  int maxRetries = 3;
  DownloaderConfig downloader;
};

struct DownloadResult {
  enum class Kind { kSucceeded, kFailed, kCancelled };

  std::shared_ptr<DownloadTask> task;
  bool success = false;
  std::string error;
  Kind kind = Kind::kFailed;

  static DownloadResult succeeded(std::shared_ptr<DownloadTask> task);
  static DownloadResult failed(std::shared_ptr<DownloadTask> task,
                               std::string error);
  static DownloadResult cancelled(std::shared_ptr<DownloadTask> task);
};

/**
 * @brief Runs many FileDownloader attempts under one concurrency bound.
 *
 * Every attempt holds a semaphore slot; the slot is released during the
 * 2^n second back-off between attempts. Output paths are reserved on disk
 * with O_CREAT|O_EXCL, so two tasks never share a file even across
 * processes.
 */
class DownloadManager {
 public:
  DownloadManager(Transport& transport, ExtractorRegistry& extractors,
                  ManagerConfig config = {}, utils::Sleeper sleeper = nullptr);

  // Throws ExtractorError when no extractor handles the URL; extractor
  // errors propagate unchanged.
  std::vector<FileInfo> extractFiles(
      const std::string& url,
      const std::optional<std::string>& password = std::nullopt);

  std::shared_ptr<DownloadTask> createTask(
      const FileInfo& fileInfo,
      const std::optional<std::filesystem::path>& outputDir = std::nullopt,
      const std::string& taskId = "");

  DownloadResult downloadTask(const std::shared_ptr<DownloadTask>& task,
                              const ProgressCallback& onProgress = nullptr);

  // Downloads the given tasks in parallel; results keep the input order.
  std::vector<DownloadResult> downloadTasks(
      const std::vector<std::shared_ptr<DownloadTask>>& tasks,
      const ProgressCallback& onProgress = nullptr);

  std::vector<DownloadResult> downloadUrl(
      const std::string& url,
      const std::optional<std::string>& password = std::nullopt,
      const std::optional<std::filesystem::path>& outputDir = std::nullopt,
      const ProgressCallback& onProgress = nullptr);

  // One failing URL becomes a failed result; the others still run.
  std::vector<DownloadResult> downloadUrls(
      const std::vector<std::string>& urls,
      const std::optional<std::string>& password = std::nullopt,
      const std::optional<std::filesystem::path>& outputDir = std::nullopt,
      const ProgressCallback& onProgress = nullptr);

  bool cancel(const std::string& taskId);
  void cancelAll();

  // Only tasks that have not yet reported a terminal result.
  std::shared_ptr<DownloadTask> getTask(const std::string& taskId) const;
  std::vector<std::shared_ptr<DownloadTask>> tasks() const;

  const ManagerConfig& config() const { return config_; }
  size_t availableSlots() const { return slots_.available(); }

  // Sanitizes `filename` and creates the first free one of name.ext,
  // name_1.ext, name_2.ext... in `directory`.
  std::filesystem::path allocateOutputPath(
      const std::filesystem::path& directory, const std::string& filename);

 private:
  DownloadResult runAttempts(const std::shared_ptr<DownloadTask>& task,
                             const ProgressCallback& onProgress);
  bool backoff(const DownloadTask& task, int attempt);
  void forget(const std::shared_ptr<DownloadTask>& task);

  Transport& transport_;
  ExtractorRegistry& extractors_;
  ManagerConfig config_;
  utils::Sleeper sleeper_;
  utils::Semaphore slots_;

  std::mutex pathMutex_;
  mutable std::mutex tasksMutex_;
  std::map<std::string, std::shared_ptr<DownloadTask>> tasks_;
};

}  // namespace haul

#endif  // HAUL_DOWNLOADER_DOWNLOAD_MANAGER_HPP_
