#ifndef HAUL_DOWNLOADER_FILE_DOWNLOADER_HPP_
#define HAUL_DOWNLOADER_FILE_DOWNLOADER_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "Downloader/DownloadTypes.hpp"
#include "Transport/Pacer.hpp"
#include "Transport/Transport.hpp"
#include "utils/sleeper.hpp"

namespace haul {

struct DownloaderConfig {
  size_t chunkSize = 1024 * 1024;
  bool enableResume = true;
  uint64_t speedLimit = 0;  // bytes/s, 0 = unlimited
  bool verifyChecksum = true;
  std::chrono::milliseconds chunkTimeout{60000};
  int maxChunkRetries = 3;
  // Backoff between re-requests after a stalled or broken stream.
  PacerConfig chunkPacer;
};

enum class TransferOutcome {
  kCompleted,
  kFailed,     // worth an outer retry
  kFatal,      // retrying cannot help: 4xx, no disk space, bad key
  kCancelled,
};

/**
 * @brief Transfers one FileInfo to one output path.
 *
 * Steps: HEAD metadata, resume negotiation, disk-space check, chunked write with
 * optional AES-CTR decryption, speed/ETA smoothing, checksum verification.
 * Stalled or broken streams are re-requested from the current offset up to
 * maxChunkRetries times before the attempt is given up.
 *
 * download() never throws for transfer problems: the outcome and
 * task.progress (status, error) describe what happened.
 */
class FileDownloader {
 public:
  FileDownloader(Transport& transport, DownloaderConfig config = {},
                 utils::Sleeper sleeper = nullptr);

  TransferOutcome download(DownloadTask& task,
                           const ProgressCallback& onProgress = nullptr);

  const DownloaderConfig& config() const { return config_; }

  // Guesses the digest from its hex length when the extractor gave none.
  static std::string checksumAlgorithm(const FileInfo& info);

 private:
  TransferOutcome transfer(DownloadTask& task,
                           const ProgressCallback& onProgress);
  ProbeResult probeQuietly(const HttpRequest& request);
  void checkDiskSpace(const std::filesystem::path& path, uint64_t required);
  TransferOutcome complete(DownloadTask& task,
                           const ProgressCallback& onProgress);
  void notify(const DownloadTask& task, const ProgressCallback& onProgress);
  // Returns true if the task was cancelled while waiting.
  bool wait(const DownloadTask& task, std::chrono::milliseconds delay);

  Transport& transport_;
  DownloaderConfig config_;
  utils::Sleeper sleeper_;
};

}  // namespace haul

#endif  // HAUL_DOWNLOADER_FILE_DOWNLOADER_HPP_
