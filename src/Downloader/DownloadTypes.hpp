#ifndef HAUL_DOWNLOADER_DOWNLOAD_TYPES_HPP_
#define HAUL_DOWNLOADER_DOWNLOAD_TYPES_HPP_

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "Transport/Transport.hpp"
#include "utils/cancel_token.hpp"

namespace haul {

enum class DownloadStatus {
  kPending,
  kExtracting,
  kDownloading,
  kPaused,
  kVerifying,
  kCompleted,
  kFailed,
  kCancelled,
};

const char* toString(DownloadStatus status);

// Describes one remote file as produced by an extractor. Not modified once
// handed to the manager.
struct FileInfo {
  std::string url;
  std::string filename;
  uint64_t size = 0;  // 0 = unknown
  std::string directUrl;
  Headers headers;
  Cookies cookies;
  std::string checksum;
  std::string checksumType;  // "md5", "sha256", ...
  std::string parentFolder;
  std::string extractorName;
  bool passwordProtected = false;

  // Raw AES key / IV bytes for encrypted hosts.
  std::string encryptionKey;
  std::string encryptionIv;
  bool encrypted = false;

  // 优先使用直链
  const std::string& downloadUrl() const {
    return directUrl.empty() ? url : directUrl;
  }
};

struct DownloadProgress {
  uint64_t downloaded = 0;
  uint64_t total = 0;  // 0 = unknown
  double speed = 0.0;  // bytes/s, smoothed
  double eta = 0.0;    // seconds
  DownloadStatus status = DownloadStatus::kPending;
  std::string error;

  double percentage() const;
};

// What progress callbacks see: a copy, never live task state.
struct ProgressEvent {
  std::string taskId;
  std::string filename;
  double percentage = 0.0;
  uint64_t downloaded = 0;
  uint64_t total = 0;
  double speed = 0.0;
  double eta = 0.0;
  std::string status;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct DownloadTask {
  std::string taskId;
  FileInfo fileInfo;
  std::filesystem::path outputPath;
  DownloadProgress progress;
  int retries = 0;
  int maxRetries = 3;
  std::shared_ptr<utils::CancelToken> cancelToken =
      std::make_shared<utils::CancelToken>();

  bool cancelled() const { return cancelToken && cancelToken->cancelled(); }
  ProgressEvent snapshot() const;

  // 8 lowercase hex characters.
  static std::string generateId();
};

}  // namespace haul

#endif  // HAUL_DOWNLOADER_DOWNLOAD_TYPES_HPP_
