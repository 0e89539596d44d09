#include "Downloader/DownloadTypes.hpp"

#include <algorithm>
#include <cstdio>
#include <random>

namespace haul {

const char* toString(DownloadStatus status) {
  switch (status) {
    case DownloadStatus::kPending:
      return "pending";
    case DownloadStatus::kExtracting:
      return "extracting";
    case DownloadStatus::kDownloading:
      return "downloading";
    case DownloadStatus::kPaused:
      return "paused";
    case DownloadStatus::kVerifying:
      return "verifying";
    case DownloadStatus::kCompleted:
      return "completed";
    case DownloadStatus::kFailed:
      return "failed";
    case DownloadStatus::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

double DownloadProgress::percentage() const {
  if (total == 0) return 0.0;
  return std::min(100.0, static_cast<double>(downloaded) /
                             static_cast<double>(total) * 100.0);
}

ProgressEvent DownloadTask::snapshot() const {
  ProgressEvent event;
  event.taskId = taskId;
  event.filename = fileInfo.filename;
  event.percentage = progress.percentage();
  event.downloaded = progress.downloaded;
  event.total = progress.total;
  event.speed = progress.speed;
  event.eta = progress.eta;
  event.status = toString(progress.status);
  return event;
}

std::string DownloadTask::generateId() {
  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist;
  char buf[9];
  std::snprintf(buf, sizeof(buf), "%08x", dist(rng));
  return std::string(buf);
}

}  // namespace haul
