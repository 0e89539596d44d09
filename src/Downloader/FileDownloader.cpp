#include "Downloader/FileDownloader.hpp"

#include <algorithm>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

#include "Crypto/Checksum.hpp"
#include "Crypto/CtrDecryptor.hpp"
#include "Downloader/SpeedEstimator.hpp"
#include "utils/errors.hpp"
#include "utils/logger.hpp"

namespace fs = std::filesystem;

namespace haul {

namespace {

std::string trimmed(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return std::string();
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

}  // namespace

FileDownloader::FileDownloader(Transport& transport, DownloaderConfig config,
                               utils::Sleeper sleeper)
    : transport_(transport),
      config_(std::move(config)),
      sleeper_(std::move(sleeper)) {
  config_.chunkSize = std::max<size_t>(config_.chunkSize, 1);
  config_.maxChunkRetries = std::max(config_.maxChunkRetries, 0);
}

std::string FileDownloader::checksumAlgorithm(const FileInfo& info) {
  if (!info.checksumType.empty()) return normalizeAlgorithm(info.checksumType);
  switch (trimmed(info.checksum).size()) {
    case 32:
      return "md5";
    case 40:
      return "sha1";
    case 64:
      return "sha256";
    case 128:
      return "sha512";
    default:
      return "";
  }
}

TransferOutcome FileDownloader::download(DownloadTask& task,
                                         const ProgressCallback& onProgress) {
  task.progress.error.clear();
  auto fail = [&](const std::string& message, TransferOutcome outcome) {
    task.progress.status = DownloadStatus::kFailed;
    task.progress.error = message;
    task.progress.speed = 0.0;
    task.progress.eta = 0.0;
    LOG(ERROR) << "[" << task.taskId << "] " << task.fileInfo.filename
               << " failed: " << message;
    notify(task, onProgress);
    return outcome;
  };

  try {
    return transfer(task, onProgress);
  } catch (const HttpStatusError& e) {
    return fail(e.what(), TransferOutcome::kFatal);
  } catch (const InsufficientDiskSpaceError& e) {
    return fail(e.what(), TransferOutcome::kFatal);
  } catch (const DecryptionError& e) {
    return fail(e.what(), TransferOutcome::kFatal);
  } catch (const std::exception& e) {
    return fail(e.what(), TransferOutcome::kFailed);
  }
}

ProbeResult FileDownloader::probeQuietly(const HttpRequest& request) {
  try {
    return transport_.probe(request);
  } catch (const HaulError& e) {
    // Some hosts reject HEAD outright; carry on without size or ranges.
    LOG(WARN) << "HEAD request failed for " << request.url << ": " << e.what();
    return ProbeResult();
  }
}

void FileDownloader::checkDiskSpace(const fs::path& path, uint64_t required) {
  if (required == 0) return;
  fs::path dir = path.parent_path();
  if (dir.empty()) dir = ".";
  std::error_code ec;
  fs::space_info info = fs::space(dir, ec);
  if (ec) {
    LOG(WARN) << "Cannot query free space of " << dir << ": " << ec.message();
    return;
  }
  if (info.available < required) {
    throw InsufficientDiskSpaceError(required, info.available);
  }
}

TransferOutcome FileDownloader::transfer(DownloadTask& task,
                                         const ProgressCallback& onProgress) {
  const FileInfo& info = task.fileInfo;
  DownloadProgress& progress = task.progress;
  const fs::path& path = task.outputPath;

  if (task.cancelled()) {
    progress.status = DownloadStatus::kCancelled;
    notify(task, onProgress);
    return TransferOutcome::kCancelled;
  }
  progress.status = DownloadStatus::kDownloading;

  HttpRequest request{info.downloadUrl(), info.headers, info.cookies};
  ProbeResult probe = probeQuietly(request);
  const bool ranges = probe.acceptRanges;
  uint64_t total = probe.contentLength > 0 ? probe.contentLength : info.size;

  if (path.has_parent_path()) fs::create_directories(path.parent_path());

  // 断点续传协商
  uint64_t offset = 0;
  std::error_code ec;
  if (config_.enableResume && ranges && fs::exists(path, ec)) {
    uint64_t existing = fs::file_size(path, ec);
    if (ec) existing = 0;
    if (total > 0 && existing > total) {
      LOG(WARN) << "Partial file " << path << " is larger than remote ("
                << existing << " > " << total << "), discarding";
      existing = 0;
    }
    offset = existing;
  } else if (fs::exists(path, ec) && fs::file_size(path, ec) > 0) {
    LOG(INFO) << "Restarting " << path << " from 0"
              << (ranges ? "" : " (server does not support ranges)");
  }
  progress.total = total;
  progress.downloaded = offset;

  if (offset > 0 && offset == total) {
    LOG(INFO) << "[" << task.taskId << "] " << path
              << " already complete, verifying";
    return complete(task, onProgress);
  }

  checkDiskSpace(path, total > offset ? total - offset : 0);

  std::ofstream out(path, std::ios::binary | (offset > 0 ? std::ios::app
                                                          : std::ios::trunc));
  if (!out) throw HaulError("Cannot open output file: " + path.string());

  std::unique_ptr<CtrDecryptor> decryptor;
  if (info.encrypted) {
    decryptor = std::make_unique<CtrDecryptor>(info.encryptionKey,
                                               info.encryptionIv, offset);
  }

  if (offset > 0) {
    LOG(INFO) << "[" << task.taskId << "] Resuming " << info.filename
              << " at byte " << offset;
  }

  SpeedEstimator speed;
  speed.start(offset);
  auto throttleStart = std::chrono::steady_clock::now();
  uint64_t throttleBase = offset;

  Pacer chunkPacer(config_.chunkPacer);
  int chunkAttempt = 0;
  bool cancelled = false;
  std::vector<char> buffer;

  for (;;) {
    StreamOptions options;
    options.chunkSize = config_.chunkSize;
    options.chunkTimeout = config_.chunkTimeout;
    if (ranges && progress.downloaded > 0) {
      options.rangeStart = progress.downloaded;
    }
    const bool rangeSent = options.rangeStart.has_value();

    auto onStart = [&](const StreamStart& start) {
      if (rangeSent && start.status != 206) {
        LOG(WARN) << "Server ignored Range for " << info.filename
                  << " (status " << start.status << "), restarting from 0";
        out.close();
        out.open(path, std::ios::binary | std::ios::trunc);
        if (!out) throw HaulError("Cannot reopen output file: " + path.string());
        progress.downloaded = 0;
        if (decryptor) {
          decryptor = std::make_unique<CtrDecryptor>(info.encryptionKey,
                                                     info.encryptionIv, 0);
        }
        speed.reset();
        speed.start(0);
        throttleStart = std::chrono::steady_clock::now();
        throttleBase = 0;
      }
      if (progress.total == 0 && start.contentLength > 0) {
        progress.total = progress.downloaded + start.contentLength;
        checkDiskSpace(path, start.contentLength);
      }
      progress.status = DownloadStatus::kDownloading;
    };

    auto onChunk = [&](const StreamChunk& chunk) {
      buffer.assign(chunk.data, chunk.data + chunk.size);
      if (decryptor) decryptor->update(buffer.data(), buffer.size());
      out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      if (!out) throw HaulError("Write failed: " + path.string());

      progress.downloaded += chunk.size;
      if (progress.total > 0 && progress.downloaded > progress.total) {
        progress.total = progress.downloaded;
      }
      chunkAttempt = 0;
      chunkPacer.reset();

      if (speed.update(progress.downloaded)) {
        progress.speed = speed.speed().value_or(0.0);
        progress.eta = speed.eta(progress.downloaded, progress.total);
      }

      if (config_.speedLimit > 0) {
        double elapsed = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - throttleStart)
                             .count();
        double due = static_cast<double>(progress.downloaded - throttleBase) /
                     static_cast<double>(config_.speedLimit);
        if (due > elapsed) {
          wait(task, std::chrono::milliseconds(
                         static_cast<int64_t>((due - elapsed) * 1000)));
        }
      }

      notify(task, onProgress);
      if (task.cancelled()) {
        cancelled = true;
        return false;
      }
      return true;
    };

    std::string interruption;
    try {
      transport_.downloadStream(request, options, onStart, onChunk);
      break;
    } catch (const ChunkTimeoutError& e) {
      interruption = e.what();
    } catch (const StreamInterruptedError& e) {
      interruption = e.what();
    } catch (const HttpStatusError& e) {
      // A range starting at EOF of a file whose size we never learned.
      if (e.status() == 416 && rangeSent && progress.total == 0) {
        LOG(INFO) << "Range not satisfiable at " << progress.downloaded
                  << ", treating " << path << " as complete";
        break;
      }
      if (e.status() == 416 && rangeSent) {
        // 本地数据与远端大小不符，不能留作续传
        LOG(WARN) << "Range not satisfiable at " << progress.downloaded
                  << " of " << progress.total << " bytes; discarding partial "
                  << path;
        out.close();
        std::ofstream truncate(path, std::ios::binary | std::ios::trunc);
        progress.downloaded = 0;
      }
      throw;
    }

    if (task.cancelled()) {
      cancelled = true;
      break;
    }
    if (!ranges) {
      throw HaulError("Stream interrupted and server does not support resume: " +
                      interruption);
    }
    if (chunkAttempt >= config_.maxChunkRetries) {
      throw HaulError("Chunk retries exhausted: " + interruption);
    }
    out.flush();
    progress.status = DownloadStatus::kPaused;
    notify(task, onProgress);

    auto delay = chunkPacer.backoff(chunkAttempt++);
    LOG(WARN) << "[" << task.taskId << "] " << interruption << "; resuming at "
              << progress.downloaded << " in " << delay.count() << "ms ("
              << chunkAttempt << "/" << config_.maxChunkRetries << ")";
    if (wait(task, delay)) {
      cancelled = true;
      break;
    }
  }

  out.close();
  if (cancelled || task.cancelled()) {
    progress.status = DownloadStatus::kCancelled;
    progress.speed = 0.0;
    progress.eta = 0.0;
    LOG(INFO) << "[" << task.taskId << "] " << info.filename << " cancelled at "
              << progress.downloaded << " bytes";
    notify(task, onProgress);
    return TransferOutcome::kCancelled;
  }
  if (!out) throw HaulError("Failed to flush " + path.string());

  if (progress.total > 0 && progress.downloaded < progress.total) {
    throw HaulError("Incomplete download: received " +
                    std::to_string(progress.downloaded) + " of " +
                    std::to_string(progress.total) + " bytes");
  }
  if (progress.total == 0) progress.total = progress.downloaded;
  return complete(task, onProgress);
}

TransferOutcome FileDownloader::complete(DownloadTask& task,
                                         const ProgressCallback& onProgress) {
  const FileInfo& info = task.fileInfo;
  DownloadProgress& progress = task.progress;

  if (config_.verifyChecksum && !trimmed(info.checksum).empty()) {
    progress.status = DownloadStatus::kVerifying;
    notify(task, onProgress);

    const std::string algorithm = checksumAlgorithm(info);
    std::optional<std::string> actual = fileDigest(task.outputPath, algorithm);
    const std::string expected = trimmed(info.checksum);
    if (!actual) {
      LOG(WARN) << "Cannot verify " << info.filename << ": unsupported algorithm '"
                << info.checksumType << "'";
    } else if (!digestEquals(*actual, expected)) {
      // 截断，避免外层重试在损坏数据上续传
      std::ofstream truncate(task.outputPath,
                             std::ios::binary | std::ios::trunc);
      progress.downloaded = 0;
      throw ChecksumMismatchError(expected, *actual, algorithm);
    } else {
      LOG(DEBUG) << info.filename << " " << algorithm << " OK";
    }
  }

  progress.status = DownloadStatus::kCompleted;
  progress.eta = 0.0;
  LOG(INFO) << "[" << task.taskId << "] Completed " << task.outputPath << " ("
            << progress.downloaded << " bytes)";
  notify(task, onProgress);
  return TransferOutcome::kCompleted;
}

void FileDownloader::notify(const DownloadTask& task,
                            const ProgressCallback& onProgress) {
  if (!onProgress) return;
  try {
    onProgress(task.snapshot());
  } catch (const std::exception& e) {
    LOG(WARN) << "Progress callback failed for " << task.taskId << ": "
              << e.what();
  }
}

bool FileDownloader::wait(const DownloadTask& task,
                          std::chrono::milliseconds delay) {
  if (delay.count() <= 0) return task.cancelled();
  if (sleeper_) {
    sleeper_(delay);
    return task.cancelled();
  }
  if (task.cancelToken) return task.cancelToken->waitFor(delay);
  std::this_thread::sleep_for(delay);
  return false;
}

}  // namespace haul
