#include "Service/Config.hpp"

#include <algorithm>

#include "Storage/TaskRegistry.hpp"
#include "utils/flags.hpp"

namespace haul {

AppConfig configFromFlags() {
  AppConfig config;

  config.transport.requestsPerSecond = FLAGS_requests_per_second;
  config.transport.maxRetries = std::max(FLAGS_max_retries, 0);
  config.transport.connectTimeout = std::chrono::seconds(FLAGS_connect_timeout);
  config.transport.readTimeout = std::chrono::seconds(FLAGS_read_timeout);
  config.transport.totalTimeout = std::chrono::seconds(FLAGS_total_timeout);
  config.transport.proxy = FLAGS_proxy;

  DownloaderConfig& dl = config.manager.downloader;
  dl.chunkSize = static_cast<size_t>(std::max<uint64_t>(FLAGS_chunk_size, 1));
  dl.enableResume = FLAGS_enable_resume;
  dl.speedLimit = FLAGS_speed_limit;
  dl.verifyChecksum = FLAGS_verify_checksum;
  dl.chunkTimeout = std::chrono::seconds(std::max(FLAGS_chunk_timeout, 0));
  dl.maxChunkRetries = std::max(FLAGS_max_chunk_retries, 0);

  config.manager.outputDir = FLAGS_output_dir;
  config.manager.maxConcurrent = std::max(FLAGS_max_concurrent, 1);
  config.manager.maxRetries = std::max(FLAGS_max_retries, 0);

  config.taskDb = FLAGS_task_db.empty() ? TaskRegistry::defaultPath()
                                        : std::filesystem::path(FLAGS_task_db);
  if (!FLAGS_password.empty()) config.password = FLAGS_password;
  config.skipCompleted = FLAGS_skip_completed;
  config.historyLimit = static_cast<size_t>(std::max(FLAGS_history_limit, 1));
  config.cancelPollInterval =
      std::chrono::milliseconds(std::max(FLAGS_cancel_poll_ms, 50));

  config.log.logFilePath = FLAGS_log_dir;
  config.log.maxFileSize = static_cast<size_t>(FLAGS_log_max_file_size);
  config.log.maxBackupFiles = static_cast<size_t>(FLAGS_log_max_backups);
  config.log.minLevel = utils::Logger::parseLevel(FLAGS_log_level);
  return config;
}

}  // namespace haul
