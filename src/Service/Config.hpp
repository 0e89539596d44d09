#ifndef HAUL_SERVICE_CONFIG_HPP_
#define HAUL_SERVICE_CONFIG_HPP_

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "Downloader/DownloadManager.hpp"
#include "Downloader/FileDownloader.hpp"
#include "Transport/CurlTransport.hpp"
#include "utils/logger.hpp"

namespace haul {

struct AppConfig {
  TransportConfig transport;
  ManagerConfig manager;  // carries the DownloaderConfig
  std::filesystem::path taskDb;
  std::optional<std::string> password;
  bool skipCompleted = true;
  size_t historyLimit = 50;
  std::chrono::milliseconds cancelPollInterval{1000};
  utils::LogConfig log;
};

// Reads the --flags (and --flagfile) values into typed configuration.
AppConfig configFromFlags();

}  // namespace haul

#endif  // HAUL_SERVICE_CONFIG_HPP_
