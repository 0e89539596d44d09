#include <gflags/gflags.h>

#include <chrono>
#include <cstdio>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Downloader/DownloadManager.hpp"
#include "Extractors/DirectLinkExtractor.hpp"
#include "Extractors/ExtractorRegistry.hpp"
#include "Service/Config.hpp"
#include "Service/DownloadService.hpp"
#include "Storage/TaskRegistry.hpp"
#include "Transport/CurlTransport.hpp"
#include "utils/errors.hpp"
#include "utils/flags.hpp"
#include "utils/logger.hpp"
#include "utils/tbb_manager.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

const char* kUsage =
    "haul <command> [args] [--flags]\n"
    "  get <url>...        download every file behind the URLs\n"
    "  info <url>          list the files behind a URL\n"
    "  status <task-id>    show a task from the task store\n"
    "  list                list active tasks\n"
    "  cancel <task-id>    cancel a task (also one running in another process)\n"
    "  history [status]    list recent tasks, optionally only one status\n"
    "  delete <task-id>    remove a finished task from the task store\n"
    "  prune <days>        remove finished tasks idle for more than <days>";

std::string humanBytes(double bytes) {
  static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  int unit = 0;
  while (bytes >= 1024.0 && unit < 4) {
    bytes /= 1024.0;
    ++unit;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", bytes, kUnits[unit]);
  return buf;
}

void printTask(const haul::TaskInfo& info) {
  std::cout << info.taskId << "  " << haul::toString(info.status) << "  ";
  std::printf("%5.1f%%  ", info.progress.percentage);
  std::cout << humanBytes(static_cast<double>(info.progress.downloaded)) << "/"
            << humanBytes(static_cast<double>(info.progress.total)) << "  "
            << info.url;
  if (info.error) std::cout << "  error: " << *info.error;
  std::cout << std::endl;
}

// 每个文件每 10% 打印一次，状态变化时也打印
class ProgressPrinter {
 public:
  void operator()(const haul::ProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& last = last_[event.taskId];
    int bucket = static_cast<int>(event.percentage / 10.0);
    if (bucket == last.first && event.status == last.second) return;
    last = {bucket, event.status};
    std::fprintf(stderr, "[%s] %s %5.1f%% %s/s %s\n", event.taskId.c_str(),
                 event.filename.c_str(), event.percentage,
                 humanBytes(event.speed).c_str(), event.status.c_str());
  }

 private:
  std::mutex mutex_;
  std::map<std::string, std::pair<int, std::string>> last_;
};

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc < 2) {
    std::cerr << "Usage: " << kUsage << std::endl;
    return kExitUsage;
  }
  const std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  haul::AppConfig config = haul::configFromFlags();
  haul::utils::Logger::initialize(config.log);

  try {
    haul::CurlTransport transport(config.transport);
    haul::ExtractorRegistry extractors;
    extractors.add(std::make_unique<haul::DirectLinkExtractor>(transport));

    haul::DownloadManager manager(transport, extractors, config.manager);
    haul::TaskRegistry registry(config.taskDb);
    registry.connect();
    haul::DownloadService service(manager, registry,
                                  config.cancelPollInterval);

    if (command == "get") {
      if (args.empty()) {
        std::cerr << "Usage: haul get <url>..." << std::endl;
        return kExitUsage;
      }
      service.start();
      ProgressPrinter printer;
      int exitCode = kExitOk;
      for (const auto& url : args) {
        if (config.skipCompleted && service.alreadyDownloaded(url)) {
          std::cout << "skip " << url
                    << " (already downloaded; --noskip_completed to fetch again)"
                    << std::endl;
          continue;
        }
        std::string taskId = service.createTask(url, config.manager.outputDir);
        std::cout << "task " << taskId << " " << url << std::endl;
        try {
          auto results =
              service.run(taskId, url, config.manager.outputDir,
                          config.password, std::ref(printer));
          for (const auto& r : results) {
            if (r.success) {
              std::cout << "  ok      " << r.task->outputPath.string()
                        << std::endl;
            } else {
              std::cout << "  " << (r.kind == haul::DownloadResult::Kind::kCancelled
                                        ? "cancel  "
                                        : "failed  ")
                        << r.task->fileInfo.filename << ": " << r.error
                        << std::endl;
              exitCode = kExitFailure;
            }
          }
        } catch (const haul::HaulError& e) {
          std::cerr << "  error   " << url << ": " << e.what() << std::endl;
          exitCode = kExitFailure;
        } catch (const std::exception& e) {
          // 文件系统等非预期错误只影响当前 URL
          LOG(ERROR) << "Unexpected error for " << url << ": " << e.what();
          std::cerr << "  error   " << url << ": " << e.what() << std::endl;
          exitCode = kExitFailure;
        }
      }
      service.stop();
      haul::utils::TBBManager::GetInstance().Release();
      return exitCode;
    }

    if (command == "info") {
      if (args.size() != 1) {
        std::cerr << "Usage: haul info <url>" << std::endl;
        return kExitUsage;
      }
      for (const auto& file : service.listFiles(args[0], config.password)) {
        std::cout << file.filename << "  "
                  << (file.size ? humanBytes(static_cast<double>(file.size))
                                : std::string("?"))
                  << "  " << file.downloadUrl() << std::endl;
      }
      return kExitOk;
    }

    if (command == "status") {
      if (args.size() != 1) {
        std::cerr << "Usage: haul status <task-id>" << std::endl;
        return kExitUsage;
      }
      auto info = service.getStatus(args[0]);
      if (!info) {
        std::cerr << "No such task: " << args[0] << std::endl;
        return kExitFailure;
      }
      printTask(*info);
      return kExitOk;
    }

    if (command == "list") {
      for (const auto& info : service.listActive()) printTask(info);
      return kExitOk;
    }

    if (command == "cancel") {
      if (args.size() != 1) {
        std::cerr << "Usage: haul cancel <task-id>" << std::endl;
        return kExitUsage;
      }
      if (!service.cancel(args[0])) {
        std::cerr << "No such task: " << args[0] << std::endl;
        return kExitFailure;
      }
      std::cout << "cancelled " << args[0] << std::endl;
      return kExitOk;
    }

    if (command == "history") {
      if (args.size() > 1) {
        std::cerr << "Usage: haul history [status]" << std::endl;
        return kExitUsage;
      }
      std::optional<haul::TaskStatus> status;
      if (!args.empty()) {
        status = haul::parseTaskStatus(args[0]);
        if (!status) {
          std::cerr << "Unknown status '" << args[0] << "'" << std::endl;
          return kExitUsage;
        }
      }
      for (const auto& info : service.history(status, config.historyLimit)) {
        printTask(info);
      }
      return kExitOk;
    }

    if (command == "delete") {
      if (args.size() != 1) {
        std::cerr << "Usage: haul delete <task-id>" << std::endl;
        return kExitUsage;
      }
      if (!service.deleteTask(args[0])) {
        std::cerr << "No such task: " << args[0] << std::endl;
        return kExitFailure;
      }
      std::cout << "deleted " << args[0] << std::endl;
      return kExitOk;
    }

    if (command == "prune") {
      int days = -1;
      if (args.size() == 1) {
        try {
          days = std::stoi(args[0]);
        } catch (const std::exception&) {
          days = -1;
        }
      }
      if (days < 0) {
        std::cerr << "Usage: haul prune <days>" << std::endl;
        return kExitUsage;
      }
      size_t removed = service.prune(std::chrono::hours(24 * days));
      std::cout << "pruned " << removed << " tasks" << std::endl;
      return kExitOk;
    }

    std::cerr << "Unknown command '" << command << "'\nUsage: " << kUsage
              << std::endl;
    return kExitUsage;
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    std::cerr << "error: " << e.what() << std::endl;
    return kExitFailure;
  }
}
