#include "utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>
#include <string>

namespace haul {
namespace utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
std::string log_dir = "logs";
std::string log_file_path;
size_t max_file_size = 10 * 1024 * 1024;  // 10MB
size_t max_backup_files = 3;
bool console_output = true;
bool file_output = true;
std::atomic<int> min_level{static_cast<int>(LogLevel::INFO)};

const char* getLevelStr(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARN:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

std::string getCurrentTime() {
  auto now = std::chrono::system_clock::now();
  auto t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0')
      << std::setw(3) << ms.count();
  return oss.str();
}

// __FILE__ 是完整路径，只保留文件名
const char* baseName(const char* path) {
  const char* base = path;
  for (const char* p = path; *p; ++p) {
    if (*p == '/' || *p == '\\') base = p + 1;
  }
  return base;
}

void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty() || !std::filesystem::exists(log_file_path, ec) ||
      std::filesystem::file_size(log_file_path, ec) < max_file_size) {
    return;
  }
  log_file.close();
  // Rotate old logs
  for (int i = static_cast<int>(max_backup_files) - 1; i >= 0; --i) {
    std::string old_name =
        log_file_path + (i == 0 ? "" : ("." + std::to_string(i)));
    std::string new_name = log_file_path + "." + std::to_string(i + 1);
    if (std::filesystem::exists(old_name, ec)) {
      std::filesystem::rename(old_name, new_name, ec);
    }
  }
  log_file.open(log_file_path, std::ios::trunc);
}

void openLogFile() {
  if (!file_output) return;
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  log_file_path = log_dir + "/haul.log";
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
    file_output = false;
  }
}

const std::regex& secretParamPattern() {
  static const std::regex re(
      R"(([?&;](?:[A-Za-z0-9_\-]*(?:token|key|password|passwd|secret|auth|sig|signature|session)[A-Za-z0-9_\-]*)=)[^&#\s"']+)",
      std::regex::icase);
  return re;
}

const std::regex& secretHeaderPattern() {
  static const std::regex re(
      R"(((?:authorization|proxy-authorization|cookie|set-cookie)\s*[:=]\s*)[^\r\n]+)",
      std::regex::icase);
  return re;
}
}  // namespace

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) log_file.close();
  file_output = !config.logFilePath.empty();
  log_dir = config.logFilePath;
  max_file_size = config.maxFileSize ? config.maxFileSize : 10 * 1024 * 1024;
  max_backup_files = config.maxBackupFiles ? config.maxBackupFiles : 3;
  console_output = config.console;
  min_level.store(static_cast<int>(config.minLevel));
  openLogFile();
}

void Logger::setLevel(LogLevel level) {
  min_level.store(static_cast<int>(level));
}

bool Logger::enabled(LogLevel level) {
  return static_cast<int>(level) >= min_level.load();
}

LogLevel Logger::parseLevel(const std::string& name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL" || upper == "CRITICAL") return LogLevel::FATAL;
  return LogLevel::INFO;
}

std::string Logger::redact(const std::string& message) {
  std::string out =
      std::regex_replace(message, secretParamPattern(), "$1***");
  return std::regex_replace(out, secretHeaderPattern(), "$1***");
}

Logger::LogStream::LogStream(LogLevel level, const char* file, const char* func,
                             int line)
    : level_(level), enabled_(Logger::enabled(level)), oss_() {
  if (!enabled_) return;
  oss_ << "[" << getLevelStr(level) << "] " << getCurrentTime() << " "
       << baseName(file) << ":" << line << " " << func << ": ";
}

Logger::LogStream::~LogStream() {
  if (!enabled_) return;
  std::string msg = Logger::redact(oss_.str());
  msg += "\n";
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (file_output && !log_file.is_open()) openLogFile();
    rotateLogsIfNeeded();
    if (console_output) std::cerr << msg;
    if (log_file.is_open()) log_file << msg, log_file.flush();
  }
}

}  // namespace utils
}  // namespace haul
