#include "logger.hpp"

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

namespace utils {

namespace {
std::mutex log_mutex;
std::ofstream log_file;
std::string log_dir = "logs";
std::string log_file_name = "dataset_fetcher.log";
std::string log_file_path;
size_t max_file_size = 10 * 1024 * 1024;  // 10MB
size_t max_backup_files = 3;
LogLevel min_level = LogLevel::DEBUG;
LogLevel console_level = LogLevel::WARN;

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

void rotateLogsIfNeeded() {
  std::error_code ec;
  if (log_file_path.empty() || !std::filesystem::exists(log_file_path, ec) ||
      std::filesystem::file_size(log_file_path, ec) < max_file_size || ec) {
    return;
  }
  log_file.close();
  // Rotate old logs, the oldest backup falls off the end
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
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  log_file_path = log_dir + "/" + log_file_name;
  log_file.open(log_file_path, std::ios::app);
  if (!log_file.is_open()) {
    std::cerr << "Failed to open log file: " << log_file_path << std::endl;
  }
}
}  // namespace

void Logger::initialize(const LogConfig& config) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file.is_open()) log_file.close();
  log_dir = config.logFilePath.empty() ? "logs" : config.logFilePath;
  log_file_name = config.logFileName.empty() ? "dataset_fetcher.log"
                                             : config.logFileName;
  max_file_size = config.maxFileSize ? config.maxFileSize : 10 * 1024 * 1024;
  max_backup_files = config.maxBackupFiles ? config.maxBackupFiles : 3;
  min_level = config.minLevel;
  console_level = config.consoleLevel;
  openLogFile();
}

Logger::LogStream::LogStream(LogLevel level, const char* file, const char* func,
                             int line)
    : level_(level), oss_() {
  oss_ << "[" << getLevelStr(level) << "] " << getCurrentTime() << " "
       << std::filesystem::path(file).filename().string() << ":" << line << " "
       << func << ": ";
}

Logger::LogStream::~LogStream() {
  oss_ << "\n";
  std::string msg = oss_.str();
  {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level_ < min_level) return;
    if (!log_file.is_open()) openLogFile();
    rotateLogsIfNeeded();
    // stdout 留给进度行，控制台只回显 WARN 以上
    if (level_ >= console_level) std::cerr << "\n" << msg << std::flush;
    if (log_file.is_open()) log_file << msg, log_file.flush();
  }
}

}  // namespace utils
