#include "common/logger.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

namespace {
  const char* LevelName(LogLevel l) {
    switch (l) {
      case LogLevel::DEBUG: return "DEBUG";
      case LogLevel::INFO: return "INFO";
      case LogLevel::WARNING: return "WARN";
      case LogLevel::ERROR: return "ERROR";
      case LogLevel::CRITICAL: return "CRIT";
    }
    return "UNK";
  }

  const char* BaseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    const char* backslash = std::strrchr(path, '\\');
    const char* last = slash;
    if (backslash && (!last || backslash > last)) last = backslash;
    return last ? last + 1 : path;
  }

  // 2024-05-01T12:34:56.789Z
  std::string UtcTimestamp(const std::chrono::system_clock::time_point& tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    std::ostringstream oss;
    oss << buf << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
  }

  std::string Format(const LogEntry& e) {
    std::ostringstream oss;
    oss << UtcTimestamp(e.timestamp) << " [" << LevelName(e.level) << "]"
        << " (" << e.thread_id << ") " << BaseName(e.file) << ":" << e.line << " - "
        << e.message << '\n';
    return oss.str();
  }
}

LogLevel ParseLogLevel(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info") return LogLevel::INFO;
  if (s == "warn" || s == "warning") return LogLevel::WARNING;
  if (s == "error") return LogLevel::ERROR;
  if (s == "critical" || s == "crit") return LogLevel::CRITICAL;
  throw ConfigError("unknown log level: " + name);
}

void Logger::Initialize(const std::string& path, LogLevel min_level, bool echo_stderr) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) return;
  std::unique_ptr<Logger> logger(new Logger());
  logger->min_level_ = min_level;
  logger->echo_stderr_ = echo_stderr;
  logger->log_file_.open(path, std::ios::out | std::ios::app);
  if (!logger->log_file_.is_open()) std::cerr << "logger: cannot open " << path << ", logging to stderr" << std::endl;
  logger->worker_ = std::thread(&Logger::Run, logger.get());
  instance_ = std::move(logger);
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> logger;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    logger = std::move(instance_);
  }
  if (logger) logger->Stop();
}

Logger::~Logger() { Stop(); }

void Logger::Stop() {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  if (log_file_.is_open()) log_file_.close();
}

void Logger::Run() {
  std::vector<LogEntry> batch;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      cv_.wait(lock, [&]{ return !pending_.empty() || stopping_; });
      if (pending_.empty() && stopping_) return;
      batch.swap(pending_);
    }
    Write(batch);
    batch.clear();
  }
}

void Logger::Write(const std::vector<LogEntry>& batch) {
  for (const auto& e : batch) {
    std::string line = Format(e);
    if (log_file_.is_open()) log_file_ << line;
    else std::cerr << line;
    if (echo_stderr_ && log_file_.is_open() && e.level >= LogLevel::WARNING) std::cerr << line;
  }
  if (log_file_.is_open()) log_file_.flush();
}

bool Logger::IsEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return instance_ && level >= instance_->min_level_;
}

void Logger::Log(LogLevel level, const std::string& message, const char* file, int line) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_ || level < instance_->min_level_) return;
  {
    std::lock_guard<std::mutex> qlock(instance_->queue_mutex_);
    instance_->pending_.push_back(LogEntry{std::chrono::system_clock::now(), level, message, file, line, std::this_thread::get_id()});
  }
  instance_->cv_.notify_one();
}
