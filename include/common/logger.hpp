#pragma once
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// Accepts debug/info/warn/warning/error/critical (any case). Throws ConfigError otherwise.
LogLevel ParseLogLevel(const std::string& name);

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  const char* file;
  int line;
  std::thread::id thread_id;
};

// Process-wide asynchronous logger. Callers enqueue; one worker thread drains the
// queue in batches and writes to the log file (stderr if the file cannot be
// opened). Calls made before Initialize() or after Shutdown() are dropped, so
// library code can log unconditionally. Never pass key material to it.
class Logger {
public:
  // Opens `path` for append. echo_stderr additionally mirrors WARNING and above to stderr.
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO, bool echo_stderr = false);
  // Flushes everything queued so far and stops the worker.
  static void Shutdown();
  static bool IsEnabled(LogLevel level);
  static void Log(LogLevel level, const std::string& message, const char* file = __FILE__, int line = __LINE__);
  static void Debug(const std::string& m, const char* f = __FILE__, int l = __LINE__) { Log(LogLevel::DEBUG, m, f, l); }
  static void Info(const std::string& m, const char* f = __FILE__, int l = __LINE__) { Log(LogLevel::INFO, m, f, l); }
  static void Warning(const std::string& m, const char* f = __FILE__, int l = __LINE__) { Log(LogLevel::WARNING, m, f, l); }
  static void Error(const std::string& m, const char* f = __FILE__, int l = __LINE__) { Log(LogLevel::ERROR, m, f, l); }
  static void Critical(const std::string& m, const char* f = __FILE__, int l = __LINE__) { Log(LogLevel::CRITICAL, m, f, l); }
  ~Logger();

private:
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  bool echo_stderr_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  std::mutex queue_mutex_;
  std::condition_variable cv_;
  std::vector<LogEntry> pending_;
  bool stopping_ = false;
  std::thread worker_;
  Logger() = default;
  void Run();
  void Stop();
  void Write(const std::vector<LogEntry>& batch);
};
