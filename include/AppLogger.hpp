#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <mutex>

enum class LogLevel
{
  Debug = 0,
  Info,
  Warn,
  Error
};

// AppLogger class for centralized logging
class AppLogger
{
public:
  static AppLogger &getInstance();

  bool open(const std::string &filename);

  void setLevel(LogLevel level);
  LogLevel level() const;

  static LogLevel parseLevel(const std::string &name, LogLevel fallback);

  void debug(const std::string &message);

  void info(const std::string &message);

  void warn(const std::string &message);

  void error(const std::string &message);

  ~AppLogger();

private:
  AppLogger();

  AppLogger(const AppLogger &) = delete;
  AppLogger &operator=(const AppLogger &) = delete;

  std::ofstream logFile;
  mutable std::mutex mutex_;
  LogLevel level_ = LogLevel::Info;

  std::string getTimestamp();

  void logToStream(const std::string &message);
};
