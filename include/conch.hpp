#pragma once

#include <chrono>
#include <optional>
#include <string>

struct ConchHolder
{
  long pid = 0;
  std::string agent;
  std::string acquired;
};

// Cross-process marker that a voice conversation owns the audio devices.
// The lock file holds {"pid", "agent", "acquired"} as JSON and is guarded
// by flock so only one process can hold it.
class Conch
{
public:
  explicit Conch(std::string lockPath);
  ~Conch();

  Conch(const Conch &) = delete;
  Conch &operator=(const Conch &) = delete;

  // False when another process holds the lock.
  bool tryAcquire(const std::string &agent);

  // Returns how long the lock was held.
  std::chrono::milliseconds release();

  bool held() const { return fd_ >= 0; }
  const std::string &path() const { return lockPath_; }

  // Lock file present and its pid alive.
  static bool isActive(const std::string &lockPath);
  static std::optional<ConchHolder> holder(const std::string &lockPath);

  // Expands a leading "~/" using $HOME.
  static std::string expandHome(const std::string &path);

private:
  std::string lockPath_;
  int fd_ = -1;
  std::chrono::steady_clock::time_point acquiredAt_;
};

// Holds a conch for the lifetime of a scope.
class ConchGuard
{
public:
  explicit ConchGuard(Conch &conch) : conch_(conch) {}
  ~ConchGuard() { conch_.release(); }

  ConchGuard(const ConchGuard &) = delete;
  ConchGuard &operator=(const ConchGuard &) = delete;

private:
  Conch &conch_;
};
