#include "conch.hpp"
#include "AppLogger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace
{

std::string isoTimestamp()
{
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
  return buffer;
}

}

Conch::Conch(std::string lockPath) : lockPath_(expandHome(lockPath))
{
}

Conch::~Conch()
{
  release();
}

std::string Conch::expandHome(const std::string &path)
{
  if (path.rfind("~/", 0) != 0)
  {
    return path;
  }
  const char *home = std::getenv("HOME");
  if (!home)
  {
    return path;
  }
  return std::string(home) + path.substr(1);
}

bool Conch::tryAcquire(const std::string &agent)
{
  if (held())
  {
    return true;
  }

  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(lockPath_).parent_path();
  if (!parent.empty())
  {
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
      AppLogger::getInstance().warn("Cannot create conch directory " + parent.string() + ": " + ec.message());
    }
  }

  int fd = ::open(lockPath_.c_str(), O_CREAT | O_RDWR, 0644);
  if (fd < 0)
  {
    AppLogger::getInstance().error("Cannot open conch " + lockPath_ + ": " + std::strerror(errno));
    return false;
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
  {
    ::close(fd);
    return false;
  }

  nlohmann::json data = {
      {"pid", static_cast<long>(::getpid())},
      {"agent", agent.empty() ? "unknown" : agent},
      {"acquired", isoTimestamp()},
      {"expires", nullptr}};
  const std::string text = data.dump(2);

  if (::ftruncate(fd, 0) != 0 || ::lseek(fd, 0, SEEK_SET) != 0 ||
      ::write(fd, text.data(), text.size()) != static_cast<ssize_t>(text.size()))
  {
    AppLogger::getInstance().warn("Could not write conch holder info: " + std::string(std::strerror(errno)));
  }
  if (::fsync(fd) != 0)
  {
    AppLogger::getInstance().warn("Could not sync conch file: " + std::string(std::strerror(errno)));
  }

  fd_ = fd;
  acquiredAt_ = std::chrono::steady_clock::now();
  AppLogger::getInstance().debug("Conch acquired by " + data["agent"].get<std::string>());
  return true;
}

std::chrono::milliseconds Conch::release()
{
  if (!held())
  {
    return std::chrono::milliseconds(0);
  }

  auto heldFor = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - acquiredAt_);

  // Unlink before unlocking so a waiting process never locks a stale file.
  std::error_code ec;
  std::filesystem::remove(lockPath_, ec);
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;

  AppLogger::getInstance().debug("Conch released after " + std::to_string(heldFor.count()) + "ms");
  return heldFor;
}

std::optional<ConchHolder> Conch::holder(const std::string &lockPath)
{
  std::ifstream file(expandHome(lockPath));
  if (!file.is_open())
  {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  nlohmann::json data;
  try
  {
    data = nlohmann::json::parse(buffer.str());
  }
  catch (const nlohmann::json::parse_error &)
  {
    return std::nullopt;
  }

  if (!data.is_object() || !data.contains("pid") || !data["pid"].is_number_integer())
  {
    return std::nullopt;
  }

  ConchHolder holder;
  holder.pid = data["pid"].get<long>();
  holder.agent = data.value("agent", "unknown");
  holder.acquired = data.value("acquired", "");
  return holder;
}

bool Conch::isActive(const std::string &lockPath)
{
  std::optional<ConchHolder> info = holder(lockPath);
  if (!info || info->pid <= 0)
  {
    return false;
  }
  return ::kill(static_cast<pid_t>(info->pid), 0) == 0;
}
