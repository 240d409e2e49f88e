#include "AppLogger.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>


AppLogger& AppLogger::getInstance() {
    static AppLogger instance;
    return instance;
}


AppLogger::AppLogger() = default;

AppLogger::~AppLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile.is_open()) {
        logFile << "--- Log Ended: " << getTimestamp() << " ---\n";
        logFile.close();
    }
}

bool AppLogger::open(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::filesystem::path logPath(filename);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(logPath.parent_path(), ec);
        if (ec) {
            std::cerr << "Error: Could not create log directory " << logPath.parent_path() << ": " << ec.message() << std::endl;
            logFile.setstate(std::ios_base::failbit);
            return false;
        }
    }
    if (logFile.is_open()) {
        logFile.close();
    }
    logFile.open(filename, std::ios_base::app);
    if (!logFile.is_open()) {
        std::cerr << "Error: Could not open log file: " << filename << std::endl;
        return false;
    }
    logFile << "--- Log Started: " << getTimestamp() << " ---\n";
    return true;
}

void AppLogger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel AppLogger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

LogLevel AppLogger::parseLevel(const std::string& name, LogLevel fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return fallback;
}

void AppLogger::debug(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ > LogLevel::Debug) return;
    logToStream("[DEBUG] " + message + "\n");
}

void AppLogger::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ > LogLevel::Info) return;
    logToStream("[INFO] " + message + "\n");
}

void AppLogger::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ > LogLevel::Warn) return;
    std::cerr << "[WARN] " << message << "\n";
    logToStream("[WARN] " + message + "\n");
}

void AppLogger::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[ERROR] " << message << "\n";
    logToStream("[ERROR] " + message + "\n");
    logFile.flush();
}

std::string AppLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&now_c, &local_tm);

    char buffer[80];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_tm);
    return buffer;
}

// Callers hold mutex_.
void AppLogger::logToStream(const std::string& message) {
    if (logFile.is_open()) {
        logFile << getTimestamp() << " " << message;
    } else {
        // fallback to std::cout if the log file is not open
        std::cout << getTimestamp() << " " << message;
    }
}
