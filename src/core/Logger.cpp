/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only - debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <vector>

namespace PyroForge {
namespace {

constexpr size_t LOGS_TO_KEEP = 5;
constexpr size_t FLUSH_INTERVAL = 50;
constexpr const char *LOG_PREFIX = "pyroforge_";

std::tm localTime(std::time_t t) {
  std::tm timeinfo{};
#ifdef _WIN32
  localtime_s(&timeinfo, &t);
#else
  localtime_r(&t, &timeinfo);
#endif
  return timeinfo;
}

class FileLogger {
public:
  static FileLogger &Instance() {
    static FileLogger instance;
    return instance;
  }

  void write(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_fileMutex);

    if (!m_initialized) {
      initialize();
    }
    if (!m_fileStream.is_open()) {
      return;
    }

    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;
    std::tm t = localTime(std::chrono::system_clock::to_time_t(now));

    m_fileStream << std::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} "
                                "[{}] [{}] {}\n",
                                t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
                                t.tm_hour, t.tm_min, t.tm_sec, ms.count(),
                                level, system, message);

    if (std::strcmp(level, "CRITICAL") == 0 ||
        ++m_messageCount >= FLUSH_INTERVAL) {
      m_fileStream.flush();
      m_messageCount = 0;
    }
  }

private:
  FileLogger() = default;

  ~FileLogger() {
    if (m_fileStream.is_open()) {
      m_fileStream.flush();
    }
  }

  FileLogger(const FileLogger &) = delete;
  FileLogger &operator=(const FileLogger &) = delete;

  void initialize() {
    m_initialized = true;

    // PYRO_APP_NAME is defined via CMake from ${PROJECT_NAME}
    char *prefPath = SDL_GetPrefPath("HammerForged", PYRO_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }

    namespace fs = std::filesystem;
    fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }

    pruneLogs(logDir);

    std::tm t = localTime(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    std::string filename =
        std::format("{}{:04}{:02}{:02}_{:02}{:02}{:02}.log", LOG_PREFIX,
                    t.tm_year + 1900, t.tm_mon + 1, t.tm_mday, t.tm_hour,
                    t.tm_min, t.tm_sec);

    m_fileStream.open(logDir / filename, std::ios::out | std::ios::app);
    if (m_fileStream.is_open()) {
      m_fileStream << std::format("=== {} Log ===\n", PYRO_APP_NAME);
      m_fileStream.flush();
    }
  }

  // Keeps the newest LOGS_TO_KEEP - 1 files so the new log makes LOGS_TO_KEEP
  void pruneLogs(const std::filesystem::path &logDir) {
    namespace fs = std::filesystem;

    std::vector<fs::directory_entry> logFiles;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with(LOG_PREFIX)) {
        logFiles.push_back(entry);
      }
    }

    if (logFiles.size() < LOGS_TO_KEEP) {
      return;
    }

    std::sort(logFiles.begin(), logFiles.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                std::error_code errA;
                std::error_code errB;
                return fs::last_write_time(a, errA) <
                       fs::last_write_time(b, errB);
              });

    size_t toRemove = logFiles.size() - (LOGS_TO_KEEP - 1);
    for (size_t i = 0; i < toRemove; ++i) {
      fs::remove(logFiles[i].path(), ec);
    }
  }

  std::mutex m_fileMutex;
  std::ofstream m_fileStream;
  bool m_initialized = false;
  size_t m_messageCount = 0;
};

} // anonymous namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  FileLogger::Instance().write(level, system, message);
}

} // namespace PyroForge

#endif // ifndef DEBUG
