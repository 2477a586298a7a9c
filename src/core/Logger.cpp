/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Wayfarer {
namespace {

constexpr size_t KEEP_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;
constexpr const char *LOG_PREFIX = "wayfarer_";

std::tm localTime(std::chrono::system_clock::time_point when) {
  auto t = std::chrono::system_clock::to_time_t(when);
  std::tm info{};
#ifdef _WIN32
  localtime_s(&info, &t);
#else
  localtime_r(&t, &info);
#endif
  return info;
}

class RunLogFile {
public:
  static RunLogFile &Instance() {
    static RunLogFile instance;
    return instance;
  }

  void append(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_opened) {
      open();
    }
    if (!m_out.is_open()) {
      return;
    }

    auto now = std::chrono::system_clock::now();
    std::tm info = localTime(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    m_out << std::put_time(&info, "%Y-%m-%d %H:%M:%S") << '.'
          << std::setfill('0') << std::setw(3) << ms.count() << " [" << level
          << "] [" << system << "] " << message << '\n';

    if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
      m_out.flush();
      m_pending = 0;
    }
  }

  RunLogFile(const RunLogFile &) = delete;
  RunLogFile &operator=(const RunLogFile &) = delete;

private:
  RunLogFile() = default;
  ~RunLogFile() {
    if (m_out.is_open()) {
      m_out.flush();
    }
  }

  void open() {
    namespace fs = std::filesystem;
    m_opened = true;

    // WAYFARER_APP_NAME comes from CMake (${PROJECT_NAME})
    char *prefPath = SDL_GetPrefPath("Wayfarer", WAYFARER_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }
    fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }
    pruneOldLogs(logDir);

    std::tm info = localTime(std::chrono::system_clock::now());
    std::ostringstream name;
    name << LOG_PREFIX << std::put_time(&info, "%Y%m%d_%H%M%S") << ".log";

    m_out.open(logDir / name.str(), std::ios::out | std::ios::app);
    if (m_out.is_open()) {
      m_out << "=== " << WAYFARER_APP_NAME << " run log ===\n"
            << "Started: " << std::put_time(&info, "%Y-%m-%d %H:%M:%S")
            << "\n\n";
      m_out.flush();
    }
  }

  static void pruneOldLogs(const std::filesystem::path &logDir) {
    namespace fs = std::filesystem;
    std::vector<fs::directory_entry> existing;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with(LOG_PREFIX)) {
        existing.push_back(entry);
      }
    }
    if (existing.size() < KEEP_LOG_FILES) {
      return;
    }

    std::sort(existing.begin(), existing.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.path().filename() < b.path().filename();
              });
    // Leave room for the file about to be created
    size_t excess = existing.size() - KEEP_LOG_FILES + 1;
    for (size_t i = 0; i < excess; ++i) {
      fs::remove(existing[i].path(), ec);
    }
  }

  std::mutex m_mutex;
  std::ofstream m_out;
  bool m_opened{false};
  size_t m_pending{0};
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
  RunLogFile::Instance().append(level, system, message);
}

} // namespace Wayfarer

#endif // ifndef DEBUG
