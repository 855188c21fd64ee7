/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log inline from Logger.hpp
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace Ember {
namespace {

namespace fs = std::filesystem;

constexpr const char *LOG_ORGANIZATION = "HammerForged";
constexpr const char *LOG_PREFIX = "ember_particles_";
constexpr size_t MAX_LOG_FILES = 5;
constexpr size_t FLUSH_INTERVAL = 50;

std::tm localTime(std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm result{};
#ifdef _WIN32
  localtime_s(&result, &seconds);
#else
  localtime_r(&seconds, &result);
#endif
  return result;
}

// Oldest files first; everything past the newest `keep` is removed
void pruneLogs(const fs::path &dir, size_t keep) {
  std::error_code ec;
  std::vector<fs::directory_entry> logs;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.path().extension() == ".log" && name.starts_with(LOG_PREFIX)) {
      logs.push_back(entry);
    }
  }
  if (logs.size() <= keep) {
    return;
  }

  std::sort(logs.begin(), logs.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.last_write_time() < b.last_write_time();
            });
  for (size_t i = 0; i + keep < logs.size(); ++i) {
    fs::remove(logs[i].path(), ec);
  }
}

/**
 * @brief Session log file in the SDL preference directory
 *
 * Opened on the first CRITICAL/ERROR. Without a writable preference
 * directory there is no file and messages are dropped.
 */
class SessionLog {
public:
  static SessionLog &Instance() {
    static SessionLog instance;
    return instance;
  }

  SessionLog(const SessionLog &) = delete;
  SessionLog &operator=(const SessionLog &) = delete;

  void write(const char *level, const char *system, const char *message) {
    if (!m_opened) {
      open();
    }
    if (!m_stream.is_open()) {
      return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) %
                        1000;
    const std::tm local = localTime(now);

    m_stream << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << millis.count() << " ["
             << level << "] [" << system << "] " << message << '\n';

    if (++m_pending >= FLUSH_INTERVAL || std::strcmp(level, "CRITICAL") == 0) {
      m_stream.flush();
      m_pending = 0;
    }
  }

private:
  SessionLog() = default;
  ~SessionLog() {
    if (m_stream.is_open()) {
      m_stream.flush();
    }
  }

  void open() {
    m_opened = true;

    // EMBER_APP_NAME comes from the build system
    char *prefPath = SDL_GetPrefPath(LOG_ORGANIZATION, EMBER_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }
    const fs::path dir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      return;
    }
    pruneLogs(dir, MAX_LOG_FILES - 1);

    const std::tm local = localTime(std::chrono::system_clock::now());
    std::ostringstream name;
    name << LOG_PREFIX << std::put_time(&local, "%Y%m%d_%H%M%S") << ".log";

    m_stream.open(dir / name.str(), std::ios::out | std::ios::app);
    if (m_stream.is_open()) {
      m_stream << "=== " << EMBER_APP_NAME << " session "
               << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " ===\n";
      m_stream.flush();
    }
  }

  std::ofstream m_stream;
  bool m_opened{false};
  size_t m_pending{0};
};

} // namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }

  std::lock_guard<std::mutex> lock(s_logMutex);
  if (LogSink sink = s_sink.load(std::memory_order_acquire)) {
    sink(level, system, message);
    return;
  }
  SessionLog::Instance().write(level, system, message);
}

} // namespace Ember

#endif // DEBUG
