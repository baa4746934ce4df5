/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace CurveLights {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Renamed to avoid macro conflicts
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Curve Lights - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define CURVELIGHTS_CRITICAL(system, msg)                                      \
  CurveLights::Logger::Log(CurveLights::LogLevel::CRITICAL, system, msg)
#define CURVELIGHTS_ERROR(system, msg)                                         \
  CurveLights::Logger::Log(CurveLights::LogLevel::ERROR_LEVEL, system, msg)
#define CURVELIGHTS_WARN(system, msg)                                          \
  CurveLights::Logger::Log(CurveLights::LogLevel::WARNING, system, msg)
#define CURVELIGHTS_INFO(system, msg)                                          \
  CurveLights::Logger::Log(CurveLights::LogLevel::INFO, system, msg)
#define CURVELIGHTS_DEBUG(system, msg)                                         \
  CurveLights::Logger::Log(CurveLights::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write CRITICAL and ERROR to a rotating log file (Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define CURVELIGHTS_CRITICAL(system, msg)                                      \
  CurveLights::Logger::Log("CRITICAL", system, msg)

#define CURVELIGHTS_ERROR(system, msg)                                         \
  CurveLights::Logger::Log("ERROR", system, msg)

#define CURVELIGHTS_WARN(system, msg) ((void)0)  // Zero overhead
#define CURVELIGHTS_INFO(system, msg) ((void)0)  // Zero overhead
#define CURVELIGHTS_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

#define APP_CRITICAL(msg) CURVELIGHTS_CRITICAL("CurveLights", msg)
#define APP_ERROR(msg) CURVELIGHTS_ERROR("CurveLights", msg)
#define APP_WARN(msg) CURVELIGHTS_WARN("CurveLights", msg)
#define APP_INFO(msg) CURVELIGHTS_INFO("CurveLights", msg)
#define APP_DEBUG(msg) CURVELIGHTS_DEBUG("CurveLights", msg)

#define PATH_CRITICAL(msg) CURVELIGHTS_CRITICAL("PathGenerator", msg)
#define PATH_ERROR(msg) CURVELIGHTS_ERROR("PathGenerator", msg)
#define PATH_WARN(msg) CURVELIGHTS_WARN("PathGenerator", msg)
#define PATH_INFO(msg) CURVELIGHTS_INFO("PathGenerator", msg)
#define PATH_DEBUG(msg) CURVELIGHTS_DEBUG("PathGenerator", msg)

#define PARTICLE_CRITICAL(msg) CURVELIGHTS_CRITICAL("ParticleSystem", msg)
#define PARTICLE_ERROR(msg) CURVELIGHTS_ERROR("ParticleSystem", msg)
#define PARTICLE_WARN(msg) CURVELIGHTS_WARN("ParticleSystem", msg)
#define PARTICLE_INFO(msg) CURVELIGHTS_INFO("ParticleSystem", msg)
#define PARTICLE_DEBUG(msg) CURVELIGHTS_DEBUG("ParticleSystem", msg)

#define COLOR_CRITICAL(msg) CURVELIGHTS_CRITICAL("ColorAssigner", msg)
#define COLOR_ERROR(msg) CURVELIGHTS_ERROR("ColorAssigner", msg)
#define COLOR_WARN(msg) CURVELIGHTS_WARN("ColorAssigner", msg)
#define COLOR_INFO(msg) CURVELIGHTS_INFO("ColorAssigner", msg)
#define COLOR_DEBUG(msg) CURVELIGHTS_DEBUG("ColorAssigner", msg)

#define LIGHTSHOW_CRITICAL(msg) CURVELIGHTS_CRITICAL("LightShowManager", msg)
#define LIGHTSHOW_ERROR(msg) CURVELIGHTS_ERROR("LightShowManager", msg)
#define LIGHTSHOW_WARN(msg) CURVELIGHTS_WARN("LightShowManager", msg)
#define LIGHTSHOW_INFO(msg) CURVELIGHTS_INFO("LightShowManager", msg)
#define LIGHTSHOW_DEBUG(msg) CURVELIGHTS_DEBUG("LightShowManager", msg)

#define RENDER_CRITICAL(msg) CURVELIGHTS_CRITICAL("SDLRenderSink", msg)
#define RENDER_ERROR(msg) CURVELIGHTS_ERROR("SDLRenderSink", msg)
#define RENDER_WARN(msg) CURVELIGHTS_WARN("SDLRenderSink", msg)
#define RENDER_INFO(msg) CURVELIGHTS_INFO("SDLRenderSink", msg)
#define RENDER_DEBUG(msg) CURVELIGHTS_DEBUG("SDLRenderSink", msg)

#define SETTINGS_CRITICAL(msg) CURVELIGHTS_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) CURVELIGHTS_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) CURVELIGHTS_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) CURVELIGHTS_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) CURVELIGHTS_DEBUG("SettingsManager", msg)

// Benchmark mode convenience macros
#define CURVELIGHTS_ENABLE_BENCHMARK_MODE()                                    \
  CurveLights::Logger::SetBenchmarkMode(true)
#define CURVELIGHTS_DISABLE_BENCHMARK_MODE()                                   \
  CurveLights::Logger::SetBenchmarkMode(false)

} // namespace CurveLights

#endif // LOGGER_HPP
