// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_SUPPORT_LOGGER_H
#define WAVE_SUPPORT_LOGGER_H

#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

namespace wave {

// Components that can be enabled independently through LLVM debug types.
enum class LogComponent {
  Expansion,
  DimScaling,
  Graph,
  Constraints,
  Test,
  General
};

// Log levels in order of verbosity.
enum class LogLevel {
  Trace,   // Most verbose, enabled only with WAVE_LOGGER_LEVEL=trace
  Debug,   // Default level
  Warning, // Advisories that do not stop compilation
  Fatal    // Fatal errors
};

inline constexpr const char *getLogComponentStr(LogComponent component) {
  switch (component) {
  case LogComponent::Expansion:
    return "wave-expansion";
  case LogComponent::DimScaling:
    return "wave-dim-scaling";
  case LogComponent::Graph:
    return "wave-graph";
  case LogComponent::Constraints:
    return "wave-constraints";
  case LogComponent::Test:
    return "test";
  case LogComponent::General:
    return "general";
  }
  return "unknown";
}

inline constexpr const char *getLogLevelStr(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Fatal:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline llvm::raw_ostream::Colors getLogLevelColor(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return llvm::raw_ostream::CYAN;
  case LogLevel::Debug:
    return llvm::raw_ostream::GREEN;
  case LogLevel::Warning:
    return llvm::raw_ostream::YELLOW;
  case LogLevel::Fatal:
    return llvm::raw_ostream::RED;
  }
  return llvm::raw_ostream::RESET;
}

// Parses a WAVE_LOGGER_LEVEL value. Unrecognized values map to Debug.
inline LogLevel parseLogLevel(const char *value) {
  if (!value) {
    return LogLevel::Debug;
  }
  std::string level(value);
  std::transform(level.begin(), level.end(), level.begin(), ::toupper);
  if (level == "TRACE") {
    return LogLevel::Trace;
  }
  if (level == "WARNING") {
    return LogLevel::Warning;
  }
  return LogLevel::Debug;
}

// Minimum log level, read once from the environment.
inline LogLevel getMinLogLevel() {
  static LogLevel minLevel = parseLogLevel(std::getenv("WAVE_LOGGER_LEVEL"));
  return minLevel;
}

inline bool isLogLevelEnabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(getMinLogLevel());
}

inline std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::stringstream ss;
  ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << '.'
     << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

#ifdef WAVE_ENABLE_DEBUG_LOGS
#define WAVE_LOG_FMT(logComponent, logLevel, /* fmt, args */...)               \
  DEBUG_WITH_TYPE(                                                             \
      wave::getLogComponentStr(logComponent),                                  \
      if (wave::isLogLevelEnabled(logLevel)) {                                 \
        auto &OS = llvm::dbgs();                                               \
        OS << "[" << wave::getCurrentTimestamp() << "] [";                     \
        OS.changeColor(wave::getLogLevelColor(logLevel), /*bold=*/true);       \
        OS << wave::getLogLevelStr(logLevel);                                  \
        OS.resetColor();                                                       \
        OS << "] [";                                                           \
        OS.changeColor(llvm::raw_ostream::MAGENTA, /*bold=*/true);             \
        OS << wave::getLogComponentStr(logComponent);                          \
        OS.resetColor();                                                       \
        OS << "] " << llvm::formatv(__VA_ARGS__) << "\n";                      \
        if (logLevel == wave::LogLevel::Fatal) {                               \
          abort();                                                             \
        }                                                                      \
      })
#else
#define WAVE_LOG_FMT(logComponent, logLevel, /* fmt, args */...) ((void)0)
#endif

#define WAVE_TRACE(component, /* fmt, args */...)                              \
  WAVE_LOG_FMT(component, wave::LogLevel::Trace, /* fmt, args */ __VA_ARGS__)
#define WAVE_DEBUG(component, /* fmt, args */...)                              \
  WAVE_LOG_FMT(component, wave::LogLevel::Debug, /* fmt, args */ __VA_ARGS__)
#define WAVE_WARNING(component, /* fmt, args */...)                            \
  WAVE_LOG_FMT(component, wave::LogLevel::Warning, /* fmt, args */ __VA_ARGS__)
#define WAVE_FATAL(component, /* fmt, args */...)                              \
  WAVE_LOG_FMT(component, wave::LogLevel::Fatal, /* fmt, args */ __VA_ARGS__)

} // namespace wave

#endif // WAVE_SUPPORT_LOGGER_H
