#pragma once
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace logger {
  // Returns ms since program start (steady clock).
  uint64_t ms_since_start();

  // True if VERBOSE env var is set and not "0".
  bool verbose();

  // Per-thread label used in log lines (defaults to "main").
  extern thread_local const char* tlabel;

  enum Level_E {
    Level_Debug,
    Level_Info,
    Level_Warn,
    Level_Error,
  };

  // Sets the spdlog pattern/level. Safe to call more than once; write_line calls it lazily.
  void init();

  // Hands a finished line to spdlog at the given level.
  void write_line(Level_E level, const std::string& line);
}

// Stream-style macros, e.g. LOG_ALWAYS("SC: idx=" << idx). Lines are prefixed with ms since start + thread label.
#define LOG_AT_LEVEL(level, msg) do { \
  std::ostringstream log_oss_; \
  log_oss_ << "[" << std::setw(6) << logger::ms_since_start() << " ms] " \
           << logger::tlabel << ": " << msg; \
  logger::write_line(level, log_oss_.str()); \
} while(0)

#define LOG_ALWAYS(msg) LOG_AT_LEVEL(logger::Level_Info, msg)
#define LOG_WARN(msg) LOG_AT_LEVEL(logger::Level_Warn, msg)
#define LOG_ERR(msg) LOG_AT_LEVEL(logger::Level_Error, msg)

#define LOG_DBG(msg) do { if (logger::verbose()) LOG_AT_LEVEL(logger::Level_Debug, msg); } while(0)
