#include "Logger.hpp"
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string_view>
#include <spdlog/spdlog.h>   // main spdlog API (info/warn/error, set_pattern, set_level)

namespace {
  const auto g_t0 = std::chrono::steady_clock::now();
  std::once_flag g_init_flag;
}

namespace logger {
  thread_local const char* tlabel = "main";

  uint64_t ms_since_start() {
    return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_t0).count());
  }

  bool verbose() {
    const char* v = std::getenv("VERBOSE");
    return v && *v && std::string_view(v) != "0";
  }

  void init() {
    std::call_once(g_init_flag, []() {
      spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
      // LOG_DBG is already gated on VERBOSE; let debug lines through when it's on
      spdlog::set_level(verbose() ? spdlog::level::debug : spdlog::level::info);
    });
  }

  void write_line(Level_E level, const std::string& line) {
    init();
    switch (level) {
      case Level_Debug:
        spdlog::debug("{}", line);
        break;
      case Level_Warn:
        spdlog::warn("{}", line);
        break;
      case Level_Error:
        spdlog::error("{}", line);
        break;
      case Level_Info:
      default:
        spdlog::info("{}", line);
        break;
    }
  }
}
