#include "Log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace Log {

static std::shared_ptr<spdlog::logger> s_Logger;

void Init(const bool consoleOnly, const spdlog::level::level_enum level) {
  if (s_Logger) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;

  // Console sink with color
  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  consoleSink->set_pattern("%^[%T] %n: %v%$");
  sinks.push_back(consoleSink);

  // Tools and tests pass consoleOnly so they don't clobber the viewer's log.
  if (!consoleOnly) {
    auto fileSink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>("pinfield.log", true);
    fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v");
    sinks.push_back(fileSink);
  }

  s_Logger =
      std::make_shared<spdlog::logger>("PINFIELD", sinks.begin(), sinks.end());
  spdlog::register_logger(s_Logger);

  s_Logger->set_level(level);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_INFO("Logging initialized");
}

void SetLevel(const spdlog::level::level_enum level) {
  GetLogger()->set_level(level);
}

void Shutdown() {
  s_Logger.reset();
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger> &GetLogger() {
  // Library code may log before any executable called Init (unit tests,
  // embedding hosts). Fall back to a console logger in that case.
  if (!s_Logger) {
    Init(true);
  }
  return s_Logger;
}

} // namespace Log
