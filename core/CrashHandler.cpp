#include "CrashHandler.hpp"

#include "core/Log.hpp"

#include <backward.hpp>
#include <cstdlib>
#include <exception>

namespace CrashHandler {

// Dynamic allocation to keep it alive for the duration of the program
static backward::SignalHandling *s_SignalHandler = nullptr;

namespace {

[[noreturn]] void OnTerminate() {
  if (const std::exception_ptr current = std::current_exception()) {
    try {
      std::rethrow_exception(current);
    } catch (const std::exception &e) {
      LOG_CRITICAL("Unhandled exception: {}", e.what());
    } catch (...) {
      LOG_CRITICAL("Unhandled non-standard exception");
    }
  } else {
    LOG_CRITICAL("std::terminate called without an active exception");
  }

  backward::StackTrace st;
  st.load_here(32);
  backward::Printer printer;
  printer.print(st, stderr);

  Log::GetLogger()->flush();
  std::abort();
}

} // namespace

void Init() {
  if (!s_SignalHandler) {
    s_SignalHandler = new backward::SignalHandling();
    if (!s_SignalHandler->loaded()) {
      LOG_WARN("Crash signal handlers could not be installed");
    }
    std::set_terminate(OnTerminate);
  }
}

} // namespace CrashHandler
