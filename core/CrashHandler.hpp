#pragma once

// Installs backward-cpp signal handlers so a crash in any executable prints
// a symbolised stack trace, and routes std::terminate through the logger
// before aborting.
namespace CrashHandler {

void Init();

} // namespace CrashHandler
