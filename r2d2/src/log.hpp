#pragma once
#include <string>

// Diagnostics go to std::cerr as "[level] message". Lines are serialised so
// worker threads do not interleave.

namespace logging {

enum class Level { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void  set_level(Level l);
Level level();

// "error", "warn", "info", "debug". Throws std::runtime_error otherwise.
Level level_from_str(const std::string& s);

void error(const std::string& msg);
void warn(const std::string& msg);
void info(const std::string& msg);
void debug(const std::string& msg);

} // namespace logging
