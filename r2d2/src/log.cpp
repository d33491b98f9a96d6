#include "log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace logging {

static std::atomic<int> g_level{(int)Level::Warn};
static std::mutex       g_mutex;

static void emit(Level l, const char* tag, const std::string& msg) {
    if ((int)l > g_level.load())
        return;
    std::lock_guard<std::mutex> lock(g_mutex);
    std::cerr << "[" << tag << "] " << msg << "\n";
}

void set_level(Level l) { g_level.store((int)l); }

Level level() { return (Level)g_level.load(); }

Level level_from_str(const std::string& s) {
    if (s == "error") return Level::Error;
    if (s == "warn")  return Level::Warn;
    if (s == "info")  return Level::Info;
    if (s == "debug") return Level::Debug;
    throw std::runtime_error("Unknown log level: " + s);
}

void error(const std::string& msg) { emit(Level::Error, "error", msg); }
void warn(const std::string& msg)  { emit(Level::Warn,  "warn",  msg); }
void info(const std::string& msg)  { emit(Level::Info,  "info",  msg); }
void debug(const std::string& msg) { emit(Level::Debug, "debug", msg); }

} // namespace logging
