#include "logging.hpp"
#include <atomic>
#include <iostream>

static std::atomic<int> g_level{(int)LogLevel::Info};

void set_log_level(LogLevel level) { g_level = (int)level; }
LogLevel log_level() { return (LogLevel)g_level.load(); }

static void emit(LogLevel level, const char* tag, const std::string& msg) {
  if ((int)level < g_level.load()) return;
  // everything goes to stderr so stdout stays clean for reports
  std::cerr << "[" << tag << "] " << msg << "\n";
}

void log_debug(const std::string& msg) { emit(LogLevel::Debug, "DEBUG", msg); }
void log_info(const std::string& msg)  { emit(LogLevel::Info, "INFO", msg); }
void log_warn(const std::string& msg)  { emit(LogLevel::Warn, "WARN", msg); }
void log_error(const std::string& msg) { emit(LogLevel::Error, "ERROR", msg); }
