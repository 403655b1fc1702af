#include "log.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <cstdarg>
#include <cstdio>
#include <iostream>

namespace textclf {

static std::mutex g_m;
static std::ofstream g_file;
static std::atomic<LogLevel> g_level{LogLevel::Info};

void Log::init(const std::string& dir) {
  std::scoped_lock lk(g_m);
  if (g_file.is_open()) g_file.close();
  if (dir.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "[W] could not create log dir " << dir << ": " << ec.message() << "\n";
    return;
  }
  g_file.open(dir + "/log.txt", std::ios::app);
}

void Log::setLevel(LogLevel lvl) { g_level.store(lvl); }

LogLevel Log::level() { return g_level.load(); }

bool Log::parseLevel(const std::string& name, LogLevel& out) {
  if (name == "debug") out = LogLevel::Debug;
  else if (name == "info") out = LogLevel::Info;
  else if (name == "warn") out = LogLevel::Warn;
  else if (name == "error") out = LogLevel::Error;
  else return false;
  return true;
}

void Log::write(LogLevel lvl, const char* fmt, ...) {
  if (static_cast<int>(lvl) < static_cast<int>(g_level.load())) return;
  const char* tag = (lvl==LogLevel::Debug)?"D":(lvl==LogLevel::Info)?"I":(lvl==LogLevel::Warn)?"W":"E";
  char buf[1024];
  va_list ap; va_start(ap, fmt);
  vsnprintf(buf, sizeof(buf), fmt, ap);
  va_end(ap);
  std::scoped_lock lk(g_m);
  // stdout is reserved for classification results
  std::cerr << "[" << tag << "] " << buf << "\n";
  if (g_file.is_open()) g_file << "[" << tag << "] " << buf << "\n";
}

} // namespace textclf
