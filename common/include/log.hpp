#pragma once
#include <string>

namespace textclf {

enum class LogLevel { Debug, Info, Warn, Error };

namespace Log {
  // Empty dir keeps output on the console only.
  void init(const std::string& dir = "./logs");
  void setLevel(LogLevel lvl);
  LogLevel level();
  bool parseLevel(const std::string& name, LogLevel& out);
  void write(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
      __attribute__((format(printf, 2, 3)))
#endif
      ;
}

} // namespace textclf
