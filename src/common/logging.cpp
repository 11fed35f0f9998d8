#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <vector>

namespace clipmesh {

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}

void Logger::set_level(LogLevel lvl) { level_ = lvl; }

void Logger::set_sink(Sink sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = std::move(sink);
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_)
    return;

  va_list ap;
  va_start(ap, fmt);
  va_list ap2;
  va_copy(ap2, ap);
  int n = std::vsnprintf(nullptr, 0, fmt, ap);
  va_end(ap);
  std::vector<char> msg(n > 0 ? (size_t)n + 1 : 1, '\0');
  if (n > 0)
    std::vsnprintf(msg.data(), msg.size(), fmt, ap2);
  va_end(ap2);

  std::lock_guard<std::mutex> lk(mtx_);
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm_buf{};
#if defined(_WIN32)
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::fprintf(stderr, "%s [%s] %s\n", ts, level_str(lvl), msg.data());
  if (sink_)
    sink_(lvl, std::string(msg.data()));
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (v == "trace")
    out = LogLevel::TRACE;
  else if (v == "debug")
    out = LogLevel::DEBUG;
  else if (v == "info")
    out = LogLevel::INFO;
  else if (v == "warn" || v == "warning")
    out = LogLevel::WARN;
  else if (v == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

} // namespace clipmesh
