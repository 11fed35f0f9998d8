#pragma once
#include <cstdio>
#include <cstdarg>
#include <functional>
#include <mutex>
#include <string>

namespace clipmesh {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    // Receives every emitted line (without timestamp) in addition to stderr.
    void set_sink(Sink sink);
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    LogLevel level_ = LogLevel::INFO;
    Sink sink_;
    const char* level_str(LogLevel lvl);
};

bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace clipmesh
