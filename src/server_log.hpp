#pragma once

#include <string>
#include <functional>
#include <mutex>
#include <atomic>

namespace tailf {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

const char* log_level_name(LogLevel level);

// Process-wide engine log. Messages go through a replaceable sink so the
// console UI can capture them instead of stdout/stderr.
class ServerLog {
public:
    using Sink = std::function<void(LogLevel level,
                                    const std::string& component,
                                    const std::string& message)>;

    static void set_sink(Sink sink);
    static void set_min_level(LogLevel level);
    static LogLevel min_level();

    static void debug(const std::string& component, const std::string& message);
    static void log(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);

    // Default sink: timestamped lines, warnings and errors on stderr
    static void console_sink(LogLevel level, const std::string& component,
                             const std::string& message);

private:
    static void write(LogLevel level, const std::string& component, const std::string& message);

    static Sink sink_;
    static std::mutex mutex_;
    static std::atomic<int> min_level_;
};

} // namespace tailf
