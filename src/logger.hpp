#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

LogLevel parse_log_level(const std::string& s);

// Thread-safe logger.
// - File output by default; stderr when no file is configured or when mirroring.
// - Never used for user-facing CLI output (see Console).
class Logger {
public:
    Logger() = default;
    explicit Logger(const std::string& path, LogLevel lvl = LogLevel::INFO);

    bool open(const std::string& path);
    void set_level(LogLevel lvl);
    void set_mirror_stderr(bool on);
    bool enabled(LogLevel lvl) const;

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warn(const std::string& msg);
    void error(const std::string& msg);

private:
    void log(LogLevel lvl, const std::string& msg);
    static std::string ts();
    static const char* level_str(LogLevel lvl);

    std::mutex mu_;
    std::ofstream out_;
    bool to_stderr_ = false;
    bool mirror_stderr_ = false;
    std::atomic<int> level_{static_cast<int>(LogLevel::INFO)};
};
