#include "logger.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "info") return LogLevel::INFO;
    if (s == "warn") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

Logger::Logger(const std::string& path, LogLevel lvl) : level_(static_cast<int>(lvl)) {
    open(path);
}

bool Logger::open(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);
    if (out_.is_open()) out_.close();
    if (path.empty()) {
        to_stderr_ = true;
        return true;
    }
    to_stderr_ = false;
    out_.open(path, std::ios::out | std::ios::app);
    return out_.is_open();
}

void Logger::set_level(LogLevel lvl) {
    level_.store(static_cast<int>(lvl));
}

void Logger::set_mirror_stderr(bool on) {
    std::lock_guard<std::mutex> lk(mu_);
    mirror_stderr_ = on;
}

bool Logger::enabled(LogLevel lvl) const {
    return static_cast<int>(lvl) >= level_.load();
}

void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg) { log(LogLevel::INFO, msg); }
void Logger::warn(const std::string& msg) { log(LogLevel::WARN, msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }

const char* Logger::level_str(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "?";
    }
}

std::string Logger::ts() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto tt = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::string line = ts() + " [" + level_str(lvl) + "] " + msg + "\n";
    std::lock_guard<std::mutex> lk(mu_);
    if (out_.is_open()) {
        out_ << line;
        out_.flush();
    }
    if (to_stderr_ || mirror_stderr_) {
        std::cerr << line;
        std::cerr.flush();
    }
}
