#include "core/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <filesystem>
#include <stdexcept>

using namespace std::chrono;

bool logLevelFromString(const std::string& s, LogLevel& level) {
    if (s == "debug")   { level = LogLevel::Debug; return true; }
    if (s == "info")    { level = LogLevel::Info;  return true; }
    if (s == "warn" || s == "warning") { level = LogLevel::Warn; return true; }
    if (s == "error")   { level = LogLevel::Error; return true; }
    return false;
}

// =======================
// Singleton
// =======================
Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

// =======================
// Configuration
// =======================
void Logger::setLevel(LogLevel level) {
    level_ = level;
}

void Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    logPath_ = path;

    if (out_.is_open())
        out_.close();

    if (path.empty()) {
        fileSize_ = 0;
        return;
    }

    out_.open(path, std::ios::app);
    if (!out_.is_open())
        throw std::runtime_error("cannot open log file " + path);

    fileSize_ = std::filesystem::exists(path)
        ? std::filesystem::file_size(path)
        : 0;
}

const char* Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "UNKNOWN";
    }
}

// =======================
// Rotation
// =======================
void Logger::rotateIfNeeded() {
    constexpr size_t MAX_SIZE = 50 * 1024 * 1024; // 50 MB
    constexpr int KEEP = 5;

    if (!out_.is_open() || fileSize_.load() < MAX_SIZE)
        return;

    out_.close();

    // sinkhole.log.4 -> sinkhole.log.5, ..., sinkhole.log -> sinkhole.log.1
    std::error_code ec;
    for (int i = KEEP - 1; i >= 1; --i) {
        std::filesystem::path old = logPath_ + "." + std::to_string(i);
        std::filesystem::path next = logPath_ + "." + std::to_string(i + 1);
        if (std::filesystem::exists(old, ec))
            std::filesystem::rename(old, next, ec);
    }
    std::filesystem::rename(logPath_, logPath_ + ".1", ec);

    out_.open(logPath_, std::ios::app);
    fileSize_.store(0);
}

// =======================
// Logging
// =======================
void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_.load())
        return;
    std::lock_guard<std::mutex> log_lock(mutex_);
    rotateIfNeeded();

    auto now = system_clock::now();
    std::time_t tt = system_clock::to_time_t(now);

    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostream& os = out_.is_open()
        ? static_cast<std::ostream&>(out_)
        : std::cout;

    writeToStream(os, level, message, tm);

    fileSize_.fetch_add(message.size() + 30, std::memory_order_relaxed);
}

void Logger::writeToStream(
    std::ostream& os,
    LogLevel level,
    const std::string& message,
    const std::tm& tm
) {
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << " [" << levelToString(level) << "] "
       << message << std::endl;
}
