#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <atomic>
#include <chrono>
#include <ctime>

enum class LogLevel { Debug, Info, Warn, Error };

// Returns false and leaves level untouched for unknown names
bool logLevelFromString(const std::string& name, LogLevel& level);

class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);

    // Empty path sends output back to stdout. Throws std::runtime_error
    // if the file cannot be opened.
    void setFile(const std::string& path);

    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream out_;
    std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    static const char* levelToString(LogLevel level);

    // Rotation state
    std::atomic<size_t> fileSize_{0};
    std::string logPath_;

    void rotateIfNeeded();
    void writeToStream(std::ostream& os, LogLevel level, const std::string& message, const std::tm& tm);
};
