// <syslog.h> owns the LOG_* names as priority constants; capture them before
// the logging macros take the names over.
#include <syslog.h>

namespace {
constexpr int kSyslogDebug = LOG_DEBUG;
constexpr int kSyslogInfo = LOG_INFO;
constexpr int kSyslogWarning = LOG_WARNING;
constexpr int kSyslogError = LOG_ERR;
constexpr int kSyslogCritical = LOG_CRIT;
}

#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING

#include "Logger.hpp"
#include <ironwatch/BoundedBuffer.hpp>
#include <ironwatch/Constants.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace ironwatch {

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace" || lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    return std::nullopt;
}

namespace {

const char* levelString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

int syslogPriority(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return kSyslogDebug;
        case LogLevel::Info:     return kSyslogInfo;
        case LogLevel::Warning:  return kSyslogWarning;
        case LogLevel::Error:    return kSyslogError;
        case LogLevel::Critical: return kSyslogCritical;
    }
    return kSyslogInfo;
}

} // namespace

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    size_t maxFileSize{10 * 1024 * 1024};
    bool rotate{true};
    bool includeTimestamps{true};
    bool includeSourceInfo{true};

    BoundedBuffer<std::string> recentLogs{RECENT_LOG_CAPACITY};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    std::string format(LogLevel level,
                       const std::string& message,
                       const std::string& source,
                       const std::string& function) const {
        std::stringstream ss;

        if (includeTimestamps) {
            auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local{};
            localtime_r(&time, &local);
            ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " ";
        }

        ss << "[" << levelString(level) << "] ";

        if (includeSourceInfo && !source.empty()) {
            ss << std::filesystem::path(source).filename().string();
            if (!function.empty()) {
                ss << ":" << function;
            }
            ss << " - ";
        }

        ss << message;
        return ss.str();
    }

    void writeToFile(const std::string& line) {
        if (!fileStream || !fileStream->is_open()) {
            openLogFile();
        }
        if (fileStream && fileStream->is_open()) {
            (*fileStream) << line << '\n';
            fileStream->flush();
        }
    }

    // Returns the name of the rotated file, empty if nothing was rotated.
    std::string rotateIfNeeded() {
        if (!rotate || logFile.empty()) {
            return {};
        }

        std::error_code ec;
        auto size = std::filesystem::file_size(logFile, ec);
        if (ec || size < maxFileSize) {
            return {};
        }

        closeLogFile();
        std::string rotated = logFile + ".1";
        std::filesystem::rename(logFile, rotated, ec);
        openLogFile();

        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
            return {};
        }
        return rotated;
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
    qRegisterMetaType<ironwatch::LogLevel>("ironwatch::LogLevel");
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::setMaxFileSize(size_t bytes) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->maxFileSize = bytes;
}

void Logger::setRotationEnabled(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->rotate = enable;
}

void Logger::enableTimestamps(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeTimestamps = enable;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeSourceInfo = enable;
}

void Logger::debug(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                      const std::string& source,
                      const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    std::string rotatedFrom;
    std::string rotatedTo;
    {
        std::lock_guard<std::mutex> lock(d->logMutex);

        if (level < d->currentLevel) {
            return;
        }

        std::string line = d->format(level, message, source, function);
        d->recentLogs.push(line);

        const bool all = d->destination == LogDestination::All;

        if (all || d->destination == LogDestination::Console) {
            auto& out = level >= LogLevel::Warning ? std::cerr : std::clog;
            out << line << std::endl;
        }

        if (all || d->destination == LogDestination::File) {
            rotatedTo = d->rotateIfNeeded();
            if (!rotatedTo.empty()) {
                rotatedFrom = d->logFile;
            }
            d->writeToFile(line);
        }

        if (all || d->destination == LogDestination::System) {
            syslog(syslogPriority(level), "%s", message.c_str());
        }
    }

    // Observers may log themselves; never call them with the mutex held.
    if (!rotatedTo.empty()) {
        emit logFileRotated(rotatedFrom, rotatedTo);
    }
    emit logAdded(level, message);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
}

std::vector<std::string> Logger::getRecentLogs(size_t count) const {
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t start = (count >= d->recentLogs.size()) ? 0 : d->recentLogs.size() - count;
    std::vector<std::string> result;
    result.reserve(d->recentLogs.size() - start);
    for (size_t i = start; i < d->recentLogs.size(); ++i) {
        result.push_back(d->recentLogs[i]);
    }
    return result;
}

} // namespace ironwatch
