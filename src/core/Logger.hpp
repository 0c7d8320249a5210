#pragma once
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ironwatch {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    System,
    All
};

// Accepts the config spellings: trace, debug, info, warn(ing), error, critical.
std::optional<LogLevel> parseLogLevel(const std::string& name);

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    void setMaxFileSize(size_t bytes);
    void setRotationEnabled(bool enable);
    void enableTimestamps(bool enable);
    void enableSourceInfo(bool enable);

    void debug(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void info(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void warning(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");
    void error(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void critical(const std::string& message,
                  const std::string& source = "",
                  const std::string& function = "");

    void flush();
    std::vector<std::string> getRecentLogs(size_t count = 100) const;

signals:
    void logAdded(ironwatch::LogLevel level, const std::string& message);
    void logFileRotated(const std::string& oldFile, const std::string& newFile);

private:
    Logger();
    ~Logger() override;

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);

    class Private;
    std::unique_ptr<Private> d;
};

#define LOG_DEBUG(msg) \
    ::ironwatch::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define LOG_INFO(msg) \
    ::ironwatch::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define LOG_WARNING(msg) \
    ::ironwatch::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define LOG_ERROR(msg) \
    ::ironwatch::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define LOG_CRITICAL(msg) \
    ::ironwatch::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace ironwatch

Q_DECLARE_METATYPE(ironwatch::LogLevel)
