#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <memory>
#include <chrono>
#include <fstream>

namespace gest {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name ("trace", "DEBUG", "warning", ...)
 * @return false if the name is not a recognized level
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

/**
 * Parse a file size: "10MB", "512KB", "1GB" or a plain byte count
 * @return false for malformed or zero sizes
 */
bool parseByteSize(const std::string& text, size_t& bytes);

/**
 * Size-based rotation of the log files
 *
 * A write that would grow a file past maxBytes first shifts gest.log to
 * gest.log.1, gest.log.1 to gest.log.2 and so on. Backups numbered above
 * backupCount are deleted.
 */
struct LogRotation {
    size_t maxBytes = 10 * 1024 * 1024;   ///< 0 disables rotation
    int backupCount = 5;
};

/**
 * Thread-safe logger writing to the console, a main log file and an
 * optional error log that receives ERROR and CRITICAL lines only
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    /**
     * Set minimum log level
     */
    void setLevel(LogLevel level) { minLevel_ = level; }

    LogLevel getLevel() const { return minLevel_; }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    void setRotation(const LogRotation& rotation);

    LogRotation getRotation() const;

    /**
     * Set main log file (appends)
     */
    bool setLogFile(const std::string& filename);

    /**
     * Set error log file (appends); receives ERROR and above
     */
    bool setErrorLogFile(const std::string& filename);

    /**
     * Close both log files
     */
    void closeLogFile();

    /**
     * Open gest_<timestamp>.log and gest_errors_<timestamp>.log in a directory
     * Creates the directory (and missing parents) if needed
     * @param level Minimum log level to capture
     * @return true if the main file is open, false if console only
     */
    bool initializeWithTimestamp(const std::string& logDirectory,
                                 LogLevel level = LogLevel::INFO);

    /**
     * Current main log file path, empty if no file logging
     */
    std::string getCurrentLogFile() const;

    std::string getCurrentErrorLogFile() const;

    void flush();

    /**
     * Log message
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

    // Convenience methods
    void trace(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::TRACE, msg, file, line);
    }

    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, msg, file, line);
    }

    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, msg, file, line);
    }

    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, msg, file, line);
    }

    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, msg, file, line);
    }

    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, msg, file, line);
    }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    struct FileSink {
        std::string path;
        std::ofstream stream;
        size_t bytes = 0;       ///< Size of the current file, including earlier runs
    };

    bool openSink(FileSink& sink, const std::string& filename);
    void closeSink(FileSink& sink);
    void writeSink(FileSink& sink, const std::string& line, bool flushNow);
    void rotateSink(FileSink& sink);

    std::string levelToString(LogLevel level) const;
    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;
    std::string generateTimestampedFilename(const std::string& directory, const std::string& prefix) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    LogRotation rotation_;

    mutable std::mutex mutex_;
    FileSink mainLog_;
    FileSink errorLog_;
};

// Convenience macros
#define LOG_TRACE(msg) gest::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) gest::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) gest::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) gest::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) gest::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) gest::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

/**
 * Stream-style logging with a component prefix
 */
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        if (component_.empty()) {
            Logger::getInstance().log(level_, stream_.str());
        } else {
            Logger::getInstance().log(level_, component_ + ": " + stream_.str());
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define GEST_LOG_DEBUG(component) \
    gest::core::LogStream(gest::core::LogLevel::DEBUG, component)

#define GEST_LOG_INFO(component) \
    gest::core::LogStream(gest::core::LogLevel::INFO, component)

#define GEST_LOG_WARNING(component) \
    gest::core::LogStream(gest::core::LogLevel::WARNING, component)

#define GEST_LOG_ERROR(component) \
    gest::core::LogStream(gest::core::LogLevel::ERROR, component)

} // namespace core
} // namespace gest
