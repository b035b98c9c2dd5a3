#include "gest/core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

namespace gest {
namespace core {

namespace {

bool fileExists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

size_t fileSize(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 ? static_cast<size_t>(st.st_size) : 0;
}

std::string backupName(const std::string& path, int index) {
    return path + "." + std::to_string(index);
}

} // namespace

bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") { level = LogLevel::TRACE; return true; }
    if (upper == "DEBUG") { level = LogLevel::DEBUG; return true; }
    if (upper == "INFO") { level = LogLevel::INFO; return true; }
    if (upper == "WARNING" || upper == "WARN") { level = LogLevel::WARNING; return true; }
    if (upper == "ERROR") { level = LogLevel::ERROR; return true; }
    if (upper == "CRITICAL") { level = LogLevel::CRITICAL; return true; }
    return false;
}

bool parseByteSize(const std::string& text, size_t& bytes) {
    size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        digits++;
    }
    if (digits == 0 || digits > 12) {
        return false;
    }

    std::string unit = text.substr(digits);
    unit.erase(std::remove(unit.begin(), unit.end(), ' '), unit.end());
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    size_t multiplier = 0;
    if (unit.empty() || unit == "B") {
        multiplier = 1;
    } else if (unit == "KB" || unit == "K") {
        multiplier = 1024;
    } else if (unit == "MB" || unit == "M") {
        multiplier = 1024 * 1024;
    } else if (unit == "GB" || unit == "G") {
        multiplier = 1024 * 1024 * 1024;
    } else {
        return false;
    }

    const size_t value = static_cast<size_t>(std::stoull(text.substr(0, digits)));
    if (value == 0) {
        return false;
    }
    bytes = value * multiplier;
    return true;
}

Logger::Logger() : minLevel_(LogLevel::INFO), consoleOutput_(true) {
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setRotation(const LogRotation& rotation) {
    std::lock_guard<std::mutex> lock(mutex_);
    rotation_ = rotation;
}

LogRotation Logger::getRotation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rotation_;
}

// ============================================================================
// File sinks (caller holds mutex_)
// ============================================================================

bool Logger::openSink(FileSink& sink, const std::string& filename) {
    closeSink(sink);
    sink.stream.open(filename, std::ios::out | std::ios::app);
    if (!sink.stream.is_open()) {
        std::cerr << "[Logger] Error: Failed to open log file " << filename
                  << ": " << std::strerror(errno) << std::endl;
        return false;
    }
    sink.path = filename;
    sink.bytes = fileSize(filename);
    return true;
}

void Logger::closeSink(FileSink& sink) {
    if (sink.stream.is_open()) {
        sink.stream.close();
    }
    sink.path.clear();
    sink.bytes = 0;
}

void Logger::writeSink(FileSink& sink, const std::string& line, bool flushNow) {
    if (!sink.stream.is_open()) {
        return;
    }

    const size_t size = line.size() + 1;
    if (rotation_.maxBytes > 0 && sink.bytes > 0 && sink.bytes + size > rotation_.maxBytes) {
        rotateSink(sink);
        if (!sink.stream.is_open()) {
            return;
        }
    }

    sink.stream << line << '\n';
    sink.bytes += size;
    if (flushNow) {
        sink.stream.flush();
    }
}

void Logger::rotateSink(FileSink& sink) {
    const std::string path = sink.path;
    sink.stream.close();

    if (rotation_.backupCount > 0) {
        const std::string oldest = backupName(path, rotation_.backupCount);
        if (fileExists(oldest) && std::remove(oldest.c_str()) != 0) {
            std::cerr << "[Logger] Cannot delete " << oldest << ": " << std::strerror(errno) << std::endl;
        }
        for (int i = rotation_.backupCount - 1; i >= 1; --i) {
            const std::string from = backupName(path, i);
            if (fileExists(from) && std::rename(from.c_str(), backupName(path, i + 1).c_str()) != 0) {
                std::cerr << "[Logger] Cannot rotate " << from << ": " << std::strerror(errno) << std::endl;
            }
        }
        if (std::rename(path.c_str(), backupName(path, 1).c_str()) != 0) {
            std::cerr << "[Logger] Cannot rotate " << path << ": " << std::strerror(errno) << std::endl;
        }
    }

    // Without backups the file is simply truncated
    sink.stream.open(path, std::ios::out | std::ios::trunc);
    sink.bytes = 0;
    if (!sink.stream.is_open()) {
        std::cerr << "[Logger] Error: Failed to reopen " << path << " after rotation" << std::endl;
    }
}

// ============================================================================
// Public API
// ============================================================================

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    return openSink(mainLog_, filename);
}

bool Logger::setErrorLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    return openSink(errorLog_, filename);
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeSink(mainLog_);
    closeSink(errorLog_);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        std::cout.flush();
        std::cerr.flush();
    }
    if (mainLog_.stream.is_open()) {
        mainLog_.stream.flush();
    }
    if (errorLog_.stream.is_open()) {
        errorLog_.stream.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line) {
    if (level < minLevel_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const std::string formatted = formatMessage(level, message, file, line);
    const bool severe = level >= LogLevel::ERROR;

    if (consoleOutput_) {
        (severe ? std::cerr : std::cout) << formatted << std::endl;
    }

    // Errors reach disk even if the process dies right after
    writeSink(mainLog_, formatted, severe);
    if (severe) {
        writeSink(errorLog_, formatted, true);
    }
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

std::string Logger::getTimestamp() const {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "."
        << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::formatMessage(LogLevel level, const std::string& message,
                                  const std::string& file, int line) const {
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] [" << levelToString(level) << "] " << message;

    if (!file.empty() && line > 0) {
        const size_t slash = file.find_last_of("/\\");
        oss << " (" << (slash == std::string::npos ? file : file.substr(slash + 1)) << ":" << line << ")";
    }
    return oss.str();
}

std::string Logger::generateTimestampedFilename(const std::string& directory, const std::string& prefix) const {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << directory;
    if (!directory.empty() && directory.back() != '/') {
        oss << '/';
    }
    oss << prefix << std::put_time(&local, "%Y-%m-%d_%H-%M-%S") << ".log";
    return oss.str();
}

bool Logger::createDirectoryIfNeeded(const std::string& directory) const {
    struct stat st;
    if (::stat(directory.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return true;
        }
        std::cerr << "[Logger] Error: " << directory << " exists but is not a directory" << std::endl;
        return false;
    }

    if (::mkdir(directory.c_str(), 0755) == 0) {
        return true;
    }

    if (errno == ENOENT) {
        const size_t slash = directory.find_last_of('/');
        if (slash != std::string::npos && slash > 0 && createDirectoryIfNeeded(directory.substr(0, slash))) {
            return ::mkdir(directory.c_str(), 0755) == 0 || errno == EEXIST;
        }
    }

    std::cerr << "[Logger] Failed to create directory " << directory
              << ": " << std::strerror(errno) << std::endl;
    return false;
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    minLevel_ = level;

    if (!createDirectoryIfNeeded(logDirectory)) {
        std::cerr << "[Logger] Warning: Could not create log directory, file logging disabled" << std::endl;
        return false;
    }

    if (!openSink(mainLog_, generateTimestampedFilename(logDirectory, "gest_"))) {
        return false;
    }
    if (!openSink(errorLog_, generateTimestampedFilename(logDirectory, "gest_errors_"))) {
        std::cerr << "[Logger] Warning: error log disabled" << std::endl;
    }

    std::ostringstream banner;
    banner << "=== gest log started " << getTimestamp() << ", level " << levelToString(level)
           << ", rotation " << rotation_.maxBytes << " bytes x " << rotation_.backupCount << " ===";
    writeSink(mainLog_, banner.str(), true);
    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mainLog_.path;
}

std::string Logger::getCurrentErrorLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return errorLog_.path;
}

} // namespace core
} // namespace gest
