/**
 * @file test_logger.cpp
 * @brief File logging, level filtering and thread-safety of the Logger
 */

#include <gtest/gtest.h>
#include <gest/core/Logger.hpp>

#include <cstdio>
#include <fstream>
#include <sys/stat.h>
#include <string>
#include <thread>
#include <vector>

using namespace gest::core;

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

int count_containing(const std::vector<std::string>& lines, const std::string& needle) {
    int count = 0;
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) {
            count++;
        }
    }
    return count;
}

bool exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

long size_of(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 ? static_cast<long>(st.st_size) : -1;
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::getInstance();
        logger.setConsoleOutput(false);
        path_ = ::testing::TempDir() + "gest_logger_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log";
        errorPath_ = path_ + ".errors";
        std::remove(path_.c_str());
        ASSERT_TRUE(logger.setLogFile(path_));
        EXPECT_EQ(logger.getCurrentLogFile(), path_);
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.closeLogFile();
        logger.setConsoleOutput(true);
        logger.setLevel(LogLevel::INFO);
        logger.setRotation(LogRotation());
        std::remove(path_.c_str());
        for (int i = 1; i <= 3; ++i) {
            std::remove((path_ + "." + std::to_string(i)).c_str());
        }
        std::remove(errorPath_.c_str());
    }

    std::string path_;
    std::string errorPath_;
};

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("WARN", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::WARNING);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger& logger = Logger::getInstance();
    logger.setLevel(LogLevel::WARNING);

    LOG_DEBUG("hidden debug line");
    LOG_INFO("hidden info line");
    LOG_WARNING("visible warning line");
    LOG_ERROR("visible error line");
    logger.flush();

    auto lines = read_lines(path_);
    EXPECT_EQ(count_containing(lines, "hidden"), 0);
    EXPECT_EQ(count_containing(lines, "[WARNING] visible warning line"), 1);
    EXPECT_EQ(count_containing(lines, "[ERROR] visible error line"), 1);

    // Macros append the source location
    EXPECT_EQ(count_containing(lines, "(test_logger.cpp:"), 2);
}

TEST_F(LoggerTest, StreamLoggingPrefixesComponent) {
    Logger::getInstance().setLevel(LogLevel::DEBUG);
    GEST_LOG_INFO("Camera") << "frame " << 42;
    Logger::getInstance().flush();

    EXPECT_EQ(count_containing(read_lines(path_), "Camera: frame 42"), 1);
}

TEST_F(LoggerTest, ConcurrentLoggingKeepsLinesIntact) {
    Logger& logger = Logger::getInstance();
    logger.setLevel(LogLevel::INFO);

    constexpr int kThreads = 8;
    constexpr int kMessages = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t, &logger] {
            for (int m = 0; m < kMessages; ++m) {
                logger.info("worker " + std::to_string(t) + " message " + std::to_string(m));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger.flush();

    auto lines = read_lines(path_);
    EXPECT_EQ(count_containing(lines, "[INFO] worker "), kThreads * kMessages);
    for (int t = 0; t < kThreads; ++t) {
        EXPECT_EQ(count_containing(lines, "worker " + std::to_string(t) + " message " +
                                   std::to_string(kMessages - 1)), 1);
    }
}

TEST_F(LoggerTest, ParsesByteSizes) {
    size_t bytes = 0;
    EXPECT_TRUE(parseByteSize("10MB", bytes));
    EXPECT_EQ(bytes, 10u * 1024 * 1024);
    EXPECT_TRUE(parseByteSize("512kb", bytes));
    EXPECT_EQ(bytes, 512u * 1024);
    EXPECT_TRUE(parseByteSize("1 GB", bytes));
    EXPECT_EQ(bytes, 1024u * 1024 * 1024);
    EXPECT_TRUE(parseByteSize("4096", bytes));
    EXPECT_EQ(bytes, 4096u);

    EXPECT_FALSE(parseByteSize("0MB", bytes));
    EXPECT_FALSE(parseByteSize("MB", bytes));
    EXPECT_FALSE(parseByteSize("10 parsecs", bytes));
    EXPECT_FALSE(parseByteSize("-5KB", bytes));
    EXPECT_FALSE(parseByteSize("", bytes));
    EXPECT_EQ(bytes, 4096u);
}

TEST_F(LoggerTest, RotatesBySizeAndKeepsBackupCount) {
    Logger& logger = Logger::getInstance();
    LogRotation rotation;
    rotation.maxBytes = 2048;
    rotation.backupCount = 2;
    logger.setRotation(rotation);

    const std::string padding(80, 'x');
    for (int i = 0; i < 200; ++i) {
        logger.info("rotation line " + std::to_string(i) + " " + padding);
    }
    logger.info("final rotation line");
    logger.flush();

    EXPECT_TRUE(exists(path_));
    EXPECT_TRUE(exists(path_ + ".1"));
    EXPECT_TRUE(exists(path_ + ".2"));
    EXPECT_FALSE(exists(path_ + ".3"));

    for (const std::string& file : {path_, path_ + ".1", path_ + ".2"}) {
        EXPECT_GT(size_of(file), 0) << file;
        EXPECT_LE(size_of(file), 2048) << file;
    }

    EXPECT_EQ(count_containing(read_lines(path_), "final rotation line"), 1);
    EXPECT_EQ(count_containing(read_lines(path_ + ".1"), "final rotation line"), 0);

    // Oldest lines were dropped with the third rotation
    EXPECT_EQ(count_containing(read_lines(path_ + ".2"), "rotation line 0 "), 0);
}

TEST_F(LoggerTest, ZeroBackupsTruncatesInPlace) {
    Logger& logger = Logger::getInstance();
    LogRotation rotation;
    rotation.maxBytes = 1024;
    rotation.backupCount = 0;
    logger.setRotation(rotation);

    for (int i = 0; i < 50; ++i) {
        logger.info("truncate line " + std::to_string(i) + " " + std::string(60, 'y'));
    }
    logger.flush();

    EXPECT_FALSE(exists(path_ + ".1"));
    EXPECT_LE(size_of(path_), 1024);
    EXPECT_EQ(count_containing(read_lines(path_), "truncate line 49 "), 1);
}

TEST_F(LoggerTest, ErrorLogReceivesOnlyErrors) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.setErrorLogFile(errorPath_));
    EXPECT_EQ(logger.getCurrentErrorLogFile(), errorPath_);

    LOG_INFO("routine entry");
    LOG_WARNING("suspicious entry");
    LOG_ERROR("failed entry");
    LOG_CRITICAL("fatal entry");
    logger.flush();

    auto errors = read_lines(errorPath_);
    EXPECT_EQ(errors.size(), 2u);
    EXPECT_EQ(count_containing(errors, "[ERROR] failed entry"), 1);
    EXPECT_EQ(count_containing(errors, "[CRITICAL] fatal entry"), 1);

    auto all = read_lines(path_);
    EXPECT_EQ(count_containing(all, "routine entry"), 1);
    EXPECT_EQ(count_containing(all, "suspicious entry"), 1);
    EXPECT_EQ(count_containing(all, "failed entry"), 1);

    logger.closeLogFile();
    EXPECT_TRUE(logger.getCurrentLogFile().empty());
    EXPECT_TRUE(logger.getCurrentErrorLogFile().empty());
}

TEST(LoggerDirectoryTest, InitializesTimestampedFile) {
    Logger& logger = Logger::getInstance();
    logger.setConsoleOutput(false);

    const std::string directory = ::testing::TempDir() + "gest_log_dir/nested";
    ASSERT_TRUE(logger.initializeWithTimestamp(directory, LogLevel::DEBUG));

    const std::string file = logger.getCurrentLogFile();
    EXPECT_EQ(file.rfind(directory + "/gest_", 0), 0u);
    EXPECT_NE(file.find(".log"), std::string::npos);

    const std::string errorFile = logger.getCurrentErrorLogFile();
    EXPECT_EQ(errorFile.rfind(directory + "/gest_errors_", 0), 0u);

    LOG_DEBUG("timestamped file entry");
    LOG_ERROR("timestamped error entry");
    logger.flush();
    EXPECT_EQ(count_containing(read_lines(file), "timestamped file entry"), 1);
    EXPECT_EQ(count_containing(read_lines(file), "timestamped error entry"), 1);
    EXPECT_EQ(count_containing(read_lines(errorFile), "timestamped file entry"), 0);
    EXPECT_EQ(count_containing(read_lines(errorFile), "timestamped error entry"), 1);

    logger.closeLogFile();
    logger.setConsoleOutput(true);
    logger.setLevel(LogLevel::INFO);
    std::remove(file.c_str());
    std::remove(errorFile.c_str());
}
