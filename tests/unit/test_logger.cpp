#include <gtest/gtest.h>

#include "Logger.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace PeerDrop;

TEST(LoggerTest, Singleton) {
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Warn"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::CRITICAL);
    EXPECT_FALSE(parseLogLevel("chatty").has_value());
    EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST(LoggerTest, FileLoggingHonoursLevel) {
    auto logFile = std::filesystem::temp_directory_path() / ("peerdrop_log_" + std::to_string(getpid()) + ".txt");
    std::filesystem::remove(logFile);

    Logger& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLogFile(logFile.string());
    logger.setLevel(LogLevel::INFO);

    logger.debug("hidden debug line", "Test");
    logger.info("Test info message", "Test");
    logger.error("Test error message", "Test");

    // Release the file before reading it back
    logger.setLogFile("");
    logger.setConsoleOutput(true);

    std::ifstream file(logFile);
    ASSERT_TRUE(file.is_open());

    bool foundInfo = false;
    bool foundError = false;
    bool foundDebug = false;
    std::string line;
    while (std::getline(file, line)) {
        if (line.find("[INFO] [Test] Test info message") != std::string::npos) foundInfo = true;
        if (line.find("[ERROR] [Test] Test error message") != std::string::npos) foundError = true;
        if (line.find("hidden debug line") != std::string::npos) foundDebug = true;
    }

    EXPECT_TRUE(foundInfo);
    EXPECT_TRUE(foundError);
    EXPECT_FALSE(foundDebug);

    std::filesystem::remove(logFile);
}

TEST(LoggerTest, LevelChangesWhileOtherThreadsLog) {
    auto logFile = std::filesystem::temp_directory_path() / ("peerdrop_log_mt_" + std::to_string(getpid()) + ".txt");
    std::filesystem::remove(logFile);

    Logger& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLogFile(logFile.string());

    logger.setLevel(LogLevel::WARN);
    EXPECT_EQ(logger.getLevel(), LogLevel::WARN);

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&logger, t]() {
            for (int i = 0; i < 200; ++i) {
                logger.info("writer " + std::to_string(t) + " line " + std::to_string(i), "Test");
            }
        });
    }
    for (int i = 0; i < 200; ++i) {
        logger.setLevel(i % 2 == 0 ? LogLevel::DEBUG : LogLevel::ERROR);
    }
    for (auto& writer : writers) {
        writer.join();
    }

    logger.setLevel(LogLevel::INFO);
    EXPECT_EQ(logger.getLevel(), LogLevel::INFO);
    logger.info("after the storm", "Test");
    logger.setLogFile("");

    std::ifstream file(logFile);
    ASSERT_TRUE(file.is_open());
    bool foundLast = false;
    std::string line;
    while (std::getline(file, line)) {
        if (line.find("[INFO] [Test] after the storm") != std::string::npos) foundLast = true;
    }
    EXPECT_TRUE(foundLast);

    std::filesystem::remove(logFile);
}
