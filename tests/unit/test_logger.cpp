/**
 * @file test_logger.cpp
 * @brief Logger levels, file output and component tags
 */

#include <gtest/gtest.h>
#include "Logger.h"
#include "LoggerMacros.h"
#include "MockStores.h"
#include <fstream>
#include <sstream>

using namespace ChunkVault;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_ = std::make_unique<ScratchDir>("chunkvault_logger");
        Logger& logger = Logger::instance();
        logger.setConsoleOutput(false);
        logger.setLogFile(scratch_->file("test.log"));
        logger.setLevel(LogLevel::DEBUG);
    }

    void TearDown() override {
        Logger& logger = Logger::instance();
        logger.setLogFile("");
        logger.setLevel(LogLevel::INFO);
        logger.setConsoleOutput(true);
        scratch_.reset();
    }

    std::string contents() const {
        std::ifstream in(scratch_->file("test.log"));
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::unique_ptr<ScratchDir> scratch_;
};

TEST_F(LoggerTest, IsSingleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggerTest, WritesLevelAndComponent) {
    Logger::instance().info("Test info message", "Uploader");
    Logger::instance().error("Test error message", "Uploader");

    std::string log = contents();
    EXPECT_NE(log.find("[INFO] [Uploader] Test info message"), std::string::npos);
    EXPECT_NE(log.find("[ERROR] [Uploader] Test error message"), std::string::npos);
}

TEST_F(LoggerTest, DropsMessagesBelowLevel) {
    Logger& logger = Logger::instance();
    logger.setLevel(LogLevel::WARN);
    logger.info("quiet info");
    logger.warn("loud warning");

    std::string log = contents();
    EXPECT_EQ(log.find("quiet info"), std::string::npos);
    EXPECT_NE(log.find("loud warning"), std::string::npos);
}

TEST_F(LoggerTest, MacrosCarryComponent) {
    LOG_INFO_COMP_IF("macro message", "Stream");
    LOG_WARN_COMP("macro warning", "Stream");
    std::string log = contents();
    EXPECT_NE(log.find("[Stream] macro message"), std::string::npos);
    EXPECT_NE(log.find("[WARN] [Stream] macro warning"), std::string::npos);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString("WARN"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("Error"), LogLevel::ERROR);
    EXPECT_EQ(logLevelFromString("nonsense"), LogLevel::INFO);
}
