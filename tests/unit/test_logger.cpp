/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <atomic>
#include "ragd/logger.h"

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ragd::Logger::shutdown();
    }

    void TearDown() override {
        ragd::Logger::shutdown();
    }
};

// ============================================================================
// Levels
// ============================================================================

TEST_F(LoggerTest, InitSetsLevel) {
    for (auto level : {ragd::LogLevel::DEBUG, ragd::LogLevel::INFO, ragd::LogLevel::WARN,
                       ragd::LogLevel::ERROR, ragd::LogLevel::CRITICAL}) {
        ragd::Logger::init(level, false);
        EXPECT_EQ(ragd::Logger::get_level(), level);
        ragd::Logger::shutdown();
    }
}

TEST_F(LoggerTest, SetLevelChangesFilter) {
    ragd::Logger::init(ragd::LogLevel::INFO, false);
    EXPECT_FALSE(ragd::Logger::enabled(ragd::LogLevel::DEBUG));
    EXPECT_TRUE(ragd::Logger::enabled(ragd::LogLevel::INFO));

    ragd::Logger::set_level(ragd::LogLevel::ERROR);
    EXPECT_EQ(ragd::Logger::get_level(), ragd::LogLevel::ERROR);
    EXPECT_FALSE(ragd::Logger::enabled(ragd::LogLevel::WARN));
    EXPECT_TRUE(ragd::Logger::enabled(ragd::LogLevel::CRITICAL));
}

TEST_F(LoggerTest, LevelFromConfigIntegerClamps) {
    EXPECT_EQ(ragd::Logger::level_from_int(-3), ragd::LogLevel::DEBUG);
    EXPECT_EQ(ragd::Logger::level_from_int(0), ragd::LogLevel::DEBUG);
    EXPECT_EQ(ragd::Logger::level_from_int(1), ragd::LogLevel::INFO);
    EXPECT_EQ(ragd::Logger::level_from_int(2), ragd::LogLevel::WARN);
    EXPECT_EQ(ragd::Logger::level_from_int(3), ragd::LogLevel::ERROR);
    EXPECT_EQ(ragd::Logger::level_from_int(4), ragd::LogLevel::CRITICAL);
    EXPECT_EQ(ragd::Logger::level_from_int(42), ragd::LogLevel::CRITICAL);
}

TEST_F(LoggerTest, LogLevelOrdering) {
    EXPECT_LT(static_cast<int>(ragd::LogLevel::DEBUG), static_cast<int>(ragd::LogLevel::INFO));
    EXPECT_LT(static_cast<int>(ragd::LogLevel::INFO), static_cast<int>(ragd::LogLevel::WARN));
    EXPECT_LT(static_cast<int>(ragd::LogLevel::WARN), static_cast<int>(ragd::LogLevel::ERROR));
    EXPECT_LT(static_cast<int>(ragd::LogLevel::ERROR), static_cast<int>(ragd::LogLevel::CRITICAL));
}

TEST_F(LoggerTest, LevelFromName) {
    EXPECT_EQ(ragd::Logger::level_from_name("debug"), ragd::LogLevel::DEBUG);
    EXPECT_EQ(ragd::Logger::level_from_name("INFO"), ragd::LogLevel::INFO);
    EXPECT_EQ(ragd::Logger::level_from_name("warning"), ragd::LogLevel::WARN);
    EXPECT_EQ(ragd::Logger::level_from_name("Warn"), ragd::LogLevel::WARN);
    EXPECT_EQ(ragd::Logger::level_from_name("critical"), ragd::LogLevel::CRITICAL);
    EXPECT_FALSE(ragd::Logger::level_from_name("verbose").has_value());
    EXPECT_FALSE(ragd::Logger::level_from_name("2").has_value());
}

// ============================================================================
// Output
// ============================================================================

TEST_F(LoggerTest, LogMacrosWork) {
    ragd::Logger::init(ragd::LogLevel::DEBUG, false);

    LOG_DEBUG("MacroTest", "debug via macro");
    LOG_INFO("MacroTest", "info via macro");
    LOG_WARN("MacroTest", "warn via macro");
    LOG_ERROR("MacroTest", "error via macro");
    LOG_CRITICAL("MacroTest", "critical via macro");

    SUCCEED();
}

TEST_F(LoggerTest, TracedRecordsCarryTraceId) {
    ragd::Logger::init(ragd::LogLevel::DEBUG, false);

    testing::internal::CaptureStderr();
    LOG_TRACED(INFO, "IPCServer", "0123abcd", "/v1/query -> 200");
    ragd::Logger::traced(ragd::LogLevel::WARN, "IPCServer", "", "no trace");
    std::string out = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("[INFO] IPCServer [0123abcd]: /v1/query -> 200"), std::string::npos);
    EXPECT_NE(out.find("[WARN] IPCServer: no trace"), std::string::npos);
}

TEST_F(LoggerTest, TracedRecordsRespectLevel) {
    ragd::Logger::init(ragd::LogLevel::ERROR, false);

    testing::internal::CaptureStderr();
    LOG_TRACED(DEBUG, "Handlers", "t-1", "hidden");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}

TEST_F(LoggerTest, OddMessagesWork) {
    ragd::Logger::init(ragd::LogLevel::DEBUG, false);

    ragd::Logger::info("", "empty component");
    ragd::Logger::info("Test", "");
    ragd::Logger::info("Test", std::string(10000, 'a'));
    ragd::Logger::info("Test", "frame \"18\\n{...}\\n\" with UTF-8: \xc3\xa9");

    SUCCEED();
}

TEST_F(LoggerTest, LoggingWithoutInit) {
    ragd::Logger::info("Test", "message before init");
    SUCCEED();
}

// ============================================================================
// Lifecycle and threads
// ============================================================================

TEST_F(LoggerTest, ShutdownAndReinit) {
    ragd::Logger::init(ragd::LogLevel::DEBUG, false);
    ragd::Logger::shutdown();
    ragd::Logger::shutdown();

    ragd::Logger::init(ragd::LogLevel::WARN, false);
    EXPECT_EQ(ragd::Logger::get_level(), ragd::LogLevel::WARN);
}

TEST_F(LoggerTest, ThreadSafeLevelChange) {
    ragd::Logger::init(ragd::LogLevel::INFO, false);
    std::atomic<bool> running{true};

    std::thread writer([&]() {
        while (running) {
            ragd::Logger::info("Test", "message");
            std::this_thread::sleep_for(std::chrono::microseconds(10));
        }
    });

    std::vector<std::thread> changers;
    for (int t = 0; t < 4; ++t) {
        changers.emplace_back([]() {
            for (int i = 0; i < 100; ++i) {
                ragd::Logger::set_level(ragd::LogLevel::DEBUG);
                ragd::Logger::set_level(ragd::LogLevel::ERROR);
            }
        });
    }
    for (auto& t : changers) {
        t.join();
    }
    running = false;
    writer.join();

    SUCCEED();
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
