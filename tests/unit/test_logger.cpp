#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Glimpse::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Logger::info("Test info message - hidden");
    Logger::error("Test error message - hidden");
    std::string out = testing::internal::GetCapturedStdout() + testing::internal::GetCapturedStderr();
    Logger::set_level(LOG_ALL);

    EXPECT_TRUE(out.empty());
}

TEST(LoggerTest, LevelFiltering) {
    Logger::set_level(LOG_ERROR);
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Logger::info("This should not be printed");
    Logger::warn("Neither should this");
    Logger::error("This should be printed");
    std::string out = testing::internal::GetCapturedStdout() + testing::internal::GetCapturedStderr();
    Logger::set_level(LOG_ALL);

    EXPECT_EQ(out.find("should not"), std::string::npos);
    EXPECT_EQ(out.find("Neither"), std::string::npos);
    EXPECT_NE(out.find("This should be printed"), std::string::npos);
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_ALL);
    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 100; ++j) {
                Logger::info("Logging from thread "
                             + std::to_string(
                                 std::hash<std::thread::id>{}(std::this_thread::get_id())));
            }
        });
    }
    for (auto& t : threads)
        t.join();
}
