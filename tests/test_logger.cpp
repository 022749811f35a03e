#include <gtest/gtest.h>
#include "core/Logger.hpp"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace ward;

TEST(LoggerTest, LevelNamesParse) {
    EXPECT_EQ(LogLevelFromString("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(LogLevelFromString("Critical"), LogLevel::CRITICAL);
    EXPECT_EQ(LogLevelFromString("verbose"), LogLevel::INFO);
}

TEST(LoggerTest, ConcurrentCallersShareOneLogger) {
    std::vector<std::thread> threads;
    std::vector<spdlog::logger*> seen(8, nullptr);

    for (size_t t = 0; t < seen.size(); ++t) {
        threads.emplace_back([&seen, t]() {
            for (int i = 0; i < 200; ++i) {
                LOG_DEBUG("worker {} iteration {}", t, i);
            }
            seen[t] = Logger::Get().get();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<spdlog::logger*> distinct(seen.begin(), seen.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_NE(*distinct.begin(), nullptr);
}

TEST(LoggerTest, ShutdownFallsBackToConsoleLogger) {
    auto before = Logger::Get();
    ASSERT_NE(before, nullptr);

    Logger::Shutdown();
    auto after = Logger::Get();
    ASSERT_NE(after, nullptr);
    EXPECT_NE(before.get(), after.get());
    EXPECT_EQ(after.get(), Logger::Get().get());
}
