#include "gtest/gtest.h"
#include "qospol/util/logger.h"
#include "qospol/policy/policy_errors.h"

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace qospol {
namespace util {

class LoggerTest : public ::testing::Test {
protected:
    // Builds a mutable argv from string literals.
    std::vector<char*> make_argv(std::vector<std::string>& args) {
        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(&a[0]);
        }
        argv.push_back(nullptr);
        return argv;
    }
};

TEST_F(LoggerTest, ParseLevelNames) {
    EXPECT_EQ(Logger::parse_level("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parse_level("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parse_level("info"), spdlog::level::info);
    EXPECT_EQ(Logger::parse_level("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parse_level("err"), spdlog::level::err);
    EXPECT_EQ(Logger::parse_level("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parse_level("critical"), spdlog::level::critical);
    EXPECT_EQ(Logger::parse_level("off"), spdlog::level::off);
    EXPECT_THROW(Logger::parse_level("verbose"), policy::ArgumentError);
}

TEST_F(LoggerTest, CliArgsDefaults) {
    std::vector<std::string> args{"qospol_demo", "--unrelated"};
    auto argv = make_argv(args);
    LogConfig cfg = Logger::parse_cli_args(static_cast<int>(args.size()), argv.data());
    EXPECT_EQ(cfg.level, spdlog::level::info);
    EXPECT_TRUE(cfg.file_path.empty());
}

TEST_F(LoggerTest, CliArgsLevelAndFile) {
    std::vector<std::string> args{"qospol_demo", "--log-level", "debug", "--log-file", "/tmp/qospol.log"};
    auto argv = make_argv(args);
    LogConfig cfg = Logger::parse_cli_args(static_cast<int>(args.size()), argv.data());
    EXPECT_EQ(cfg.level, spdlog::level::debug);
    EXPECT_EQ(cfg.file_path, "/tmp/qospol.log");
}

TEST_F(LoggerTest, CliArgsMissingValue) {
    std::vector<std::string> args{"qospol_demo", "--log-level"};
    auto argv = make_argv(args);
    EXPECT_THROW(Logger::parse_cli_args(static_cast<int>(args.size()), argv.data()), policy::ArgumentError);
}

TEST_F(LoggerTest, InstanceIsAvailableWithoutInit) {
    auto logger = Logger::instance();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(Logger::instance(), logger);
}

TEST_F(LoggerTest, InitAppliesLevel) {
    LogConfig cfg;
    cfg.level = spdlog::level::warn;
    Logger::init(cfg);
    EXPECT_EQ(Logger::instance()->level(), spdlog::level::warn);
    EXPECT_EQ(Logger::instance()->name(), "qospol");
}

TEST_F(LoggerTest, ConcurrentInstanceKeepsConfiguredLogger) {
    LogConfig cfg;
    cfg.logger_name = "qospol_concurrent";
    cfg.level = spdlog::level::err;
    Logger::init(cfg);

    std::vector<std::shared_ptr<spdlog::logger>> seen(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&seen, i]() { seen[i] = Logger::instance(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& logger : seen) {
        ASSERT_NE(logger, nullptr);
        EXPECT_EQ(logger, Logger::instance());
        EXPECT_EQ(logger->name(), "qospol_concurrent");
        EXPECT_EQ(logger->level(), spdlog::level::err);
    }
}

} // namespace util
} // namespace qospol
