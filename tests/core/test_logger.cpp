#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include "trend_lab/core/logger.hpp"

using namespace trend_lab;

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        Logger::register_component("");

        saved_cout_ = std::cout.rdbuf(console_.rdbuf());

        std::error_code ec;
        fs::remove_all(log_dir_, ec);
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        std::cout.rdbuf(saved_cout_);
        Logger::reset_for_tests();

        std::error_code ec;
        fs::remove_all(log_dir_, ec);
    }

    // Bare messages: no timestamp, no level
    LoggerConfig plain_config(LogDestination destination) const {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = log_dir_;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::vector<fs::path> log_files(const fs::path& dir) const {
        std::vector<fs::path> files;
        if (!fs::exists(dir)) {
            return files;
        }
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    static std::string slurp(const fs::path& path) {
        std::ifstream in(path);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::streambuf* saved_cout_ = nullptr;
    std::stringstream console_;
    const std::string log_dir_ = "trend_lab_test_logs";
};

TEST_F(LoggerTest, ResetReleasesLogFile) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));
    Logger::reset_for_tests();

    std::error_code ec;
    fs::remove_all(log_dir_, ec);
    EXPECT_FALSE(ec) << ec.message();
}

TEST_F(LoggerTest, CreatesNestedLogDirectory) {
    auto config = plain_config(LogDestination::FILE);
    config.log_directory = log_dir_ + "/backtests/spy";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(fs::is_directory(config.log_directory));
    EXPECT_EQ(log_files(config.log_directory).size(), 1u);
}

TEST_F(LoggerTest, ConsoleDestination) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));
    Logger::instance().log(LogLevel::INFO, "aligned 252 rows");

    EXPECT_EQ(console_.str(), "aligned 252 rows\n");
    EXPECT_TRUE(log_files(log_dir_).empty());
}

TEST_F(LoggerTest, FileDestination) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));
    Logger::instance().log(LogLevel::INFO, "ENTER on 2024-03-01");

    auto files = log_files(log_dir_);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(slurp(files[0]), "ENTER on 2024-03-01\n");
    EXPECT_TRUE(console_.str().empty());
}

TEST_F(LoggerTest, BothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));
    Logger::instance().log(LogLevel::WARNING, "QQQ excluded");

    EXPECT_EQ(console_.str(), "QQQ excluded\n");
    auto files = log_files(log_dir_);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(slurp(files[0]), "QQQ excluded\n");
}

TEST_F(LoggerTest, MessagesBelowMinimumLevelAreDropped) {
    auto config = plain_config(LogDestination::FILE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::TRACE, "t");
    Logger::instance().log(LogLevel::DEBUG, "d");
    Logger::instance().log(LogLevel::INFO, "i");
    Logger::instance().log(LogLevel::WARNING, "w");
    Logger::instance().log(LogLevel::ERR, "e");
    Logger::instance().log(LogLevel::FATAL, "f");

    auto files = log_files(log_dir_);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(slurp(files[0]), "w\ne\nf\n");
}

TEST_F(LoggerTest, TimestampAndLevelFormatting) {
    auto config = plain_config(LogDestination::CONSOLE);
    config.include_timestamp = true;
    config.include_level = true;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::ERR, "no overlap");

    // "YYYY-MM-DD HH:MM:SS [ERROR] no overlap\n"
    std::string line = console_.str();
    ASSERT_EQ(line.size(), 20u + std::string("[ERROR] no overlap\n").size());
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[13], ':');
    EXPECT_EQ(line.substr(20), "[ERROR] no overlap\n");
}

TEST_F(LoggerTest, RotatesWhenFileExceedsMaximumSize) {
    auto config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;
    config.max_files = 5;
    Logger::instance().initialize(config);

    // 8 bytes each: the second write crosses the limit
    Logger::instance().log(LogLevel::INFO, "SPY 401");
    EXPECT_EQ(log_files(log_dir_).size(), 1u);
    Logger::instance().log(LogLevel::INFO, "SPY 402");
    EXPECT_EQ(log_files(log_dir_).size(), 2u);
}

TEST_F(LoggerTest, RetentionKeepsAtMostMaxFiles) {
    auto config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int day = 0; day < 4; ++day) {
        Logger::instance().log(LogLevel::INFO, "day " + std::to_string(day));
    }

    EXPECT_EQ(log_files(log_dir_).size(), 2u);
}

TEST_F(LoggerTest, UninitializedLoggerWritesNothingToSinks) {
    Logger::reset_for_tests();

    std::stringstream captured_err;
    std::streambuf* saved_err = std::cerr.rdbuf(captured_err.rdbuf());
    Logger::instance().log(LogLevel::INFO, "early");
    std::cerr.rdbuf(saved_err);

    EXPECT_TRUE(console_.str().empty());
    EXPECT_TRUE(log_files(log_dir_).empty());
    EXPECT_NE(captured_err.str().find("early"), std::string::npos);
}

TEST_F(LoggerTest, ReinitializeInAnotherDirectory) {
    fs::path first_dir = fs::absolute(log_dir_) / "first";
    fs::path second_dir = fs::absolute(log_dir_) / "second";

    auto config = plain_config(LogDestination::FILE);
    config.log_directory = first_dir.string();
    config.filename_prefix = "bt_trend_filter";
    Logger::instance().initialize(config);
    Logger::instance().log(LogLevel::INFO, "first run");
    Logger::reset_for_tests();

    config.log_directory = second_dir.string();
    config.filename_prefix = "rank_momentum";
    Logger::instance().initialize(config);
    Logger::instance().log(LogLevel::INFO, "second run");
    Logger::reset_for_tests();

    auto first_files = log_files(first_dir);
    auto second_files = log_files(second_dir);
    ASSERT_EQ(first_files.size(), 1u);
    ASSERT_EQ(second_files.size(), 1u);
    EXPECT_EQ(first_files[0].filename().string().rfind("bt_trend_filter_", 0), 0u);
    EXPECT_EQ(slurp(second_files[0]), "second run\n");
}

TEST_F(LoggerTest, ComponentTagIsPrefixed) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::register_component("PriceAligner");
    Logger::instance().log(LogLevel::INFO, "Aligned");
    Logger::register_component("");

    EXPECT_EQ(console_.str(), "[PriceAligner] Aligned\n");
}

TEST_F(LoggerTest, MacrosRespectMinimumLevel) {
    auto config = plain_config(LogDestination::CONSOLE);
    config.min_level = LogLevel::INFO;
    config.include_level = true;
    Logger::instance().initialize(config);

    int window = 200;
    DEBUG("hidden " << window);
    INFO("window=" << window);
    WARN("stale");

    EXPECT_EQ(console_.str(), "[INFO] window=200\n[WARNING] stale\n");

    Logger::instance().set_level(LogLevel::ERR);
    EXPECT_EQ(Logger::instance().get_min_level(), LogLevel::ERR);
}

TEST_F(LoggerTest, LevelChangesWhileOtherThreadsLog) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([] {
            for (int i = 0; i < 200; ++i) {
                INFO("tick");
            }
        });
    }
    std::thread switcher([] {
        for (int i = 0; i < 200; ++i) {
            Logger::instance().set_level(i % 2 == 0 ? LogLevel::ERR : LogLevel::INFO);
        }
        Logger::instance().set_level(LogLevel::WARNING);
    });
    for (auto& writer : writers) {
        writer.join();
    }
    switcher.join();

    EXPECT_EQ(Logger::instance().get_min_level(), LogLevel::WARNING);

    std::istringstream lines(console_.str());
    std::string line;
    size_t count = 0;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line, "tick");
        ++count;
    }
    EXPECT_LE(count, 800u);

    INFO("dropped");
    EXPECT_EQ(console_.str().find("dropped"), std::string::npos);
}

TEST_F(LoggerTest, LevelAndDestinationParsing) {
    EXPECT_EQ(level_from_string("ERROR").value(), LogLevel::ERR);
    EXPECT_EQ(level_from_string("TRACE").value(), LogLevel::TRACE);
    EXPECT_TRUE(level_from_string("VERBOSE").is_error());
    EXPECT_EQ(log_destination_from_string("BOTH").value(), LogDestination::BOTH);
    EXPECT_TRUE(log_destination_from_string("SYSLOG").is_error());
}
