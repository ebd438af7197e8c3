// test_config_base.cpp
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "trend_lab/backtest/backtest_config.hpp"
#include "trend_lab/core/config_base.hpp"
#include "trend_lab/core/logger.hpp"
#include "trend_lab/core/time_utils.hpp"
#include "trend_lab/momentum/momentum_ranker.hpp"

using namespace trend_lab;
using namespace trend_lab::backtest;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "trend_lab_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    void write_file(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::filesystem::path test_dir;
};

// Minimal concrete ConfigBase
class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 1.5;

    std::filesystem::path file_path = test_dir / "test_config.json";

    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << "Failed to save config: "
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << "Failed to load config: "
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 1.5);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    TestConfig config;

    nlohmann::json partial;
    partial["name"] = "partial";
    config.from_json(partial);

    EXPECT_EQ(config.name, "partial");
    EXPECT_EQ(config.value, 42);
    EXPECT_DOUBLE_EQ(config.ratio, 0.5);
}

TEST_F(ConfigBaseTest, MissingFile) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "does_not_exist.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(ConfigBaseTest, UnwritableLocation) {
    TestConfig config;
    auto result = config.save_to_file((test_dir / "missing_dir" / "config.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "invalid.json";
    write_file(file_path, "{ this is not valid JSON }");

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
}

TEST_F(ConfigBaseTest, WrongValueTypeIsInvalidArgument) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "wrong_type.json";
    write_file(file_path, R"({"value": "forty-two"})");

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, BacktestConfigRoundTrip) {
    BacktestConfig config;
    config.signal_symbol = "^GSPC";
    config.traded_symbol = "SSO";
    config.start_date = core::make_date(2010, 1, 4);
    config.end_date = core::make_date(2020, 12, 31);
    config.window_length = 150;
    config.initial_policy = InitialPolicy::START_INVESTED_IF_ABOVE;
    config.moving_average_type = MovingAverageType::EMA;
    config.initial_capital = 25000.0;

    nlohmann::json j = config.to_json();
    EXPECT_EQ(j["start_date"], "2010-01-04");
    EXPECT_EQ(j["initial_policy"], "START_INVESTED_IF_ABOVE");

    BacktestConfig loaded;
    loaded.from_json(j);
    EXPECT_EQ(loaded.signal_symbol, "^GSPC");
    EXPECT_EQ(loaded.traded_symbol, "SSO");
    EXPECT_EQ(loaded.start_date, config.start_date);
    EXPECT_EQ(loaded.end_date, config.end_date);
    EXPECT_EQ(loaded.window_length, 150);
    EXPECT_EQ(loaded.initial_policy, InitialPolicy::START_INVESTED_IF_ABOVE);
    EXPECT_EQ(loaded.moving_average_type, MovingAverageType::EMA);
    EXPECT_DOUBLE_EQ(loaded.initial_capital, 25000.0);
    EXPECT_EQ(loaded.min_buffer_days, 365);
}

TEST_F(ConfigBaseTest, BacktestConfigDefaults) {
    BacktestConfig config;
    EXPECT_EQ(config.window_length, 200);
    EXPECT_EQ(config.initial_policy, InitialPolicy::START_FLAT);
    EXPECT_EQ(config.moving_average_type, MovingAverageType::SMA);
    EXPECT_DOUBLE_EQ(config.initial_capital, 10000.0);
}

TEST_F(ConfigBaseTest, BacktestConfigBadFieldsFromFile) {
    BacktestConfig config;

    std::filesystem::path bad_date = test_dir / "bad_date.json";
    write_file(bad_date, R"({"start_date": "01/04/2010"})");
    auto date_result = config.load_from_file(bad_date.string());
    ASSERT_TRUE(date_result.is_error());
    EXPECT_EQ(date_result.error()->code(), ErrorCode::CONVERSION_ERROR);

    std::filesystem::path bad_policy = test_dir / "bad_policy.json";
    write_file(bad_policy, R"({"initial_policy": "SOMETIMES"})");
    auto policy_result = config.load_from_file(bad_policy.string());
    ASSERT_TRUE(policy_result.is_error());
    EXPECT_EQ(policy_result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, BacktestConfigValidation) {
    BacktestConfig config;
    config.signal_symbol = "SPY";
    config.traded_symbol = "SSO";
    config.start_date = core::make_date(2020, 1, 1);
    config.end_date = core::make_date(2021, 1, 1);
    EXPECT_TRUE(config.validate().is_ok());

    BacktestConfig reversed = config;
    reversed.start_date = config.end_date;
    reversed.end_date = config.start_date;
    ASSERT_TRUE(reversed.validate().is_error());
    EXPECT_EQ(reversed.validate().error()->code(), ErrorCode::INVALID_RANGE);

    BacktestConfig same_day = config;
    same_day.end_date = config.start_date;
    EXPECT_EQ(same_day.validate().error()->code(), ErrorCode::INVALID_RANGE);

    BacktestConfig no_window = config;
    no_window.window_length = 0;
    EXPECT_EQ(no_window.validate().error()->code(), ErrorCode::INVALID_ARGUMENT);

    BacktestConfig no_symbol = config;
    no_symbol.traded_symbol.clear();
    EXPECT_EQ(no_symbol.validate().error()->code(), ErrorCode::INVALID_ARGUMENT);

    BacktestConfig no_capital = config;
    no_capital.initial_capital = 0.0;
    EXPECT_EQ(no_capital.validate().error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, MomentumConfigRoundTrip) {
    momentum::MomentumConfig config;
    config.staleness_tolerance_days = 5;
    config.lookback_months = 6;

    std::filesystem::path file_path = test_dir / "momentum.json";
    ASSERT_TRUE(config.save_to_file(file_path.string()).is_ok());

    momentum::MomentumConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(file_path.string()).is_ok());
    EXPECT_EQ(loaded.staleness_tolerance_days, 5);
    EXPECT_EQ(loaded.lookback_months, 6);
    EXPECT_EQ(loaded.moving_average_window, 200);

    loaded.lookback_months = 0;
    EXPECT_EQ(loaded.validate().error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(ConfigBaseTest, LoggerConfigRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.log_directory = "custom_logs";

    LoggerConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.log_directory, "custom_logs");

    nlohmann::json bad = {{"min_level", "LOUD"}};
    EXPECT_THROW(loaded.from_json(bad), TrendLabError);
}
