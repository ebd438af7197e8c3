#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "trend_lab/core/error.hpp"

using namespace trend_lab;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<double> double_result(3.14);
    EXPECT_DOUBLE_EQ(double_result.value(), 3.14);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::NO_OVERLAP, "Series share no dates", "PriceAligner");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::NO_OVERLAP);
    EXPECT_STREQ(error_result.error()->what(), "Series share no dates");
    EXPECT_EQ(error_result.error()->component(), "PriceAligner");
}

TEST_F(ResultTest, ValueOnErrorThrows) {
    auto error_result = make_error<std::vector<double>>(ErrorCode::EMPTY_SERIES, "No rows", "Test");

    EXPECT_THROW(error_result.value(), TrendLabError);
    try {
        error_result.value();
        FAIL() << "value() should throw";
    } catch (const TrendLabError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EMPTY_SERIES);
    }
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);

    std::unique_ptr<int> taken = result.take_value();
    EXPECT_EQ(*taken, 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::string> str_result(std::string("test"));
    Result<std::string> moved_str = std::move(str_result);

    EXPECT_TRUE(moved_str.is_ok());
    EXPECT_EQ(moved_str.value(), "test");

    auto error_result = make_error<std::string>(ErrorCode::NOT_FOUND, "missing");
    Result<std::string> moved_error = std::move(error_result);
    EXPECT_TRUE(moved_error.is_error());
    EXPECT_EQ(moved_error.error()->code(), ErrorCode::NOT_FOUND);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());
    EXPECT_NO_THROW(success.value());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_FALSE(error.is_ok());
    EXPECT_THROW(error.value(), TrendLabError);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeMessageAndComponent) {
    auto original = make_error<void>(ErrorCode::INSUFFICIENT_HISTORY, "Only 150 rows",
                                     "PriceAligner");
    auto forwarded = forward_error<double>(original);

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::INSUFFICIENT_HISTORY);
    EXPECT_STREQ(forwarded.error()->what(), "Only 150 rows");
    EXPECT_EQ(forwarded.error()->component(), "PriceAligner");
}

TEST_F(ResultTest, ErrorToString) {
    TrendLabError error(ErrorCode::INVALID_RANGE, "start after end", "BacktestConfig");
    EXPECT_EQ(error.to_string(),
              "Error in BacktestConfig: start after end (Code: INVALID_RANGE)");
    EXPECT_EQ(error_code_to_string(ErrorCode::FILE_IO_ERROR), "FILE_IO_ERROR");
    EXPECT_EQ(error_code_to_string(static_cast<ErrorCode>(1001)), "CUSTOM_ERROR");
}
