#include "core/Result.h"

#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace NeuroEvo;

TEST(ResultTest, OkayHoldsValue)
{
    auto result = Result<int, std::string>::okay(7);

    EXPECT_TRUE(result.isValue());
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.value(), 7);
}

TEST(ResultTest, ErrorHoldsMessage)
{
    auto result = Result<int, std::string>::error("bad");

    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue(), "bad");
}

TEST(ResultTest, SameTypeForValueAndErrorStaysDistinct)
{
    auto okay = Result<std::string, std::string>::okay("value");
    auto error = Result<std::string, std::string>::error("error");

    EXPECT_TRUE(okay.isValue());
    EXPECT_TRUE(error.isError());
}

TEST(ResultTest, HoldsMoveOnlyValues)
{
    auto result = Result<std::unique_ptr<int>, std::string>::okay(std::make_unique<int>(3));

    ASSERT_TRUE(result.isValue());
    std::unique_ptr<int> owned = std::move(result.value());
    EXPECT_EQ(*owned, 3);
}
