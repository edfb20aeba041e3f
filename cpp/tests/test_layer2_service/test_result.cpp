/**
 * @file test_result.cpp
 * @brief Tests for solohub::utils::Result and VoidResult.
 */
#include "solo_service.hpp"
#include "test_patterns.h"
#include <gtest/gtest.h>
#include <memory>
#include <string>

using solohub::utils::Result;
using solohub::utils::VoidResult;

namespace
{
enum class TestError
{
    None,
    NotFound,
    Busy,
};

struct RichError
{
    std::string detail;
};

Result<int, TestError> parse_positive(int v)
{
    if (v > 0)
        return Result<int, TestError>::ok(v);
    return Result<int, TestError>::error(TestError::NotFound, v);
}
} // namespace

class ResultTest : public solohub::tests::PureApiTest
{
};

TEST_F(ResultTest, Ok_HoldsValue)
{
    auto r = parse_positive(7);
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), 7);
    EXPECT_THROW((void)r.error(), std::logic_error);
    EXPECT_THROW((void)r.error_code(), std::logic_error);
}

TEST_F(ResultTest, Error_HoldsErrorAndCode)
{
    auto r = parse_positive(-3);
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TestError::NotFound);
    EXPECT_EQ(r.error_code(), -3);
    EXPECT_THROW((void)r.content(), std::logic_error);
}

TEST_F(ResultTest, Error_CodeDefaultsToZero)
{
    auto r = Result<int, TestError>::error(TestError::Busy);
    EXPECT_EQ(r.error_code(), 0);
}

TEST_F(ResultTest, DefaultConstructed_IsDefaultError)
{
    Result<int, TestError> r;
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), TestError::None);
}

TEST_F(ResultTest, ValueOr)
{
    EXPECT_EQ(parse_positive(5).value_or(-1), 5);
    EXPECT_EQ(parse_positive(0).value_or(-1), -1);
}

TEST_F(ResultTest, MoveOnlyContent_CanBeMovedOut)
{
    auto r = Result<std::unique_ptr<int>, TestError>::ok(std::make_unique<int>(11));
    ASSERT_TRUE(r.is_ok());
    std::unique_ptr<int> p = std::move(r).content();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 11);
}

TEST_F(ResultTest, MoveConstruction_KeepsState)
{
    auto a = Result<std::string, RichError>::error(RichError{"slot taken"}, 16);
    auto b = std::move(a);
    ASSERT_TRUE(b.is_error());
    EXPECT_EQ(b.error().detail, "slot taken");
    EXPECT_EQ(b.error_code(), 16);
}

TEST_F(ResultTest, VoidResult_OkAndError)
{
    auto ok = VoidResult<TestError>::ok();
    EXPECT_TRUE(ok.is_ok());

    auto err = VoidResult<TestError>::error(TestError::Busy, 11);
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), TestError::Busy);
    EXPECT_EQ(err.error_code(), 11);
}

TEST_F(ResultTest, IsNotCopyable)
{
    static_assert(!std::is_copy_constructible_v<Result<int, TestError>>);
    static_assert(!std::is_copy_assignable_v<Result<int, TestError>>);
    static_assert(std::is_nothrow_move_constructible_v<Result<int, TestError>>);
    SUCCEED();
}
