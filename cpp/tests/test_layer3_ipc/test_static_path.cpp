/**
 * @file test_static_path.cpp
 * @brief StaticPath<N>: conversion limits, byte round trip, formatting.
 */
#include "solo_ipc.hpp"
#include "test_patterns.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

using namespace solohub::ipc;
namespace fs = std::filesystem;

namespace
{
std::vector<uint8_t> bytes_of(std::string_view s)
{
    return {s.begin(), s.end()};
}
} // namespace

class StaticPathTest : public solohub::tests::PureApiTest
{
};

TEST_F(StaticPathTest, IsTransportPayload)
{
    static_assert(std::is_trivially_copyable_v<StaticPath<64>>);
    static_assert(solohub::hub::ShmPayload<StaticPath<64>>);
    static_assert(StaticPath<64>::capacity() == 64);
    SUCCEED();
}

TEST_F(StaticPathTest, DefaultIsEmpty)
{
    StaticPath<16> p;
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.size(), 0u);
    auto back = p.to_path();
    ASSERT_TRUE(back.is_ok());
    EXPECT_TRUE(back.content().empty());
}

TEST_F(StaticPathTest, RoundTrip)
{
    const fs::path original = fs::path("/tmp") / "solohub" / "session.json";
    auto p = StaticPath<64>::from_path(original);
    ASSERT_TRUE(p.is_ok());
    EXPECT_EQ(p.content().size(), original.native().size());

    auto back = p.content().to_path();
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.content(), original);
}

TEST_F(StaticPathTest, ExactCapacityFits)
{
    const std::string name(32, 'x');
    auto p = StaticPath<32>::from_path(name);
    ASSERT_TRUE(p.is_ok());
    EXPECT_EQ(p.content().size(), 32u);
}

TEST_F(StaticPathTest, SmallestCapacityHoldsOneByte)
{
    static_assert(StaticPath<1>::capacity() == 1);
    static_assert(sizeof(StaticPath<1>) > 0);

    auto one = StaticPath<1>::from_path("a");
    ASSERT_TRUE(one.is_ok());
    EXPECT_EQ(one.content().size(), 1u);
    EXPECT_EQ(one.content().to_path().content(), fs::path("a"));

    auto two = StaticPath<1>::from_path("ab");
    ASSERT_TRUE(two.is_error());
    EXPECT_EQ(two.error(), FromPathError::too_long(1, 2));
}

TEST_F(StaticPathTest, TooLongReportsLimitAndLength)
{
    const std::string name(40, 'x');
    auto p = StaticPath<32>::from_path(name);
    ASSERT_TRUE(p.is_error());
    EXPECT_EQ(p.error(), FromPathError::too_long(32, 40));
    EXPECT_EQ(p.error().kind, FromPathError::Kind::TooLong);
    EXPECT_EQ(p.error().at_most, 32u);
    EXPECT_EQ(p.error().len, 40u);
    EXPECT_EQ(p.error().what(), "cannot create StaticPath<32> from a path of length 40");
}

TEST_F(StaticPathTest, EqualityComparesStoredBytes)
{
    auto a = StaticPath<32>::from_path("/a/b");
    auto b = StaticPath<32>::from_path("/a/b");
    auto c = StaticPath<32>::from_path("/a/bc");
    ASSERT_TRUE(a.is_ok() && b.is_ok() && c.is_ok());
    EXPECT_TRUE(a.content() == b.content());
    EXPECT_FALSE(a.content() == c.content());
}

#if !defined(_WIN32)
TEST_F(StaticPathTest, NonUtf8BytesSurviveOnPosix)
{
    const std::string raw = std::string("/tmp/caf") + '\xE9' + ".txt"; // latin-1 e-acute
    auto p = StaticPath<64>::from_path(fs::path(raw));
    ASSERT_TRUE(p.is_ok());
    auto back = p.content().to_path();
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.content().native(), raw);
}
#endif

TEST_F(StaticPathTest, FormatterQuotesAndEscapes)
{
    auto plain = StaticPath<64>::from_path("/tmp/a b");
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(fmt::format("{}", plain.content()), "\"/tmp/a b\"");

    const std::vector<uint8_t> mixed = {'/', 'x', 0xFF, 'y', 0xC3, 0xA9};
    EXPECT_EQ(detail::quote_path_bytes(mixed), "\"/x\\xFFy\xC3\xA9\"");
}

TEST_F(StaticPathTest, Utf8Validation)
{
    EXPECT_TRUE(detail::is_valid_utf8(bytes_of("plain ascii")));
    EXPECT_TRUE(detail::is_valid_utf8(bytes_of("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80")));
    EXPECT_TRUE(detail::is_valid_utf8({}));

    EXPECT_FALSE(detail::is_valid_utf8(bytes_of("\xFF")));
    EXPECT_FALSE(detail::is_valid_utf8(bytes_of("\xC0\xAF")));         // overlong '/'
    EXPECT_FALSE(detail::is_valid_utf8(bytes_of("\xED\xA0\x80")));     // surrogate
    EXPECT_FALSE(detail::is_valid_utf8(bytes_of("\xF4\x90\x80\x80"))); // above U+10FFFF
    EXPECT_FALSE(detail::is_valid_utf8(bytes_of("\xE2\x82")));         // truncated
}
