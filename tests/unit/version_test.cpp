#include <gtest/gtest.h>

#include <string>

#include "gnb/core/result.hpp"
#include "gnb/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(gnb::Version::major, 0);
    EXPECT_EQ(gnb::Version::minor, 1);
    EXPECT_EQ(gnb::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(gnb::Version::string, "0.1.0");
}

using IntResult = gnb::Result<int, std::string>;
using VoidResult = gnb::Result<void, std::string>;

TEST(ResultTest, OkValue) {
    auto result = IntResult::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = IntResult::err("something failed");
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), "something failed");
}

TEST(ResultTest, SameValueAndErrorType) {
    auto ok = gnb::Result<std::string, std::string>::ok("value");
    auto err = gnb::Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, ValueOr) {
    auto ok = IntResult::ok(10);
    auto err = IntResult::err("fail");
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = IntResult::ok(1);
    auto err = IntResult::err("fail");
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MoveOutValue) {
    auto result = gnb::Result<std::string, int>::ok(std::string(64, 'x'));
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved.size(), 64u);
}

TEST(ResultVoidTest, Ok) {
    auto result = VoidResult::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = VoidResult::err("void error");
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), "void error");
}
