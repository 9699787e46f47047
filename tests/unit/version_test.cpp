#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "tcc/core/result.hpp"
#include "tcc/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(tcc::Version::major, 0);
    EXPECT_EQ(tcc::Version::minor, 3);
    EXPECT_EQ(tcc::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(tcc::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = tcc::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = tcc::Result<int>::err(tcc::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = tcc::Result<int>::err(tcc::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = tcc::Result<int>::ok(10);
    auto err = tcc::Result<int>::err(tcc::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = tcc::Result<int>::ok(1);
    auto err = tcc::Result<int>::err(tcc::Error("fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MoveOnlyValue) {
    auto result = tcc::Result<std::unique_ptr<int>>::ok(std::make_unique<int>(7));
    ASSERT_TRUE(result.hasValue());
    auto owned = std::move(result).value();
    EXPECT_EQ(*owned, 7);
}

TEST(ResultVoidTest, Ok) {
    auto result = tcc::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = tcc::Result<void>::err(tcc::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
