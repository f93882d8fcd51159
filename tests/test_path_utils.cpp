#include <gtest/gtest.h>

#include "util/path_utils.hpp"

#include <string>

TEST(PathUtilsTest, ContainsPathSeparator) {
    EXPECT_TRUE(otasrv::ContainsPathSeparator("../../etc/passwd"));
    EXPECT_TRUE(otasrv::ContainsPathSeparator("1.0.0/x"));
    EXPECT_TRUE(otasrv::ContainsPathSeparator("..\\boot.ini"));
    EXPECT_TRUE(otasrv::ContainsPathSeparator(std::string("1.0.0\0x", 7)));
    EXPECT_FALSE(otasrv::ContainsPathSeparator("1.2.0-rc.1+b7"));
    EXPECT_FALSE(otasrv::ContainsPathSeparator(".."));
}

TEST(PathUtilsTest, JoinPath) {
    EXPECT_EQ(otasrv::JoinPath("/srv/ota", "a.wasm"), "/srv/ota/a.wasm");
    EXPECT_EQ(otasrv::JoinPath("/srv/ota/", "a.wasm"), "/srv/ota/a.wasm");
    EXPECT_EQ(otasrv::JoinPath("", "a.wasm"), "a.wasm");
}

TEST(PathUtilsTest, EncodeQueryValue) {
    EXPECT_EQ(otasrv::EncodeQueryValue("1.2.0-rc.1"), "1.2.0-rc.1");
    EXPECT_EQ(otasrv::EncodeQueryValue("1.2.0+build.5"), "1.2.0%2Bbuild.5");
    EXPECT_EQ(otasrv::EncodeQueryValue("a b&c"), "a%20b%26c");
}
