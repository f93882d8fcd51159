#include <gtest/gtest.h>

#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <string>

namespace otasrv {

TEST(Sha256Test, KnownVector) {
    testutil::MemoryReader reader("abc");
    EXPECT_EQ(Sha256Hex(reader),
              "ba7816bf8f01cfea414140de5dae2223"
              "b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, EmptyInput) {
    testutil::MemoryReader reader("");
    EXPECT_EQ(Sha256Hex(reader),
              "e3b0c44298fc1c149afbf4c8996fb924"
              "27ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, FileSpanningSeveralBuffers) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.WriteFile("big.bin", std::string(200 * 1024, 'a'));

    std::string hex;
    auto r = Sha256HexFile(p, hex);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(hex.size(), 64U);

    testutil::MemoryReader same(std::string(200 * 1024, 'a'));
    EXPECT_EQ(hex, Sha256Hex(same));
}

TEST(Sha256Test, MissingFileFails) {
    std::string hex = "stale";
    auto r = Sha256HexFile("/nonexistent/otasrv/file.bin", hex);
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(hex.empty());
}

} // namespace otasrv
